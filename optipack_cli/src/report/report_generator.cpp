#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <string>

#include <sys/ioctl.h>
#include <unistd.h>

using optipack::OptimizedResult;
using optipack::ResultStatus;

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string format_percent(const double pct) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << pct << "%";
    return oss.str();
}

static std::string outcome_label(const OptimizedResult& r, const bool use_colors) {
    std::string label(optipack::to_string(r.status));
    std::ranges::transform(label, label.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (r.converted) label += " (jpeg)";
    if (!use_colors) return label;
    switch (r.status) {
        case ResultStatus::Success: return GREEN + label + RESET;
        case ResultStatus::Skipped: return YELLOW + label + RESET;
        case ResultStatus::Error:   return RED + label + RESET;
    }
    return label;
}

void print_console_report(const std::vector<OptimizedResult>& results,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    std::size_t max_format = 8;
    std::size_t max_before = 12;
    std::size_t max_after = 12;
    std::size_t max_delta = 10;
    std::size_t max_result = 10;
    for (const auto& r : results) {
        max_before = std::max(max_before, std::to_string(r.original_size / 1024).size() + 2);
        max_after  = std::max(max_after,  std::to_string(r.optimized_size / 1024).size() + 2);
        max_delta  = std::max(max_delta,  format_percent(r.saving_percentage).size() + 2);
        max_result = std::max(max_result, strip_ansi(outcome_label(r, false)).size() + 2);
    }

    const std::size_t fixed_cols_width = max_format + max_before + max_after + max_delta + max_result;
    const std::size_t file_col_width = term_width > fixed_cols_width + 10
                                       ? term_width - fixed_cols_width
                                       : 10;

    auto truncate = [](const std::string& s, const std::size_t max_len) {
        if (max_len < 4) return s;
        return s.size() < max_len ? s : s.substr(0, max_len - 4) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(file_col_width)) << "File"
              << std::setw(static_cast<int>(max_format)) << "Format"
              << std::setw(static_cast<int>(max_before)) << "Before(KB)"
              << std::setw(static_cast<int>(max_after))  << "After(KB)"
              << std::setw(static_cast<int>(max_delta))  << "Delta(%)"
              << "Result"
              << "\n";

    std::uint64_t total_original = 0;
    std::uint64_t total_optimized = 0;
    std::size_t errors = 0;

    for (const auto& r : results) {
        total_original += r.original_size;
        total_optimized += r.optimized_size;
        if (r.status == ResultStatus::Error) ++errors;

        std::string name = r.name;
        if (r.output_name != r.name) name += " -> " + r.output_name;

        std::cerr << std::left << std::setw(static_cast<int>(file_col_width)) << truncate(name, file_col_width)
                  << std::setw(static_cast<int>(max_format)) << optipack::image_format_to_string(r.format)
                  << std::setw(static_cast<int>(max_before)) << r.original_size / 1024
                  << std::setw(static_cast<int>(max_after))  << r.optimized_size / 1024
                  << std::setw(static_cast<int>(max_delta))  << format_percent(r.saving_percentage)
                  << outcome_label(r, use_colors)
                  << "\n";
        if (r.error_detail) {
            std::cerr << "    " << *r.error_detail << "\n";
        }
    }

    const auto saved = static_cast<std::int64_t>(total_original) - static_cast<std::int64_t>(total_optimized);
    std::cerr << "\nTotal saved space: " << saved / 1024 << " KB\n";
    if (total_original > 0) {
        std::cerr << "Total reduction: "
                  << format_percent(optipack::compute_saving_percentage(total_original, total_optimized)) << "\n";
    }
    if (errors > 0) {
        std::cerr << (use_colors ? RED : "") << errors << " file(s) could not be optimized"
                  << (use_colors ? RESET : "") << "\n";
    }
    std::cerr << "Total time: " << std::fixed << std::setprecision(2) << total_seconds << " s\n";
}

bool export_csv_report(const std::vector<OptimizedResult>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Output,Format,Before(bytes),After(bytes),Delta(%),Result,Error\n";
    for (const auto& r : results) {
        std::ostringstream osspct;
        osspct << std::fixed << std::setprecision(2) << r.saving_percentage;
        out << csv_escape(r.name) << ","
            << csv_escape(r.output_name) << ","
            << optipack::image_format_to_string(r.format) << ","
            << r.original_size << ","
            << r.optimized_size << ","
            << osspct.str() << ","
            << optipack::to_string(r.status) << ","
            << csv_escape(r.error_detail.value_or("")) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << std::fixed << std::setprecision(2) << total_seconds << " seconds\n";
    return static_cast<bool>(out);
}
