#include "../../include/optimization_options.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace optipack {

namespace {

std::string trim_lower(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
    std::string s(value);
    std::ranges::transform(s, s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

void OptimizationOptions::validate() const {
    if (jpeg_quality < kMinJpegQuality || jpeg_quality > kMaxJpegQuality) {
        throw ValidationError("jpeg quality must be between 1 and 100, got " + std::to_string(jpeg_quality));
    }
}

OptimizationOptions OptimizationOptions::parse(const std::string_view quality, const std::string_view convert_png) {
    OptimizationOptions options;
    const std::string q = trim_lower(quality);
    if (!q.empty()) {
        int value = 0;
        const char* first = q.data();
        const char* last = q.data() + q.size();
        if (*first == '+') ++first;
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last || first == last) {
            throw ValidationError("jpeg quality must be an integer, got '" + std::string(quality) + "'");
        }
        options.jpeg_quality = value;
    }
    options.convert_png_to_jpeg = parse_flag(convert_png);
    options.validate();
    return options;
}

bool OptimizationOptions::parse_flag(const std::string_view value) {
    const std::string v = trim_lower(value);
    if (v.empty() || v == "off" || v == "false" || v == "no" || v == "0") return false;
    if (v == "on" || v == "true" || v == "yes" || v == "1") return true;
    throw ValidationError("invalid boolean value '" + std::string(value) + "'");
}

std::string to_string(const OptimizationOptions& options) {
    return "quality=" + std::to_string(options.jpeg_quality) +
           " convert_png=" + (options.convert_png_to_jpeg ? "yes" : "no");
}

} // namespace optipack
