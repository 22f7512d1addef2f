#ifndef OPTIPACK_REPORT_GENERATOR_HPP
#define OPTIPACK_REPORT_GENERATOR_HPP

#include "../../../liboptipack/include/optimized_result.hpp"
#include <filesystem>
#include <vector>

/**
 * @brief Width of the attached terminal, 80 when it cannot be queried.
 */
unsigned get_terminal_width();

/**
 * @brief Prints a per-entry table and the totals to stderr.
 * @param results Results in processing order.
 * @param total_seconds Wall time of the whole job.
 */
void print_console_report(const std::vector<optipack::OptimizedResult>& results,
                          double total_seconds);

/**
 * @brief Writes the results as CSV.
 * @return false if the file cannot be written.
 */
bool export_csv_report(const std::vector<optipack::OptimizedResult>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // OPTIPACK_REPORT_GENERATOR_HPP
