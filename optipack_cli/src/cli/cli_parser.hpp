#ifndef OPTIPACK_CLI_PARSER_HPP
#define OPTIPACK_CLI_PARSER_HPP

#include <cstddef>
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

/**
 * @brief Options of the `serve` subcommand.
 */
struct ServeSettings {
    std::string host = "0.0.0.0";
    int port = 8080;
    unsigned worker_threads = 1;
    unsigned http_threads = 16;
    std::filesystem::path data_dir;
    unsigned retention_seconds = 3600;
    unsigned download_grace_seconds = 60;
    std::size_t max_pending_jobs = 0;
    std::size_t max_upload_mb = 512;
};

/**
 * @brief Options of the `optimize` subcommand.
 */
struct OptimizeSettings {
    std::filesystem::path input;
    std::filesystem::path output;
    int jpeg_quality = 85;
    bool convert_png = false;
    std::filesystem::path report_path;
};

struct Settings {
    bool quiet = false;
    std::string log_level = "INFO";
    std::filesystem::path log_file;

    ServeSettings serve;
    OptimizeSettings optimize;

    bool run_serve = false;
    bool run_optimize = false;
};

/**
 * @brief Configures the CLI11 parser with both subcommands and the global options.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // OPTIPACK_CLI_PARSER_HPP
