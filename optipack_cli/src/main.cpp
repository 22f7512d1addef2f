#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <variant>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "http/http_server.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../liboptipack/include/errors.hpp"
#include "../../liboptipack/include/file_utils.hpp"
#include "../../liboptipack/include/logger.hpp"
#include "../../liboptipack/include/optipack.hpp"

// simple progress bar printer
inline void print_progress_bar(const int percent, const std::size_t done, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);
    const unsigned pos = bar_width * static_cast<unsigned>(percent) / 100u;

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && percent < 100) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(3) << percent << "%"
              << " (" << done << " files)"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace optipack;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static HttpServer* g_server = nullptr;

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
        if (g_server) {
            g_server->stop();
        }
    }
}

static void setup_logging(const Settings& settings) {
    Logger::clear_sinks();
    Logger::set_level(Logger::string_to_level(settings.log_level));

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file);
        if (!file_sink->is_open()) {
            std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
        }
        Logger::add_sink(std::move(file_sink));
    }

    if (!settings.quiet) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(console_sink));
    }
}

static int run_serve(const ServeSettings& s) {
    ServiceConfig config;
    config.worker_threads = s.worker_threads;
    config.data_dir = s.data_dir;
    config.retention = std::chrono::seconds(s.retention_seconds);
    config.download_grace = std::chrono::seconds(s.download_grace_seconds);
    config.max_pending_jobs = s.max_pending_jobs;

    OptimizationService service(config);
    HttpServer server(service, config.keepalive_interval, s.max_upload_mb * 1024 * 1024, s.http_threads);

    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const bool listened = server.listen(s.host, s.port);
    g_server = nullptr;
    service.shutdown();

    if (!listened && !interrupted.load()) {
        Logger::log(LogLevel::Error, "Cannot listen on " + s.host + ":" + std::to_string(s.port), "main");
        return 1;
    }
    return interrupted.load() ? 130 : 0;
}

static int run_optimize(const OptimizeSettings& o, const bool quiet) {
    OptimizationOptions options;
    options.jpeg_quality = o.jpeg_quality;
    options.convert_png_to_jpeg = o.convert_png;

    // the artifact only passes through the store on its way to the output file
    const ScopedTempDir work("cli", "main");
    ServiceConfig config;
    config.worker_threads = 1;
    config.data_dir = work.path();
    config.reaper_interval = std::chrono::milliseconds(0);

    OptimizationService service(config);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    SubmittedJob job;
    try {
        job = service.submit_and_subscribe(read_file(o.input), options);
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }

    std::vector<OptimizedResult> results;
    int exit_code = 1;
    bool done = false;
    while (!done) {
        if (interrupted.load()) {
            std::cerr << CYAN << "\n[INTERRUPT] Stop detected. Cancelling job..." << RESET << std::endl;
            service.shutdown();
            return 130;
        }
        const auto event = job.events->next(std::chrono::milliseconds(250));
        if (!event) {
            if (job.events->finished()) break;
            continue;
        }

        if (const auto* fc = std::get_if<FileComplete>(&*event)) {
            results.push_back(fc->result);
        } else if (const auto* p = std::get_if<Progress>(&*event)) {
            if (!quiet) print_progress_bar(p->percent, results.size(), elapsed());
        } else if (const auto* c = std::get_if<Complete>(&*event)) {
            write_file(o.output, service.fetch_artifact(c->artifact_id));
            exit_code = 0;
            done = true;
        } else if (const auto* f = std::get_if<Failed>(&*event)) {
            std::cerr << RED << "\nJob failed: " << f->reason << RESET << std::endl;
            done = true;
        }
    }

    const double total_seconds = elapsed();
    if (!quiet && !results.empty()) {
        std::cerr << std::endl;
        print_console_report(results, total_seconds);
    }
    if (!o.report_path.empty() && !export_csv_report(results, o.report_path, total_seconds)) {
        Logger::log(LogLevel::Error, "Cannot write report " + o.report_path.string(), "main");
    }
    if (exit_code == 0 && !quiet) {
        std::cerr << GREEN << "Output saved to: " << o.output.string() << RESET << std::endl;
    }
    return exit_code;
}

int main(int argc, char* argv[]) {
    CLI::App app{"optipack: batch image optimization for archives."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    setup_logging(settings);

    try {
        if (settings.run_serve) {
            return run_serve(settings.serve);
        }
        return run_optimize(settings.optimize, settings.quiet);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
}
