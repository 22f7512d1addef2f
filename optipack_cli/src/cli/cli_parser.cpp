#include "cli_parser.hpp"
#include "../../../liboptipack/include/optimization_options.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <thread>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.require_subcommand(1);

    // --- Global options ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("INFO")
                   ->envname("OPTIPACK_LOG_LEVEL")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to a file (default: no file logging).");

    // --- serve ---
    CLI::App* serve = app.add_subcommand("serve", "Run the HTTP optimization service.");
    auto& s = settings.serve;

    serve->add_option("--host", s.host, "Address to bind.")
         ->default_val(s.host)
         ->envname("OPTIPACK_HOST");

    serve->add_option("-p,--port", s.port, "TCP port to listen on.")
         ->default_val(s.port)
         ->envname("OPTIPACK_PORT")
         ->check(CLI::Range(1, 65535));

    s.worker_threads = std::max(1U, std::thread::hardware_concurrency());
    serve->add_option("--threads", s.worker_threads, "Worker threads running optimization jobs.")
         ->default_val(s.worker_threads)
         ->envname("OPTIPACK_THREADS")
         ->check(CLI::PositiveNumber);

    serve->add_option("--http-threads", s.http_threads,
                      "Threads serving HTTP requests; open progress streams may hold at most three quarters of them.")
         ->default_val(s.http_threads)
         ->check(CLI::PositiveNumber);

    s.data_dir = std::filesystem::temp_directory_path() / "optipack";
    serve->add_option("--data-dir", s.data_dir, "Directory where finished archives are kept.")
         ->default_val(s.data_dir.string())
         ->envname("OPTIPACK_DATA_DIR");

    serve->add_option("--retention", s.retention_seconds,
                      "Seconds a finished job and its archive are kept.")
         ->default_val(s.retention_seconds)
         ->envname("OPTIPACK_RETENTION")
         ->check(CLI::PositiveNumber);

    serve->add_option("--download-grace", s.download_grace_seconds,
                      "Seconds an archive stays available after its first download.")
         ->default_val(s.download_grace_seconds);

    serve->add_option("--max-pending", s.max_pending_jobs,
                      "Queued plus running jobs before uploads are refused (0 = unlimited).")
         ->default_val(s.max_pending_jobs);

    serve->add_option("--max-upload-mb", s.max_upload_mb, "Largest accepted upload, in MiB.")
         ->default_val(s.max_upload_mb)
         ->check(CLI::PositiveNumber);

    // --- optimize ---
    CLI::App* optimize = app.add_subcommand("optimize", "Optimize one archive locally and write the result.");
    auto& o = settings.optimize;

    optimize->add_option("input", o.input, "Input archive (zip, tar, 7z).")
            ->required()
            ->check(CLI::ExistingFile);

    optimize->add_option("output", o.output, "Output ZIP archive.")
            ->required();

    optimize->add_option("--quality", o.jpeg_quality, "JPEG quality (1-100).")
            ->default_val(optipack::kDefaultJpegQuality)
            ->check(CLI::Range(optipack::kMinJpegQuality, optipack::kMaxJpegQuality));

    optimize->add_flag("--convert-png", o.convert_png,
                       "Convert PNGs without an alpha channel to JPEG.");

    optimize->add_option("--report-csv", o.report_path, "CSV report export filename.")
            ->take_last();

    optimize->callback([&settings]() {
        const auto& opts = settings.optimize;
        std::error_code ec;
        if (std::filesystem::equivalent(opts.input, opts.output, ec)) {
            throw CLI::ValidationError("Output archive must differ from the input archive.");
        }
    });

    app.callback([&settings, serve, optimize]() {
        settings.run_serve = serve->parsed();
        settings.run_optimize = optimize->parsed();
    });
}
