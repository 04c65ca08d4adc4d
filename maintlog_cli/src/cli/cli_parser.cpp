#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <thread>

maintlog::ReportConfig Settings::to_config() const {
    maintlog::ReportConfig config;
    config.max_attachment_bytes = static_cast<size_t>(std::llround(max_attachment_mb * 1024.0 * 1024.0));
    config.max_attachments_per_record = max_attachments;
    config.max_image_dimension = max_dimension;
    config.logo_max_dimension = logo_dimension;
    config.jpeg_quality = jpeg_quality;
    config.max_decoded_pixels = static_cast<size_t>(std::llround(max_megapixels * 1e6));
    config.attachment_timeout = std::chrono::milliseconds(timeout_ms);
    config.worker_threads = num_threads;
    config.page = page_size == PageSize::A4 ? maintlog::PageGeometry::a4()
                                            : maintlog::PageGeometry::letter();
    return config;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // options may also come from an INI/TOML file
    app.set_config("--config", "", "Read options from an INI or TOML file.");

    // --- Flags (booleans) ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (log lines, warning table).");

    app.add_option("-o,--output", settings.output_path,
                   "Write the PDF to PATH.\n"
                   "(If PATH is a directory, the suggested file name is used inside it).");

    app.add_option("--warnings-csv", settings.warnings_csv,
                   "CSV export of the warnings collected during the export.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Limits ---
    app.add_option("--max-attachment-mb", settings.max_attachment_mb,
                   "Largest accepted attachment, in MiB.")
                   ->default_val(settings.max_attachment_mb)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-attachments", settings.max_attachments,
                   "Attachments kept per record; extra ones are ignored.")
                   ->default_val(settings.max_attachments)
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-dimension", settings.max_dimension,
                   "Longest side of an embedded photo, in pixels.")
                   ->default_val(settings.max_dimension)
                   ->check(CLI::Range(16, 10000));

    app.add_option("--logo-dimension", settings.logo_dimension,
                   "Longest side of the organization logo, in pixels.")
                   ->default_val(settings.logo_dimension)
                   ->check(CLI::Range(16, 4000));

    app.add_option("--jpeg-quality", settings.jpeg_quality,
                   "JPEG quality of embedded images.")
                   ->default_val(settings.jpeg_quality)
                   ->check(CLI::Range(1, 100));

    app.add_option("--max-megapixels", settings.max_megapixels,
                   "Largest photo (width x height, in millions of pixels) that is decoded.")
                   ->default_val(settings.max_megapixels)
                   ->check(CLI::Range(0.01, 1000.0));

    app.add_option("--timeout-ms", settings.timeout_ms,
                   "Time budget for decoding one attachment, in milliseconds.")
                   ->default_val(settings.timeout_ms)
                   ->check(CLI::PositiveNumber);

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for attachment normalization.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    // page size option with a map transformer
    app.add_option("--page-size", settings.page_size, "Page size: 'letter' (default) or 'a4'.")
        ->default_val(PageSize::Letter)
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, PageSize>{
                {"letter", PageSize::Letter},
                {"a4", PageSize::A4}
            }, CLI::ignore_case));

    // --- Logging ---
    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG.")
                   ->default_val("WARNING")
                   ->transform(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Positional Arguments ---
    app.add_option("manifest", settings.manifest, "JSON manifest describing the report")
        ->required()
        ->check(CLI::ExistingFile);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.output_path.empty()) {
            throw CLI::ValidationError("Option '-o, --output' is required.");
        }

        if (!settings.warnings_csv.empty() && std::filesystem::is_directory(settings.warnings_csv)) {
            throw CLI::ValidationError("--warnings-csv must name a file, not a directory.");
        }

        if (!settings.warnings_csv.empty() && settings.warnings_csv == settings.output_path) {
            throw CLI::ValidationError("--warnings-csv and -o, --output cannot point to the same file.");
        }
    });
}
