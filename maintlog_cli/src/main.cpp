#include <chrono>
#include <clocale>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/summary_printer.hpp"
#include "request/request_loader.hpp"
#include "../utils/color.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../libmaintlog/include/logger.hpp"
#include "../../libmaintlog/include/maintlog.hpp"
#include "../../libmaintlog/include/report_error.hpp"

using namespace maintlog;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInput = 1;
constexpr int kExitFatal = 2;

// prints progress of the export on the console
class ConsoleObserver final : public ExportObserver {
public:
    void onAttachmentRejected(const std::string& record_id, const size_t index,
                              const ErrorKind kind, const std::string& reason) override {
        const std::string owner = record_id.empty() ? "logo" : "record " + record_id + ", photo " +
                                                              std::to_string(index + 1);
        Logger::log(LogLevel::Info, owner + " omitted: " + std::string(to_string(kind)) + " (" + reason + ")",
                    "main");
    }

    void onRecordFormatted(const std::string& record_id) override {
        Logger::log(LogLevel::Debug, "record " + record_id + " formatted", "main");
    }
};

bool write_document(const std::vector<std::uint8_t>& bytes, const fs::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"maintlog-report: Render maintenance incident records as a branded PDF report."};
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
        app.exit(e);
        return kExitInput;
    }

    std::setlocale(LC_ALL, "");

    // set loggers
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return kExitInput;
        }
        Logger::add_sink(std::move(fileSink));
    }

    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(settings.log_level);
        Logger::add_sink(std::move(consoleSink));
    }

    const auto start_total = std::chrono::steady_clock::now();

    ReportRequest request;
    try {
        request = load_request(settings.manifest);
    } catch (const ManifestError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        if (settings.quiet) std::cerr << e.what() << std::endl;
        return kExitInput;
    }

    ReportExporter exporter;
    ConsoleObserver observer;
    exporter.setObserver(&observer);

    ReportResult result;
    try {
        exporter.config(settings.to_config());
        result = exporter.exportReport(request);
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::Error, std::string("Invalid configuration: ") + e.what(), "main");
        return kExitInput;
    }

    fs::path output = settings.output_path;
    if (fs::is_directory(output)) {
        output /= ReportExporter::suggested_filename(request.branding, request.generated_at);
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    int status = kExitOk;
    if (const auto* error = result.error()) {
        Logger::log(LogLevel::Error, std::string(to_string(error->kind())) + ": " + error->what(), "main");
        status = kExitFatal;
    } else if (!write_document(result.bytes(), output)) {
        Logger::log(LogLevel::Error, "Failed to write output to: " + output.string(), "main");
        status = kExitFatal;
    }

    // export CSV if requested
    if (!settings.warnings_csv.empty() && !export_warnings_csv(result, settings.warnings_csv)) {
        Logger::log(LogLevel::Error, "Failed to write warnings CSV: " + settings.warnings_csv.string(), "main");
    }

    if (!settings.quiet) {
        print_console_summary(result, output, total_seconds);
    }

    exporter.setObserver(nullptr);
    Logger::clear_sinks();
    return status;
}
