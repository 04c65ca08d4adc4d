#ifndef MAINTLOG_CLI_PARSER_HPP
#define MAINTLOG_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include "../../../libmaintlog/include/report_config.hpp"

// forward declaration
namespace CLI { class App; }

enum class PageSize {
    Letter,
    A4
};

struct Settings {
    bool quiet = false;

    double max_attachment_mb = 5.0;
    size_t max_attachments = 5;
    int max_dimension = 1600;
    int logo_dimension = 400;
    int jpeg_quality = 85;
    double max_megapixels = 50.0;
    int timeout_ms = 5000;
    unsigned num_threads = 1;
    PageSize page_size = PageSize::Letter;

    std::string log_level = "WARNING";
    std::filesystem::path log_file;
    std::filesystem::path output_path;
    std::filesystem::path warnings_csv;

    std::filesystem::path manifest;

    /// @return The export configuration described by the options.
    [[nodiscard]] maintlog::ReportConfig to_config() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // MAINTLOG_CLI_PARSER_HPP
