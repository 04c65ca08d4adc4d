#ifndef MAINTLOG_SUMMARY_PRINTER_HPP
#define MAINTLOG_SUMMARY_PRINTER_HPP

#include "../../../libmaintlog/include/report_generator.hpp"
#include <filesystem>
#include <string>

/**
 * @brief Prints the outcome of an export and its warning table to stderr.
 */
void print_console_summary(const maintlog::ReportResult& result,
                           const std::filesystem::path& output_path,
                           double total_seconds);

/**
 * @brief Writes the warnings of an export as CSV.
 * @return false if the file could not be written.
 */
bool export_warnings_csv(const maintlog::ReportResult& result,
                         const std::filesystem::path& output_path);

/// @return data quoted for CSV when it contains separators, quotes or newlines.
std::string csv_escape(const std::string& data);

#endif // MAINTLOG_SUMMARY_PRINTER_HPP
