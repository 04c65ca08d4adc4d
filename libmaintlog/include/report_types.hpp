/**
 * @file report_types.hpp
 * @brief Input data model of an export: records, attachments, branding.
 */

#ifndef MAINTLOG_REPORT_TYPES_HPP
#define MAINTLOG_REPORT_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace maintlog {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Closed set of incident categories.
 */
enum class Category {
    Electrical,
    Plumbing,
    HVAC,
    Structural,
    Grounds,
    Custodial,
    Safety,
    Other
};

/**
 * @brief Parses a category name, ignoring case and surrounding blanks.
 * @return std::nullopt when the name is not one of the closed set.
 */
[[nodiscard]] std::optional<Category> parse_category(std::string_view name);

/// @return Display name, e.g. "Plumbing", "HVAC".
[[nodiscard]] std::string_view to_string(Category category) noexcept;

/**
 * @brief A single image file submitted with a log record.
 */
struct Attachment {
    std::vector<std::uint8_t> bytes; ///< Raw file content
    std::string mime_type;           ///< Declared MIME type (e.g. "image/jpeg")
    std::string file_name;           ///< Original file name, informational only

    [[nodiscard]] size_t size() const noexcept { return bytes.size(); }
};

/**
 * @brief One maintenance incident as delivered by the log management layer.
 *
 * Fields are kept as received; RecordFormatter validates them once.
 */
struct LogRecord {
    std::string id;
    std::string title;
    std::string category;                ///< Raw category name, parsed with parse_category()
    std::string location;
    std::string description;
    std::optional<Timestamp> created_at;
    std::string created_by;
    std::vector<Attachment> attachments;
};

/**
 * @brief Organization branding stamped on every page.
 */
struct Branding {
    std::string organization;
    std::string department;
    std::optional<Attachment> logo;
    std::string report_title = "Maintenance Service Report";
};

/**
 * @brief Everything one export needs. Record order is preserved in the output.
 */
struct ReportRequest {
    std::vector<LogRecord> records;
    Branding branding;
    Timestamp generated_at = std::chrono::system_clock::now();
};

} // namespace maintlog

#endif // MAINTLOG_REPORT_TYPES_HPP
