/**
 * @file text_utils.hpp
 * @brief Small string and timestamp helpers shared by the pipeline and the CLI.
 */

#ifndef MAINTLOG_TEXT_UTILS_HPP
#define MAINTLOG_TEXT_UTILS_HPP

#include "report_types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace maintlog {

    /// @return s without leading/trailing ASCII whitespace.
    [[nodiscard]] std::string_view trim(std::string_view s) noexcept;

    /// @return true if both strings are equal ignoring ASCII case.
    [[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

    /// @return ASCII upper-case copy of s (non-ASCII bytes are kept).
    [[nodiscard]] std::string to_upper_copy(std::string_view s);

    /// @return ASCII lower-case copy of s.
    [[nodiscard]] std::string to_lower_copy(std::string_view s);

    /**
     * @brief Formats a time point in UTC with a strftime pattern.
     * @param ts The time point.
     * @param pattern strftime-style pattern, e.g. "%B %d, %Y at %I:%M %p".
     */
    [[nodiscard]] std::string format_utc(Timestamp ts, const char* pattern);

    /// @return Timestamp as used in report text: "March 14, 2025 at 09:30 AM UTC".
    [[nodiscard]] std::string format_report_time(Timestamp ts);

    /**
     * @brief Parses an ISO 8601 UTC timestamp ("2025-03-14T09:30:00Z",
     * "2025-03-14T09:30:00", "2025-03-14").
     * @return std::nullopt if the text is not a timestamp.
     */
    [[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

} // namespace maintlog

#endif // MAINTLOG_TEXT_UTILS_HPP
