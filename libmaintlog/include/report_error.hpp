/**
 * @file report_error.hpp
 * @brief Error taxonomy, warnings and tagged stage outcomes.
 */

#ifndef MAINTLOG_REPORT_ERROR_HPP
#define MAINTLOG_REPORT_ERROR_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace maintlog {

/**
 * @brief Every way an export, a record or an attachment can fail.
 *
 * Attachment-level kinds (AttachmentTooLarge, UnsupportedFormat,
 * DecodeFailed) degrade to an omitted image. InvalidRecord skips one
 * record. EmptyReport and AssemblyError are the only fatal kinds.
 */
enum class ErrorKind {
    AttachmentTooLarge,
    UnsupportedFormat,
    DecodeFailed,
    InvalidRecord,
    EmptyReport,
    AssemblyError
};

/// @return Stable identifier of the kind (e.g. "DecodeFailed").
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// @return true for EmptyReport and AssemblyError.
[[nodiscard]] constexpr bool is_fatal(const ErrorKind kind) noexcept {
    return kind == ErrorKind::EmptyReport || kind == ErrorKind::AssemblyError;
}

/**
 * @brief Exception carrying an ErrorKind.
 *
 * Thrown inside a stage (decoders, writer) and returned by value as the
 * failure alternative of Outcome at stage boundaries.
 */
class ReportError : public std::runtime_error {
public:
    ReportError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Tagged success/failure result of a pipeline stage.
 */
template <typename T>
using Outcome = std::variant<T, ReportError>;

template <typename T>
[[nodiscard]] bool succeeded(const Outcome<T>& outcome) noexcept {
    return std::holds_alternative<T>(outcome);
}

/**
 * @brief A non-fatal, reported degradation attached to an export.
 */
struct Warning {
    std::string record_id;                   ///< Empty for report-level issues (e.g. the logo)
    std::optional<size_t> attachment_index;  ///< Zero-based index when an image was omitted
    ErrorKind kind = ErrorKind::DecodeFailed;
    std::string reason;

    bool operator==(const Warning&) const = default;
};

/// @return One-line rendering, e.g. "record A, photo 2: DecodeFailed (timed out)".
[[nodiscard]] std::string describe(const Warning& warning);

} // namespace maintlog

#endif // MAINTLOG_REPORT_ERROR_HPP
