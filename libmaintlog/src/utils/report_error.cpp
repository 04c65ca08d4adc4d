#include "../../include/report_error.hpp"

namespace maintlog {

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::AttachmentTooLarge: return "AttachmentTooLarge";
        case ErrorKind::UnsupportedFormat:  return "UnsupportedFormat";
        case ErrorKind::DecodeFailed:       return "DecodeFailed";
        case ErrorKind::InvalidRecord:      return "InvalidRecord";
        case ErrorKind::EmptyReport:        return "EmptyReport";
        case ErrorKind::AssemblyError:      return "AssemblyError";
    }
    return "Unknown";
}

std::string describe(const Warning& warning) {
    std::string out;
    if (warning.record_id.empty()) {
        out = "report";
    } else {
        out = "record " + warning.record_id;
    }
    if (warning.attachment_index) {
        out += ", photo " + std::to_string(*warning.attachment_index + 1);
    }
    out += ": ";
    out += to_string(warning.kind);
    if (!warning.reason.empty()) {
        out += " (" + warning.reason + ")";
    }
    return out;
}

} // namespace maintlog
