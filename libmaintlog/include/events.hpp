/**
 * @file events.hpp
 * @brief Progress events published by ReportGenerator on the EventBus.
 */

#ifndef MAINTLOG_EVENTS_HPP
#define MAINTLOG_EVENTS_HPP

#include "report_error.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace maintlog {

/**
 * @brief Events published during the stages of an export.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (the ReportExporter facade, the CLI) about progress and degradations.
 * They are simple data carriers without behavior. Attachment events are
 * published from normalization workers.
 */

// --- Stage 1: Normalization ---

/**
 * @brief Emitted when an attachment was converted to a canonical JPEG.
 */
struct AttachmentNormalizedEvent {
    std::string record_id;     ///< Owning record (empty for the logo)
    size_t index = 0;          ///< Zero-based attachment index
    int width = 0;             ///< Normalized width in pixels
    int height = 0;            ///< Normalized height in pixels
    size_t original_size = 0;  ///< Attachment size in bytes
    size_t jpeg_size = 0;      ///< Canonical JPEG size in bytes
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when an attachment is omitted from the report.
 */
struct AttachmentRejectedEvent {
    std::string record_id;
    size_t index = 0;
    ErrorKind kind = ErrorKind::DecodeFailed;
    std::string reason;
};

// --- Stage 2: Formatting ---

/**
 * @brief Emitted when a record was laid out.
 */
struct RecordFormattedEvent {
    std::string record_id;
    size_t block_count = 0;
    size_t omitted_images = 0;
};

/**
 * @brief Emitted when a record is left out of the report.
 */
struct RecordSkippedEvent {
    std::string record_id;
    std::string reason;
};

// --- Stage 3: Assembly ---

/**
 * @brief Emitted when the document was written.
 */
struct ReportCompleteEvent {
    size_t record_count = 0;
    size_t page_count = 0;
    size_t byte_size = 0;
    size_t warning_count = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when the export ends without a document.
 */
struct ReportFailedEvent {
    ErrorKind kind = ErrorKind::AssemblyError;
    std::string error_message;
};

} // namespace maintlog

#endif // MAINTLOG_EVENTS_HPP
