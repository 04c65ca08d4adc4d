/**
 * @file maintlog.hpp
 * @brief Public API for the maintlog library.
 */

#ifndef MAINTLOG_HPP
#define MAINTLOG_HPP

#include "report_config.hpp"
#include "report_error.hpp"
#include "report_generator.hpp"
#include "report_types.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace maintlog {

/**
 * @brief Interface for receiving progress and status events during an export.
 *
 * Attachment callbacks may arrive from worker threads.
 */
struct ExportObserver {
    virtual ~ExportObserver() = default;

    virtual void onAttachmentRejected(const std::string& record_id, size_t index,
                                      ErrorKind kind, const std::string& reason) {}

    virtual void onRecordFormatted(const std::string& record_id) {}

    virtual void onRecordSkipped(const std::string& record_id, const std::string& reason) {}

    virtual void onReportComplete(size_t page_count, size_t byte_size, size_t warning_count) {}

    virtual void onReportFailed(ErrorKind kind, const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the maintlog library.
 *
 * @details Wraps the report pipeline into a simple, blocking API.
 * Uses PIMPL idiom to hide internal dependencies.
 */
class ReportExporter {
public:
    ReportExporter();
    ~ReportExporter();

    ReportExporter(const ReportExporter&) = delete;
    ReportExporter& operator=(const ReportExporter&) = delete;
    ReportExporter(ReportExporter&&) noexcept;
    ReportExporter& operator=(ReportExporter&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Replace the whole configuration.
     */
    ReportExporter& config(const ReportConfig& cfg);

    /// @return The current configuration.
    [[nodiscard]] const ReportConfig& config() const;

    /**
     * @brief Maximum attachment size in bytes.
     * Default: 5 MiB.
     */
    ReportExporter& maxAttachmentBytes(size_t bytes);

    /**
     * @brief Maximum number of attachments per record.
     * Default: 5.
     */
    ReportExporter& maxAttachmentsPerRecord(size_t count);

    /**
     * @brief Longest side of a normalized photo in pixels.
     * Default: 1600.
     */
    ReportExporter& maxImageDimension(int pixels);

    /**
     * @brief Longest side of the normalized logo in pixels.
     * Default: 400.
     */
    ReportExporter& logoMaxDimension(int pixels);

    /**
     * @brief JPEG quality of embedded images.
     * Default: 85.
     */
    ReportExporter& jpegQuality(int quality);

    /**
     * @brief Time budget of one attachment.
     * Default: 5 seconds.
     */
    ReportExporter& attachmentTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Set the number of worker threads to use.
     * Default: hardware concurrency / 2.
     */
    ReportExporter& threads(unsigned val);

    /**
     * @brief Page size and bands.
     * Default: US Letter.
     */
    ReportExporter& page(const PageGeometry& geometry);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(ExportObserver* observer);

    // --- Execution ---

    /**
     * @brief Generates the report. Blocks until completion.
     * @throws std::invalid_argument if the configuration is inconsistent.
     */
    [[nodiscard]] ReportResult exportReport(const ReportRequest& request);

    /**
     * @brief File name offered for a generated report, e.g.
     * "South-Dade-Academy-MaintenanceReport-2025-03-14.pdf".
     *
     * The organization name is reduced to [A-Za-z0-9-] with blanks turned
     * into dashes; the date is the UTC date of the timestamp.
     */
    [[nodiscard]] static std::string suggested_filename(const Branding& branding, Timestamp generated_at);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace maintlog

#endif // MAINTLOG_HPP
