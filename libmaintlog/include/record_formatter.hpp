/**
 * @file record_formatter.hpp
 * @brief Validates log records and lays them out as measured page blocks.
 */

#ifndef MAINTLOG_RECORD_FORMATTER_HPP
#define MAINTLOG_RECORD_FORMATTER_HPP

#include "image_normalizer.hpp"
#include "page_block.hpp"
#include "report_config.hpp"
#include "report_error.hpp"
#include "report_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace maintlog {

/**
 * @brief Blocks of one record plus the warnings of its omitted images.
 */
struct FormattedRecord {
    std::string record_id;
    std::vector<PageBlock> blocks;
    std::vector<Warning> warnings;
};

/**
 * @brief Turns records into blocks sized for the configured page.
 *
 * @details Block order per record: header, description (split into
 * continuation blocks when it would not fit on one page), one block per
 * successfully normalized image. Output is a pure function of the inputs,
 * so formatting the same record twice yields equal blocks.
 */
class RecordFormatter {
public:
    /// @param config Export configuration; must outlive the formatter.
    explicit RecordFormatter(const ReportConfig& config) : config_(config) {}

    /**
     * @brief Checks the text fields and attachment count of a record.
     * @return std::nullopt when valid, otherwise InvalidRecord naming the
     * record and the first failing field.
     */
    [[nodiscard]] std::optional<ReportError> validate(const LogRecord& record) const;

    /**
     * @brief Formats one record.
     * @param record The record.
     * @param images Normalization outcome of every attachment, index-aligned
     * with record.attachments.
     * @return The formatted record, or InvalidRecord.
     */
    [[nodiscard]] Outcome<FormattedRecord> format(const LogRecord& record,
                                                  const std::vector<Outcome<NormalizedImage>>& images) const;

    /**
     * @brief Builds the report title block placed before the first record.
     * @param branding Report title source.
     * @param incident_count Number of records that made it into the report.
     * @param generated_at Generation timestamp.
     */
    [[nodiscard]] PageBlock format_title(const Branding& branding, size_t incident_count,
                                         Timestamp generated_at) const;

private:
    [[nodiscard]] PageBlock header_block(const LogRecord& record, Category category) const;
    [[nodiscard]] std::vector<PageBlock> description_blocks(const LogRecord& record) const;
    [[nodiscard]] PageBlock image_block(const LogRecord& record, const NormalizedImage& image,
                                        size_t photo_number, size_t photo_total, bool first) const;

    const ReportConfig& config_;
};

} // namespace maintlog

#endif // MAINTLOG_RECORD_FORMATTER_HPP
