/**
 * @file document_assembler.hpp
 * @brief Writes paginated blocks as a PDF document using qpdf.
 */

#ifndef MAINTLOG_DOCUMENT_ASSEMBLER_HPP
#define MAINTLOG_DOCUMENT_ASSEMBLER_HPP

#include "pagination_engine.hpp"
#include "report_config.hpp"
#include "report_error.hpp"
#include "report_types.hpp"
#include <cstdint>
#include <vector>

namespace maintlog {

/**
 * @brief A finished PDF plus the image placeholders it had to use.
 */
struct AssembledDocument {
    std::vector<std::uint8_t> bytes;
    std::vector<Warning> warnings;
    size_t page_count = 0;
};

/**
 * @brief Owns the PDF writer lifecycle of one export.
 *
 * @details Registers Helvetica and Helvetica-Bold (WinAnsiEncoding), emits
 * one content stream per page (running header, blocks, running footer),
 * embeds every normalized image once as a /DCTDecode XObject and writes
 * the document to memory with a deterministic ID.
 *
 * Image data is re-verified before embedding. An image that fails is drawn
 * as an "Image unavailable" frame and reported as a warning; the document
 * still completes. Blocks taller than the content area are clipped to it.
 */
class DocumentAssembler {
public:
    /// @param config Export configuration; must outlive the assembler.
    explicit DocumentAssembler(const ReportConfig& config) : config_(config) {}

    /**
     * @brief Builds the PDF.
     * @param pages Output of paginate(), in order.
     * @param generated_at Written as /CreationDate.
     * @return The document, or AssemblyError when qpdf fails or there are no pages.
     */
    [[nodiscard]] Outcome<AssembledDocument> assemble(const std::vector<Page>& pages,
                                                      Timestamp generated_at) const;

private:
    const ReportConfig& config_;
};

} // namespace maintlog

#endif // MAINTLOG_DOCUMENT_ASSEMBLER_HPP
