/**
 * @file report_generator.hpp
 * @brief Orchestrates normalization, formatting, pagination and assembly.
 */

#ifndef MAINTLOG_REPORT_GENERATOR_HPP
#define MAINTLOG_REPORT_GENERATOR_HPP

#include "decoder_registry.hpp"
#include "event_bus.hpp"
#include "report_config.hpp"
#include "report_error.hpp"
#include "report_types.hpp"
#include <cstdint>
#include <vector>

namespace maintlog {

/**
 * @brief Outcome of one export: the PDF or a fatal error, plus every
 * warning collected on the way.
 */
struct ReportResult {
    Outcome<std::vector<std::uint8_t>> document;
    std::vector<Warning> warnings;
    size_t page_count = 0;
    size_t record_count = 0; ///< Records that made it into the document

    [[nodiscard]] bool ok() const noexcept { return succeeded(document); }

    /// @throws std::bad_variant_access when the export failed.
    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const {
        return std::get<std::vector<std::uint8_t>>(document);
    }

    /// @return The fatal error, or nullptr on success.
    [[nodiscard]] const ReportError* error() const noexcept {
        return std::get_if<ReportError>(&document);
    }
};

/**
 * @brief Runs one export synchronously.
 *
 * @details Stages, in order:
 * 1. normalize the branding logo and every attachment of every valid record
 *    on a ThreadPool owned by the call;
 * 2. format records in request order (invalid ones are skipped with a warning);
 * 3. paginate the title block and the record blocks;
 * 4. assemble the PDF.
 *
 * EmptyReport (no record survived) and AssemblyError are the only fatal
 * outcomes. Progress is published on the EventBus given at construction.
 */
class ReportGenerator {
public:
    /**
     * @param config Export configuration; must outlive the generator.
     * @param registry Decoders used by the normalizer.
     * @param bus Receives the events of events.hpp.
     */
    ReportGenerator(const ReportConfig& config, const DecoderRegistry& registry, EventBus& bus)
        : config_(config), registry_(registry), bus_(bus) {}

    /**
     * @brief Produces the report.
     * @throws std::invalid_argument if the configuration is inconsistent.
     */
    [[nodiscard]] ReportResult generate(const ReportRequest& request);

private:
    const ReportConfig& config_;
    const DecoderRegistry& registry_;
    EventBus& bus_;
};

} // namespace maintlog

#endif // MAINTLOG_REPORT_GENERATOR_HPP
