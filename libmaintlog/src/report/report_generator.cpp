#include "../../include/report_generator.hpp"
#include "../../include/document_assembler.hpp"
#include "../../include/events.hpp"
#include "../../include/image_normalizer.hpp"
#include "../../include/logger.hpp"
#include "../../include/pagination_engine.hpp"
#include "../../include/record_formatter.hpp"
#include "../../include/text_utils.hpp"
#include "../../include/thread_pool.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iterator>
#include <memory>
#include <optional>

namespace maintlog {

namespace {

using clock_type = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(const clock_type::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_type::now() - start);
}

// collects a normalization future; a lost task is a failed attachment
Outcome<NormalizedImage> collect(std::future<Outcome<NormalizedImage>>& future) {
    try {
        return future.get();
    } catch (const std::exception& e) {
        return ReportError(ErrorKind::DecodeFailed, e.what());
    }
}

} // namespace

ReportResult ReportGenerator::generate(const ReportRequest& request) {
    config_.validate();

    const auto start = clock_type::now();
    ReportResult result;
    Logger::log(LogLevel::Info, "Generating report for " + std::to_string(request.records.size()) +
                " records", "report_generator");

    const ImageNormalizer normalizer(config_, registry_);
    const RecordFormatter formatter(config_);

    // --- validation: invalid records never reach the workers ---
    std::vector<std::optional<ReportError>> rejections;
    rejections.reserve(request.records.size());
    size_t attachment_count = 0;
    for (const auto& record : request.records) {
        rejections.push_back(formatter.validate(record));
        if (!rejections.back()) attachment_count += record.attachments.size();
    }
    const bool has_logo = request.branding.logo.has_value();

    // --- stage 1: normalization ---
    std::optional<Outcome<NormalizedImage>> logo_outcome;
    std::vector<std::vector<Outcome<NormalizedImage>>> images(request.records.size());
    {
        const size_t jobs = attachment_count + (has_logo ? 1 : 0);
        const unsigned threads = static_cast<unsigned>(
            std::max<size_t>(1, std::min<size_t>(config_.worker_threads, jobs)));

        auto run = [this, &normalizer](const Attachment& attachment, const std::string& record_id,
                                       const size_t index, const int max_dimension) {
            const auto task_start = clock_type::now();
            Outcome<NormalizedImage> outcome = normalizer.normalize(attachment, index, max_dimension);
            if (const auto* image = std::get_if<NormalizedImage>(&outcome)) {
                bus_.publish(AttachmentNormalizedEvent{record_id, index, image->width, image->height,
                                                       attachment.size(), image->jpeg.size(),
                                                       elapsed_since(task_start)});
            } else {
                const auto& error = std::get<ReportError>(outcome);
                bus_.publish(AttachmentRejectedEvent{record_id, index, error.kind(), error.what()});
            }
            return outcome;
        };

        // destroyed before run: ~ThreadPool still executes whatever is queued
        std::optional<ThreadPool> pool;
        if (jobs > 0) pool.emplace(threads);

        std::optional<std::future<Outcome<NormalizedImage>>> logo_future;
        if (has_logo) {
            const Attachment& logo = *request.branding.logo;
            logo_future = pool->submit([&run, &logo, this] {
                return run(logo, "", 0, config_.logo_max_dimension);
            });
        }

        std::vector<std::vector<std::future<Outcome<NormalizedImage>>>> futures(request.records.size());
        for (size_t r = 0; r < request.records.size(); ++r) {
            if (rejections[r]) continue;
            const LogRecord& record = request.records[r];
            for (size_t i = 0; i < record.attachments.size(); ++i) {
                futures[r].push_back(pool->submit([&run, &record, i, this] {
                    return run(record.attachments[i], record.id, i, config_.max_image_dimension);
                }));
            }
        }

        // restore input order
        if (logo_future) logo_outcome = collect(*logo_future);
        for (size_t r = 0; r < futures.size(); ++r) {
            images[r].reserve(futures[r].size());
            for (auto& future : futures[r]) {
                images[r].push_back(collect(future));
            }
        }
    }

    std::shared_ptr<const NormalizedImage> logo;
    if (logo_outcome) {
        if (auto* image = std::get_if<NormalizedImage>(&*logo_outcome)) {
            logo = std::make_shared<const NormalizedImage>(std::move(*image));
        } else {
            const auto& error = std::get<ReportError>(*logo_outcome);
            result.warnings.push_back(Warning{"", std::nullopt, error.kind(),
                                              std::string("logo omitted: ") + error.what()});
            Logger::log(LogLevel::Warning, std::string("Logo omitted: ") + error.what(), "report_generator");
        }
    }

    // --- stage 2: formatting, in request order ---
    std::vector<PageBlock> record_blocks;
    size_t formatted = 0;
    for (size_t r = 0; r < request.records.size(); ++r) {
        const LogRecord& record = request.records[r];
        Outcome<FormattedRecord> outcome = rejections[r]
            ? Outcome<FormattedRecord>(*rejections[r])
            : formatter.format(record, images[r]);

        if (const auto* error = std::get_if<ReportError>(&outcome)) {
            result.warnings.push_back(Warning{record.id, std::nullopt, error->kind(), error->what()});
            bus_.publish(RecordSkippedEvent{record.id, error->what()});
            Logger::log(LogLevel::Warning, std::string("Record skipped: ") + error->what(), "report_generator");
            continue;
        }

        auto& record_out = std::get<FormattedRecord>(outcome);
        bus_.publish(RecordFormattedEvent{record.id, record_out.blocks.size(), record_out.warnings.size()});
        for (auto& warning : record_out.warnings) {
            Logger::log(LogLevel::Warning, describe(warning), "report_generator");
            result.warnings.push_back(std::move(warning));
        }
        for (auto& block : record_out.blocks) {
            record_blocks.push_back(std::move(block));
        }
        ++formatted;
    }

    if (formatted == 0) {
        const std::string message = request.records.empty()
            ? "the request contains no records"
            : "none of the " + std::to_string(request.records.size()) + " records could be formatted";
        Logger::log(LogLevel::Error, "Report not generated: " + message, "report_generator");
        bus_.publish(ReportFailedEvent{ErrorKind::EmptyReport, message});
        result.document = ReportError(ErrorKind::EmptyReport, message);
        return result;
    }

    // --- stage 3: pagination ---
    std::vector<PageBlock> blocks;
    blocks.reserve(record_blocks.size() + 1);
    blocks.push_back(formatter.format_title(request.branding, formatted, request.generated_at));
    std::move(record_blocks.begin(), record_blocks.end(), std::back_inserter(blocks));

    auto running = std::make_shared<RunningContent>();
    running->organization = request.branding.organization;
    running->department = request.branding.department;
    running->report_title = request.branding.report_title;
    running->generated_at = format_report_time(request.generated_at);
    running->logo = std::move(logo);

    const std::vector<Page> pages = paginate(blocks, config_.page, std::move(running));

    // --- stage 4: assembly ---
    const DocumentAssembler assembler(config_);
    Outcome<AssembledDocument> assembled = assembler.assemble(pages, request.generated_at);
    if (auto* error = std::get_if<ReportError>(&assembled)) {
        bus_.publish(ReportFailedEvent{error->kind(), error->what()});
        result.document = std::move(*error);
        return result;
    }

    auto& document = std::get<AssembledDocument>(assembled);
    for (auto& warning : document.warnings) {
        result.warnings.push_back(std::move(warning));
    }
    result.page_count = document.page_count;
    result.record_count = formatted;
    result.document = std::move(document.bytes);

    const auto duration = elapsed_since(start);
    bus_.publish(ReportCompleteEvent{formatted, result.page_count, result.bytes().size(),
                                     result.warnings.size(), duration});
    Logger::log(LogLevel::Info, "Report generated: " + std::to_string(formatted) + " records, " +
                std::to_string(result.page_count) + " pages, " + std::to_string(result.warnings.size()) +
                " warnings in " + std::to_string(duration.count()) + " ms", "report_generator");
    return result;
}

} // namespace maintlog
