/**
 * @file maintlog.cpp
 * @brief Implementation of the public ReportExporter API.
 */

#include "../../include/maintlog.hpp"

#include "../../include/decoder_registry.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

namespace maintlog {

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    ExportObserver* observer_;
public:
    explicit BridgeLogSink(ExportObserver* obs) : observer_(obs) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (observer_) {
            observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
        }
    }
};

struct ReportExporter::Impl {
    DecoderRegistry registry;
    ReportConfig config;

    ExportObserver* observer = nullptr;
    const ILogSink* bridge = nullptr; ///< Owned by Logger while installed

    void removeBridge() {
        if (bridge) {
            Logger::remove_sink(bridge);
            bridge = nullptr;
        }
    }

    void setupEventBridging(EventBus& bus) const {
        if (!observer) return;
        ExportObserver* obs = observer;

        bus.subscribe<AttachmentRejectedEvent>([obs](const AttachmentRejectedEvent& e) {
            obs->onAttachmentRejected(e.record_id, e.index, e.kind, e.reason);
        });

        bus.subscribe<RecordFormattedEvent>([obs](const RecordFormattedEvent& e) {
            obs->onRecordFormatted(e.record_id);
        });

        bus.subscribe<RecordSkippedEvent>([obs](const RecordSkippedEvent& e) {
            obs->onRecordSkipped(e.record_id, e.reason);
        });

        bus.subscribe<ReportCompleteEvent>([obs](const ReportCompleteEvent& e) {
            obs->onReportComplete(e.page_count, e.byte_size, e.warning_count);
        });

        bus.subscribe<ReportFailedEvent>([obs](const ReportFailedEvent& e) {
            obs->onReportFailed(e.kind, e.error_message);
        });
    }
};

ReportExporter::ReportExporter() : impl_(std::make_unique<Impl>()) {}

ReportExporter::~ReportExporter() {
    if (impl_) impl_->removeBridge();
}

ReportExporter::ReportExporter(ReportExporter&&) noexcept = default;
ReportExporter& ReportExporter::operator=(ReportExporter&& other) noexcept {
    if (this != &other) {
        if (impl_) impl_->removeBridge();
        impl_ = std::move(other.impl_);
    }
    return *this;
}

ReportExporter& ReportExporter::config(const ReportConfig& cfg) {
    impl_->config = cfg;
    return *this;
}

const ReportConfig& ReportExporter::config() const {
    return impl_->config;
}

ReportExporter& ReportExporter::maxAttachmentBytes(const size_t bytes) {
    impl_->config.max_attachment_bytes = bytes;
    return *this;
}

ReportExporter& ReportExporter::maxAttachmentsPerRecord(const size_t count) {
    impl_->config.max_attachments_per_record = count;
    return *this;
}

ReportExporter& ReportExporter::maxImageDimension(const int pixels) {
    impl_->config.max_image_dimension = pixels;
    return *this;
}

ReportExporter& ReportExporter::logoMaxDimension(const int pixels) {
    impl_->config.logo_max_dimension = pixels;
    return *this;
}

ReportExporter& ReportExporter::jpegQuality(const int quality) {
    impl_->config.jpeg_quality = quality;
    return *this;
}

ReportExporter& ReportExporter::attachmentTimeout(const std::chrono::milliseconds timeout) {
    impl_->config.attachment_timeout = timeout;
    return *this;
}

ReportExporter& ReportExporter::threads(const unsigned val) {
    impl_->config.worker_threads = val > 0 ? val : std::thread::hardware_concurrency() / 2;
    if (impl_->config.worker_threads == 0) impl_->config.worker_threads = 1;
    return *this;
}

ReportExporter& ReportExporter::page(const PageGeometry& geometry) {
    impl_->config.page = geometry;
    return *this;
}

void ReportExporter::setObserver(ExportObserver* observer) {
    impl_->removeBridge();
    impl_->observer = observer;
}

ReportResult ReportExporter::exportReport(const ReportRequest& request) {
    EventBus bus;
    impl_->setupEventBridging(bus);

    // inject bridge sink once if observer is present
    if (impl_->observer && !impl_->bridge) {
        auto sink = std::make_unique<BridgeLogSink>(impl_->observer);
        impl_->bridge = sink.get();
        Logger::add_sink(std::move(sink));
    }

    ReportGenerator generator(impl_->config, impl_->registry, bus);
    return generator.generate(request);
}

std::string ReportExporter::suggested_filename(const Branding& branding, const Timestamp generated_at) {
    std::string slug;
    bool pending_dash = false;
    for (const char ch : trim(branding.organization)) {
        const auto uc = static_cast<unsigned char>(ch);
        if (std::isalnum(uc) && uc < 0x80) {
            if (pending_dash && !slug.empty()) slug.push_back('-');
            pending_dash = false;
            slug.push_back(ch);
        } else if (ch == ' ' || ch == '-' || ch == '\t') {
            pending_dash = true;
        }
    }
    if (slug.empty()) slug = "Organization";
    return slug + "-MaintenanceReport-" + format_utc(generated_at, "%Y-%m-%d") + ".pdf";
}

} // namespace maintlog
