#include "test_helpers.hpp"

#include "../libmaintlog/include/maintlog.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <string>

using namespace maintlog;

namespace {

struct CountingObserver final : ExportObserver {
    std::atomic<int> rejected{0};
    std::atomic<int> formatted{0};
    std::atomic<int> skipped{0};
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};

    void onAttachmentRejected(const std::string&, size_t, ErrorKind, const std::string&) override { ++rejected; }
    void onRecordFormatted(const std::string&) override { ++formatted; }
    void onRecordSkipped(const std::string&, const std::string&) override { ++skipped; }
    void onReportComplete(size_t, size_t, size_t) override { ++completed; }
    void onReportFailed(ErrorKind, const std::string&) override { ++failed; }
};

ReportRequest base_request() {
    ReportRequest request;
    request.branding.organization = "South Dade Academy";
    request.branding.department = "Facilities";
    request.generated_at = test::at("2025-03-14T09:30:00Z");
    return request;
}

bool has_warning(const ReportResult& result, const std::string& record_id, const ErrorKind kind) {
    return std::any_of(result.warnings.begin(), result.warnings.end(), [&](const Warning& w) {
        return w.record_id == record_id && w.kind == kind;
    });
}

} // namespace

int main() {
    // valid record plus one with an empty title
    {
        ReportRequest request = base_request();
        LogRecord a = test::record("A");
        a.attachments = {test::jpeg_attachment(640, 480)};
        request.records = {a, test::record("B", "")};

        CountingObserver observer;
        ReportExporter exporter;
        exporter.setObserver(&observer);
        const ReportResult result = exporter.exportReport(request);

        assert(result.ok());
        assert(result.error() == nullptr);
        assert(result.record_count == 1);
        assert(result.page_count >= 1);
        assert(test::count_pages(result.bytes()) == result.page_count);
        assert(result.warnings.size() == 1);
        assert(has_warning(result, "B", ErrorKind::InvalidRecord));
        assert(observer.formatted == 1);
        assert(observer.skipped == 1);
        assert(observer.completed == 1);
        assert(observer.failed == 0);
        exporter.setObserver(nullptr);
    }

    // nothing survives: no document at all
    {
        ReportRequest request = base_request();
        LogRecord bad = test::record("C");
        bad.category = "Unknown";
        request.records = {test::record("B", ""), bad};

        CountingObserver observer;
        ReportExporter exporter;
        exporter.setObserver(&observer);
        const ReportResult result = exporter.exportReport(request);
        assert(!result.ok());
        assert(result.error()->kind() == ErrorKind::EmptyReport);
        assert(result.page_count == 0);
        assert(result.warnings.size() == 2);
        assert(observer.failed == 1);
    }
    {
        ReportExporter exporter;
        const ReportResult result = exporter.exportReport(base_request());
        assert(!result.ok());
        assert(result.error()->kind() == ErrorKind::EmptyReport);
    }

    // an oversize attachment is dropped, its record kept
    {
        ReportRequest request = base_request();
        LogRecord a = test::record("A");
        a.attachments = {test::jpeg_attachment(256, 256), test::jpeg_attachment(16, 16)};
        request.records = {a};

        ReportExporter exporter;
        exporter.maxAttachmentBytes(a.attachments[1].size());
        assert(a.attachments[0].size() > a.attachments[1].size());
        const ReportResult result = exporter.exportReport(request);
        assert(result.ok());
        assert(result.record_count == 1);
        assert(result.warnings.size() == 1);
        assert(result.warnings[0].record_id == "A");
        assert(result.warnings[0].attachment_index == 0u);
        assert(result.warnings[0].kind == ErrorKind::AttachmentTooLarge);
    }

    // unusable logo degrades to a report-level warning
    {
        ReportRequest request = base_request();
        request.branding.logo = Attachment{{'n', 'o', 't', ' ', 'p', 'n', 'g'}, "image/png", "logo.png"};
        request.records = {test::record("A")};

        ReportExporter exporter;
        const ReportResult result = exporter.exportReport(request);
        assert(result.ok());
        assert(result.warnings.size() == 1);
        assert(result.warnings[0].record_id.empty());
        assert(result.warnings[0].reason.starts_with("logo omitted"));
    }

    // page count and bytes are reproducible, whatever the thread count
    {
        ReportRequest request = base_request();
        for (int i = 0; i < 25; ++i) {
            request.records.push_back(test::record("T" + std::to_string(i)));
        }
        request.records[3].attachments = {test::jpeg_attachment(300, 200)};
        request.records[17].attachments = {test::jpeg_attachment(200, 300), test::jpeg_attachment(64, 64)};
        request.branding.logo = test::jpeg_attachment(500, 200, "logo.jpg");

        ReportExporter single;
        single.threads(1);
        ReportExporter many;
        many.threads(4);
        const ReportResult first = single.exportReport(request);
        const ReportResult second = many.exportReport(request);
        assert(first.ok() && second.ok());
        assert(first.warnings.empty());
        assert(first.record_count == 25);
        assert(first.page_count == second.page_count);
        assert(first.page_count > 1);
        assert(first.bytes() == second.bytes());
        assert(test::count_pages(first.bytes()) == first.page_count);
    }

    // a page-tall image still lands on its own page
    {
        ReportRequest request = base_request();
        LogRecord a = test::record("A");
        a.attachments = {test::jpeg_attachment(200, 1600)};
        request.records = {a};

        ReportConfig config;
        config.image_box_height = 2000;
        ReportExporter exporter;
        exporter.config(config);
        const ReportResult result = exporter.exportReport(request);
        assert(result.ok());
        assert(result.warnings.empty());
        assert(result.page_count == 2);
    }

    // configuration errors are reported before any work
    {
        ReportExporter exporter;
        exporter.jpegQuality(0);
        bool thrown = false;
        try {
            (void)exporter.exportReport(base_request());
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    // suggested file names
    {
        Branding branding;
        branding.organization = "South Dade Academy";
        const Timestamp ts = test::at("2025-03-14T09:30:00Z");
        assert(ReportExporter::suggested_filename(branding, ts) ==
               "South-Dade-Academy-MaintenanceReport-2025-03-14.pdf");
        branding.organization = "  St. Mary's  (North) ";
        assert(ReportExporter::suggested_filename(branding, ts) ==
               "St-Marys-North-MaintenanceReport-2025-03-14.pdf");
        branding.organization = "";
        assert(ReportExporter::suggested_filename(branding, ts) ==
               "Organization-MaintenanceReport-2025-03-14.pdf");
    }
    return 0;
}
