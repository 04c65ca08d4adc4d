#include "test_helpers.hpp"

#include "../libmaintlog/include/document_assembler.hpp"
#include "../libmaintlog/include/pagination_engine.hpp"
#include "../libmaintlog/include/record_formatter.hpp"

#include <cassert>
#include <memory>
#include <string>
#include <variant>

using namespace maintlog;

namespace {

std::shared_ptr<RunningContent> running_content() {
    auto running = std::make_shared<RunningContent>();
    running->organization = "South Dade Academy";
    running->department = "Facilities (Maintenance)";
    running->report_title = "Maintenance Service Report";
    running->generated_at = "March 14, 2025 at 09:30 AM UTC";
    return running;
}

const AssembledDocument& ok(const Outcome<AssembledDocument>& outcome) {
    assert(std::holds_alternative<AssembledDocument>(outcome));
    return std::get<AssembledDocument>(outcome);
}

} // namespace

int main() {
    const ReportConfig config;
    const DocumentAssembler assembler(config);
    const RecordFormatter formatter(config);
    const Timestamp generated_at = test::at("2025-03-14T09:30:00Z");

    // nothing to write
    {
        const auto outcome = assembler.assemble({}, generated_at);
        assert(std::holds_alternative<ReportError>(outcome));
        assert(std::get<ReportError>(outcome).kind() == ErrorKind::AssemblyError);
    }

    // formatted records with a real photo and a logo
    std::vector<PageBlock> blocks;
    Branding branding;
    branding.organization = "South Dade Academy";
    blocks.push_back(formatter.format_title(branding, 12, generated_at));
    for (int i = 0; i < 12; ++i) {
        LogRecord record = test::record("R" + std::to_string(i), "Broken (left) door \\ hinge");
        record.attachments = {test::jpeg_attachment(8, 8)};
        NormalizedImage image;
        image.jpeg = test::jpeg_bytes(120, 90);
        image.width = 120;
        image.height = 90;
        const auto formatted = formatter.format(record, {image});
        for (const auto& block : std::get<FormattedRecord>(formatted).blocks) blocks.push_back(block);
    }

    auto running = running_content();
    auto logo = std::make_shared<NormalizedImage>();
    logo->jpeg = test::jpeg_bytes(200, 80);
    logo->width = 200;
    logo->height = 80;
    running->logo = logo;

    const auto pages = paginate(blocks, config.page, running);
    assert(pages.size() > 1);

    const auto first = assembler.assemble(pages, generated_at);
    const auto& document = ok(first);
    assert(document.warnings.empty());
    assert(document.page_count == pages.size());
    assert(document.bytes.size() > 5);
    assert(std::string(document.bytes.begin(), document.bytes.begin() + 5) == "%PDF-");
    assert(test::count_pages(document.bytes) == pages.size());

    // identical input, identical bytes
    const auto second = assembler.assemble(pages, generated_at);
    assert(ok(second).bytes == document.bytes);

    // undecodable image data becomes a placeholder plus a warning
    {
        auto broken = std::make_shared<NormalizedImage>();
        broken->jpeg = {0xFF, 0xD8, 0x00, 0x01, 0x02, 0x03};
        broken->width = 100;
        broken->height = 100;
        broken->source_index = 2;

        PageBlock block;
        block.kind = BlockKind::Image;
        block.record_id = "X";
        block.height = 130;
        block.ops.emplace_back(ImagePlacement{10, 0, 100, 100, broken});

        const auto outcome = assembler.assemble(paginate({block}, config.page, running_content()), generated_at);
        const auto& doc = ok(outcome);
        assert(doc.warnings.size() == 1);
        assert(doc.warnings[0].record_id == "X");
        assert(doc.warnings[0].attachment_index == 2u);
        assert(doc.warnings[0].kind == ErrorKind::DecodeFailed);
        assert(test::count_pages(doc.bytes) == 1);
    }

    // a declared size that disagrees with the stream is not embedded either
    {
        auto lying = std::make_shared<NormalizedImage>();
        lying->jpeg = test::jpeg_bytes(50, 50);
        lying->width = 60;
        lying->height = 50;

        PageBlock block;
        block.kind = BlockKind::Image;
        block.record_id = "Y";
        block.height = 80;
        block.ops.emplace_back(ImagePlacement{0, 0, 60, 50, lying});

        const auto& doc = ok(assembler.assemble(paginate({block}, config.page, running_content()), generated_at));
        assert(doc.warnings.size() == 1);
        assert(doc.warnings[0].record_id == "Y");
    }

    // an oversized block is clipped, not dropped
    {
        auto tall = std::make_shared<NormalizedImage>();
        tall->jpeg = test::jpeg_bytes(200, 1600);
        tall->width = 200;
        tall->height = 1600;

        PageBlock block;
        block.kind = BlockKind::Image;
        block.record_id = "T";
        block.height = 1620;
        block.ops.emplace_back(ImagePlacement{0, 0, 200, 1600, tall});

        const auto tall_pages = paginate({block}, config.page, running_content());
        assert(tall_pages.size() == 1 && tall_pages[0].oversized(config.page));
        const auto& doc = ok(assembler.assemble(tall_pages, generated_at));
        assert(doc.warnings.empty());
        assert(test::count_pages(doc.bytes) == 1);
    }

    // A4 pages
    {
        ReportConfig a4 = config;
        a4.page = PageGeometry::a4();
        const DocumentAssembler a4_assembler(a4);
        const auto a4_pages = paginate({formatter.format_title(branding, 0, generated_at)}, a4.page, running_content());
        const auto& doc = ok(a4_assembler.assemble(a4_pages, generated_at));
        assert(test::count_pages(doc.bytes) == 1);
    }
    return 0;
}
