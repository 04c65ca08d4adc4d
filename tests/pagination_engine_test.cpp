#include "../libmaintlog/include/pagination_engine.hpp"

#include <cassert>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace maintlog;

namespace {

PageBlock block(const std::string& record_id, const double height,
                const BlockKind kind = BlockKind::Description) {
    PageBlock b;
    b.kind = kind;
    b.record_id = record_id;
    b.height = height;
    return b;
}

} // namespace

int main() {
    const PageGeometry letter = PageGeometry::letter();
    const double capacity = letter.content_height();
    auto running = std::make_shared<RunningContent>();
    running->organization = "South Dade Academy";

    assert(paginate({}, letter, running).empty());

    // greedy fill, numbering and running content on every page
    {
        std::vector<PageBlock> blocks;
        for (int i = 0; i < 13; ++i) blocks.push_back(block(std::to_string(i), 100));
        const auto pages = paginate(blocks, letter, running);
        assert(pages.size() == 3);
        assert(pages[0].blocks.size() == 6);
        assert(pages[1].blocks.size() == 6);
        assert(pages[2].blocks.size() == 1);
        for (size_t i = 0; i < pages.size(); ++i) {
            assert(pages[i].number == i + 1);
            assert(pages[i].total == 3);
            assert(pages[i].running == running);
            assert(!pages[i].oversized(letter));
            double expected_top = 0;
            for (const auto& placed : pages[i].blocks) {
                assert(placed.top == expected_top);
                expected_top += placed.block.height;
            }
        }
        // input order is kept
        assert(pages[1].blocks.front().block.record_id == "6");
        assert(pages[2].blocks.front().block.record_id == "12");
    }

    // a block that would straddle the bottom moves whole to the next page
    {
        const auto pages = paginate({block("a", capacity - 50), block("b", 100)}, letter, running);
        assert(pages.size() == 2);
        assert(pages[1].blocks.size() == 1);
        assert(pages[1].blocks[0].top == 0);
    }

    // one record's header, description and photos flow onto the following page
    {
        const std::vector<PageBlock> blocks = {
            block("R-1", capacity - 300, BlockKind::RecordHeader),
            block("R-2", 150, BlockKind::RecordHeader),
            block("R-2", 100, BlockKind::Description),
            block("R-2", 120, BlockKind::Description),
            block("R-2", 200, BlockKind::Image),
            block("R-2", 200, BlockKind::Image),
            block("R-3", 80, BlockKind::RecordHeader),
        };
        const auto pages = paginate(blocks, letter, running);
        assert(pages.size() == 2);

        // R-2 starts on page 1 and continues on page 2, order intact
        assert(pages[0].blocks.size() == 3);
        assert(pages[0].blocks[1].block.record_id == "R-2");
        assert(pages[0].blocks[1].block.kind == BlockKind::RecordHeader);
        assert(pages[0].blocks[2].block.kind == BlockKind::Description);
        assert(std::abs(pages[0].blocks[2].top - (capacity - 150)) < 1e-9);

        assert(pages[1].blocks.size() == 4);
        assert(pages[1].blocks[0].block.record_id == "R-2");
        assert(pages[1].blocks[0].block.kind == BlockKind::Description);
        assert(pages[1].blocks[0].top == 0);
        assert(pages[1].blocks[1].block.kind == BlockKind::Image);
        assert(pages[1].blocks[2].block.kind == BlockKind::Image);
        assert(pages[1].blocks[3].block.record_id == "R-3");
        assert(pages[1].blocks[3].top == 120 + 200 + 200);
    }

    // an exact fit stays on the page
    {
        const auto pages = paginate({block("a", capacity / 2), block("b", capacity / 2)}, letter, running);
        assert(pages.size() == 1);
    }

    // a block taller than a page sits alone
    {
        const auto pages = paginate({block("a", 100), block("big", capacity + 200), block("c", 100)},
                                    letter, running);
        assert(pages.size() == 3);
        assert(pages[1].blocks.size() == 1);
        assert(pages[1].blocks[0].block.record_id == "big");
        assert(pages[1].oversized(letter));
        assert(!pages[0].oversized(letter));
        assert(pages[2].blocks[0].block.record_id == "c");
    }
    {
        const auto pages = paginate({block("big", capacity * 2), block("small", 10)}, letter, running);
        assert(pages.size() == 2);
    }

    // page count depends only on the blocks and the geometry
    {
        std::vector<PageBlock> blocks;
        for (int i = 0; i < 40; ++i) blocks.push_back(block(std::to_string(i), 37.5 + (i % 7) * 21));
        assert(paginate(blocks, letter, running).size() == paginate(blocks, letter, nullptr).size());
        assert(paginate(blocks, PageGeometry::a4(), running).size() <= paginate(blocks, letter, running).size());
    }
    return 0;
}
