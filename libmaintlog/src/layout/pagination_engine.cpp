#include "../../include/pagination_engine.hpp"
#include "../../include/logger.hpp"

namespace maintlog {

bool Page::oversized(const PageGeometry& geometry) const noexcept {
    for (const auto& placed : blocks) {
        if (placed.block.height > geometry.content_height()) return true;
    }
    return false;
}

std::vector<Page> paginate(const std::vector<PageBlock>& blocks,
                           const PageGeometry& geometry,
                           std::shared_ptr<const RunningContent> running) {
    std::vector<Page> pages;
    if (blocks.empty()) return pages;

    const double capacity = geometry.content_height();
    double used = 0;
    bool page_closed = true; // no open page yet

    for (const auto& block : blocks) {
        const bool oversized = block.height > capacity;
        if (page_closed || (!pages.back().blocks.empty() && (oversized || used + block.height > capacity))) {
            pages.emplace_back();
            used = 0;
            page_closed = false;
        }
        pages.back().blocks.push_back(PlacedBlock{block, used});
        used += block.height;
        if (oversized) {
            Logger::log(LogLevel::Warning,
                        "Block of record '" + block.record_id + "' is taller than a page (" +
                        std::to_string(static_cast<int>(block.height)) + " pt), placed alone",
                        "pagination");
            page_closed = true;
        }
    }

    const size_t total = pages.size();
    for (size_t i = 0; i < total; ++i) {
        pages[i].number = i + 1;
        pages[i].total = total;
        pages[i].running = running;
    }
    Logger::log(LogLevel::Debug, std::to_string(blocks.size()) + " blocks on " + std::to_string(total) + " pages",
                "pagination");
    return pages;
}

} // namespace maintlog
