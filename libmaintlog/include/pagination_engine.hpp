/**
 * @file pagination_engine.hpp
 * @brief Greedy-fill placement of page blocks onto fixed-size pages.
 */

#ifndef MAINTLOG_PAGINATION_ENGINE_HPP
#define MAINTLOG_PAGINATION_ENGINE_HPP

#include "image_normalizer.hpp"
#include "page_block.hpp"
#include "report_config.hpp"
#include <memory>
#include <string>
#include <vector>

namespace maintlog {

/**
 * @brief Data repeated on every page (header band and footer band).
 */
struct RunningContent {
    std::string organization;
    std::string department;
    std::string report_title;
    std::string generated_at;                     ///< Already formatted for display
    std::shared_ptr<const NormalizedImage> logo;  ///< nullptr when no usable logo
};

/**
 * @brief A block with its vertical offset from the top of the content area.
 */
struct PlacedBlock {
    PageBlock block;
    double top = 0;
};

struct Page {
    size_t number = 0; ///< 1-based
    size_t total = 0;
    std::vector<PlacedBlock> blocks;
    std::shared_ptr<const RunningContent> running;

    /// @return true if a block on this page is taller than the content area.
    [[nodiscard]] bool oversized(const PageGeometry& geometry) const noexcept;
};

/**
 * @brief Places blocks in input order, starting a new page whenever the
 * next block does not fit in the remaining space.
 *
 * @details A block taller than the content area gets a page of its own,
 * and the block after it starts a new page. Blocks are never split.
 *
 * @param blocks Blocks in report order.
 * @param geometry Page geometry; only content_height() is used.
 * @param running Running header/footer data stamped on every page.
 * @return Pages numbered 1..N with total N; empty for no blocks.
 */
[[nodiscard]] std::vector<Page> paginate(const std::vector<PageBlock>& blocks,
                                         const PageGeometry& geometry,
                                         std::shared_ptr<const RunningContent> running);

} // namespace maintlog

#endif // MAINTLOG_PAGINATION_ENGINE_HPP
