/**
 * @file image_transform.hpp
 * @brief Raster operations applied between decoding and re-encoding.
 */

#ifndef MAINTLOG_IMAGE_TRANSFORM_HPP
#define MAINTLOG_IMAGE_TRANSFORM_HPP

#include "bitmap.hpp"
#include <utility>

namespace maintlog {

    /**
     * @brief Rotates/mirrors a bitmap so that it displays upright.
     * @param src Decoded raster.
     * @param orientation EXIF orientation 1..8; other values are treated as 1.
     * @param deadline Checked once per output row.
     * @return The upright raster (width and height swapped for 5..8).
     */
    [[nodiscard]] Bitmap apply_orientation(Bitmap src, int orientation, const Deadline& deadline);

    /**
     * @brief Computes the downscaled size whose longest side is max_dimension.
     *
     * Aspect ratio is preserved, sides are rounded to the nearest pixel and
     * never drop below 1. Sizes already within the bound are returned as is.
     */
    [[nodiscard]] std::pair<int, int> fit_within(int width, int height, int max_dimension) noexcept;

    /**
     * @brief Area-averaging (box filter) downscale.
     * @pre target_width <= src.width and target_height <= src.height.
     * @throws std::invalid_argument if the target is larger than the source.
     */
    [[nodiscard]] Bitmap downscale_box(const Bitmap& src, int target_width, int target_height,
                                       const Deadline& deadline);

    /**
     * @brief Composites an RGBA raster onto an opaque white background.
     * @return An RGB raster; inputs without alpha are returned unchanged.
     */
    [[nodiscard]] Bitmap flatten_alpha(Bitmap src, const Deadline& deadline);

} // namespace maintlog

#endif // MAINTLOG_IMAGE_TRANSFORM_HPP
