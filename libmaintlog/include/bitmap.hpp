/**
 * @file bitmap.hpp
 * @brief In-memory 8-bit raster plus the cooperative deadline used while decoding.
 */

#ifndef MAINTLOG_BITMAP_HPP
#define MAINTLOG_BITMAP_HPP

#include "report_error.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace maintlog {

/**
 * @brief Interleaved 8-bit pixels, row-major, no padding.
 *
 * channels is 1 (gray), 3 (RGB) or 4 (RGBA).
 */
struct Bitmap {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] size_t row_bytes() const noexcept {
        return static_cast<size_t>(width) * static_cast<size_t>(channels);
    }

    [[nodiscard]] bool empty() const noexcept { return width <= 0 || height <= 0; }

    /// @brief Allocates a zeroed buffer of the given shape.
    void allocate(const int w, const int h, const int c) {
        width = w;
        height = h;
        channels = c;
        pixels.assign(row_bytes() * static_cast<size_t>(h), 0);
    }

    [[nodiscard]] std::uint8_t* row(const int y) noexcept {
        return pixels.data() + static_cast<size_t>(y) * row_bytes();
    }

    [[nodiscard]] const std::uint8_t* row(const int y) const noexcept {
        return pixels.data() + static_cast<size_t>(y) * row_bytes();
    }
};

/**
 * @brief Rejects a declared raster size before anything is allocated for it.
 * @throws ReportError (DecodeFailed) for a zero side or more than max_pixels pixels.
 */
inline void check_pixel_limit(const std::uint64_t width, const std::uint64_t height,
                              const std::uint64_t max_pixels) {
    if (width == 0 || height == 0) {
        throw ReportError(ErrorKind::DecodeFailed, "image has no pixels");
    }
    if (width > max_pixels / height) {
        throw ReportError(ErrorKind::DecodeFailed,
                          std::to_string(width) + "x" + std::to_string(height) +
                          " exceeds the decode limit of " + std::to_string(max_pixels) + " pixels");
    }
}

/**
 * @brief Time budget of a single attachment.
 *
 * Decoders, transforms and the encoder call check() between rows; an
 * expired budget raises ReportError(DecodeFailed, "timed out").
 */
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    /// @brief A deadline that never expires.
    Deadline() = default;

    explicit Deadline(const std::chrono::milliseconds budget)
        : limit_(clock::now() + budget), bounded_(true) {}

    [[nodiscard]] bool expired() const noexcept {
        return bounded_ && clock::now() >= limit_;
    }

    /// @throws ReportError (DecodeFailed) once the budget is exhausted.
    void check() const {
        if (expired()) {
            throw ReportError(ErrorKind::DecodeFailed, "timed out");
        }
    }

private:
    clock::time_point limit_{};
    bool bounded_ = false;
};

} // namespace maintlog

#endif // MAINTLOG_BITMAP_HPP
