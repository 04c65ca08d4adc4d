#include "../../include/image_transform.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace maintlog {

Bitmap apply_orientation(Bitmap src, const int orientation, const Deadline& deadline) {
    if (orientation <= 1 || orientation > 8 || src.empty()) return src;

    const int w = src.width;
    const int h = src.height;
    const int c = src.channels;
    const bool swap = orientation >= 5;

    Bitmap out;
    out.allocate(swap ? h : w, swap ? w : h, c);

    for (int y = 0; y < out.height; ++y) {
        deadline.check();
        std::uint8_t* dst = out.row(y);
        for (int x = 0; x < out.width; ++x) {
            int sx = x, sy = y;
            switch (orientation) {
                case 2: sx = w - 1 - x; sy = y;         break; // mirror horizontal
                case 3: sx = w - 1 - x; sy = h - 1 - y; break; // rotate 180
                case 4: sx = x;         sy = h - 1 - y; break; // mirror vertical
                case 5: sx = y;         sy = x;         break; // transpose
                case 6: sx = y;         sy = h - 1 - x; break; // rotate 90 cw
                case 7: sx = w - 1 - y; sy = h - 1 - x; break; // transverse
                case 8: sx = w - 1 - y; sy = x;         break; // rotate 90 ccw
                default: break;
            }
            std::memcpy(dst + static_cast<size_t>(x) * c, src.row(sy) + static_cast<size_t>(sx) * c,
                        static_cast<size_t>(c));
        }
    }
    return out;
}

std::pair<int, int> fit_within(const int width, const int height, const int max_dimension) noexcept {
    const int longest = std::max(width, height);
    if (longest <= max_dimension || longest <= 0) return {width, height};
    const double scale = static_cast<double>(max_dimension) / static_cast<double>(longest);
    const int w = std::max(1, static_cast<int>(std::lround(width * scale)));
    const int h = std::max(1, static_cast<int>(std::lround(height * scale)));
    return {std::min(w, max_dimension), std::min(h, max_dimension)};
}

Bitmap downscale_box(const Bitmap& src, const int target_width, const int target_height,
                     const Deadline& deadline) {
    if (target_width <= 0 || target_height <= 0 ||
        target_width > src.width || target_height > src.height) {
        throw std::invalid_argument("downscale_box: target must be within the source size");
    }
    if (target_width == src.width && target_height == src.height) return src;

    const int c = src.channels;
    Bitmap out;
    out.allocate(target_width, target_height, c);

    // source column span of every output column
    std::vector<int> x0(static_cast<size_t>(target_width)), x1(static_cast<size_t>(target_width));
    for (int x = 0; x < target_width; ++x) {
        const auto lo = static_cast<int>(static_cast<long long>(x) * src.width / target_width);
        const auto hi = static_cast<int>(static_cast<long long>(x + 1) * src.width / target_width);
        x0[static_cast<size_t>(x)] = lo;
        x1[static_cast<size_t>(x)] = std::max(lo + 1, hi);
    }

    std::vector<std::uint32_t> acc(static_cast<size_t>(target_width) * c);
    for (int y = 0; y < target_height; ++y) {
        deadline.check();
        const auto sy0 = static_cast<int>(static_cast<long long>(y) * src.height / target_height);
        const auto sy1 = std::max(sy0 + 1,
            static_cast<int>(static_cast<long long>(y + 1) * src.height / target_height));

        std::fill(acc.begin(), acc.end(), 0u);
        for (int sy = sy0; sy < sy1; ++sy) {
            const std::uint8_t* row = src.row(sy);
            for (int x = 0; x < target_width; ++x) {
                std::uint32_t* a = acc.data() + static_cast<size_t>(x) * c;
                for (int sx = x0[static_cast<size_t>(x)]; sx < x1[static_cast<size_t>(x)]; ++sx) {
                    const std::uint8_t* p = row + static_cast<size_t>(sx) * c;
                    for (int k = 0; k < c; ++k) a[k] += p[k];
                }
            }
        }

        std::uint8_t* dst = out.row(y);
        const std::uint32_t rows = static_cast<std::uint32_t>(sy1 - sy0);
        for (int x = 0; x < target_width; ++x) {
            const std::uint32_t count = rows *
                static_cast<std::uint32_t>(x1[static_cast<size_t>(x)] - x0[static_cast<size_t>(x)]);
            const std::uint32_t* a = acc.data() + static_cast<size_t>(x) * c;
            for (int k = 0; k < c; ++k) {
                dst[static_cast<size_t>(x) * c + k] = static_cast<std::uint8_t>((a[k] + count / 2) / count);
            }
        }
    }
    return out;
}

Bitmap flatten_alpha(Bitmap src, const Deadline& deadline) {
    if (src.channels != 4) return src;

    Bitmap out;
    out.allocate(src.width, src.height, 3);
    for (int y = 0; y < src.height; ++y) {
        deadline.check();
        const std::uint8_t* in = src.row(y);
        std::uint8_t* dst = out.row(y);
        for (int x = 0; x < src.width; ++x) {
            const unsigned a = in[4 * x + 3];
            for (int k = 0; k < 3; ++k) {
                // white background: c*a + 255*(1-a)
                dst[3 * x + k] = static_cast<std::uint8_t>((in[4 * x + k] * a + 255u * (255u - a) + 127u) / 255u);
            }
        }
    }
    return out;
}

} // namespace maintlog
