/**
 * @file png_decoder.hpp
 * @brief Defines the IImageDecoder implementation for PNG files using libpng.
 */

#ifndef MAINTLOG_PNG_DECODER_HPP
#define MAINTLOG_PNG_DECODER_HPP

#include "image_decoder.hpp"
#include <array>
#include <span>
#include <string_view>

namespace maintlog {

    /**
     * @brief Implements IImageDecoder for PNG files using libpng.
     *
     * @details Palette, low bit depth and 16-bit images are expanded to
     * 8 bits per sample. Gray stays single-channel unless it carries alpha,
     * in which case the output is RGBA. Interlaced files are supported.
     */
    class PngDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] DecodedImage decode(std::span<const std::uint8_t> data,
                                          const Deadline& deadline,
                                          size_t max_pixels) const override;
    };

} // namespace maintlog

#endif // MAINTLOG_PNG_DECODER_HPP
