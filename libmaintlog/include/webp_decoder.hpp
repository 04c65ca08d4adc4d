/**
 * @file webp_decoder.hpp
 * @brief Defines the IImageDecoder implementation for WebP files using libwebp.
 */

#ifndef MAINTLOG_WEBP_DECODER_HPP
#define MAINTLOG_WEBP_DECODER_HPP

#include "image_decoder.hpp"
#include <array>
#include <span>
#include <string_view>

namespace maintlog {

    /**
     * @brief Implements IImageDecoder for still WebP images (lossy and lossless).
     *
     * @details Animated files are rejected. libwebp decodes in one call, so the
     * deadline is only checked before and after decoding.
     */
    class WebpDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] DecodedImage decode(std::span<const std::uint8_t> data,
                                          const Deadline& deadline,
                                          size_t max_pixels) const override;
    };

} // namespace maintlog

#endif // MAINTLOG_WEBP_DECODER_HPP
