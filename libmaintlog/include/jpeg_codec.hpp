/**
 * @file jpeg_codec.hpp
 * @brief libjpeg based JPEG decoder, encoder and header probe.
 */

#ifndef MAINTLOG_JPEG_CODEC_HPP
#define MAINTLOG_JPEG_CODEC_HPP

#include "image_decoder.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace maintlog {

    /**
     * @brief Implements IImageDecoder for JPEG files using libjpeg.
     *
     * @details Baseline, progressive, grayscale and Adobe CMYK/YCCK files are
     * decoded to gray or RGB. APP1 markers are saved so the EXIF orientation
     * can be reported to the normalizer.
     */
    class JpegDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/jpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] DecodedImage decode(std::span<const std::uint8_t> data,
                                          const Deadline& deadline,
                                          size_t max_pixels) const override;
    };

    /**
     * @brief Dimensions and color layout read from a JPEG header.
     */
    struct JpegInfo {
        int width = 0;
        int height = 0;
        int components = 0; ///< 1 (gray), 3 (YCbCr/RGB) or 4 (CMYK)
    };

    /**
     * @brief Reads only the JPEG header.
     * @throws std::runtime_error if the data is not a readable JPEG stream.
     */
    [[nodiscard]] JpegInfo probe_jpeg(std::span<const std::uint8_t> data);

    /**
     * @brief Encodes a gray or RGB bitmap as a baseline JPEG.
     * @param bitmap 1 or 3 channel raster.
     * @param quality libjpeg quality 1..100.
     * @param deadline Time budget, checked between rows.
     * @throws std::invalid_argument for other channel counts.
     * @throws ReportError (DecodeFailed) on libjpeg failure or an expired deadline.
     */
    [[nodiscard]] std::vector<std::uint8_t> encode_jpeg(const Bitmap& bitmap,
                                                        int quality,
                                                        const Deadline& deadline = {});

    /**
     * @brief Extracts the orientation tag (0x0112) from an EXIF APP1 payload.
     * @param app1 Marker payload starting with "Exif\0\0".
     * @return 1..8, or 1 when absent or malformed.
     */
    [[nodiscard]] int exif_orientation(std::span<const std::uint8_t> app1) noexcept;

} // namespace maintlog

#endif // MAINTLOG_JPEG_CODEC_HPP
