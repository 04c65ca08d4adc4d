/**
 * @file image_decoder.hpp
 * @brief Interface of a format-specific attachment decoder.
 */

#ifndef MAINTLOG_IMAGE_DECODER_HPP
#define MAINTLOG_IMAGE_DECODER_HPP

#include "bitmap.hpp"
#include <cstdint>
#include <span>
#include <string_view>

namespace maintlog {

/**
 * @brief Raster produced by a decoder plus the orientation it declared.
 */
struct DecodedImage {
    Bitmap bitmap;
    int orientation = 1; ///< EXIF orientation 1..8 (1 = upright)
};

/**
 * @brief Interface for an image decoding module.
 *
 * Each implementation targets one image format and is self-descriptive
 * about the MIME types it handles. Implementations are stateless so the
 * DecoderRegistry can share one instance across normalization workers.
 */
class IImageDecoder {
public:
    virtual ~IImageDecoder() = default;

    // --- self-description ---

    /// @return Human-readable name of the decoder (e.g. "JpegDecoder").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decode an in-memory file to 8-bit gray, RGB or RGBA pixels.
     * @param data Complete file content.
     * @param deadline Time budget, checked between rows.
     * @param max_pixels Largest width x height accepted; checked against the
     *        header before the raster is allocated.
     * @throws ReportError (DecodeFailed) on corrupt data, an oversized raster
     *         or an expired deadline.
     */
    [[nodiscard]] virtual DecodedImage decode(std::span<const std::uint8_t> data,
                                              const Deadline& deadline,
                                              size_t max_pixels) const = 0;
};

} // namespace maintlog

#endif // MAINTLOG_IMAGE_DECODER_HPP
