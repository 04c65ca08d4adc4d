/**
 * @file decoder_registry.hpp
 * @brief Defines the registry for discovering IImageDecoder instances.
 */

#ifndef MAINTLOG_DECODER_REGISTRY_HPP
#define MAINTLOG_DECODER_REGISTRY_HPP

#include "image_decoder.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace maintlog {

/**
 * @brief Registry of all available image decoders.
 *
 * @details The DecoderRegistry owns the concrete IImageDecoder
 * implementations and resolves a canonical MIME type to one of them.
 * Decoders are stateless, so one registry is shared read-only by every
 * normalization worker of an export.
 */
class DecoderRegistry {
public:
    /**
     * @brief Construct and register the built-in decoders
     * (JpegDecoder, PngDecoder, WebpDecoder).
     */
    DecoderRegistry();

    /**
     * @brief Find the decoder for a MIME type.
     * @param mime Canonical MIME type (e.g. "image/png").
     * @return Non-owning pointer, or nullptr when no decoder handles it.
     */
    [[nodiscard]] const IImageDecoder* find_by_mime(std::string_view mime) const;

    /**
     * @brief Access all registered decoders.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<IImageDecoder>>& all() const { return decoders_; }

private:
    ///< Owned instances of all registered decoders.
    std::vector<std::unique_ptr<IImageDecoder>> decoders_;
};

} // namespace maintlog

#endif // MAINTLOG_DECODER_REGISTRY_HPP
