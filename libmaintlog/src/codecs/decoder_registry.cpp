#include "../../include/decoder_registry.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/png_decoder.hpp"
#include "../../include/webp_decoder.hpp"

namespace maintlog {

DecoderRegistry::DecoderRegistry() {
    decoders_.push_back(std::make_unique<JpegDecoder>());
    decoders_.push_back(std::make_unique<PngDecoder>());
    decoders_.push_back(std::make_unique<WebpDecoder>());
}

const IImageDecoder* DecoderRegistry::find_by_mime(const std::string_view mime) const {
    for (const auto& decoder : decoders_) {
        for (const auto supported_mime : decoder->get_supported_mime_types()) {
            if (supported_mime == mime) {
                return decoder.get();
            }
        }
    }
    return nullptr;
}

} // namespace maintlog
