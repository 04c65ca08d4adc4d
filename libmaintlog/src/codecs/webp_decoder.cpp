#include "../../include/webp_decoder.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

namespace maintlog {

namespace {

struct WebPDeleter {
    void operator()(std::uint8_t* p) const { if (p) WebPFree(p); }
};

using unique_webp = std::unique_ptr<std::uint8_t, WebPDeleter>;

} // namespace

DecodedImage WebpDecoder::decode(const std::span<const std::uint8_t> data,
                                 const Deadline& deadline,
                                 const size_t max_pixels) const {
    deadline.check();

    // inspect bitstream features
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data.data(), data.size(), &features) != VP8_STATUS_OK) {
        throw ReportError(ErrorKind::DecodeFailed, "WebP feature detection failed");
    }
    if (features.has_animation) {
        throw ReportError(ErrorKind::DecodeFailed, "Animated WebP is not supported");
    }
    check_pixel_limit(static_cast<std::uint64_t>(std::max(features.width, 0)),
                      static_cast<std::uint64_t>(std::max(features.height, 0)), max_pixels);

    Logger::log(LogLevel::Debug,
                std::string("WebP ") + (features.format == 2 ? "lossless" : "lossy") + " " +
                std::to_string(features.width) + "x" + std::to_string(features.height),
                "webp_decoder");

    const int channels = features.has_alpha ? 4 : 3;
    int width = 0, height = 0;
    const unique_webp decoded(features.has_alpha
        ? WebPDecodeRGBA(data.data(), data.size(), &width, &height)
        : WebPDecodeRGB(data.data(), data.size(), &width, &height));
    if (!decoded) {
        throw ReportError(ErrorKind::DecodeFailed, "WebP decode failed");
    }
    deadline.check();

    DecodedImage result;
    result.bitmap.allocate(width, height, channels);
    std::memcpy(result.bitmap.pixels.data(), decoded.get(), result.bitmap.pixels.size());
    return result;
}

} // namespace maintlog
