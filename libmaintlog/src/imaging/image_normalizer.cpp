#include "../../include/image_normalizer.hpp"
#include "../../include/image_transform.hpp"
#include "../../include/jpeg_codec.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include <new>
#include <string>

namespace maintlog {

Outcome<NormalizedImage> ImageNormalizer::normalize(const Attachment& attachment,
                                                    const size_t source_index,
                                                    const int max_dimension) const {
    const Deadline deadline(config_.attachment_timeout);
    return normalize(attachment, source_index, max_dimension, deadline);
}

Outcome<NormalizedImage> ImageNormalizer::normalize(const Attachment& attachment,
                                                    const size_t source_index,
                                                    const int max_dimension,
                                                    const Deadline& deadline) const {
    try {
        return run(attachment, source_index, max_dimension, deadline);
    } catch (const ReportError& e) {
        Logger::log(LogLevel::Debug, "Attachment " + std::to_string(source_index) +
                    " rejected: " + std::string(to_string(e.kind())) + ": " + e.what(),
                    "image_normalizer");
        return e;
    } catch (const std::bad_alloc&) {
        return ReportError(ErrorKind::DecodeFailed, "out of memory");
    } catch (const std::exception& e) {
        return ReportError(ErrorKind::DecodeFailed, e.what());
    }
}

NormalizedImage ImageNormalizer::run(const Attachment& attachment, const size_t source_index,
                                     const int max_dimension, const Deadline& deadline) const {
    if (attachment.size() > config_.max_attachment_bytes) {
        throw ReportError(ErrorKind::AttachmentTooLarge,
                          std::to_string(attachment.size()) + " bytes exceeds the limit of " +
                          std::to_string(config_.max_attachment_bytes));
    }

    const std::string declared = canonical_mime(attachment.mime_type);
    if (!config_.is_supported_mime(declared)) {
        throw ReportError(ErrorKind::UnsupportedFormat,
                          "unsupported type '" + attachment.mime_type + "'");
    }
    if (attachment.bytes.empty()) {
        throw ReportError(ErrorKind::DecodeFailed, "empty attachment");
    }

    // content wins over the declared type when both are supported images
    std::string effective = declared;
    const std::string sniffed = MimeDetector::detect(attachment.bytes);
    if (sniffed != declared && sniffed.starts_with("image/")) {
        if (!config_.is_supported_mime(sniffed)) {
            throw ReportError(ErrorKind::UnsupportedFormat,
                              "content is '" + sniffed + "', declared '" + attachment.mime_type + "'");
        }
        Logger::log(LogLevel::Debug, "Declared " + declared + " but content is " + sniffed,
                    "image_normalizer");
        effective = sniffed;
    }

    const IImageDecoder* decoder = registry_.find_by_mime(effective);
    if (!decoder) {
        throw ReportError(ErrorKind::UnsupportedFormat, "no decoder for '" + effective + "'");
    }

    deadline.check();
    DecodedImage decoded = decoder->decode(attachment.bytes, deadline, config_.max_decoded_pixels);
    if (decoded.bitmap.empty()) {
        throw ReportError(ErrorKind::DecodeFailed, "image has no pixels");
    }
    const int source_width = decoded.bitmap.width;
    const int source_height = decoded.bitmap.height;

    Bitmap bitmap = apply_orientation(std::move(decoded.bitmap), decoded.orientation, deadline);

    const auto [target_w, target_h] = fit_within(bitmap.width, bitmap.height, max_dimension);
    if (target_w != bitmap.width || target_h != bitmap.height) {
        bitmap = downscale_box(bitmap, target_w, target_h, deadline);
    }
    bitmap = flatten_alpha(std::move(bitmap), deadline);

    NormalizedImage out;
    out.jpeg = encode_jpeg(bitmap, config_.jpeg_quality, deadline);
    out.width = bitmap.width;
    out.height = bitmap.height;
    out.components = bitmap.channels;
    out.source_index = source_index;

    Logger::log(LogLevel::Debug,
                std::string(decoder->get_name()) + ": " + std::to_string(source_width) + "x" +
                std::to_string(source_height) + " -> " + std::to_string(out.width) + "x" +
                std::to_string(out.height) + " (orientation " + std::to_string(decoded.orientation) +
                ", " + std::to_string(out.jpeg.size()) + " bytes)",
                "image_normalizer");
    return out;
}

} // namespace maintlog
