/**
 * @file image_normalizer.hpp
 * @brief Converts an attachment into a canonical, PDF-embeddable JPEG.
 */

#ifndef MAINTLOG_IMAGE_NORMALIZER_HPP
#define MAINTLOG_IMAGE_NORMALIZER_HPP

#include "bitmap.hpp"
#include "decoder_registry.hpp"
#include "report_config.hpp"
#include "report_error.hpp"
#include "report_types.hpp"
#include <cstdint>
#include <vector>

namespace maintlog {

/**
 * @brief An attachment after normalization: baseline JPEG, upright,
 * opaque, no side longer than the configured bound.
 */
struct NormalizedImage {
    std::vector<std::uint8_t> jpeg; ///< Baseline JPEG stream (/DCTDecode)
    int width = 0;                  ///< Pixels
    int height = 0;
    int components = 3;             ///< 1 (gray) or 3 (RGB)
    size_t source_index = 0;        ///< Index of the attachment within its record

    bool operator==(const NormalizedImage&) const = default;
};

/**
 * @brief Stateless attachment normalizer.
 *
 * @details Order of checks: byte size (AttachmentTooLarge), declared MIME
 * (UnsupportedFormat), sniffed content type, decoding (DecodeFailed).
 * Then EXIF orientation, box downscale, alpha flattening and JPEG
 * re-encoding. Safe to call concurrently from several threads.
 */
class ImageNormalizer {
public:
    /**
     * @param config Limits of the current export; must outlive the normalizer.
     * @param registry Decoder lookup; must outlive the normalizer.
     */
    ImageNormalizer(const ReportConfig& config, const DecoderRegistry& registry)
        : config_(config), registry_(registry) {}

    /**
     * @brief Normalizes one attachment with a fresh deadline of
     * config.attachment_timeout.
     * @param attachment Source attachment.
     * @param source_index Index recorded in the result.
     * @param max_dimension Longest allowed side in pixels.
     */
    [[nodiscard]] Outcome<NormalizedImage> normalize(const Attachment& attachment,
                                                     size_t source_index,
                                                     int max_dimension) const;

    /// @brief Same as above with a caller-provided deadline.
    [[nodiscard]] Outcome<NormalizedImage> normalize(const Attachment& attachment,
                                                     size_t source_index,
                                                     int max_dimension,
                                                     const Deadline& deadline) const;

private:
    NormalizedImage run(const Attachment& attachment, size_t source_index,
                        int max_dimension, const Deadline& deadline) const;

    const ReportConfig& config_;
    const DecoderRegistry& registry_;
};

} // namespace maintlog

#endif // MAINTLOG_IMAGE_NORMALIZER_HPP
