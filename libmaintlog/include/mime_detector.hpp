/**
 * @file mime_detector.hpp
 * @brief Content-based MIME type detection.
 */

#ifndef MAINTLOG_MIME_DETECTOR_HPP
#define MAINTLOG_MIME_DETECTOR_HPP

#include <cstdint>
#include <span>
#include <string>

namespace maintlog {

    /**
     * @brief Detects MIME types from content using libmagic.
     *
     * When the magic database cannot be loaded, detection falls back to the
     * signatures of the image formats the pipeline decodes.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of an in-memory buffer.
         * @param data File content.
         * @return A MIME type (e.g. "image/jpeg"), canonicalized, or
         * "application/octet-stream" when unknown.
         */
        static std::string detect(std::span<const std::uint8_t> data);

        /**
         * @brief Matches the JPEG, PNG and WebP signatures only.
         * @return The MIME type, or an empty string when none matches.
         */
        static std::string sniff_signature(std::span<const std::uint8_t> data);
    };

} // namespace maintlog

#endif // MAINTLOG_MIME_DETECTOR_HPP
