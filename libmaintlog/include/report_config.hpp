/**
 * @file report_config.hpp
 * @brief Explicit configuration threaded through every pipeline stage.
 */

#ifndef MAINTLOG_REPORT_CONFIG_HPP
#define MAINTLOG_REPORT_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace maintlog {

/**
 * @brief Physical page layout in PDF points (1/72 inch).
 */
struct PageGeometry {
    double width = 612.0;          ///< US Letter
    double height = 792.0;
    double margin = 43.2;          ///< 0.6 inch on every side
    double header_height = 56.0;   ///< Running header band (logo, organization)
    double footer_height = 28.0;   ///< Running footer band (timestamp, page number)

    [[nodiscard]] double content_width() const noexcept { return width - 2.0 * margin; }

    [[nodiscard]] double content_height() const noexcept {
        return height - 2.0 * margin - header_height - footer_height;
    }

    /// @return US Letter geometry (the default).
    static PageGeometry letter() { return {}; }

    /// @return ISO A4 geometry with the same margins and bands.
    static PageGeometry a4() {
        PageGeometry g;
        g.width = 595.28;
        g.height = 841.89;
        return g;
    }
};

/**
 * @brief Limits and layout settings of one export.
 */
struct ReportConfig {
    size_t max_attachment_bytes = 5u * 1024u * 1024u;
    size_t max_attachments_per_record = 5;
    int max_image_dimension = 1600;
    int logo_max_dimension = 400;
    int jpeg_quality = 85;
    size_t max_decoded_pixels = 50'000'000; ///< Declared width x height accepted by a decoder
    std::chrono::milliseconds attachment_timeout{5000};
    unsigned worker_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
    std::vector<std::string> supported_mime_types = {"image/jpeg", "image/png", "image/webp"};

    size_t max_title_length = 200;
    size_t max_location_length = 200;
    size_t max_author_length = 200;
    size_t max_description_length = 5000;

    PageGeometry page;
    double image_box_height = 360.0; ///< Maximum rendered photo height (5 inch)

    /**
     * @brief Checks a declared MIME type against supported_mime_types.
     *
     * "image/jpg" and "image/pjpeg" are treated as "image/jpeg".
     */
    [[nodiscard]] bool is_supported_mime(std::string_view mime) const;

    /**
     * @brief Validates internal consistency (positive limits, page larger than margins).
     * @throws std::invalid_argument describing the first inconsistent value.
     */
    void validate() const;
};

/// @return The canonical spelling of a MIME alias ("image/jpg" -> "image/jpeg").
[[nodiscard]] std::string canonical_mime(std::string_view mime);

} // namespace maintlog

#endif // MAINTLOG_REPORT_CONFIG_HPP
