#include "../../include/report_config.hpp"
#include "../../include/text_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace maintlog {

std::string canonical_mime(const std::string_view mime) {
    std::string lower = to_lower_copy(trim(mime));
    // drop parameters such as "; charset=binary"
    if (const auto semi = lower.find(';'); semi != std::string::npos) {
        lower = std::string(trim(std::string_view(lower).substr(0, semi)));
    }
    if (lower == "image/jpg" || lower == "image/pjpeg") return "image/jpeg";
    if (lower == "image/x-png") return "image/png";
    if (lower == "image/x-webp") return "image/webp";
    return lower;
}

bool ReportConfig::is_supported_mime(const std::string_view mime) const {
    const std::string canonical = canonical_mime(mime);
    return std::ranges::any_of(supported_mime_types, [&](const std::string& m) {
        return canonical_mime(m) == canonical;
    });
}

void ReportConfig::validate() const {
    if (max_attachment_bytes == 0)
        throw std::invalid_argument("max_attachment_bytes must be positive");
    if (max_image_dimension < 16)
        throw std::invalid_argument("max_image_dimension must be at least 16 px");
    if (logo_max_dimension < 16)
        throw std::invalid_argument("logo_max_dimension must be at least 16 px");
    if (jpeg_quality < 1 || jpeg_quality > 100)
        throw std::invalid_argument("jpeg_quality must be within 1..100");
    if (max_decoded_pixels < 256)
        throw std::invalid_argument("max_decoded_pixels must be at least 256");
    if (attachment_timeout.count() <= 0)
        throw std::invalid_argument("attachment_timeout must be positive");
    if (page.content_width() < 144.0)
        throw std::invalid_argument("page content width must be at least 2 inch");
    if (page.content_height() < 144.0)
        throw std::invalid_argument("page content height must be at least 2 inch");
    if (image_box_height <= 0.0)
        throw std::invalid_argument("image_box_height must be positive");
    if (supported_mime_types.empty())
        throw std::invalid_argument("supported_mime_types must not be empty");
}

} // namespace maintlog
