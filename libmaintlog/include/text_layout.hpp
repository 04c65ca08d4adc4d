/**
 * @file text_layout.hpp
 * @brief Standard-14 Helvetica metrics, WinAnsi encoding and line wrapping.
 *
 * Measurements use the Adobe font metrics of the two base fonts the
 * assembler registers, so text measured here lays out identically in the
 * written PDF.
 */

#ifndef MAINTLOG_TEXT_LAYOUT_HPP
#define MAINTLOG_TEXT_LAYOUT_HPP

#include <string>
#include <string_view>
#include <vector>

namespace maintlog {

    enum class Font {
        Regular, ///< Helvetica
        Bold     ///< Helvetica-Bold
    };

    /// @return PDF BaseFont name ("Helvetica", "Helvetica-Bold").
    [[nodiscard]] std::string_view base_font_name(Font font) noexcept;

    /// @return Resource name used in content streams ("F1", "F2").
    [[nodiscard]] std::string_view font_resource_name(Font font) noexcept;

    /**
     * @brief Transcodes UTF-8 to WinAnsiEncoding (CP-1252).
     *
     * Code points without a WinAnsi glyph and malformed sequences become '?'.
     * Tabs become a space, other control characters except '\n' are dropped.
     */
    [[nodiscard]] std::string encode_win_ansi(std::string_view utf8);

    /**
     * @brief Width of WinAnsi-encoded text in points.
     * @param encoded Text produced by encode_win_ansi().
     * @param font Font face.
     * @param size Font size in points.
     */
    [[nodiscard]] double measure_text(std::string_view encoded, Font font, double size) noexcept;

    /**
     * @brief Greedy word wrap.
     *
     * Explicit '\n' breaks are preserved (an empty paragraph yields an empty
     * line). Words wider than max_width are broken between characters.
     *
     * @param utf8 Source text.
     * @param font Font face.
     * @param size Font size in points.
     * @param max_width Available width in points.
     * @return WinAnsi-encoded lines, each no wider than max_width
     * (a single glyph wider than max_width still gets its own line).
     */
    [[nodiscard]] std::vector<std::string> wrap_text(std::string_view utf8, Font font,
                                                     double size, double max_width);

    /**
     * @brief Shortens encoded text to fit max_width, appending "..." when cut.
     */
    [[nodiscard]] std::string truncate_to_width(std::string_view encoded, Font font,
                                                double size, double max_width);

    /// @brief Escapes '(', ')' and '\' for a PDF literal string.
    [[nodiscard]] std::string escape_pdf_string(std::string_view encoded);

} // namespace maintlog

#endif // MAINTLOG_TEXT_LAYOUT_HPP
