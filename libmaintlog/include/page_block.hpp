/**
 * @file page_block.hpp
 * @brief Measured units of report content and the drawing operations they hold.
 *
 * Block coordinates are local: origin at the block's top-left corner, x to
 * the right, y downwards, in points. The assembler translates them to PDF
 * user space once the block has a position on a page.
 */

#ifndef MAINTLOG_PAGE_BLOCK_HPP
#define MAINTLOG_PAGE_BLOCK_HPP

#include "image_normalizer.hpp"
#include "text_layout.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace maintlog {

/**
 * @brief Device RGB color, components in 0..1.
 */
struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    /// @brief Builds a color from 0xRRGGBB.
    static constexpr Color hex(const unsigned rgb) {
        return {((rgb >> 16) & 0xFF) / 255.0, ((rgb >> 8) & 0xFF) / 255.0, (rgb & 0xFF) / 255.0};
    }

    bool operator==(const Color&) const = default;
};

namespace palette {
    inline constexpr Color primary = Color::hex(0x003366);
    inline constexpr Color secondary = Color::hex(0x0066CC);
    inline constexpr Color light_gray = Color::hex(0xF5F5F5);
    inline constexpr Color medium_gray = Color::hex(0xE0E0E0);
    inline constexpr Color dark_gray = Color::hex(0x333333);
    inline constexpr Color white = Color::hex(0xFFFFFF);
} // namespace palette

struct FilledRect {
    double x = 0, y = 0, width = 0, height = 0;
    Color color;

    bool operator==(const FilledRect&) const = default;
};

struct StrokedRect {
    double x = 0, y = 0, width = 0, height = 0;
    Color color;
    double line_width = 0.5;

    bool operator==(const StrokedRect&) const = default;
};

/**
 * @brief One line of text. text is WinAnsi-encoded, baseline is the
 * distance from the block top to the glyph baseline.
 */
struct TextRun {
    double x = 0, baseline = 0;
    Font font = Font::Regular;
    double size = 10;
    Color color;
    std::string text;

    bool operator==(const TextRun&) const = default;
};

/**
 * @brief A normalized photo drawn into a rectangle.
 *
 * Equality compares the image content, not the pointer.
 */
struct ImagePlacement {
    double x = 0, y = 0, width = 0, height = 0;
    std::shared_ptr<const NormalizedImage> image;

    bool operator==(const ImagePlacement& other) const {
        if (x != other.x || y != other.y || width != other.width || height != other.height) return false;
        if (image == other.image) return true;
        return image && other.image && *image == *other.image;
    }
};

using DrawOp = std::variant<FilledRect, StrokedRect, TextRun, ImagePlacement>;

enum class BlockKind {
    Title,        ///< Report title banner and summary line
    RecordHeader, ///< Record banner, info table, summary and location sections
    Description,  ///< Detailed description (long text continues in further blocks)
    Image         ///< One photo with its caption
};

/**
 * @brief A self-contained, measured unit of content. Never split across pages.
 */
struct PageBlock {
    BlockKind kind = BlockKind::Title;
    std::string record_id; ///< Empty for the title block
    double height = 0;     ///< Includes the spacing below the block
    std::vector<DrawOp> ops;

    bool operator==(const PageBlock&) const = default;
};

} // namespace maintlog

#endif // MAINTLOG_PAGE_BLOCK_HPP
