#include "../../include/record_formatter.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <memory>

namespace maintlog {

namespace {

// layout metrics, points
constexpr double kBlockGap = 12.0;
constexpr double kBannerHeight = 22.0;
constexpr double kTitleBannerHeight = 40.0;
constexpr double kSectionBarHeight = 18.0;
constexpr double kSectionGap = 4.0;
constexpr double kTextInset = 8.0;
constexpr double kInfoRowHeight = 18.0;
constexpr double kInfoLabelWidth = 130.0;
constexpr double kBodySize = 10.0;
constexpr double kBodyLeading = 13.0;
constexpr double kSummarySize = 11.0;
constexpr double kSummaryLeading = 14.0;
constexpr double kCaptionSize = 9.0;

size_t utf8_length(const std::string_view s) noexcept {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](const char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

TextRun centered(const std::string& encoded, const Font font, const double size, const Color color,
                 const double width, const double baseline) {
    const double w = measure_text(encoded, font, size);
    return TextRun{std::max(0.0, (width - w) / 2.0), baseline, font, size, color, encoded};
}

/// Appends a section bar at y and returns the y below it.
double section_bar(std::vector<DrawOp>& ops, const std::string_view label, const double width, const double y) {
    ops.emplace_back(FilledRect{0, y, width, kSectionBarHeight, palette::light_gray});
    ops.emplace_back(FilledRect{0, y, 3, kSectionBarHeight, palette::primary});
    ops.emplace_back(TextRun{kTextInset, y + 12.5, Font::Bold, 10, palette::primary,
                             encode_win_ansi(label)});
    return y + kSectionBarHeight + kSectionGap;
}

/// Appends wrapped lines starting at y and returns the y below them.
double paragraph(std::vector<DrawOp>& ops, const std::vector<std::string>& lines, const Font font,
                 const double size, const double leading, const double y) {
    double line_top = y;
    for (const auto& line : lines) {
        if (!line.empty()) {
            ops.emplace_back(TextRun{kTextInset, line_top + size, font, size, palette::dark_gray, line});
        }
        line_top += leading;
    }
    return line_top;
}

std::optional<ReportError> invalid(const LogRecord& record, const std::string& reason) {
    return ReportError(ErrorKind::InvalidRecord, "record " + record.id + ": " + reason);
}

} // namespace

std::optional<ReportError> RecordFormatter::validate(const LogRecord& record) const {
    if (trim(record.id).empty()) {
        return ReportError(ErrorKind::InvalidRecord, "record without id");
    }
    if (trim(record.title).empty()) return invalid(record, "title is empty");
    if (utf8_length(record.title) > config_.max_title_length) {
        return invalid(record, "title exceeds " + std::to_string(config_.max_title_length) + " characters");
    }
    if (trim(record.description).empty()) return invalid(record, "description is empty");
    if (utf8_length(record.description) > config_.max_description_length) {
        return invalid(record, "description exceeds " + std::to_string(config_.max_description_length) +
                               " characters");
    }
    if (utf8_length(record.location) > config_.max_location_length) {
        return invalid(record, "location exceeds " + std::to_string(config_.max_location_length) + " characters");
    }
    if (utf8_length(record.created_by) > config_.max_author_length) {
        return invalid(record, "author exceeds " + std::to_string(config_.max_author_length) + " characters");
    }
    if (!parse_category(record.category)) {
        return invalid(record, "unknown category '" + record.category + "'");
    }
    if (!record.created_at) return invalid(record, "creation timestamp is missing");
    if (record.attachments.size() > config_.max_attachments_per_record) {
        return invalid(record, std::to_string(record.attachments.size()) + " attachments exceed the limit of " +
                               std::to_string(config_.max_attachments_per_record));
    }
    return std::nullopt;
}

Outcome<FormattedRecord> RecordFormatter::format(const LogRecord& record,
                                                 const std::vector<Outcome<NormalizedImage>>& images) const {
    if (auto error = validate(record)) {
        return *error;
    }
    if (images.size() != record.attachments.size()) {
        return ReportError(ErrorKind::InvalidRecord,
                           "record " + record.id + ": attachment outcomes do not match attachments");
    }

    FormattedRecord out;
    out.record_id = record.id;
    out.blocks.push_back(header_block(record, *parse_category(record.category)));
    for (auto& block : description_blocks(record)) {
        out.blocks.push_back(std::move(block));
    }

    bool first_image = true;
    for (size_t i = 0; i < images.size(); ++i) {
        if (const auto* image = std::get_if<NormalizedImage>(&images[i])) {
            out.blocks.push_back(image_block(record, *image, i + 1, images.size(), first_image));
            first_image = false;
        } else {
            const auto& error = std::get<ReportError>(images[i]);
            out.warnings.push_back(Warning{record.id, i, error.kind(), error.what()});
        }
    }
    return out;
}

PageBlock RecordFormatter::format_title(const Branding& branding, const size_t incident_count,
                                        const Timestamp generated_at) const {
    const double width = config_.page.content_width();
    PageBlock block;
    block.kind = BlockKind::Title;

    const std::string title = encode_win_ansi(to_upper_copy(branding.report_title));
    block.ops.emplace_back(FilledRect{0, 0, width, kTitleBannerHeight, palette::primary});
    block.ops.emplace_back(centered(truncate_to_width(title, Font::Bold, 16, width - 2 * kTextInset),
                                    Font::Bold, 16, palette::white, width, 26));

    const std::string summary = std::to_string(incident_count) +
                                (incident_count == 1 ? " incident" : " incidents") +
                                " \xC2\xB7 generated " + format_report_time(generated_at);
    block.ops.emplace_back(centered(encode_win_ansi(summary), Font::Regular, 9, palette::dark_gray, width,
                                    kTitleBannerHeight + 16));

    block.height = kTitleBannerHeight + 22 + kBlockGap;
    return block;
}

PageBlock RecordFormatter::header_block(const LogRecord& record, const Category category) const {
    const double width = config_.page.content_width();
    PageBlock block;
    block.kind = BlockKind::RecordHeader;
    block.record_id = record.id;
    auto& ops = block.ops;

    ops.emplace_back(FilledRect{0, 0, width, kBannerHeight, palette::secondary});
    ops.emplace_back(TextRun{kTextInset, 15, Font::Bold, 11, palette::white,
                             truncate_to_width(encode_win_ansi("INCIDENT " + record.id), Font::Bold, 11,
                                               width - 2 * kTextInset)});
    double y = kBannerHeight + 6;

    const std::string author(trim(record.created_by));
    const std::string rows[3][2] = {
        {"Category", to_upper_copy(to_string(category))},
        {"Reported by", author.empty() ? "Not specified" : author},
        {"Date Reported", format_report_time(*record.created_at)},
    };
    for (size_t i = 0; i < 3; ++i) {
        const double ry = y + static_cast<double>(i) * kInfoRowHeight;
        const bool badge = i == 0;
        ops.emplace_back(FilledRect{0, ry, kInfoLabelWidth, kInfoRowHeight, palette::light_gray});
        ops.emplace_back(StrokedRect{0, ry, width, kInfoRowHeight, palette::medium_gray, 0.5});
        ops.emplace_back(TextRun{6, ry + 12, Font::Bold, 9, palette::dark_gray, encode_win_ansi(rows[i][0])});
        const Font value_font = badge ? Font::Bold : Font::Regular;
        ops.emplace_back(TextRun{kInfoLabelWidth + 6, ry + 12, value_font, 9,
                                 badge ? palette::secondary : palette::dark_gray,
                                 truncate_to_width(encode_win_ansi(rows[i][1]), value_font, 9,
                                                   width - kInfoLabelWidth - 12)});
    }
    y += 3 * kInfoRowHeight + 10;

    const double text_width = width - 2 * kTextInset;
    y = section_bar(ops, "ISSUE / REQUEST SUMMARY", width, y);
    y = paragraph(ops, wrap_text(trim(record.title), Font::Bold, kSummarySize, text_width),
                  Font::Bold, kSummarySize, kSummaryLeading, y) + 8;

    const std::string_view location = trim(record.location);
    y = section_bar(ops, "LOCATION / EQUIPMENT IDENTIFICATION", width, y);
    y = paragraph(ops, wrap_text(location.empty() ? "Not specified" : location, Font::Regular, kBodySize,
                                 text_width),
                  Font::Regular, kBodySize, kBodyLeading, y);

    block.height = y + kBlockGap;
    return block;
}

std::vector<PageBlock> RecordFormatter::description_blocks(const LogRecord& record) const {
    const double width = config_.page.content_width();
    const std::vector<std::string> lines =
        wrap_text(record.description, Font::Regular, kBodySize, width - 2 * kTextInset);

    // each block must fit on an empty page
    const double overhead = kSectionBarHeight + kSectionGap + kBlockGap;
    const auto per_block = std::max<size_t>(
        1, static_cast<size_t>(std::floor((config_.page.content_height() - overhead) / kBodyLeading)));

    std::vector<PageBlock> blocks;
    for (size_t start = 0; start < lines.size() || blocks.empty(); start += per_block) {
        const size_t end = std::min(lines.size(), start + per_block);
        PageBlock block;
        block.kind = BlockKind::Description;
        block.record_id = record.id;
        double y = section_bar(block.ops, start == 0 ? "DETAILED DESCRIPTION" : "DETAILED DESCRIPTION (CONTINUED)",
                               width, 0);
        const std::vector<std::string> chunk(lines.begin() + static_cast<std::ptrdiff_t>(start),
                                             lines.begin() + static_cast<std::ptrdiff_t>(end));
        y = paragraph(block.ops, chunk, Font::Regular, kBodySize, kBodyLeading, y);
        block.height = y + kBlockGap;
        blocks.push_back(std::move(block));
        if (end >= lines.size()) break;
    }
    return blocks;
}

PageBlock RecordFormatter::image_block(const LogRecord& record, const NormalizedImage& image,
                                       const size_t photo_number, const size_t photo_total,
                                       const bool first) const {
    const double width = config_.page.content_width();
    PageBlock block;
    block.kind = BlockKind::Image;
    block.record_id = record.id;

    double y = 0;
    if (first) {
        y = section_bar(block.ops, "PHOTOGRAPHIC DOCUMENTATION", width, 0) + 2;
    }

    // 1 px = 1 pt at most, never enlarged
    const double scale = std::min({1.0,
                                   width / static_cast<double>(image.width),
                                   config_.image_box_height / static_cast<double>(image.height)});
    const double w = static_cast<double>(image.width) * scale;
    const double h = static_cast<double>(image.height) * scale;
    const double x = (width - w) / 2.0;

    block.ops.emplace_back(ImagePlacement{x, y, w, h, std::make_shared<const NormalizedImage>(image)});
    block.ops.emplace_back(StrokedRect{x, y, w, h, palette::medium_gray, 0.5});

    const std::string caption = "Photo " + std::to_string(photo_number) + " of " + std::to_string(photo_total);
    block.ops.emplace_back(centered(encode_win_ansi(caption), Font::Regular, kCaptionSize, palette::dark_gray,
                                    width, y + h + 4 + kCaptionSize));

    block.height = y + h + 4 + kCaptionSize + 5 + kBlockGap;
    Logger::log(LogLevel::Debug, "Record " + record.id + " photo " + std::to_string(photo_number) +
                " placed at " + std::to_string(static_cast<int>(w)) + "x" + std::to_string(static_cast<int>(h)) + " pt",
                "record_formatter");
    return block;
}

} // namespace maintlog
