#include "../../include/text_layout.hpp"
#include <array>
#include <cstdint>
#include <utility>

namespace maintlog {

namespace {

// AFM advance widths per 1000 em, WinAnsi codes 32..255
constexpr std::array<std::uint16_t, 224> kHelveticaWidths = {
     278,  278,  355,  556,  556,  889,  667,  191,  333,  333,  389,  584,  278,  333,  278,  278,  // 32
     556,  556,  556,  556,  556,  556,  556,  556,  556,  556,  278,  278,  584,  584,  584,  556,  // 48
    1015,  667,  667,  722,  722,  667,  611,  778,  722,  278,  500,  667,  556,  833,  722,  778,  // 64
     667,  778,  722,  667,  611,  722,  667,  944,  667,  667,  611,  278,  278,  278,  469,  556,  // 80
     333,  556,  556,  500,  556,  556,  278,  556,  556,  222,  222,  500,  222,  833,  556,  556,  // 96
     556,  556,  333,  500,  278,  556,  500,  722,  500,  500,  500,  334,  260,  334,  584,  349,  // 112
     556,  349,  221,  556,  332, 1000,  556,  556,  332, 1000,  667,  332, 1000,  349,  610,  349,  // 128
     349,  221,  221,  332,  332,  349,  556, 1000,  332, 1000,  500,  332,  943,  349,  500,  667,  // 144
     278,  332,  556,  556,  556,  556,  260,  556,  332,  736,  369,  556,  583,  332,  736,  332,  // 160
     400,  583,  332,  332,  332,  556,  537,  278,  332,  332,  364,  556,  833,  833,  833,  610,  // 176
     667,  667,  667,  667,  667,  667, 1000,  721,  667,  667,  667,  667,  278,  278,  278,  278,  // 192
     721,  721,  778,  778,  778,  778,  778,  583,  778,  721,  721,  721,  721,  667,  667,  610,  // 208
     556,  556,  556,  556,  556,  556,  889,  500,  556,  556,  556,  556,  278,  278,  278,  278,  // 224
     556,  556,  556,  556,  556,  556,  556,  583,  610,  556,  556,  556,  556,  500,  556,  500,  // 240
};

constexpr std::array<std::uint16_t, 224> kHelveticaBoldWidths = {
     278,  333,  474,  556,  556,  889,  722,  238,  333,  333,  389,  584,  278,  333,  278,  278,  // 32
     556,  556,  556,  556,  556,  556,  556,  556,  556,  556,  333,  333,  584,  584,  584,  611,  // 48
     975,  722,  722,  722,  722,  667,  611,  778,  722,  278,  556,  722,  611,  833,  722,  778,  // 64
     667,  778,  722,  667,  611,  722,  667,  944,  667,  667,  611,  333,  278,  333,  584,  556,  // 80
     333,  556,  611,  556,  611,  556,  333,  611,  611,  278,  278,  556,  278,  889,  611,  611,  // 96
     611,  611,  389,  556,  333,  611,  556,  778,  556,  556,  500,  389,  280,  389,  584,  349,  // 112
     556,  349,  278,  556,  500, 1000,  556,  556,  332, 1000,  667,  332, 1000,  349,  610,  349,  // 128
     349,  278,  278,  500,  500,  349,  556, 1000,  332, 1000,  556,  332,  943,  349,  500,  667,  // 144
     278,  332,  556,  556,  556,  556,  280,  556,  332,  736,  369,  556,  583,  332,  736,  332,  // 160
     400,  583,  332,  332,  332,  610,  556,  278,  332,  332,  364,  556,  833,  833,  833,  610,  // 176
     721,  721,  721,  721,  721,  721, 1000,  721,  667,  667,  667,  667,  278,  278,  278,  278,  // 192
     721,  721,  778,  778,  778,  778,  778,  583,  778,  721,  721,  721,  721,  667,  667,  610,  // 208
     556,  556,  556,  556,  556,  556,  889,  556,  556,  556,  556,  556,  278,  278,  278,  278,  // 224
     610,  610,  610,  610,  610,  610,  610,  583,  610,  610,  610,  610,  610,  556,  610,  556,  // 240
};

unsigned glyph_width(const unsigned char c, const Font font) noexcept {
    if (c < 32) return 0;
    return font == Font::Bold ? kHelveticaBoldWidths[c - 32] : kHelveticaWidths[c - 32];
}

unsigned char win_ansi_codepoint(const std::uint32_t cp) noexcept {
    if (cp < 0x80 || (cp >= 0xA0 && cp <= 0xFF)) return static_cast<unsigned char>(cp);
    switch (cp) {
        case 0x20AC: return 0x80; // euro
        case 0x201A: return 0x82;
        case 0x0192: return 0x83;
        case 0x201E: return 0x84;
        case 0x2026: return 0x85; // ellipsis
        case 0x2020: return 0x86;
        case 0x2021: return 0x87;
        case 0x02C6: return 0x88;
        case 0x2030: return 0x89;
        case 0x0160: return 0x8A;
        case 0x2039: return 0x8B;
        case 0x0152: return 0x8C;
        case 0x017D: return 0x8E;
        case 0x2018: return 0x91; // curly quotes
        case 0x2019: return 0x92;
        case 0x201C: return 0x93;
        case 0x201D: return 0x94;
        case 0x2022: return 0x95; // bullet
        case 0x2013: return 0x96; // en dash
        case 0x2014: return 0x97;
        case 0x02DC: return 0x98;
        case 0x2122: return 0x99;
        case 0x0161: return 0x9A;
        case 0x203A: return 0x9B;
        case 0x0153: return 0x9C;
        case 0x017E: return 0x9E;
        case 0x0178: return 0x9F;
        default:     return '?';
    }
}

void break_long_word(const std::string_view word, const Font font, const double size,
                     const double max_width, std::vector<std::string>& lines, std::string& current) {
    for (const char ch : word) {
        const double w = measure_text(current, font, size) +
                         measure_text(std::string_view(&ch, 1), font, size);
        if (!current.empty() && w > max_width) {
            lines.push_back(std::move(current));
            current.clear();
        }
        current.push_back(ch);
    }
}

void wrap_paragraph(const std::string_view para, const Font font, const double size,
                    const double max_width, std::vector<std::string>& lines) {
    std::string current;
    size_t pos = 0;
    bool any_word = false;
    while (pos < para.size()) {
        while (pos < para.size() && para[pos] == ' ') ++pos;
        if (pos >= para.size()) break;
        size_t end = para.find(' ', pos);
        if (end == std::string_view::npos) end = para.size();
        const std::string_view word = para.substr(pos, end - pos);
        pos = end;
        any_word = true;

        if (current.empty()) {
            if (measure_text(word, font, size) <= max_width) {
                current.assign(word);
            } else {
                break_long_word(word, font, size, max_width, lines, current);
            }
            continue;
        }

        std::string candidate = current;
        candidate.push_back(' ');
        candidate.append(word);
        if (measure_text(candidate, font, size) <= max_width) {
            current = std::move(candidate);
        } else {
            lines.push_back(std::move(current));
            current.clear();
            if (measure_text(word, font, size) <= max_width) {
                current.assign(word);
            } else {
                break_long_word(word, font, size, max_width, lines, current);
            }
        }
    }
    if (!current.empty() || !any_word) {
        lines.push_back(std::move(current));
    }
}

} // namespace

std::string_view base_font_name(const Font font) noexcept {
    return font == Font::Bold ? "Helvetica-Bold" : "Helvetica";
}

std::string_view font_resource_name(const Font font) noexcept {
    return font == Font::Bold ? "F2" : "F1";
}

std::string encode_win_ansi(const std::string_view utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        const auto lead = static_cast<unsigned char>(utf8[i]);
        size_t length = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            length = 1;
            cp = lead;
        } else if ((lead >> 5) == 0x6) {
            length = 2;
            cp = lead & 0x1Fu;
        } else if ((lead >> 4) == 0xE) {
            length = 3;
            cp = lead & 0x0Fu;
        } else if ((lead >> 3) == 0x1E) {
            length = 4;
            cp = lead & 0x07u;
        }
        // every continuation byte must be 10xxxxxx; otherwise drop only the lead
        bool valid = length != 0 && i + length <= utf8.size();
        for (size_t k = 1; valid && k < length; ++k) {
            const auto next = static_cast<unsigned char>(utf8[i + k]);
            valid = (next & 0xC0u) == 0x80u;
            cp = (cp << 6) | (next & 0x3Fu);
        }
        if (!valid) {
            out.push_back('?');
            ++i;
            continue;
        }
        i += length;

        if (cp == '\n') {
            out.push_back('\n');
        } else if (cp == '\t') {
            out.push_back(' ');
        } else if (cp < 0x20 || cp == 0x7F) {
            continue;
        } else {
            out.push_back(static_cast<char>(win_ansi_codepoint(cp)));
        }
    }
    return out;
}

double measure_text(const std::string_view encoded, const Font font, const double size) noexcept {
    unsigned units = 0;
    for (const char ch : encoded) {
        units += glyph_width(static_cast<unsigned char>(ch), font);
    }
    return static_cast<double>(units) * size / 1000.0;
}

std::vector<std::string> wrap_text(const std::string_view utf8, const Font font,
                                   const double size, const double max_width) {
    std::vector<std::string> lines;
    const std::string encoded = encode_win_ansi(utf8);
    std::string_view rest = encoded;
    while (true) {
        const size_t nl = rest.find('\n');
        wrap_paragraph(rest.substr(0, nl), font, size, max_width, lines);
        if (nl == std::string_view::npos) break;
        rest.remove_prefix(nl + 1);
    }
    return lines;
}

std::string truncate_to_width(const std::string_view encoded, const Font font,
                              const double size, const double max_width) {
    if (measure_text(encoded, font, size) <= max_width) return std::string(encoded);
    const double ellipsis = measure_text("...", font, size);
    std::string out;
    for (const char ch : encoded) {
        if (measure_text(out, font, size) + measure_text(std::string_view(&ch, 1), font, size) +
            ellipsis > max_width) {
            break;
        }
        out.push_back(ch);
    }
    out += "...";
    return out;
}

std::string escape_pdf_string(const std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size() + 8);
    for (const char ch : encoded) {
        if (ch == '(' || ch == ')' || ch == '\\') out.push_back('\\');
        out.push_back(ch);
    }
    return out;
}

} // namespace maintlog
