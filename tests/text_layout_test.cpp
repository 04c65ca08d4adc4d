#include "../libmaintlog/include/text_layout.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace maintlog;

int main() {
    // WinAnsi encoding
    assert(encode_win_ansi("plain") == "plain");
    assert(encode_win_ansi("caf\xC3\xA9") == "caf\xE9");
    assert(encode_win_ansi("\xE2\x82\xAC" "5") == "\x80" "5");
    assert(encode_win_ansi("\xE2\x80\x9Cquoted\xE2\x80\x9D") == "\x93quoted\x94");
    assert(encode_win_ansi("a\tb") == "a b");
    assert(encode_win_ansi("a\x01" "b") == "ab");
    assert(encode_win_ansi("line\nbreak") == "line\nbreak");
    assert(encode_win_ansi("\xE6\xBC\xA2") == "?");
    // a broken sequence costs only its lead byte
    assert(encode_win_ansi("\xC3(") == "?(");
    assert(encode_win_ansi("\xE2\x82x") == "??x");
    assert(encode_win_ansi("end\xC3") == "end?");

    // metrics
    assert(measure_text("A", Font::Regular, 10) == 6.67);
    assert(measure_text("", Font::Bold, 12) == 0.0);
    assert(measure_text("i", Font::Bold, 10) > measure_text("i", Font::Regular, 10));
    assert(base_font_name(Font::Regular) == "Helvetica");
    assert(base_font_name(Font::Bold) == "Helvetica-Bold");
    assert(font_resource_name(Font::Regular) != font_resource_name(Font::Bold));

    // wrapping keeps every word and respects the width
    {
        const std::string text = "The north stairwell handrail is loose at the second landing and "
                                 "moves several centimeters when leaned on.";
        const double width = 150;
        const auto lines = wrap_text(text, Font::Regular, 10, width);
        assert(lines.size() > 1);
        std::string joined;
        for (const auto& line : lines) {
            assert(measure_text(line, Font::Regular, 10) <= width);
            if (!joined.empty()) joined += ' ';
            joined += line;
        }
        assert(joined == text);
    }

    // paragraphs and blank lines survive
    {
        const auto lines = wrap_text("first\n\nthird", Font::Regular, 10, 300);
        assert(lines.size() == 3);
        assert(lines[0] == "first");
        assert(lines[1].empty());
        assert(lines[2] == "third");
    }

    // a word wider than the line is broken by character
    {
        const std::string word(200, 'W');
        const auto lines = wrap_text(word, Font::Bold, 10, 100);
        assert(lines.size() > 1);
        size_t total = 0;
        for (const auto& line : lines) {
            assert(!line.empty());
            assert(measure_text(line, Font::Bold, 10) <= 100);
            total += line.size();
        }
        assert(total == word.size());
    }

    assert(wrap_text("", Font::Regular, 10, 100).size() == 1);

    // truncation
    {
        const std::string long_text(100, 'x');
        const std::string cut = truncate_to_width(long_text, Font::Regular, 10, 60);
        assert(cut.size() < long_text.size());
        assert(cut.ends_with("..."));
        assert(measure_text(cut, Font::Regular, 10) <= 60);
        assert(truncate_to_width("short", Font::Regular, 10, 60) == "short");
    }

    assert(escape_pdf_string("(a)\\b") == "\\(a\\)\\\\b");
    return 0;
}
