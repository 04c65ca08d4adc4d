#include "../../include/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace maintlog {

namespace {

bool is_blank(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::tm to_utc_tm(const Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm out{};
#ifdef _WIN32
    gmtime_s(&out, &t);
#else
    gmtime_r(&t, &out);
#endif
    return out;
}

std::time_t utc_tm_to_time_t(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

} // namespace

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
    return s;
}

bool iequals(const std::string_view a, const std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](const char x, const char y) {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

std::string to_upper_copy(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::toupper(c)) : static_cast<char>(c);
    });
    return out;
}

std::string to_lower_copy(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

std::string format_utc(const Timestamp ts, const char* pattern) {
    const std::tm tm = to_utc_tm(ts);
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

std::string format_report_time(const Timestamp ts) {
    return format_utc(ts, "%B %d, %Y at %I:%M %p UTC");
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    text = trim(text);
    if (text.size() < 10) return std::nullopt;

    std::tm tm{};
    std::istringstream iss{std::string(text)};
    iss.imbue(std::locale::classic());
    if (text.size() == 10) {
        iss >> std::get_time(&tm, "%Y-%m-%d");
    } else {
        iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    }
    if (iss.fail()) return std::nullopt;

    // optional fractional seconds and zone designator; only UTC is accepted
    std::string rest;
    std::getline(iss, rest);
    std::string_view tail = rest;
    if (!tail.empty() && tail.front() == '.') {
        tail.remove_prefix(1);
        while (!tail.empty() && std::isdigit(static_cast<unsigned char>(tail.front()))) {
            tail.remove_prefix(1);
        }
    }
    if (!(tail.empty() || tail == "Z" || tail == "+00:00")) return std::nullopt;

    const std::time_t t = utc_tm_to_time_t(tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace maintlog
