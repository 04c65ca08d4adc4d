#include "../../include/report_types.hpp"
#include "../../include/text_utils.hpp"
#include <array>
#include <utility>

namespace maintlog {

namespace {

constexpr std::array<std::pair<std::string_view, Category>, 8> kCategories = {{
    {"Electrical", Category::Electrical},
    {"Plumbing", Category::Plumbing},
    {"HVAC", Category::HVAC},
    {"Structural", Category::Structural},
    {"Grounds", Category::Grounds},
    {"Custodial", Category::Custodial},
    {"Safety", Category::Safety},
    {"Other", Category::Other},
}};

} // namespace

std::optional<Category> parse_category(const std::string_view name) {
    const std::string_view trimmed = trim(name);
    for (const auto& [label, category] : kCategories) {
        if (iequals(label, trimmed)) {
            return category;
        }
    }
    return std::nullopt;
}

std::string_view to_string(const Category category) noexcept {
    for (const auto& [label, value] : kCategories) {
        if (value == category) return label;
    }
    return "Other";
}

} // namespace maintlog
