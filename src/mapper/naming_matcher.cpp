#include "mapper/naming_matcher.hpp"
#include "core/utils.hpp"

#include <cctype>

namespace rowmap {

namespace {

std::string strip_underscores(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (c != '_') out += c;
    }
    return out;
}

bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_lower(char c) { return std::islower(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

} // anonymous namespace

bool NamingMatcher::matches(std::string_view column_label,
                            std::string_view property_name,
                            const NamingRules& rules) {
    if (column_label.empty() || property_name.empty()) return false;

    if (rules.case_sensitive) {
        if (column_label == property_name) return true;
        return rules.camel_case_to_underscore &&
               column_label == camel_to_snake(property_name);
    }

    if (utils::iequals(column_label, property_name)) return true;
    if (!rules.camel_case_to_underscore) return false;

    const auto label = strip_underscores(column_label);
    return !label.empty() && utils::iequals(label, strip_underscores(property_name));
}

std::string NamingMatcher::camel_to_snake(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (is_upper(c)) {
            // Word boundary: lower/digit before, or end of an acronym ("HTTPCode")
            const bool after_word = i > 0 && (is_lower(name[i - 1]) || is_digit(name[i - 1]));
            const bool acronym_end = i > 0 && is_upper(name[i - 1]) &&
                                     i + 1 < name.size() && is_lower(name[i + 1]);
            if ((after_word || acronym_end) && !out.empty() && out.back() != '_') {
                out += '_';
            }
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace rowmap
