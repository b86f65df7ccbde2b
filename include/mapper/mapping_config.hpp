#pragma once

#include "mapper/naming_matcher.hpp"

#include <string_view>

namespace rowmap {

/**
 * @brief Naming configuration consumed by plan resolution
 *
 * Read-only while a plan is being resolved. Copies are cheap; callers that
 * change settings build a new config rather than mutating a shared one.
 */
class MappingConfig {
public:
    MappingConfig() = default;
    MappingConfig(NamingRules rules, bool strict_matching)
        : rules_(rules), strict_matching_(strict_matching) {}

    [[nodiscard]] bool column_name_matches(std::string_view column_label,
                                           std::string_view property_name) const {
        return NamingMatcher::matches(column_label, property_name, rules_);
    }

    // Every result column must be consumed, else resolution fails
    [[nodiscard]] bool is_strict_matching() const { return strict_matching_; }

    [[nodiscard]] const NamingRules& naming_rules() const { return rules_; }

    MappingConfig& set_strict_matching(bool strict) {
        strict_matching_ = strict;
        return *this;
    }

    MappingConfig& set_naming_rules(NamingRules rules) {
        rules_ = rules;
        return *this;
    }

private:
    NamingRules rules_;
    bool strict_matching_ = false;
};

} // namespace rowmap
