#pragma once

#include <string>
#include <string_view>

namespace rowmap {

/**
 * @brief Column-to-property naming rules
 *
 * Defaults: case-insensitive, with camelCase <-> snake_case equivalence.
 */
struct NamingRules {
    bool case_sensitive = false;
    bool camel_case_to_underscore = true;

    bool operator==(const NamingRules&) const = default;
};

/**
 * @brief Decides whether a result column label names a property
 *
 * Pure; safe to call from any thread.
 *
 * Matching, in order:
 * 1. label equals property (case-folded unless case_sensitive)
 * 2. with camel_case_to_underscore: label equals the snake_case spelling of
 *    the property ("userId" -> "user_id"); when case-insensitive the
 *    underscores are dropped from both sides before comparing, so
 *    "USER_ID", "user_id" and "userid" all match "userId"
 *
 * An empty label never matches.
 */
class NamingMatcher {
public:
    [[nodiscard]] static bool matches(std::string_view column_label,
                                      std::string_view property_name,
                                      const NamingRules& rules);

    // "userId" -> "user_id", "HTTPCode" -> "http_code"
    [[nodiscard]] static std::string camel_to_snake(std::string_view name);
};

} // namespace rowmap
