#pragma once

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rowmap {

// ============================================================================
// Raw Column Values
// ============================================================================

/**
 * @brief Raw value of a single result column
 *
 * std::monostate is SQL NULL. Connection adapters decode the wire text into
 * the narrowest alternative their column type map allows; anything they do
 * not recognize stays a string.
 */
using SqlValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const SqlValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

[[nodiscard]] inline const char* sql_value_kind(const SqlValue& value) {
    switch (value.index()) {
        case 0: return "NULL";
        case 1: return "BOOLEAN";
        case 2: return "INTEGER";
        case 3: return "DOUBLE";
        case 4: return "STRING";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Ordered column labels of a result set
 *
 * Used as part of the plan cache key: two result sets with the same
 * signature share one mapping plan.
 */
using ColumnSignature = std::vector<std::string>;

// ============================================================================
// UUID
// ============================================================================

struct Uuid {
    std::array<uint8_t, 16> bytes{};

    Uuid() = default;

    static Uuid from_parts(uint64_t most_significant, uint64_t least_significant) {
        Uuid u;
        for (int i = 0; i < 8; ++i) {
            u.bytes[i] = static_cast<uint8_t>(most_significant >> (56 - 8 * i));
            u.bytes[8 + i] = static_cast<uint8_t>(least_significant >> (56 - 8 * i));
        }
        return u;
    }

    /**
     * @brief Parse canonical 8-4-4-4-12 text, or the same 32 hex digits unhyphenated
     * @return nullopt for any other length or hyphen placement, or a non-hex digit
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view text) {
        const bool hyphenated = text.size() == 36;
        if (!hyphenated && text.size() != 32) return std::nullopt;

        Uuid u;
        size_t nibble = 0;
        for (size_t pos = 0; pos < text.size(); ++pos) {
            const char c = text[pos];
            const bool separator = hyphenated && (pos == 8 || pos == 13 || pos == 18 || pos == 23);
            if (separator != (c == '-')) return std::nullopt;
            if (separator) continue;
            unsigned int val{};
            const auto [ptr, ec] = std::from_chars(&c, &c + 1, val, 16);
            if (ec != std::errc{}) return std::nullopt;
            u.bytes[nibble / 2] |= static_cast<uint8_t>((nibble % 2 == 0) ? val << 4 : val);
            ++nibble;
        }
        if (nibble != 32) return std::nullopt;
        return u;
    }

    [[nodiscard]] std::string to_string() const {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += kHex[bytes[i] >> 4];
            out += kHex[bytes[i] & 0x0F];
        }
        return out;
    }

    bool operator==(const Uuid&) const = default;
};

// ============================================================================
// Transaction Isolation
// ============================================================================

enum class IsolationLevel : uint8_t {
    UNSPECIFIED,
    READ_UNCOMMITTED,
    READ_COMMITTED,
    REPEATABLE_READ,
    SERIALIZABLE
};

[[nodiscard]] inline const char* isolation_level_to_string(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::UNSPECIFIED:      return "UNSPECIFIED";
        case IsolationLevel::READ_UNCOMMITTED: return "READ_UNCOMMITTED";
        case IsolationLevel::READ_COMMITTED:   return "READ_COMMITTED";
        case IsolationLevel::REPEATABLE_READ:  return "REPEATABLE_READ";
        case IsolationLevel::SERIALIZABLE:     return "SERIALIZABLE";
        default:                               return "UNKNOWN";
    }
}

// SQL spelling used in BEGIN / SET TRANSACTION statements
[[nodiscard]] inline const char* isolation_level_to_sql(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::READ_UNCOMMITTED: return "READ UNCOMMITTED";
        case IsolationLevel::READ_COMMITTED:   return "READ COMMITTED";
        case IsolationLevel::REPEATABLE_READ:  return "REPEATABLE READ";
        case IsolationLevel::SERIALIZABLE:     return "SERIALIZABLE";
        default:                               return "";
    }
}

/**
 * @brief Parse "read_committed", "READ COMMITTED", "repeatable-read", ...
 * @return nullopt for unrecognized text
 */
[[nodiscard]] inline std::optional<IsolationLevel> parse_isolation_level(std::string_view text) {
    std::string norm;
    norm.reserve(text.size());
    for (const char c : text) {
        if (c == ' ' || c == '-') {
            norm += '_';
        } else {
            norm += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }

    if (norm.empty() || norm == "UNSPECIFIED" || norm == "DEFAULT") return IsolationLevel::UNSPECIFIED;
    if (norm == "READ_UNCOMMITTED") return IsolationLevel::READ_UNCOMMITTED;
    if (norm == "READ_COMMITTED")   return IsolationLevel::READ_COMMITTED;
    if (norm == "REPEATABLE_READ")  return IsolationLevel::REPEATABLE_READ;
    if (norm == "SERIALIZABLE")     return IsolationLevel::SERIALIZABLE;
    return std::nullopt;
}

} // namespace rowmap
