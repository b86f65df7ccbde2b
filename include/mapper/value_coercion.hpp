#pragma once

#include "core/types.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace rowmap {

/**
 * @brief Coercion of a non-NULL SqlValue into a C++ slot type
 *
 * Specialized for the value types the built-in converters support.
 * coerce() returns nullopt when the raw value has no sensible reading as T
 * (a string that is not a number, an integer out of range, ...).
 * NULL is never passed in; callers handle it first.
 */
template<typename T>
struct SqlValueTraits;

template<typename T>
inline constexpr bool has_sql_value_traits = requires { SqlValueTraits<T>::name; };

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {
    using value_type = T;
};

template<typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

namespace detail {

template<typename Int>
std::optional<Int> coerce_integer(const SqlValue& v) {
    int64_t wide{};
    if (const auto* i = std::get_if<int64_t>(&v)) {
        wide = *i;
    } else if (const auto* b = std::get_if<bool>(&v)) {
        wide = *b ? 1 : 0;
    } else if (const auto* d = std::get_if<double>(&v)) {
        if (!std::isfinite(*d) || std::floor(*d) != *d) return std::nullopt;
        // INT64_MAX is not representable as a double; 2^63 is the first value past it
        if (*d < -0x1p63 || *d >= 0x1p63) return std::nullopt;
        wide = static_cast<int64_t>(*d);
    } else if (const auto* s = std::get_if<std::string>(&v)) {
        const auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), wide);
        if (ec != std::errc{} || ptr != s->data() + s->size()) return std::nullopt;
    } else {
        return std::nullopt;
    }

    if (wide < static_cast<int64_t>(std::numeric_limits<Int>::min()) ||
        wide > static_cast<int64_t>(std::numeric_limits<Int>::max())) {
        return std::nullopt;
    }
    return static_cast<Int>(wide);
}

template<typename Float>
std::optional<Float> narrow_floating(double d) {
    if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<Float>::max())) {
        return std::nullopt;
    }
    return static_cast<Float>(d);
}

template<typename Float>
std::optional<Float> coerce_floating(const SqlValue& v) {
    if (const auto* d = std::get_if<double>(&v)) return narrow_floating<Float>(*d);
    if (const auto* i = std::get_if<int64_t>(&v)) return static_cast<Float>(*i);
    if (const auto* s = std::get_if<std::string>(&v)) {
        double parsed{};
        const auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
        if (ec != std::errc{} || ptr != s->data() + s->size()) return std::nullopt;
        return narrow_floating<Float>(parsed);
    }
    return std::nullopt;
}

} // namespace detail

template<>
struct SqlValueTraits<bool> {
    static constexpr const char* name = "bool";
    static std::optional<bool> coerce(const SqlValue& v) {
        if (const auto* b = std::get_if<bool>(&v)) return *b;
        if (const auto* i = std::get_if<int64_t>(&v)) return *i != 0;
        if (const auto* s = std::get_if<std::string>(&v)) {
            if (*s == "t" || *s == "true" || *s == "1") return true;
            if (*s == "f" || *s == "false" || *s == "0") return false;
        }
        return std::nullopt;
    }
};

template<>
struct SqlValueTraits<int16_t> {
    static constexpr const char* name = "int16";
    static std::optional<int16_t> coerce(const SqlValue& v) {
        return detail::coerce_integer<int16_t>(v);
    }
};

template<>
struct SqlValueTraits<int32_t> {
    static constexpr const char* name = "int32";
    static std::optional<int32_t> coerce(const SqlValue& v) {
        return detail::coerce_integer<int32_t>(v);
    }
};

template<>
struct SqlValueTraits<int64_t> {
    static constexpr const char* name = "int64";
    static std::optional<int64_t> coerce(const SqlValue& v) {
        return detail::coerce_integer<int64_t>(v);
    }
};

template<>
struct SqlValueTraits<float> {
    static constexpr const char* name = "float";
    static std::optional<float> coerce(const SqlValue& v) {
        return detail::coerce_floating<float>(v);
    }
};

template<>
struct SqlValueTraits<double> {
    static constexpr const char* name = "double";
    static std::optional<double> coerce(const SqlValue& v) {
        return detail::coerce_floating<double>(v);
    }
};

// Any non-NULL value has a text reading
template<>
struct SqlValueTraits<std::string> {
    static constexpr const char* name = "string";
    static std::optional<std::string> coerce(const SqlValue& v) {
        if (const auto* s = std::get_if<std::string>(&v)) return *s;
        if (const auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
        if (const auto* b = std::get_if<bool>(&v)) return std::string(*b ? "true" : "false");
        if (const auto* d = std::get_if<double>(&v)) {
            char buf[32];
            const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), *d);
            if (ec != std::errc{}) return std::nullopt;
            return std::string(buf, ptr);
        }
        return std::nullopt;
    }
};

template<>
struct SqlValueTraits<Uuid> {
    static constexpr const char* name = "uuid";
    static std::optional<Uuid> coerce(const SqlValue& v) {
        if (const auto* s = std::get_if<std::string>(&v)) return Uuid::parse(*s);
        return std::nullopt;
    }
};

/**
 * @brief Coerce a non-NULL value or throw std::invalid_argument
 */
template<typename T>
T coerce_or_throw(const SqlValue& v) {
    auto out = SqlValueTraits<T>::coerce(v);
    if (!out) {
        throw std::invalid_argument(std::string("cannot convert ") + sql_value_kind(v) +
                                    " value to " + SqlValueTraits<T>::name);
    }
    return std::move(*out);
}

} // namespace rowmap
