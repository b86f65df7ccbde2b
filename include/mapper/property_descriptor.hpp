#pragma once

#include "core/error.hpp"
#include "core/type_name.hpp"
#include "core/types.hpp"
#include "mapper/value_coercion.hpp"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace rowmap {

/**
 * @brief Writes a converted value into one property of an instance
 *
 * The value is either exactly the declared type, an empty std::any (SQL
 * NULL from a typed converter), or a raw SqlValue from the passthrough
 * converter, in which case the writer coerces it.
 */
using PropertyWriter = std::function<void(void* instance, std::any value)>;
using PropertyReader = std::function<std::any(const void* instance)>;

struct PropertyDescriptor {
    std::string name;
    std::type_index declared_type;
    std::string declared_type_name;
    bool readable = false;
    bool writable = false;
    bool nullable = false;                       // std::optional<> slot
    std::optional<std::string> explicit_column_name;

    PropertyReader reader;
    PropertyWriter writer;

    PropertyDescriptor(std::string n, std::type_index type, std::string type_display)
        : name(std::move(n)), declared_type(type), declared_type_name(std::move(type_display)) {}

    // Column name matched against result labels
    [[nodiscard]] const std::string& effective_column_name() const {
        return explicit_column_name ? *explicit_column_name : name;
    }
};

/**
 * @brief Introspected shape of one target type
 *
 * Immutable once handed out by the PropertyCatalog. The factory is empty
 * when the type has no usable default constructor.
 */
struct TypeShape {
    std::type_index type;
    std::string name;
    std::vector<PropertyDescriptor> properties;
    std::function<std::shared_ptr<void>()> factory;

    TypeShape(std::type_index t, std::string n) : type(t), name(std::move(n)) {}

    [[nodiscard]] bool is_instantiable() const { return static_cast<bool>(factory); }

    [[nodiscard]] const PropertyDescriptor* find_property(std::string_view property) const {
        for (const auto& p : properties) {
            if (p.name == property) return &p;
        }
        return nullptr;
    }
};

// ============================================================================
// Slot assignment
// ============================================================================

namespace detail {

template<typename U>
std::string slot_type_name() {
    if constexpr (is_optional_v<U>) {
        return "optional<" + slot_type_name<typename is_optional<U>::value_type>() + ">";
    } else if constexpr (has_sql_value_traits<U>) {
        return SqlValueTraits<U>::name;
    } else {
        return type_name<U>();
    }
}

template<typename U>
void assign_null(U& slot, const std::string& property) {
    if constexpr (is_optional_v<U>) {
        slot = std::nullopt;
    } else {
        (void)slot;
        throw NullValueError(property);
    }
}

template<typename U>
void assign_raw(U& slot, const SqlValue& raw, const std::string& property) {
    if (is_null(raw)) {
        assign_null(slot, property);
        return;
    }
    if constexpr (is_optional_v<U>) {
        using V = typename is_optional<U>::value_type;
        if constexpr (has_sql_value_traits<V>) {
            slot = coerce_or_throw<V>(raw);
            return;
        }
    } else if constexpr (has_sql_value_traits<U>) {
        slot = coerce_or_throw<U>(raw);
        return;
    }
    throw PropertyWriteError(property, std::string("no implicit conversion from ") +
                                       sql_value_kind(raw) + " to " + slot_type_name<U>());
}

/**
 * @brief Assign a converter result to a slot of declared type U
 * @throws NullValueError for NULL into a non-optional slot
 * @throws PropertyWriteError when the value's type does not fit U
 */
template<typename U>
void assign_value(U& slot, std::any value, const std::string& property) {
    if (!value.has_value()) {
        assign_null(slot, property);
        return;
    }
    if (auto* typed = std::any_cast<U>(&value)) {
        slot = std::move(*typed);
        return;
    }
    if constexpr (is_optional_v<U>) {
        if (auto* inner = std::any_cast<typename is_optional<U>::value_type>(&value)) {
            slot = std::move(*inner);
            return;
        }
    }
    if (const auto* raw = std::any_cast<SqlValue>(&value)) {
        assign_raw(slot, *raw, property);
        return;
    }
    throw PropertyWriteError(property, "converter produced a value of the wrong type for " +
                                       slot_type_name<U>());
}

} // namespace detail

} // namespace rowmap
