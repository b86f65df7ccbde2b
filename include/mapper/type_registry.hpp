#pragma once

#include "mapper/type_introspector.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>

namespace rowmap {

class TypeRegistry;

/**
 * @brief Fluent registration of one type's mappable properties
 *
 * Usage:
 * @code
 * registry.register_type<User>()
 *     .property("name", &User::name)
 *     .property("age", &User::age, &User::set_age)
 *     .property("uuid", &User::uuid).column("something")
 *     .read_only("display", &User::display);
 * @endcode
 *
 * Declaration order is the order properties are tried during matching.
 */
template<typename T>
class TypeBuilder {
public:
    TypeBuilder(TypeRegistry& registry, std::type_index type)
        : registry_(registry), type_(type) {}

    // Public data member
    template<typename U>
    TypeBuilder& property(std::string_view name, U T::* member);

    // Getter/setter pair; setter may take its argument by value or const&
    template<typename G, typename S>
    TypeBuilder& property(std::string_view name, G (T::*getter)() const, void (T::*setter)(S));

    // Getter only; matching still considers it, writing it fails per row
    template<typename G>
    TypeBuilder& read_only(std::string_view name, G (T::*getter)() const);

    // Explicit column name for the most recently declared property
    TypeBuilder& column(std::string_view column_name);

private:
    TypeRegistry& registry_;
    std::type_index type_;
    std::string last_property_;
};

/**
 * @brief Table of registered types and their property descriptors
 *
 * Registration is expected during startup, before the first mapper is
 * built; shapes are copied into the PropertyCatalog on first use and later
 * edits to an already-cataloged type are not observed.
 */
class TypeRegistry {
public:
    TypeRegistry() = default;

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /**
     * @brief Register T (or reopen an existing registration)
     * @param name Display name; defaults to the compiler's spelling of T
     */
    template<typename T>
    TypeBuilder<T> register_type(std::string name = type_name<T>()) {
        static_assert(std::is_class_v<T>, "only class types can be registered for mapping");

        const std::type_index type(typeid(T));
        std::unique_lock lock(mutex_);
        if (!types_.contains(type)) {
            auto shape = std::make_shared<TypeShape>(type, std::move(name));
            if constexpr (std::is_default_constructible_v<T> && std::is_move_constructible_v<T>) {
                shape->factory = []() -> std::shared_ptr<void> { return std::make_shared<T>(); };
            }
            types_.emplace(type, std::move(shape));
        }
        return TypeBuilder<T>(*this, type);
    }

    [[nodiscard]] bool contains(std::type_index type) const;

    /**
     * @brief Snapshot of a registered shape
     */
    [[nodiscard]] std::optional<TypeShape> find(std::type_index type) const;

    [[nodiscard]] size_t size() const;

    /**
     * @throws IntrospectionError if the type already has a property of that name
     */
    void add_property(std::type_index type, PropertyDescriptor descriptor);

    void set_column_name(std::type_index type, const std::string& property,
                         std::string column_name);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<TypeShape>> types_;
};

/**
 * @brief Introspection strategy backed by a TypeRegistry
 */
class RegisteredTypeIntrospector : public ITypeIntrospector {
public:
    explicit RegisteredTypeIntrospector(std::shared_ptr<const TypeRegistry> registry);

    [[nodiscard]] bool supports(std::type_index type) const override;
    [[nodiscard]] TypeShape introspect(std::type_index type) const override;

private:
    std::shared_ptr<const TypeRegistry> registry_;
};

// ============================================================================
// TypeBuilder implementation
// ============================================================================

template<typename T>
template<typename U>
TypeBuilder<T>& TypeBuilder<T>::property(std::string_view name, U T::* member) {
    using Slot = std::remove_const_t<U>;

    PropertyDescriptor d(std::string(name), std::type_index(typeid(Slot)),
                         detail::slot_type_name<Slot>());
    d.readable = true;
    d.nullable = is_optional_v<Slot>;
    d.reader = [member](const void* obj) -> std::any {
        return static_cast<const T*>(obj)->*member;
    };
    if constexpr (!std::is_const_v<U>) {
        d.writable = true;
        d.writer = [member, prop = std::string(name)](void* obj, std::any value) {
            detail::assign_value<U>(static_cast<T*>(obj)->*member, std::move(value), prop);
        };
    }

    registry_.add_property(type_, std::move(d));
    last_property_ = std::string(name);
    return *this;
}

template<typename T>
template<typename G, typename S>
TypeBuilder<T>& TypeBuilder<T>::property(std::string_view name,
                                         G (T::*getter)() const,
                                         void (T::*setter)(S)) {
    using Slot = std::remove_cvref_t<G>;
    static_assert(std::is_same_v<Slot, std::remove_cvref_t<S>>,
                  "getter and setter must agree on the property type");
    static_assert(std::is_default_constructible_v<Slot>,
                  "setter-backed properties need a default-constructible value type");

    PropertyDescriptor d(std::string(name), std::type_index(typeid(Slot)),
                         detail::slot_type_name<Slot>());
    d.readable = true;
    d.writable = true;
    d.nullable = is_optional_v<Slot>;
    d.reader = [getter](const void* obj) -> std::any {
        return (static_cast<const T*>(obj)->*getter)();
    };
    d.writer = [setter, prop = std::string(name)](void* obj, std::any value) {
        Slot tmp{};
        detail::assign_value<Slot>(tmp, std::move(value), prop);
        (static_cast<T*>(obj)->*setter)(std::move(tmp));
    };

    registry_.add_property(type_, std::move(d));
    last_property_ = std::string(name);
    return *this;
}

template<typename T>
template<typename G>
TypeBuilder<T>& TypeBuilder<T>::read_only(std::string_view name, G (T::*getter)() const) {
    using Slot = std::remove_cvref_t<G>;

    PropertyDescriptor d(std::string(name), std::type_index(typeid(Slot)),
                         detail::slot_type_name<Slot>());
    d.readable = true;
    d.nullable = is_optional_v<Slot>;
    d.reader = [getter](const void* obj) -> std::any {
        return (static_cast<const T*>(obj)->*getter)();
    };

    registry_.add_property(type_, std::move(d));
    last_property_ = std::string(name);
    return *this;
}

template<typename T>
TypeBuilder<T>& TypeBuilder<T>::column(std::string_view column_name) {
    if (last_property_.empty()) {
        throw IntrospectionError(type_name<T>(), "column() called before any property");
    }
    registry_.set_column_name(type_, last_property_, std::string(column_name));
    return *this;
}

} // namespace rowmap
