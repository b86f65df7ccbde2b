#include "mapper/type_registry.hpp"

#include <mutex>

namespace rowmap {

// ============================================================================
// TypeRegistry
// ============================================================================

bool TypeRegistry::contains(std::type_index type) const {
    std::shared_lock lock(mutex_);
    return types_.contains(type);
}

std::optional<TypeShape> TypeRegistry::find(std::type_index type) const {
    std::shared_lock lock(mutex_);
    const auto it = types_.find(type);
    if (it == types_.end()) return std::nullopt;
    return *it->second;
}

size_t TypeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return types_.size();
}

void TypeRegistry::add_property(std::type_index type, PropertyDescriptor descriptor) {
    std::unique_lock lock(mutex_);
    const auto it = types_.find(type);
    if (it == types_.end()) {
        throw IntrospectionError(type.name(), "property added to unregistered type");
    }

    auto& shape = *it->second;
    if (shape.find_property(descriptor.name)) {
        throw IntrospectionError(shape.name, "duplicate property '" + descriptor.name + "'");
    }
    shape.properties.push_back(std::move(descriptor));
}

void TypeRegistry::set_column_name(std::type_index type, const std::string& property,
                                   std::string column_name) {
    std::unique_lock lock(mutex_);
    const auto it = types_.find(type);
    if (it == types_.end()) {
        throw IntrospectionError(type.name(), "column name set on unregistered type");
    }

    for (auto& p : it->second->properties) {
        if (p.name == property) {
            p.explicit_column_name = std::move(column_name);
            return;
        }
    }
    throw IntrospectionError(it->second->name, "no property '" + property + "'");
}

// ============================================================================
// RegisteredTypeIntrospector
// ============================================================================

RegisteredTypeIntrospector::RegisteredTypeIntrospector(
    std::shared_ptr<const TypeRegistry> registry)
    : registry_(std::move(registry)) {}

bool RegisteredTypeIntrospector::supports(std::type_index type) const {
    return registry_->contains(type);
}

TypeShape RegisteredTypeIntrospector::introspect(std::type_index type) const {
    auto shape = registry_->find(type);
    if (!shape) {
        throw IntrospectionError(type.name(), "type is not registered");
    }
    if (shape->properties.empty()) {
        throw IntrospectionError(shape->name, "type exposes no properties");
    }
    return std::move(*shape);
}

} // namespace rowmap
