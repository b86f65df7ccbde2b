#include "mapper/property_catalog.hpp"
#include "core/utils.hpp"

#include <mutex>

namespace rowmap {

PropertyCatalog::PropertyCatalog(std::shared_ptr<const ITypeIntrospector> introspector)
    : introspector_(std::move(introspector)) {}

std::shared_ptr<const TypeShape> PropertyCatalog::introspect(std::type_index type) {
    {
        std::shared_lock lock(mutex_);
        const auto it = shapes_.find(type);
        if (it != shapes_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);

    // Throws IntrospectionError; nothing is inserted on failure
    auto shape = std::make_shared<const TypeShape>(introspector_->introspect(type));

    std::unique_lock lock(mutex_);
    const auto [it, inserted] = shapes_.try_emplace(type, std::move(shape));
    if (inserted) {
        utils::log::debug("Cataloged type " + it->second->name + " with " +
                          std::to_string(it->second->properties.size()) + " properties");
    }
    return it->second;
}

bool PropertyCatalog::supports(std::type_index type) const {
    {
        std::shared_lock lock(mutex_);
        if (shapes_.contains(type)) return true;
    }
    return introspector_->supports(type);
}

PropertyCatalog::Stats PropertyCatalog::get_stats() const {
    std::shared_lock lock(mutex_);
    return {
        shapes_.size(),
        hits_.load(std::memory_order_relaxed),
        misses_.load(std::memory_order_relaxed)
    };
}

} // namespace rowmap
