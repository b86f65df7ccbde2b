#pragma once

#include "mapper/type_introspector.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>

namespace rowmap {

/**
 * @brief Process-lifetime cache of introspected type shapes
 *
 * One canonical TypeShape per type. The cache is append-only:
 * - Lookup takes a shared lock
 * - A miss introspects outside any lock, then inserts with try_emplace
 * - Threads racing on the same new type may each introspect; the first
 *   insert wins and every caller gets that canonical entry
 *
 * Introspection failures are not cached; the next call retries.
 */
class PropertyCatalog {
public:
    explicit PropertyCatalog(std::shared_ptr<const ITypeIntrospector> introspector);

    PropertyCatalog(const PropertyCatalog&) = delete;
    PropertyCatalog& operator=(const PropertyCatalog&) = delete;

    /**
     * @brief Shape of a type, introspecting it on first request
     * @throws IntrospectionError if the strategy cannot reflect the type
     */
    [[nodiscard]] std::shared_ptr<const TypeShape> introspect(std::type_index type);

    template<typename T>
    [[nodiscard]] std::shared_ptr<const TypeShape> introspect() {
        return introspect(std::type_index(typeid(T)));
    }

    // Whether introspect() can be expected to succeed
    [[nodiscard]] bool supports(std::type_index type) const;

    struct Stats {
        size_t cached_types;
        uint64_t hits;
        uint64_t misses;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    std::shared_ptr<const ITypeIntrospector> introspector_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::shared_ptr<const TypeShape>> shapes_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace rowmap
