#pragma once

#include "mapper/converter_registry.hpp"
#include "mapper/mapping_config.hpp"
#include "mapper/mapping_plan.hpp"
#include "mapper/property_catalog.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace rowmap {

/**
 * @brief Resolves and caches mapping plans
 *
 * resolve() runs the column-matching algorithm at most once per distinct
 * (type, prefix, column signature, naming rules, strictness, converter
 * registry) key; later calls return the cached plan.
 *
 * Algorithm, per column (1-indexed):
 * 1. With a non-empty prefix, the label must start with it
 *    (case-insensitive) and be longer than it; the prefix is stripped.
 *    Labels without the prefix are skipped.
 * 2. The first catalog property whose effective column name matches the
 *    label wins. Unmatched columns are skipped.
 * 3. A property already claimed by an earlier column is not assigned again;
 *    the later column counts as unmatched.
 * 4. The converter for the property's declared type is taken from the
 *    registry, falling back to the passthrough converter.
 *
 * Post-conditions:
 * - empty plan for a result with >= 1 column: NoMatchingColumnsError
 * - strict matching and matched != total columns: IncompleteMappingError
 *
 * Failed resolutions are never cached. Concurrent first requests for one
 * key may each resolve; the first insert wins and all callers receive it.
 */
class PlanResolver {
public:
    explicit PlanResolver(std::shared_ptr<PropertyCatalog> catalog);

    PlanResolver(const PlanResolver&) = delete;
    PlanResolver& operator=(const PlanResolver&) = delete;

    /**
     * @throws IntrospectionError, NoMatchingColumnsError, IncompleteMappingError
     */
    [[nodiscard]] std::shared_ptr<const MappingPlan> resolve(
        std::type_index type,
        std::string_view prefix,
        const ColumnSignature& columns,
        const MappingConfig& config,
        const IConverterRegistry& converters);

    void clear();

    struct Stats {
        size_t cached_plans;
        uint64_t hits;
        uint64_t misses;
        uint64_t failures;

        double hit_rate() const {
            const uint64_t total = hits + misses;
            return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
        }
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const std::shared_ptr<PropertyCatalog>& catalog() const { return catalog_; }

private:
    struct PlanKey {
        std::type_index type;
        std::string prefix;
        ColumnSignature columns;
        NamingRules rules;
        bool strict;
        uint64_t converters;  // IConverterRegistry::registry_id()

        bool operator==(const PlanKey&) const = default;
    };

    struct PlanKeyHash {
        size_t operator()(const PlanKey& key) const;
    };

    [[nodiscard]] std::shared_ptr<const MappingPlan> build_plan(
        std::shared_ptr<const TypeShape> shape,
        std::string_view prefix,
        const ColumnSignature& columns,
        const MappingConfig& config,
        const IConverterRegistry& converters) const;

    std::shared_ptr<PropertyCatalog> catalog_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<PlanKey, std::shared_ptr<const MappingPlan>, PlanKeyHash> plans_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace rowmap
