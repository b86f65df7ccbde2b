#include "mapper/plan_resolver.hpp"
#include "core/utils.hpp"

#include <functional>
#include <mutex>
#include <unordered_set>

namespace rowmap {

namespace {

inline void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // anonymous namespace

// ============================================================================
// PlanKey hashing
// ============================================================================

size_t PlanResolver::PlanKeyHash::operator()(const PlanKey& key) const {
    size_t seed = std::hash<std::type_index>{}(key.type);
    hash_combine(seed, std::hash<std::string>{}(key.prefix));
    for (const auto& column : key.columns) {
        hash_combine(seed, std::hash<std::string>{}(column));
    }
    hash_combine(seed, (key.rules.case_sensitive ? 1u : 0u) |
                       (key.rules.camel_case_to_underscore ? 2u : 0u) |
                       (key.strict ? 4u : 0u));
    hash_combine(seed, std::hash<uint64_t>{}(key.converters));
    return seed;
}

// ============================================================================
// PlanResolver
// ============================================================================

PlanResolver::PlanResolver(std::shared_ptr<PropertyCatalog> catalog)
    : catalog_(std::move(catalog)) {}

std::shared_ptr<const MappingPlan> PlanResolver::resolve(
    std::type_index type,
    std::string_view prefix,
    const ColumnSignature& columns,
    const MappingConfig& config,
    const IConverterRegistry& converters) {

    PlanKey key{type, std::string(prefix), columns, config.naming_rules(),
                config.is_strict_matching(), converters.registry_id()};

    {
        std::shared_lock lock(mutex_);
        const auto it = plans_.find(key);
        if (it != plans_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);

    std::shared_ptr<const MappingPlan> plan;
    try {
        plan = build_plan(catalog_->introspect(type), prefix, columns, config, converters);
    } catch (const MappingError&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    std::unique_lock lock(mutex_);
    const auto [it, inserted] = plans_.try_emplace(std::move(key), std::move(plan));
    return it->second;
}

std::shared_ptr<const MappingPlan> PlanResolver::build_plan(
    std::shared_ptr<const TypeShape> shape,
    std::string_view prefix,
    const ColumnSignature& columns,
    const MappingConfig& config,
    const IConverterRegistry& converters) const {

    std::vector<PlanEntry> entries;
    std::unordered_set<const PropertyDescriptor*> claimed;

    for (size_t i = 1; i <= columns.size(); ++i) {
        const std::string& label = columns[i - 1];
        std::string_view name = label;

        if (!prefix.empty()) {
            if (name.size() > prefix.size() && utils::istarts_with(name, prefix)) {
                name.remove_prefix(prefix.size());
            } else {
                continue;
            }
        }

        const PropertyDescriptor* descriptor = nullptr;
        for (const auto& p : shape->properties) {
            if (config.column_name_matches(name, p.effective_column_name())) {
                descriptor = &p;
                break;
            }
        }
        if (!descriptor) continue;

        if (!claimed.insert(descriptor).second) {
            utils::log::warn("Column '" + label + "' also matches property " + shape->name +
                             "." + descriptor->name + ", already mapped; column skipped");
            continue;
        }

        auto converter = converters.find_converter(descriptor->declared_type);
        const bool typed = converter.has_value();
        if (!typed) {
            utils::log::debug("No converter for " + descriptor->declared_type_name +
                              " (" + shape->name + "." + descriptor->name +
                              "), using passthrough");
        }

        entries.push_back(PlanEntry{
            i,
            label,
            typed ? std::move(*converter) : passthrough_converter(),
            descriptor,
            typed
        });
    }

    if (entries.empty() && !columns.empty()) {
        throw NoMatchingColumnsError(shape->name);
    }

    if (config.is_strict_matching() && entries.size() != columns.size()) {
        throw IncompleteMappingError(shape->name, entries.size(), columns.size());
    }

    if (utils::log::enabled(utils::log::Level::DEBUG)) {
        utils::log::debug("Resolved plan for " + shape->name + " [" + utils::join(columns, ", ") +
                          "]: " + std::to_string(entries.size()) + " of " +
                          std::to_string(columns.size()) + " columns mapped");
    }

    return std::make_shared<const MappingPlan>(std::move(shape), std::string(prefix),
                                               columns, std::move(entries));
}

void PlanResolver::clear() {
    std::unique_lock lock(mutex_);
    plans_.clear();
}

PlanResolver::Stats PlanResolver::get_stats() const {
    std::shared_lock lock(mutex_);
    return {
        plans_.size(),
        hits_.load(std::memory_order_relaxed),
        misses_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed)
    };
}

} // namespace rowmap
