#include "mapper/row_mapper.hpp"
#include "mapper/property_catalog.hpp"
#include "mapper/type_registry.hpp"

#include <mutex>

namespace rowmap {

// ============================================================================
// MapperContext
// ============================================================================

MapperContext MapperContext::create(std::shared_ptr<const TypeRegistry> types,
                                    MappingConfig config) {
    auto catalog = std::make_shared<PropertyCatalog>(
        std::make_shared<RegisteredTypeIntrospector>(std::move(types)));
    return MapperContext{
        std::make_shared<PlanResolver>(std::move(catalog)),
        std::make_shared<ConverterRegistry>(),
        config
    };
}

// ============================================================================
// BeanMapper
// ============================================================================

BeanMapper::BeanMapper(std::type_index type, std::string prefix, MapperContext context)
    : type_(type), prefix_(std::move(prefix)), context_(std::move(context)) {}

std::shared_ptr<const MappingPlan> BeanMapper::resolve(const ColumnSignature& signature) const {
    return context_.resolver->resolve(type_, prefix_, signature, context_.config,
                                      *context_.converters);
}

std::shared_ptr<void> BeanMapper::map(const IResultRow& row) const {
    const auto plan = resolve(column_signature(row));
    return RowMaterializer::materialize(*plan, row);
}

std::shared_ptr<const RowMapper> BeanMapper::specialize(const ColumnSignature& signature) const {
    return std::make_shared<BoundRowMapper>(resolve(signature), *this);
}

// ============================================================================
// BoundRowMapper
// ============================================================================

BoundRowMapper::BoundRowMapper(std::shared_ptr<const MappingPlan> plan, BeanMapper parent)
    : plan_(std::move(plan)), parent_(std::move(parent)) {}

bool BoundRowMapper::matches_signature(const IResultRow& row) const {
    const auto& signature = plan_->signature();
    if (row.column_count() != signature.size()) return false;
    for (size_t i = 1; i <= signature.size(); ++i) {
        if (row.column_label(i) != signature[i - 1]) return false;
    }
    return true;
}

std::shared_ptr<void> BoundRowMapper::map(const IResultRow& row) const {
    if (matches_signature(row)) {
        return RowMaterializer::materialize(*plan_, row);
    }
    return parent_.map(row);
}

std::shared_ptr<const RowMapper> BoundRowMapper::specialize(
    const ColumnSignature& signature) const {
    if (signature == plan_->signature()) {
        return std::make_shared<BoundRowMapper>(plan_, parent_);
    }
    return parent_.specialize(signature);
}

// ============================================================================
// BeanMapperFactory
// ============================================================================

BeanMapperFactory::BeanMapperFactory(MapperContext context, std::string prefix)
    : context_(std::move(context)), prefix_(std::move(prefix)) {}

bool BeanMapperFactory::supports(std::type_index type) const {
    return context_.resolver->catalog()->supports(type);
}

std::shared_ptr<const RowMapper> BeanMapperFactory::build(std::type_index type) const {
    // Surfaces IntrospectionError for unsupported types
    (void)context_.resolver->catalog()->introspect(type);
    return std::make_shared<BeanMapper>(type, prefix_, context_);
}

// ============================================================================
// MapperRegistry
// ============================================================================

void MapperRegistry::register_factory(std::shared_ptr<const RowMapperFactory> factory) {
    std::unique_lock lock(mutex_);
    factories_.push_back(std::move(factory));
    memo_.clear();
    ++generation_;
}

std::shared_ptr<const RowMapper> MapperRegistry::find_mapper(std::type_index type) {
    std::vector<std::shared_ptr<const RowMapperFactory>> factories;
    uint64_t generation = 0;
    {
        std::shared_lock lock(mutex_);
        const auto it = memo_.find(type);
        if (it != memo_.end()) {
            return it->second;
        }
        factories = factories_;
        generation = generation_;
    }

    // Factories run unlocked; they may look up other types in this registry
    std::shared_ptr<const RowMapper> mapper;
    for (auto f = factories.rbegin(); f != factories.rend(); ++f) {
        if ((*f)->supports(type)) {
            mapper = (*f)->build(type);
            break;
        }
    }

    std::unique_lock lock(mutex_);
    if (generation != generation_) {
        return mapper;
    }
    const auto [it, inserted] = memo_.try_emplace(type, std::move(mapper));
    return it->second;
}

size_t MapperRegistry::factory_count() const {
    std::shared_lock lock(mutex_);
    return factories_.size();
}

} // namespace rowmap
