#pragma once

#include "core/error.hpp"
#include "core/result_row.hpp"
#include "core/type_name.hpp"
#include "db/result_set.hpp"
#include "mapper/converter_registry.hpp"
#include "mapper/mapping_config.hpp"
#include "mapper/plan_resolver.hpp"
#include "mapper/row_materializer.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rowmap {

class TypeRegistry;

// ============================================================================
// RowMapper interface
// ============================================================================

/**
 * @brief Turns result rows into instances of one target type
 *
 * Instances are returned type-erased; TypedRowMapper<T> restores the type.
 */
class RowMapper {
public:
    virtual ~RowMapper() = default;

    /**
     * @throws MappingError subclasses for resolution or write failures
     */
    [[nodiscard]] virtual std::shared_ptr<void> map(const IResultRow& row) const = 0;

    /**
     * @brief Mapper bound to the plan for one column signature
     *
     * Resolves eagerly, so resolution errors surface here rather than on
     * the first row.
     */
    [[nodiscard]] virtual std::shared_ptr<const RowMapper> specialize(
        const ColumnSignature& signature) const = 0;

    [[nodiscard]] virtual std::type_index target_type() const = 0;
};

/**
 * @brief Collaborators shared by every mapper built from one setup
 */
struct MapperContext {
    std::shared_ptr<PlanResolver> resolver;
    std::shared_ptr<const IConverterRegistry> converters;
    MappingConfig config;

    /**
     * @brief Standard wiring: registry-backed catalog, default converters
     */
    [[nodiscard]] static MapperContext create(std::shared_ptr<const TypeRegistry> types,
                                              MappingConfig config = {});
};

// ============================================================================
// BeanMapper / BoundRowMapper
// ============================================================================

/**
 * @brief Maps rows onto the properties of a registered type
 *
 * Optional prefix: only columns labelled "<prefix><name>" are considered,
 * which lets several mappers split one joined row.
 */
class BeanMapper : public RowMapper {
public:
    BeanMapper(std::type_index type, std::string prefix, MapperContext context);

    [[nodiscard]] std::shared_ptr<void> map(const IResultRow& row) const override;

    [[nodiscard]] std::shared_ptr<const RowMapper> specialize(
        const ColumnSignature& signature) const override;

    [[nodiscard]] std::type_index target_type() const override { return type_; }

    [[nodiscard]] const std::string& prefix() const { return prefix_; }

    [[nodiscard]] std::shared_ptr<const MappingPlan> resolve(const ColumnSignature& signature) const;

private:
    std::type_index type_;
    std::string prefix_;
    MapperContext context_;
};

/**
 * @brief BeanMapper with a pre-resolved plan
 *
 * Rows with the bound signature skip the resolver entirely. Rows with any
 * other signature go through the parent mapper.
 */
class BoundRowMapper : public RowMapper {
public:
    BoundRowMapper(std::shared_ptr<const MappingPlan> plan, BeanMapper parent);

    [[nodiscard]] std::shared_ptr<void> map(const IResultRow& row) const override;

    [[nodiscard]] std::shared_ptr<const RowMapper> specialize(
        const ColumnSignature& signature) const override;

    [[nodiscard]] std::type_index target_type() const override { return parent_.target_type(); }

    [[nodiscard]] const MappingPlan& plan() const { return *plan_; }

private:
    [[nodiscard]] bool matches_signature(const IResultRow& row) const;

    std::shared_ptr<const MappingPlan> plan_;
    BeanMapper parent_;
};

// ============================================================================
// Typed front end
// ============================================================================

template<typename T>
class TypedRowMapper {
public:
    explicit TypedRowMapper(std::shared_ptr<const RowMapper> mapper)
        : mapper_(std::move(mapper)) {
        if (!mapper_ || mapper_->target_type() != std::type_index(typeid(T))) {
            throw MappingError(ErrorCategory::SIGNATURE_MISMATCH,
                               "Row mapper does not produce " + type_name<T>());
        }
    }

    [[nodiscard]] T map(const IResultRow& row) const {
        auto instance = mapper_->map(row);
        return std::move(*static_cast<T*>(instance.get()));
    }

    [[nodiscard]] TypedRowMapper<T> specialize(const ColumnSignature& signature) const {
        return TypedRowMapper<T>(mapper_->specialize(signature));
    }

    [[nodiscard]] const std::shared_ptr<const RowMapper>& untyped() const { return mapper_; }

private:
    std::shared_ptr<const RowMapper> mapper_;
};

/**
 * @brief Map every row of a result set, resolving the plan once
 */
template<typename T>
[[nodiscard]] std::vector<T> map_all(const TypedRowMapper<T>& mapper, const ResultSet& result) {
    std::vector<T> out;
    if (result.row_count() == 0) return out;

    const auto bound = mapper.specialize(result.signature());
    out.reserve(result.row_count());
    for (size_t i = 0; i < result.row_count(); ++i) {
        out.push_back(bound.map(result.row(i)));
    }
    return out;
}

// ============================================================================
// Factories
// ============================================================================

class RowMapperFactory {
public:
    virtual ~RowMapperFactory() = default;

    [[nodiscard]] virtual bool supports(std::type_index type) const = 0;

    /**
     * @throws IntrospectionError if the type is not supported
     */
    [[nodiscard]] virtual std::shared_ptr<const RowMapper> build(std::type_index type) const = 0;
};

/**
 * @brief Builds BeanMappers for every type the catalog can introspect
 */
class BeanMapperFactory : public RowMapperFactory {
public:
    explicit BeanMapperFactory(MapperContext context, std::string prefix = "");

    [[nodiscard]] bool supports(std::type_index type) const override;
    [[nodiscard]] std::shared_ptr<const RowMapper> build(std::type_index type) const override;

    template<typename T>
    [[nodiscard]] TypedRowMapper<T> build() const {
        return TypedRowMapper<T>(build(std::type_index(typeid(T))));
    }

private:
    MapperContext context_;
    std::string prefix_;
};

/**
 * @brief Ordered table of mapper factories
 *
 * Lookup asks factories from the most recently registered backwards; the
 * first that supports the type builds its mapper. The result (including
 * "no mapper") is memoized per type until the next registration.
 */
class MapperRegistry {
public:
    MapperRegistry() = default;

    MapperRegistry(const MapperRegistry&) = delete;
    MapperRegistry& operator=(const MapperRegistry&) = delete;

    void register_factory(std::shared_ptr<const RowMapperFactory> factory);

    // nullptr if no registered factory supports the type
    [[nodiscard]] std::shared_ptr<const RowMapper> find_mapper(std::type_index type);

    template<typename T>
    [[nodiscard]] std::optional<TypedRowMapper<T>> find_mapper() {
        auto mapper = find_mapper(std::type_index(typeid(T)));
        if (!mapper) return std::nullopt;
        return TypedRowMapper<T>(std::move(mapper));
    }

    [[nodiscard]] size_t factory_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<const RowMapperFactory>> factories_;
    std::unordered_map<std::type_index, std::shared_ptr<const RowMapper>> memo_;
    uint64_t generation_ = 0;  // bumped by register_factory
};

} // namespace rowmap
