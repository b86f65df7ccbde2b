#pragma once

#include "core/error.hpp"
#include "core/result_row.hpp"
#include "mapper/mapping_plan.hpp"

#include <memory>
#include <typeindex>
#include <utility>

namespace rowmap {

/**
 * @brief Applies a resolved MappingPlan to one row
 *
 * Creates a fresh default-constructed instance, then for each entry in
 * column order reads the column through the entry's converter and writes
 * it to the entry's property. Properties without an entry keep their
 * default values. Stateless; safe to call from any thread.
 */
class RowMaterializer {
public:
    /**
     * @brief Build one type-erased instance from a row
     * @throws MappingError (SIGNATURE_MISMATCH) if the row is narrower than the plan
     * @throws InstantiationError if the type cannot be constructed
     * @throws PropertyWriteError (or NullValueError) naming the failing property
     */
    [[nodiscard]] static std::shared_ptr<void> materialize(const MappingPlan& plan,
                                                           const IResultRow& row);

    /**
     * @brief Typed variant; T must be the type the plan was resolved for
     */
    template<typename T>
    [[nodiscard]] static T materialize_as(const MappingPlan& plan, const IResultRow& row) {
        if (plan.shape().type != std::type_index(typeid(T))) {
            throw MappingError(ErrorCategory::SIGNATURE_MISMATCH,
                               "Plan for " + plan.shape().name + " applied as another type");
        }
        auto instance = materialize(plan, row);
        return std::move(*static_cast<T*>(instance.get()));
    }
};

} // namespace rowmap
