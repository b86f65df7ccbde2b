#include "mapper/row_materializer.hpp"

#include <exception>
#include <string>

namespace rowmap {

std::shared_ptr<void> RowMaterializer::materialize(const MappingPlan& plan,
                                                   const IResultRow& row) {
    const TypeShape& shape = plan.shape();

    if (row.column_count() < plan.signature().size()) {
        throw MappingError(ErrorCategory::SIGNATURE_MISMATCH,
                           "Row has " + std::to_string(row.column_count()) +
                           " columns, plan for " + shape.name + " expects " +
                           std::to_string(plan.signature().size()));
    }

    if (!shape.is_instantiable()) {
        throw InstantiationError(shape.name, "no default constructor registered");
    }

    std::shared_ptr<void> instance;
    try {
        instance = shape.factory();
    } catch (const std::exception& e) {
        throw InstantiationError(shape.name, e.what());
    }
    if (!instance) {
        throw InstantiationError(shape.name, "factory returned no instance");
    }

    for (const auto& entry : plan.entries()) {
        const PropertyDescriptor& property = *entry.property;
        if (!property.writable || !property.writer) {
            throw PropertyWriteError(property.name, "property is read-only");
        }

        try {
            property.writer(instance.get(), entry.converter(row, entry.column_index));
        } catch (const PropertyWriteError&) {
            throw;
        } catch (const std::exception& e) {
            throw PropertyWriteError(property.name,
                                     "column '" + entry.column_label + "': " + e.what());
        }
    }

    return instance;
}

} // namespace rowmap
