#pragma once

#include "core/types.hpp"
#include "mapper/converter_registry.hpp"
#include "mapper/property_descriptor.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace rowmap {

struct PlanEntry {
    size_t column_index;                // 1-indexed
    std::string column_label;
    Converter converter;
    const PropertyDescriptor* property; // owned by the plan's TypeShape
    bool typed_converter;               // false: passthrough fallback
};

/**
 * @brief Resolved association of result columns to properties
 *
 * Immutable and shared read-only between threads. Holds the TypeShape it
 * was built from, so entry descriptors stay valid for the plan's lifetime.
 *
 * Invariants (established by PlanResolver):
 * - every column_index is within [1, signature().size()]
 * - entries are in column order
 * - a descriptor appears in at most one entry
 */
class MappingPlan {
public:
    MappingPlan(std::shared_ptr<const TypeShape> shape,
                std::string prefix,
                ColumnSignature signature,
                std::vector<PlanEntry> entries)
        : shape_(std::move(shape)),
          prefix_(std::move(prefix)),
          signature_(std::move(signature)),
          entries_(std::move(entries)) {}

    [[nodiscard]] const TypeShape& shape() const { return *shape_; }
    [[nodiscard]] const std::string& prefix() const { return prefix_; }
    [[nodiscard]] const ColumnSignature& signature() const { return signature_; }
    [[nodiscard]] const std::vector<PlanEntry>& entries() const { return entries_; }

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    // Entry writing the named property, or nullptr
    [[nodiscard]] const PlanEntry* entry_for(std::string_view property) const {
        for (const auto& e : entries_) {
            if (e.property->name == property) return &e;
        }
        return nullptr;
    }

private:
    std::shared_ptr<const TypeShape> shape_;
    std::string prefix_;
    ColumnSignature signature_;
    std::vector<PlanEntry> entries_;
};

} // namespace rowmap
