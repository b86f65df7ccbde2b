#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>

namespace rowmap {

/**
 * @brief One pre-fetched row of a query result
 *
 * Column positions are 1-indexed, matching the numbering used by SQL
 * result metadata. Implementations hold no cursor; reading a value never
 * performs I/O.
 */
class IResultRow {
public:
    virtual ~IResultRow() = default;

    [[nodiscard]] virtual size_t column_count() const = 0;

    /**
     * @brief Column label at position (1-indexed)
     * @throws std::out_of_range for positions outside [1, column_count()]
     */
    [[nodiscard]] virtual const std::string& column_label(size_t column) const = 0;

    /**
     * @brief Raw value at position (1-indexed)
     * @throws std::out_of_range for positions outside [1, column_count()]
     */
    [[nodiscard]] virtual const SqlValue& value(size_t column) const = 0;
};

[[nodiscard]] inline ColumnSignature column_signature(const IResultRow& row) {
    ColumnSignature signature;
    const size_t count = row.column_count();
    signature.reserve(count);
    for (size_t i = 1; i <= count; ++i) {
        signature.push_back(row.column_label(i));
    }
    return signature;
}

} // namespace rowmap
