#pragma once

#include "core/column_type.hpp"
#include "core/types.hpp"
#include "db/result_set.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowmap {

/**
 * @brief Decode a column's text representation into a typed SqlValue
 *
 * Integer and floating column types become int64/double, BOOLEAN becomes
 * bool (accepting t/f, true/false, 1/0), everything else stays text.
 * Text that fails to parse is kept as a string rather than dropped, so a
 * converter further down still sees the original value.
 */
[[nodiscard]] SqlValue decode_text_value(GenericColumnType type, std::string_view text);

/**
 * @brief Accumulates a text-format query result into a ResultSet
 *
 * Adapters declare the columns first, then add rows of raw cells in
 * column order. A nullopt cell is SQL NULL; every other cell is decoded
 * with decode_text_value() using its column's generic type.
 */
class ResultSetBuilder {
public:
    using Cell = std::optional<std::string_view>;

    void add_column(std::string name, ColumnTypeInfo type);

    /**
     * @throws std::invalid_argument if cells.size() != column count
     */
    void add_row(const std::vector<Cell>& cells);

    [[nodiscard]] size_t column_count() const { return result_.column_names.size(); }

    [[nodiscard]] ResultSet finish();

private:
    ResultSet result_;
};

} // namespace rowmap
