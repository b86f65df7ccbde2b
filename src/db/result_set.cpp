#include "db/result_set.hpp"

#include <stdexcept>

namespace rowmap {

// ============================================================================
// ResultSetRow
// ============================================================================

size_t ResultSetRow::column_count() const {
    return result_set_->column_names.size();
}

const std::string& ResultSetRow::column_label(size_t column) const {
    if (column == 0 || column > result_set_->column_names.size()) {
        throw std::out_of_range("Column index " + std::to_string(column) +
                                " outside result set of " +
                                std::to_string(result_set_->column_names.size()) + " columns");
    }
    return result_set_->column_names[column - 1];
}

const SqlValue& ResultSetRow::value(size_t column) const {
    const auto& data = result_set_->rows[row_index_];
    if (column == 0 || column > data.size()) {
        throw std::out_of_range("Column index " + std::to_string(column) +
                                " outside row of " + std::to_string(data.size()) + " values");
    }
    return data[column - 1];
}

// ============================================================================
// ResultSet
// ============================================================================

ResultSet::ResultSet(std::vector<std::string> columns, std::vector<std::vector<SqlValue>> data)
    : success(true),
      column_names(std::move(columns)),
      rows(std::move(data)),
      has_rows(true) {
    column_types.resize(column_names.size());
}

ResultSet ResultSet::failure(std::string message) {
    ResultSet result;
    result.success = false;
    result.error_message = std::move(message);
    return result;
}

ResultSetRow ResultSet::row(size_t n) const {
    if (n >= rows.size()) {
        throw std::out_of_range("Row " + std::to_string(n) + " outside result set of " +
                                std::to_string(rows.size()) + " rows");
    }
    return ResultSetRow(*this, n);
}

} // namespace rowmap
