#pragma once

#include "core/column_type.hpp"
#include "core/result_row.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace rowmap {

class ResultSet;

/**
 * @brief Read-only view of one row of a ResultSet
 *
 * Does not own data; valid as long as the ResultSet it came from.
 */
class ResultSetRow : public IResultRow {
public:
    ResultSetRow(const ResultSet& result_set, size_t row_index)
        : result_set_(&result_set), row_index_(row_index) {}

    [[nodiscard]] size_t column_count() const override;
    [[nodiscard]] const std::string& column_label(size_t column) const override;
    [[nodiscard]] const SqlValue& value(size_t column) const override;

    [[nodiscard]] size_t row_index() const { return row_index_; }

private:
    const ResultSet* result_set_;
    size_t row_index_;
};

/**
 * @brief Result of a query execution, fully fetched into memory
 *
 * Returned by IDbConnection::execute(). Owns the result data (decoded
 * from native result handles), so mapping never touches the connection.
 */
class ResultSet {
public:
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<SqlValue>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    ResultSet() = default;

    /**
     * @brief Build a successful in-memory result (tests, caches, adapters)
     */
    ResultSet(std::vector<std::string> columns, std::vector<std::vector<SqlValue>> data);

    [[nodiscard]] static ResultSet failure(std::string message);

    [[nodiscard]] size_t column_count() const { return column_names.size(); }
    [[nodiscard]] size_t row_count() const { return rows.size(); }

    /**
     * @brief View of row n (0-indexed)
     * @throws std::out_of_range if n >= row_count()
     */
    [[nodiscard]] ResultSetRow row(size_t n) const;

    [[nodiscard]] const ColumnSignature& signature() const { return column_names; }
};

} // namespace rowmap
