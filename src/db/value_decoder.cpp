#include "db/value_decoder.hpp"
#include "core/utils.hpp"

#include <charconv>
#include <stdexcept>
#include <string>

namespace rowmap {

SqlValue decode_text_value(GenericColumnType type, std::string_view text) {
    if (is_integer_type(type)) {
        int64_t v{};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec == std::errc{} && ptr == text.data() + text.size()) return v;
        return std::string(text);
    }

    if (is_floating_type(type)) {
        double v{};
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec == std::errc{} && ptr == text.data() + text.size()) return v;
        return std::string(text);
    }

    if (type == GenericColumnType::BOOLEAN) {
        const auto lower = utils::to_lower(text);
        if (lower == "t" || lower == "true" || lower == "1") return true;
        if (lower == "f" || lower == "false" || lower == "0") return false;
        return std::string(text);
    }

    return std::string(text);
}

// ============================================================================
// ResultSetBuilder
// ============================================================================

void ResultSetBuilder::add_column(std::string name, ColumnTypeInfo type) {
    if (!result_.rows.empty()) {
        throw std::logic_error("ResultSetBuilder: columns must be added before rows");
    }
    result_.column_names.push_back(std::move(name));
    result_.column_types.push_back(std::move(type));
}

void ResultSetBuilder::add_row(const std::vector<Cell>& cells) {
    if (cells.size() != result_.column_names.size()) {
        throw std::invalid_argument("ResultSetBuilder: row of " + std::to_string(cells.size()) +
                                    " cells for " +
                                    std::to_string(result_.column_names.size()) + " columns");
    }

    std::vector<SqlValue> row;
    row.reserve(cells.size());
    for (size_t i = 0; i < cells.size(); ++i) {
        if (!cells[i]) {
            row.emplace_back(std::monostate{});
            continue;
        }
        row.push_back(decode_text_value(result_.column_types[i].generic_type, *cells[i]));
    }
    result_.rows.push_back(std::move(row));
}

ResultSet ResultSetBuilder::finish() {
    result_.success = true;
    result_.has_rows = true;
    return std::move(result_);
}

} // namespace rowmap
