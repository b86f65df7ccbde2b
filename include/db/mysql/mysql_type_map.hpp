#pragma once

#include "core/column_type.hpp"
#include <mysql/mysql.h>
#include <cstdint>
#include <string>

namespace rowmap {

/**
 * @brief MySQL type mapping utilities
 *
 * Maps MySQL result field types onto GenericColumnType.
 */
class MysqlTypeMap {
public:
    [[nodiscard]] static GenericColumnType field_type_to_generic(enum_field_types field_type);

    /**
     * @brief Build a full ColumnTypeInfo from a result field
     * @param field Field metadata from mysql_fetch_fields
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(const MYSQL_FIELD& field);
};

} // namespace rowmap
