#include "db/mysql/mysql_type_map.hpp"

namespace rowmap {

GenericColumnType MysqlTypeMap::field_type_to_generic(enum_field_types field_type) {
    switch (field_type) {
        // TINYINT(1) is MySQL's BOOLEAN; it decodes as an integer and the
        // bool converter accepts 0/1.
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
            return GenericColumnType::SMALLINT;
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_YEAR:
            return GenericColumnType::INTEGER;
        case MYSQL_TYPE_LONGLONG:
            return GenericColumnType::BIGINT;
        case MYSQL_TYPE_FLOAT:
            return GenericColumnType::REAL;
        case MYSQL_TYPE_DOUBLE:
            return GenericColumnType::DOUBLE_PRECISION;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return GenericColumnType::NUMERIC;
        case MYSQL_TYPE_STRING:
            return GenericColumnType::CHAR;
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_ENUM:
        case MYSQL_TYPE_SET:
            return GenericColumnType::VARCHAR;
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
            return GenericColumnType::BLOB;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
            return GenericColumnType::DATE;
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_TIME2:
            return GenericColumnType::TIME;
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_DATETIME2:
        case MYSQL_TYPE_TIMESTAMP:
        case MYSQL_TYPE_TIMESTAMP2:
            return GenericColumnType::TIMESTAMP;
        case MYSQL_TYPE_JSON:
            return GenericColumnType::JSON;
        case MYSQL_TYPE_BIT:
        case MYSQL_TYPE_GEOMETRY:
            return GenericColumnType::VENDOR_SPECIFIC;
        default:
            return GenericColumnType::UNKNOWN;
    }
}

ColumnTypeInfo MysqlTypeMap::build_type_info(const MYSQL_FIELD& field) {
    ColumnTypeInfo info;
    info.vendor_type_id = static_cast<uint32_t>(field.type);
    info.generic_type = field_type_to_generic(field.type);
    info.vendor_type_name = generic_column_type_to_string(info.generic_type);
    return info;
}

} // namespace rowmap
