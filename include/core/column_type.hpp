#pragma once

#include <cstdint>
#include <string>

namespace rowmap {

/**
 * @brief Database-agnostic column type classification
 *
 * Connection adapters map vendor types (PG OIDs, MySQL field types) onto
 * this enum; the value decoder uses it to pick the SqlValue alternative.
 */
enum class GenericColumnType : uint16_t {
    UNKNOWN = 0,

    // Integer family
    SMALLINT,
    INTEGER,
    BIGINT,

    // Floating point
    REAL,
    DOUBLE_PRECISION,
    NUMERIC,

    // String family
    TEXT,
    VARCHAR,
    CHAR,

    BOOLEAN,

    // Date/Time (carried as text)
    DATE,
    TIME,
    TIMESTAMP,
    TIMESTAMP_TZ,

    BLOB,
    JSON,
    UUID,

    VENDOR_SPECIFIC,
};

/**
 * @brief Column type carrying both the generic and the vendor-specific id
 */
struct ColumnTypeInfo {
    GenericColumnType generic_type = GenericColumnType::UNKNOWN;
    uint32_t vendor_type_id = 0;       // PG OID or MySQL field type enum
    std::string vendor_type_name;

    ColumnTypeInfo() = default;
    ColumnTypeInfo(GenericColumnType gt, uint32_t vid, std::string vname)
        : generic_type(gt), vendor_type_id(vid), vendor_type_name(std::move(vname)) {}
};

[[nodiscard]] inline const char* generic_column_type_to_string(GenericColumnType type) {
    switch (type) {
        case GenericColumnType::UNKNOWN: return "UNKNOWN";
        case GenericColumnType::SMALLINT: return "SMALLINT";
        case GenericColumnType::INTEGER: return "INTEGER";
        case GenericColumnType::BIGINT: return "BIGINT";
        case GenericColumnType::REAL: return "REAL";
        case GenericColumnType::DOUBLE_PRECISION: return "DOUBLE_PRECISION";
        case GenericColumnType::NUMERIC: return "NUMERIC";
        case GenericColumnType::TEXT: return "TEXT";
        case GenericColumnType::VARCHAR: return "VARCHAR";
        case GenericColumnType::CHAR: return "CHAR";
        case GenericColumnType::BOOLEAN: return "BOOLEAN";
        case GenericColumnType::DATE: return "DATE";
        case GenericColumnType::TIME: return "TIME";
        case GenericColumnType::TIMESTAMP: return "TIMESTAMP";
        case GenericColumnType::TIMESTAMP_TZ: return "TIMESTAMP_TZ";
        case GenericColumnType::BLOB: return "BLOB";
        case GenericColumnType::JSON: return "JSON";
        case GenericColumnType::UUID: return "UUID";
        case GenericColumnType::VENDOR_SPECIFIC: return "VENDOR_SPECIFIC";
        default: return "UNKNOWN";
    }
}

[[nodiscard]] inline bool is_integer_type(GenericColumnType type) {
    return type == GenericColumnType::SMALLINT ||
           type == GenericColumnType::INTEGER ||
           type == GenericColumnType::BIGINT;
}

// NUMERIC is excluded: arbitrary precision stays text until a converter asks
[[nodiscard]] inline bool is_floating_type(GenericColumnType type) {
    return type == GenericColumnType::REAL ||
           type == GenericColumnType::DOUBLE_PRECISION;
}

} // namespace rowmap
