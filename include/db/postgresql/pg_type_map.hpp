#pragma once

#include "core/column_type.hpp"
#include <cstdint>
#include <string>

namespace rowmap {

/**
 * @brief PostgreSQL type mapping utilities
 *
 * Maps result column OIDs (PQftype) onto GenericColumnType.
 */
class PgTypeMap {
public:
    /**
     * @brief Map PostgreSQL OID to GenericColumnType
     * @param oid PostgreSQL type OID
     * @return Generic column type (UNKNOWN for unmapped OIDs)
     */
    [[nodiscard]] static GenericColumnType oid_to_generic_type(uint32_t oid);

    /**
     * @brief Build a full ColumnTypeInfo from a result column OID
     */
    [[nodiscard]] static ColumnTypeInfo build_type_info(uint32_t oid);
};

} // namespace rowmap
