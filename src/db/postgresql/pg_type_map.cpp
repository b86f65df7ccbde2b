#include "db/postgresql/pg_type_map.hpp"
#include <unordered_map>

namespace rowmap {

namespace {

struct PgTypeEntry {
    GenericColumnType generic;
    const char* name;
};

const std::unordered_map<uint32_t, PgTypeEntry>& oid_table() {
    static const std::unordered_map<uint32_t, PgTypeEntry> OID_TO_GENERIC = {
        {16,   {GenericColumnType::BOOLEAN, "boolean"}},
        {17,   {GenericColumnType::BLOB, "bytea"}},
        {20,   {GenericColumnType::BIGINT, "bigint"}},
        {21,   {GenericColumnType::SMALLINT, "smallint"}},
        {23,   {GenericColumnType::INTEGER, "integer"}},
        {25,   {GenericColumnType::TEXT, "text"}},
        {26,   {GenericColumnType::BIGINT, "oid"}},
        {114,  {GenericColumnType::JSON, "json"}},
        {700,  {GenericColumnType::REAL, "real"}},
        {701,  {GenericColumnType::DOUBLE_PRECISION, "double precision"}},
        {1042, {GenericColumnType::CHAR, "character"}},
        {1043, {GenericColumnType::VARCHAR, "character varying"}},
        {1082, {GenericColumnType::DATE, "date"}},
        {1083, {GenericColumnType::TIME, "time"}},
        {1114, {GenericColumnType::TIMESTAMP, "timestamp"}},
        {1184, {GenericColumnType::TIMESTAMP_TZ, "timestamptz"}},
        {1266, {GenericColumnType::TIME, "timetz"}},
        {1700, {GenericColumnType::NUMERIC, "numeric"}},
        {2950, {GenericColumnType::UUID, "uuid"}},
        {3802, {GenericColumnType::JSON, "jsonb"}},
    };
    return OID_TO_GENERIC;
}

} // anonymous namespace

GenericColumnType PgTypeMap::oid_to_generic_type(uint32_t oid) {
    const auto& table = oid_table();
    const auto it = table.find(oid);
    return it != table.end() ? it->second.generic : GenericColumnType::UNKNOWN;
}

ColumnTypeInfo PgTypeMap::build_type_info(uint32_t oid) {
    const auto& table = oid_table();
    const auto it = table.find(oid);
    if (it == table.end()) {
        return ColumnTypeInfo(GenericColumnType::VENDOR_SPECIFIC, oid, "");
    }
    return ColumnTypeInfo(it->second.generic, oid, it->second.name);
}

} // namespace rowmap
