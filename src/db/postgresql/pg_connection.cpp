#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "db/value_decoder.hpp"
#include "core/utils.hpp"
#include <cstring>

namespace rowmap {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

ResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return ResultSet::failure("Connection is null");
    }

    PGresult* res = PQexec(conn_, sql.c_str());

    if (!res) {
        return ResultSet::failure(PQerrorMessage(conn_));
    }

    const ExecStatusType status = PQresultStatus(res);

    if (status == PGRES_TUPLES_OK) {
        auto result = process_tuples_result(res);
        PQclear(res);
        return result;
    }

    if (status == PGRES_COMMAND_OK) {
        auto result = process_command_result(res);
        PQclear(res);
        return result;
    }

    std::string error = PQerrorMessage(conn_);
    PQclear(res);
    return ResultSet::failure(std::move(error));
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

ResultSet PgConnection::process_tuples_result(PGresult* res) {
    ResultSetBuilder builder;

    const int ncols = PQnfields(res);
    for (int i = 0; i < ncols; i++) {
        builder.add_column(PQfname(res, i),
                           PgTypeMap::build_type_info(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    std::vector<ResultSetBuilder::Cell> cells(static_cast<size_t>(ncols));
    for (int i = 0; i < nrows; i++) {
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                cells[j] = std::nullopt;
            } else {
                cells[j] = std::string_view(PQgetvalue(res, i, j),
                                            static_cast<size_t>(PQgetlength(res, i, j)));
            }
        }
        builder.add_row(cells);
    }

    return builder.finish();
}

ResultSet PgConnection::process_command_result(PGresult* res) {
    ResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = std::stoull(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::string("Failed to connect: ") + PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace rowmap
