#pragma once

#include "db/idb_connection.hpp"
#include <libpq-fe.h>
#include <string>

namespace rowmap {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and decodes text-format results into typed SqlValues
 * using the column OIDs. All libpq calls are encapsulated here.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    ResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    void close() override;

private:
    ResultSet process_tuples_result(PGresult* res);
    ResultSet process_command_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;

    DatabaseType dialect() const override { return DatabaseType::POSTGRESQL; }
};

} // namespace rowmap
