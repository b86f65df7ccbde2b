#pragma once

#include "core/database_type.hpp"
#include "db/result_set.hpp"

#include <memory>
#include <string>

namespace rowmap {

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*, MYSQL*).
 * Implementations are not thread-safe; one connection belongs to one
 * logical session, and so does the transaction Handle built over it.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL query or statement and fetch the whole result
     * @return Fully fetched result; success == false carries the server error
     */
    [[nodiscard]] virtual ResultSet execute(const std::string& sql) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    virtual void close() = 0;
};

/**
 * @brief Creates connections for one SQL dialect
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @param connection_string Backend-specific connection string
     * @return New connection, or nullptr on failure (logged)
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string) = 0;

    // Dialect of the connections this factory creates
    [[nodiscard]] virtual DatabaseType dialect() const = 0;
};

} // namespace rowmap
