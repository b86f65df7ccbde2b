#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "db/value_decoder.hpp"
#include "core/utils.hpp"

#include <charconv>

namespace rowmap {

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

ResultSet MysqlConnection::execute(const std::string& sql) {
    if (!conn_) {
        return ResultSet::failure("Connection is null");
    }

    if (mysql_query(conn_, sql.c_str()) != 0) {
        return ResultSet::failure(mysql_error(conn_));
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        auto result = process_result_set(res);
        mysql_free_result(res);
        return result;
    }

    // No result set: DML/DDL, or an error while fetching
    if (mysql_field_count(conn_) == 0) {
        return process_affected_rows();
    }
    return ResultSet::failure(mysql_error(conn_));
}

ResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    ResultSetBuilder builder;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);
    for (unsigned int i = 0; i < num_fields; ++i) {
        builder.add_column(fields[i].name, MysqlTypeMap::build_type_info(fields[i]));
    }

    std::vector<ResultSetBuilder::Cell> cells(num_fields);
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (!row[i]) {
                cells[i] = std::nullopt;
            } else {
                cells[i] = std::string_view(row[i], lengths[i]);
            }
        }
        builder.add_row(cells);
    }

    return builder.finish();
}

ResultSet MysqlConnection::process_affected_rows() {
    ResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    return result;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(
    const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        utils::log::error("mysql_init failed");
        return nullptr;
    }

    unsigned int timeout = 5;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.c_str(),
        params.port,
        nullptr,  // unix socket
        0         // client flags
    );

    if (!result) {
        utils::log::error(std::string("MySQL connection failed: ") + mysql_error(conn));
        mysql_close(conn);
        return nullptr;
    }

    return std::make_unique<MysqlConnection>(conn);
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    params.host = "localhost";
    params.port = 3306;

    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // user:password@
    const size_t at_pos = sv.find('@');
    if (at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        const size_t colon_pos = creds.find(':');
        if (colon_pos != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon_pos));
            params.password = std::string(creds.substr(colon_pos + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    // host:port/database
    const size_t slash_pos = sv.find('/');
    std::string_view host_port = sv;
    if (slash_pos != std::string_view::npos) {
        host_port = sv.substr(0, slash_pos);
        params.database = std::string(sv.substr(slash_pos + 1));
    }

    const size_t colon_pos = host_port.find(':');
    if (colon_pos != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon_pos));
        const std::string_view port_str = host_port.substr(colon_pos + 1);
        unsigned int port{};
        const auto [ptr, ec] = std::from_chars(port_str.data(),
                                               port_str.data() + port_str.size(), port);
        params.port = (ec == std::errc{}) ? port : 3306;
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace rowmap
