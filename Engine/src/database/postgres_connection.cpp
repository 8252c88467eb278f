/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <sstream>

namespace Lookalike {

bool DatabaseError::is_transient() const noexcept {
    if (sqlstate_.empty()) return true;     // client side: connection dropped mid-call
    if (sqlstate_.size() != 5) return false;
    std::string cls = sqlstate_.substr(0, 2);
    return cls == "08"                      // connection exception
        || cls == "40"                      // serialization failure, deadlock
        || cls == "53"                      // insufficient resources
        || sqlstate_ == "57P01"             // admin shutdown
        || sqlstate_ == "57P02"             // crash shutdown
        || sqlstate_ == "57P03"             // cannot connect now
        || sqlstate_ == "55P03";            // lock not available
}

PostgresConnection::PostgresConnection() {
    // Build connection string from environment
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "lookalike") << " ";
    conninfo << "user=" << (user ? user : "postgres") << " ";

    if (password) {
        conninfo << "password=" << password << " ";
    }

    connect(conninfo.str());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), conninfo_(std::move(other.conninfo_)), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        conninfo_ = std::move(other.conninfo_);
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conninfo_ = conninfo;
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("PostgreSQL connection failed: " + last_error_, "08006");
    }
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

void PostgresConnection::reset() {
    if (conn_) {
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) return;
        last_error_ = PQerrorMessage(conn_);
        disconnect();
        throw DatabaseError("PostgreSQL reconnect failed: " + last_error_, "08006");
    }
    connect(conninfo_);
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) {
        throw DatabaseError("Not connected to database", "08003");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    if (!result) {
        last_error_ = conn_ ? PQerrorMessage(conn_) : "no connection";
        throw DatabaseError("PostgreSQL query failed: " + last_error_, "");
    }

    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
        std::string sqlstate = state ? state : "";
        PQclear(result);
        throw DatabaseError("PostgreSQL query failed: " + last_error_, sqlstate);
    }
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    return result;
}

void PostgresConnection::execute(const std::string& sql) {
    ensure_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

size_t PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    const char* tuples = PQcmdTuples(result);
    size_t affected = (tuples && *tuples) ? std::strtoull(tuples, nullptr, 10) : 0;

    PQclear(result);
    return affected;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql) {
    ensure_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, std::function<void(const std::vector<std::string>&)> callback) {
    query(sql, {}, std::move(callback));
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               std::function<void(const std::vector<std::string>&)> callback) {
    PGresult* result = exec_params(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    try {
        for (int i = 0; i < nrows; ++i) {
            std::vector<std::string> row;
            row.reserve(nfields);

            for (int j = 0; j < nfields; ++j) {
                row.push_back(PQgetvalue(result, i, j));
            }

            callback(row);
        }
    } catch (...) {
        PQclear(result);
        throw;
    }

    PQclear(result);
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_ && conn_.is_connected()) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Transaction rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace Lookalike
