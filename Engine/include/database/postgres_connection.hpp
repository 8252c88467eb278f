/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <stdexcept>
#include <libpq-fe.h>

namespace Lookalike {

/**
 * @brief Failed statement or connection, with the server's SQLSTATE
 *
 * sqlstate is empty when the failure happened client-side before any
 * statement reached the server.
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& message, std::string sqlstate)
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const noexcept { return sqlstate_; }

    /**
     * @brief Connection loss, serialization failure, deadlock, resource or
     * operator interruption: worth retrying in a fresh transaction
     */
    bool is_transient() const noexcept;

    bool is_constraint_violation() const noexcept {
        return sqlstate_.size() == 5 && sqlstate_.compare(0, 2, "23") == 0;
    }

private:
    std::string sqlstate_;
};

/**
 * @brief PostgreSQL connection wrapper
 *
 * Manages connection to the lookalike database with environment-based configuration.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect using environment variables
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, lookalike, postgres, (no password)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Check if connected
     */
    bool is_connected() const;

    /**
     * @brief Re-establish a broken connection with the original conninfo
     * @throws DatabaseError (SQLSTATE 08006) if the server is unreachable
     */
    void reset();

    /**
     * @brief Execute query (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute query with parameters (no results)
     * @return Number of rows affected
     */
    size_t execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and return single value
     */
    std::optional<std::string> query_single(const std::string& sql);

    /**
     * @brief Execute query and return single value with params
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, std::function<void(const std::vector<std::string>&)> callback);

    /**
     * @brief Execute query with params and iterate rows
     */
    void query(const std::string& sql, const std::vector<std::string>& params,
               std::function<void(const std::vector<std::string>&)> callback);

    /**
     * @brief Begin transaction
     */
    void begin();

    /**
     * @brief Commit transaction
     */
    void commit();

    /**
     * @brief Rollback transaction
     */
    void rollback();

    /**
     * @brief RAII transaction guard
     *
     * Rolls back on destruction unless commit() or rollback() ran.
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    /**
     * @brief Get last error message
     */
    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string conninfo_;
    std::string last_error_;
};

} // namespace Lookalike
