#ifndef WORDBASE_DB_CONNECTION_HPP
#define WORDBASE_DB_CONNECTION_HPP

#include <string>
#include <memory>
#include <libpq-fe.h>
#include "config/app_config.hpp"

namespace wordbase {

struct PgResultDeleter {
    void operator()(PGresult* res) const {
        if (res) PQclear(res);
    }
};

using PgResult = std::unique_ptr<PGresult, PgResultDeleter>;

/**
 * One physical PostgreSQL connection.
 *
 * executeQuery/executePrepared throw on failure: ConflictError for unique
 * violations (SQLSTATE 23505), ConnectivityError when the connection is gone
 * (SQLSTATE class 08 or CONNECTION_BAD), StorageError otherwise.
 */
class DatabaseConnection {
public:
    explicit DatabaseConnection(const DatabaseSettings& settings);
    ~DatabaseConnection();
    
    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;
    
    bool connect();
    void disconnect();
    bool isConnected() const;
    // Was connected once and has since lost the link
    bool isBroken() const;
    
    PgResult executeQuery(const std::string& query);
    PgResult executePrepared(const std::string& stmt_name,
                             int n_params,
                             const char* const* param_values);
    // One-off statement with bound parameters, no server-side preparation
    PgResult executeParams(const std::string& query,
                           int n_params,
                           const char* const* param_values);
    
    bool prepareStatement(const std::string& stmt_name,
                          const std::string& query);
    
    std::string getLastError() const;
    
    PGconn* getConnection() const { return conn_; }
    
private:
    DatabaseSettings settings_;
    PGconn* conn_;
    
    void logError();
    [[noreturn]] void throwResultError(PGresult* res, const std::string& context);
};

// Runs BEGIN on construction and ROLLBACK on destruction unless commit() succeeded
class TransactionGuard {
public:
    explicit TransactionGuard(DatabaseConnection& conn);
    ~TransactionGuard();
    
    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;
    
    void commit();
    
private:
    DatabaseConnection& conn_;
    bool finished_;
};

} // namespace wordbase

#endif // WORDBASE_DB_CONNECTION_HPP
