#include "database/db_connection.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include <cctype>
#include <cstring>
#include <vector>

namespace wordbase {

namespace {

std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

} // namespace

DatabaseConnection::DatabaseConnection(const DatabaseSettings& settings)
    : settings_(settings), conn_(nullptr) {
}

DatabaseConnection::~DatabaseConnection() {
    disconnect();
}

bool DatabaseConnection::connect() {
    disconnect();
    
    std::string conninfo = "host=" + quoteConnValue(settings_.host) +
                          " port=" + quoteConnValue(settings_.port) +
                          " dbname=" + quoteConnValue(settings_.dbname) +
                          " user=" + quoteConnValue(settings_.user) +
                          " password=" + quoteConnValue(settings_.password) +
                          " connect_timeout=" + std::to_string(settings_.pool_timeout.count());
    
    conn_ = PQconnectdb(conninfo.c_str());
    
    if (PQstatus(conn_) != CONNECTION_OK) {
        logError();
        return false;
    }
    
    Logger::getInstance().debug("Connected to PostgreSQL database " + settings_.dbname +
                                " at " + settings_.host + ":" + settings_.port);
    return true;
}

void DatabaseConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool DatabaseConnection::isConnected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool DatabaseConnection::isBroken() const {
    return conn_ != nullptr && PQstatus(conn_) != CONNECTION_OK;
}

PgResult DatabaseConnection::executeQuery(const std::string& query) {
    if (!isConnected()) {
        throw ConnectivityError("Database not connected");
    }
    
    PgResult res(PQexec(conn_, query.c_str()));
    
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK && PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        throwResultError(res.get(), "query");
    }
    
    return res;
}

PgResult DatabaseConnection::executePrepared(const std::string& stmt_name,
                                             int n_params,
                                             const char* const* param_values) {
    if (!isConnected()) {
        throw ConnectivityError("Database not connected");
    }
    
    // -1 length marks a NULL parameter
    std::vector<int> param_lengths(static_cast<size_t>(n_params));
    std::vector<int> param_formats(static_cast<size_t>(n_params), 0);
    for (int i = 0; i < n_params; i++) {
        param_lengths[i] = param_values[i] == nullptr ? -1 : static_cast<int>(strlen(param_values[i]));
    }
    
    PgResult res(PQexecPrepared(conn_, stmt_name.c_str(), n_params, param_values,
                                param_lengths.data(), param_formats.data(), 0));
    
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK && PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        throwResultError(res.get(), "prepared statement " + stmt_name);
    }
    
    return res;
}

PgResult DatabaseConnection::executeParams(const std::string& query,
                                           int n_params,
                                           const char* const* param_values) {
    if (!isConnected()) {
        throw ConnectivityError("Database not connected");
    }
    
    std::vector<int> param_lengths(static_cast<size_t>(n_params));
    std::vector<int> param_formats(static_cast<size_t>(n_params), 0);
    for (int i = 0; i < n_params; i++) {
        param_lengths[i] = param_values[i] == nullptr ? -1 : static_cast<int>(strlen(param_values[i]));
    }
    
    PgResult res(PQexecParams(conn_, query.c_str(), n_params, nullptr, param_values,
                              param_lengths.data(), param_formats.data(), 0));
    
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK && PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        throwResultError(res.get(), "parameterized query");
    }
    
    return res;
}

bool DatabaseConnection::prepareStatement(const std::string& stmt_name, const std::string& query) {
    if (!isConnected()) {
        Logger::getInstance().error("Database not connected");
        return false;
    }
    
    // Count the highest $N placeholder
    int param_count = 0;
    size_t pos = 0;
    while ((pos = query.find('$', pos)) != std::string::npos) {
        pos++;
        if (pos < query.length() && std::isdigit(static_cast<unsigned char>(query[pos]))) {
            int num = 0;
            while (pos < query.length() && std::isdigit(static_cast<unsigned char>(query[pos]))) {
                num = num * 10 + (query[pos] - '0');
                pos++;
            }
            if (num > param_count) param_count = num;
        }
    }
    
    PgResult res(PQprepare(conn_, stmt_name.c_str(), query.c_str(), param_count, nullptr));
    
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        Logger::getInstance().error("Failed to prepare statement '" + stmt_name + "' with " +
                                    std::to_string(param_count) + " params: " + getLastError());
        return false;
    }
    
    Logger::getInstance().debug("Prepared statement '" + stmt_name + "' with " +
                                std::to_string(param_count) + " parameters");
    return true;
}

std::string DatabaseConnection::getLastError() const {
    if (conn_) {
        return PQerrorMessage(conn_);
    }
    return "No connection";
}

void DatabaseConnection::logError() {
    if (conn_) {
        Logger::getInstance().error("PostgreSQL error: " + std::string(PQerrorMessage(conn_)));
    }
}

void DatabaseConnection::throwResultError(PGresult* res, const std::string& context) {
    const char* sqlstate = res ? PQresultErrorField(res, PG_DIAG_SQLSTATE) : nullptr;
    const char* message = res ? PQresultErrorMessage(res) : nullptr;
    std::string error_msg = (message && *message) ? message : getLastError();
    const std::string state = sqlstate ? sqlstate : "";
    
    if (state == "23505") {
        throw ConflictError("Unique constraint violated (" + context + "): " + error_msg);
    }
    if (state.compare(0, 2, "08") == 0 || PQstatus(conn_) != CONNECTION_OK) {
        Logger::getInstance().error("PostgreSQL connection lost (" + context + "): " + error_msg);
        throw ConnectivityError("Store unreachable (" + context + "): " + error_msg);
    }
    Logger::getInstance().error("PostgreSQL error (" + context + ", SQLSTATE " + state + "): " + error_msg);
    throw StorageError("Store error (" + context + "): " + error_msg);
}

TransactionGuard::TransactionGuard(DatabaseConnection& conn)
    : conn_(conn), finished_(false) {
    conn_.executeQuery("BEGIN");
}

TransactionGuard::~TransactionGuard() {
    if (finished_) {
        return;
    }
    if (!conn_.isConnected()) {
        return;
    }
    PgResult rb(PQexec(conn_.getConnection(), "ROLLBACK"));
    if (PQresultStatus(rb.get()) != PGRES_COMMAND_OK) {
        Logger::getInstance().warning("ROLLBACK failed: " + conn_.getLastError());
    }
}

void TransactionGuard::commit() {
    conn_.executeQuery("COMMIT");
    finished_ = true;
}

} // namespace wordbase
