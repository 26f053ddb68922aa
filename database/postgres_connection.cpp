#include "postgres_connection.hpp"

#include "ledger_errors.hpp"
#include "observability/logger.hpp"

#include <sstream>

namespace recon {
namespace database {

using observability::LogLevel;

namespace {

// Quotes a libpq keyword value.
std::string quoteValue(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') quoted += '\\';
    quoted += c;
  }
  return quoted + "'";
}

}  // namespace

PostgresConnection::PostgresConnection(const ConnectionConfig& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectUnlocked();
  }

  // Build connection string
  std::stringstream conn_str;
  conn_str << "host=" << quoteValue(config_.host)
           << " port=" << config_.port
           << " dbname=" << quoteValue(config_.database)
           << " user=" << quoteValue(config_.username)
           << " password=" << quoteValue(config_.password)
           << " connect_timeout=" << config_.connection_timeout;

  connection_ = PQconnectdb(conn_str.str().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    LOG_BUILDER(LogLevel::ERROR, "Database connection failed")
        .field("target", getConnectionInfo())
        .field("error", PQerrorMessage(connection_));
    disconnectUnlocked();
    return false;
  }

  LOG_BUILDER(LogLevel::INFO, "Connected to PostgreSQL").field("target", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectUnlocked();
}

void PostgresConnection::disconnectUnlocked() {
  if (connection_) {
    if (in_transaction_) {
      executeUnlocked("ROLLBACK");
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeUnlocked(query);
}

bool PostgresConnection::executeUnlocked(const std::string& query) {
  if (!connection_) return false;

  PgResult result(PQexec(connection_, query.c_str()));

  if (!result) {
    LOG_ERROR("Query execution failed: connection lost");
    return false;
  }

  ExecStatusType status = PQresultStatus(result.get());
  bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);

  if (!success) {
    LOG_BUILDER(LogLevel::ERROR, "Query failed")
        .field("error", PQresultErrorMessage(result.get()));
  }
  return success;
}

PgResult PostgresConnection::executeQueryWithResult(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) return nullptr;

  PgResult result(PQexec(connection_, query.c_str()));

  if (!result) {
    LOG_ERROR("Query execution failed: connection lost");
    return nullptr;
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    LOG_BUILDER(LogLevel::ERROR, "Query failed")
        .field("error", PQresultErrorMessage(result.get()));
    return nullptr;
  }

  return result;
}

PgResult PostgresConnection::executeParameterizedQuery(const std::string& query,
                                                       const Params& params) {
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) return nullptr;

  PgResult result(PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0));
  if (!result) {
    LOG_ERROR("Parameterized query execution failed: connection lost");
  }
  return result;
}

bool PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_transaction_ || !executeUnlocked("BEGIN ISOLATION LEVEL READ COMMITTED")) {
    return false;
  }

  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeUnlocked("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeUnlocked("ROLLBACK");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return "Not connected";
  }

  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw LedgerError(ErrorCode::STORAGE_ERROR,
                      "Failed to begin transaction: " + conn_.getLastError());
  }
}

TransactionGuard::~TransactionGuard() {
  if (!finished_ && !conn_.rollbackTransaction()) {
    LOG_WARN("Rollback of abandoned transaction failed");
  }
}

bool TransactionGuard::commit() {
  if (finished_) return false;
  finished_ = true;
  return conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (!finished_) {
    finished_ = true;
    if (!conn_.rollbackTransaction()) {
      LOG_WARN("Transaction rollback failed");
    }
  }
}

}  // namespace database
}  // namespace recon
