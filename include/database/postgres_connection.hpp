#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <postgresql/libpq-fe.h>

namespace recon {
namespace database {

struct PgResultDeleter {
  void operator()(PGresult* result) const { PQclear(result); }
};

// Owning handle for a libpq result
using PgResult = std::unique_ptr<PGresult, PgResultDeleter>;

/**
 * Connection configuration
 */
struct ConnectionConfig {
  std::string host = "localhost";
  int port = 5432;
  std::string database = "recon_ledger";
  std::string username = "recon_user";
  std::string password = "";
  int connection_timeout = 30;  // seconds
};

/**
 * PostgreSQL database connection wrapper.
 * Every call is serialized on the connection; callers that need several
 * statements in one transaction use TransactionGuard and their own lock.
 */
class PostgresConnection {
 public:
  using Params = std::vector<std::optional<std::string>>;  // nullopt binds SQL NULL

  explicit PostgresConnection(const ConnectionConfig& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database.
   */
  bool connect();

  /**
   * Disconnect from the database.
   */
  void disconnect();

  /**
   * Check if connected.
   */
  bool isConnected() const;

  /**
   * Execute one or more statements that don't return results.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a query and get results; nullptr on failure.
   */
  PgResult executeQueryWithResult(const std::string& query);

  /**
   * Execute a parameterized query. The result is returned whatever its
   * status so callers can inspect SQLSTATE; nullptr only without a connection.
   */
  PgResult executeParameterizedQuery(const std::string& query, const Params& params);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();
  bool inTransaction() const;

  /**
   * Get last error message.
   */
  std::string getLastError() const;

  /**
   * Get connection info for logging (no password).
   */
  std::string getConnectionInfo() const;

 private:
  bool executeUnlocked(const std::string& query);
  void disconnectUnlocked();

  ConnectionConfig config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions; rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Returns false if COMMIT failed.
   */
  bool commit();

  /**
   * Rollback the transaction.
   */
  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace recon

#endif  // POSTGRES_CONNECTION_HPP_
