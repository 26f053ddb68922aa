#ifndef POSTGRES_LEDGER_STORE_HPP_
#define POSTGRES_LEDGER_STORE_HPP_

#include "postgres_connection.hpp"
#include "ledger_store.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace recon {
namespace database {

/**
 * Ledger store backed by PostgreSQL.
 *
 * A commit runs in one database transaction: touched rows are read with
 * SELECT ... FOR UPDATE, staged through the shared commit path and written
 * back before COMMIT. Operation ids are claimed in `applied_operations`, so a
 * replay from any process sharing the database is detected.
 *
 * Failures map to LedgerError: serialization failures, deadlocks and unique
 * violations become CONCURRENCY_CONFLICT, everything else STORAGE_ERROR.
 */
class PostgresLedgerStore : public LedgerStore {
 public:
  explicit PostgresLedgerStore(std::shared_ptr<PostgresConnection> conn);
  ~PostgresLedgerStore() override = default;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  /**
   * Creates the ledger tables from a schema file. Statements are idempotent.
   */
  bool initializeSchema(const std::string& schema_path);

  /**
   * Deletes every ledger row. Used by tests against a scratch database.
   */
  bool truncateAll();

  void insertMovement(const BankMovement& movement) override;
  void insertExpense(const ExpenseRecord& expense) override;
  BankMovement cancelMovement(const std::string& movement_id) override;

  std::optional<BankMovement> findMovement(const std::string& id) const override;
  std::optional<ExpenseRecord> findExpense(const std::string& id) const override;
  std::optional<SplitGroup> findSplitGroup(const std::string& id) const override;
  std::optional<EmployeeAdvance> findAdvance(const std::string& id) const override;
  std::optional<NonReconciliationCase> findCase(const std::string& id) const override;

  std::vector<BankMovement> listMovements() const override;
  std::vector<ExpenseRecord> listExpenses() const override;
  std::vector<SplitGroup> listSplitGroups() const override;
  std::vector<EmployeeAdvance> listAdvances() const override;
  std::vector<NonReconciliationCase> listCases() const override;
  std::vector<CaseHistoryEntry> caseHistory(const std::string& case_id) const override;

  bool hasOperation(const std::string& operation_id) const override;
  bool commit(const LedgerTransaction& transaction) override;

 private:
  class Source;

  PgResult run(const std::string& query, const PostgresConnection::Params& params,
               const std::string& context) const;

  std::optional<BankMovement> selectMovement(const std::string& id, bool for_update) const;
  std::optional<ExpenseRecord> selectExpense(const std::string& id, bool for_update) const;
  std::optional<SplitGroup> selectSplitGroup(const std::string& id, bool for_update) const;
  std::optional<EmployeeAdvance> selectAdvance(const std::string& id, bool for_update) const;
  std::optional<NonReconciliationCase> selectCase(const std::string& id, bool for_update) const;
  std::vector<SplitRow> selectSplitRows(const std::string& group_id) const;

  void writeMovement(const BankMovement& movement);
  void writeExpense(const ExpenseRecord& expense);
  void writeSplitGroup(const SplitGroup& group, bool insert);
  void writeAdvance(const EmployeeAdvance& advance, bool insert);
  void writeCase(const NonReconciliationCase& nr_case, bool insert);
  void appendHistory(const CaseHistoryEntry& entry);

  std::shared_ptr<PostgresConnection> conn_;

  // One connection: statements of concurrent callers must not interleave.
  mutable std::mutex mutex_;
};

}  // namespace database
}  // namespace recon

#endif  // POSTGRES_LEDGER_STORE_HPP_
