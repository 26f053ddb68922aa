#ifndef MEMORY_LEDGER_STORE_HPP_
#define MEMORY_LEDGER_STORE_HPP_

#include "ledger_store.hpp"

#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace recon {

/**
 * In-memory ledger store.
 * Readers share the lock; commits take it exclusively, so a commit is
 * never partially observable.
 */
class InMemoryLedgerStore : public LedgerStore {
 public:
  InMemoryLedgerStore() = default;
  ~InMemoryLedgerStore() override = default;

  // Non-copyable
  InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

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

  std::unordered_map<std::string, BankMovement> movements_;
  std::unordered_map<std::string, ExpenseRecord> expenses_;
  std::unordered_map<std::string, SplitGroup> split_groups_;
  std::unordered_map<std::string, EmployeeAdvance> advances_;
  std::unordered_map<std::string, NonReconciliationCase> cases_;
  std::unordered_map<std::string, std::vector<CaseHistoryEntry>> history_;
  std::unordered_set<std::string> operations_;
  std::unordered_set<std::string> record_operations_;
  uint64_t next_history_sequence_ = 1;

  mutable std::shared_mutex mutex_;
};

}  // namespace recon

#endif  // MEMORY_LEDGER_STORE_HPP_
