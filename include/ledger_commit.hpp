#ifndef LEDGER_COMMIT_HPP_
#define LEDGER_COMMIT_HPP_

#include "ledger_store.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace recon {

/**
 * Read access a store grants to the commit stager while it holds its
 * write lock (or database transaction).
 */
class CommitSource {
 public:
  virtual ~CommitSource() = default;

  virtual std::optional<BankMovement> loadMovement(const std::string& id) = 0;
  virtual std::optional<ExpenseRecord> loadExpense(const std::string& id) = 0;
  virtual std::optional<SplitGroup> loadSplitGroup(const std::string& id) = 0;
  virtual std::optional<EmployeeAdvance> loadAdvance(const std::string& id) = 0;
  virtual std::optional<NonReconciliationCase> loadCase(const std::string& id) = 0;

  /** True if a per-record delta key was applied by an earlier commit. */
  virtual bool recordOperationApplied(const std::string& key) = 0;
};

/**
 * Result of staging a LedgerTransaction: the final state of every touched
 * record with versions already bumped. Nothing here is visible yet.
 */
struct StagedCommit {
  std::map<std::string, BankMovement> movements;
  std::map<std::string, ExpenseRecord> expenses;
  std::map<std::string, SplitGroup> split_groups;
  std::map<std::string, EmployeeAdvance> advances;
  std::map<std::string, NonReconciliationCase> cases;

  // Ids among the above that did not exist before this commit.
  std::set<std::string> inserted_split_groups;
  std::set<std::string> inserted_advances;
  std::set<std::string> inserted_cases;

  std::vector<std::string> record_operation_keys;
  std::vector<CaseHistoryEntry> history;
};

/**
 * Validates versions and applies every change to private copies.
 * Throws LedgerError (CONCURRENCY_CONFLICT, NOT_FOUND, INVALID_STATE,
 * ALLOCATION_OVERFLOW) without side effects on the source.
 */
StagedCommit stageCommit(const LedgerTransaction& transaction, CommitSource& source);

/** Idempotency key of a per-record delta. */
std::string recordOperationKey(const std::string& kind, const std::string& record_id,
                               const std::string& operation_id);

}  // namespace recon

#endif  // LEDGER_COMMIT_HPP_
