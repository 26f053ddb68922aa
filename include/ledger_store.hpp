#ifndef LEDGER_STORE_HPP_
#define LEDGER_STORE_HPP_

#include "ledger_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace recon {

/**
 * Change to the allocated (movement) or reconciled (expense) running total.
 * `operation_id` makes the delta idempotent per record.
 */
struct AllocationDelta {
  std::string record_id;
  Amount delta = 0;
  std::string operation_id;
  std::optional<uint64_t> expected_version;
  std::optional<std::string> link_group;    // set split_group_id to this group
  std::optional<std::string> unlink_group;  // reset split_group_id if it names this group
  std::optional<std::string> restore_group; // value unlink_group resets to
};

/**
 * Replacement of the advance-related flags of an expense.
 */
struct ExpenseFlagUpdate {
  std::string expense_id;
  std::optional<uint64_t> expected_version;
  bool is_employee_advance = false;
  std::optional<std::string> advance_id;
  ReimbursementStatus reimbursement_status = ReimbursementStatus::NOT_REQUIRED;
};

/**
 * Insert (expected_version == 0) or compare-and-swap update of a whole record.
 */
template <typename Record>
struct VersionedWrite {
  Record record;
  uint64_t expected_version = 0;
};

/**
 * Set of writes that must become visible together or not at all.
 * A non-empty `operation_id` is recorded on commit; committing the same id
 * again is a no-op.
 */
struct LedgerTransaction {
  std::string operation_id;
  std::vector<AllocationDelta> movement_deltas;
  std::vector<AllocationDelta> expense_deltas;
  std::vector<ExpenseFlagUpdate> expense_flags;
  std::vector<VersionedWrite<SplitGroup>> split_groups;
  std::vector<VersionedWrite<EmployeeAdvance>> advances;
  std::vector<VersionedWrite<NonReconciliationCase>> cases;
  std::vector<CaseHistoryEntry> history;

  bool empty() const {
    return movement_deltas.empty() && expense_deltas.empty() && expense_flags.empty() &&
           split_groups.empty() && advances.empty() && cases.empty() && history.empty();
  }
};

/**
 * Abstract ledger storage.
 * Implementations apply a LedgerTransaction atomically: all expected versions
 * are checked first (CONCURRENCY_CONFLICT on mismatch), then every derived
 * field is recomputed through ledger_invariants, and only then is anything
 * made visible. Each record touched by a commit has its version bumped once.
 */
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  /** Imports a bank movement. INVALID_ARGUMENT if the id is taken. */
  virtual void insertMovement(const BankMovement& movement) = 0;

  /** Imports an expense record. INVALID_ARGUMENT if the id is taken. */
  virtual void insertExpense(const ExpenseRecord& expense) = 0;

  /** Marks a movement cancelled. INVALID_STATE while any amount is allocated. */
  virtual BankMovement cancelMovement(const std::string& movement_id) = 0;

  virtual std::optional<BankMovement> findMovement(const std::string& id) const = 0;
  virtual std::optional<ExpenseRecord> findExpense(const std::string& id) const = 0;
  virtual std::optional<SplitGroup> findSplitGroup(const std::string& id) const = 0;
  virtual std::optional<EmployeeAdvance> findAdvance(const std::string& id) const = 0;
  virtual std::optional<NonReconciliationCase> findCase(const std::string& id) const = 0;

  virtual std::vector<BankMovement> listMovements() const = 0;
  virtual std::vector<ExpenseRecord> listExpenses() const = 0;
  virtual std::vector<SplitGroup> listSplitGroups() const = 0;
  virtual std::vector<EmployeeAdvance> listAdvances() const = 0;
  virtual std::vector<NonReconciliationCase> listCases() const = 0;

  /** History entries of one case in the order they were appended. */
  virtual std::vector<CaseHistoryEntry> caseHistory(const std::string& case_id) const = 0;

  /** True if a transaction with this operation id was already committed. */
  virtual bool hasOperation(const std::string& operation_id) const = 0;

  /**
   * Applies the transaction atomically.
   * Returns false when its operation id was already committed (nothing applied).
   * A transaction without an operation id always applies.
   */
  virtual bool commit(const LedgerTransaction& transaction) = 0;

  /** NOT_FOUND if the movement does not exist. */
  BankMovement getMovement(const std::string& id) const;

  /** NOT_FOUND if the expense does not exist. */
  ExpenseRecord getExpense(const std::string& id) const;

  /**
   * Applies a single allocation delta to a movement and returns the result.
   * Re-applying the same operation id is a no-op.
   */
  BankMovement updateMovementAllocation(const std::string& id, Amount delta,
                                        const std::string& operation_id);

  /**
   * Applies a single reconciliation delta to an expense and returns the result.
   * Re-applying the same operation id is a no-op.
   */
  ExpenseRecord updateExpenseReconciliation(const std::string& id, Amount delta,
                                            const std::string& operation_id);
};

}  // namespace recon

#endif  // LEDGER_STORE_HPP_
