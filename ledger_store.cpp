#include "ledger_store.hpp"

#include "ledger_errors.hpp"

namespace recon {

BankMovement LedgerStore::getMovement(const std::string& id) const {
  auto movement = findMovement(id);
  if (!movement) {
    throw LedgerError(ErrorCode::NOT_FOUND, "Movement not found: " + id);
  }
  return *movement;
}

ExpenseRecord LedgerStore::getExpense(const std::string& id) const {
  auto expense = findExpense(id);
  if (!expense) {
    throw LedgerError(ErrorCode::NOT_FOUND, "Expense not found: " + id);
  }
  return *expense;
}

BankMovement LedgerStore::updateMovementAllocation(const std::string& id, Amount delta,
                                                   const std::string& operation_id) {
  if (operation_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Allocation update requires an operation id");
  }

  LedgerTransaction transaction;
  AllocationDelta change;
  change.record_id = id;
  change.delta = delta;
  change.operation_id = operation_id;
  transaction.movement_deltas.push_back(change);

  commit(transaction);
  return getMovement(id);
}

ExpenseRecord LedgerStore::updateExpenseReconciliation(const std::string& id, Amount delta,
                                                       const std::string& operation_id) {
  if (operation_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT,
                      "Reconciliation update requires an operation id");
  }

  LedgerTransaction transaction;
  AllocationDelta change;
  change.record_id = id;
  change.delta = delta;
  change.operation_id = operation_id;
  transaction.expense_deltas.push_back(change);

  commit(transaction);
  return getExpense(id);
}

}  // namespace recon
