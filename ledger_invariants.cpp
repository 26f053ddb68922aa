#include "ledger_invariants.hpp"

#include "ledger_errors.hpp"

namespace recon {
namespace invariants {

ReconciliationMode deriveMode(Amount allocated, Amount total) {
  if (allocated == 0) return ReconciliationMode::SIMPLE;
  if (allocated == total) return ReconciliationMode::SPLIT;
  return ReconciliationMode::PARTIAL;
}

void applyMovementDelta(BankMovement& movement, Amount delta) {
  if (delta > 0) {
    if (movement.status == MovementStatus::CANCELLED) {
      throw LedgerError(ErrorCode::INVALID_STATE,
                        "Movement " + movement.id + " is cancelled");
    }
    if (!movement.isDebit()) {
      throw LedgerError(ErrorCode::INVALID_STATE,
                        "Movement " + movement.id + " is a credit and cannot fund expenses");
    }
  }

  Amount next = movement.allocated + delta;
  if (next < 0) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Movement " + movement.id + " allocation would become negative");
  }
  if (next > movement.magnitude()) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Movement " + movement.id + " allocation would exceed its amount");
  }

  movement.allocated = next;
  movement.mode = deriveMode(movement.allocated, movement.magnitude());
}

void applyExpenseDelta(ExpenseRecord& expense, Amount delta) {
  Amount next = expense.reconciled + delta;
  if (next < 0) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Expense " + expense.id + " reconciled amount would become negative");
  }
  if (next > expense.amount) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Expense " + expense.id + " reconciled amount would exceed its amount");
  }

  expense.reconciled = next;
  refreshExpenseStatus(expense);
}

void refreshExpenseStatus(ExpenseRecord& expense) {
  expense.mode = deriveMode(expense.reconciled, expense.amount);

  if (expense.is_employee_advance) {
    expense.bank_status = BankStatus::NON_RECONCILABLE;
  } else if (expense.pending() == 0 && expense.amount > 0) {
    expense.bank_status = BankStatus::RECONCILED;
  } else {
    expense.bank_status = BankStatus::PENDING;
  }
}

void applyReimbursement(EmployeeAdvance& advance, Amount amount) {
  if (advance.status == AdvanceStatus::COMPLETED ||
      advance.status == AdvanceStatus::CANCELLED) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Advance " + advance.id + " is " + toString(advance.status));
  }
  if (amount > advance.pending()) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Reimbursement exceeds pending amount of advance " + advance.id);
  }

  advance.reimbursed_amount += amount;
  advance.status = deriveAdvanceStatus(advance.advance_amount, advance.reimbursed_amount);
}

AdvanceStatus deriveAdvanceStatus(Amount advance_amount, Amount reimbursed_amount) {
  if (advance_amount - reimbursed_amount == 0) return AdvanceStatus::COMPLETED;
  if (reimbursed_amount > 0) return AdvanceStatus::PARTIAL;
  return AdvanceStatus::PENDING;
}

ReimbursementStatus mirrorReimbursementStatus(AdvanceStatus status) {
  switch (status) {
    case AdvanceStatus::PENDING: return ReimbursementStatus::PENDING;
    case AdvanceStatus::PARTIAL: return ReimbursementStatus::PARTIAL;
    case AdvanceStatus::COMPLETED: return ReimbursementStatus::COMPLETED;
    case AdvanceStatus::CANCELLED: return ReimbursementStatus::NOT_REQUIRED;
  }
  return ReimbursementStatus::NOT_REQUIRED;
}

void refreshSplitCompleteness(SplitGroup& group) {
  Amount total = group.allocatedTotal();
  if (total > group.target_amount) {
    throw LedgerError(ErrorCode::ALLOCATION_OVERFLOW,
                      "Split group " + group.id + " allocates " + std::to_string(total) +
                      " against a target of " + std::to_string(group.target_amount));
  }

  group.is_complete = group.status != SplitGroupStatus::REJECTED &&
                      total == group.target_amount;
  for (auto& row : group.rows) {
    row.is_complete = group.is_complete;
  }
}

int basisPoints(Amount part, Amount whole) {
  if (whole <= 0) return 0;
  return static_cast<int>((part * 10000) / whole);
}

}  // namespace invariants
}  // namespace recon
