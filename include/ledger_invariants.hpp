#ifndef LEDGER_INVARIANTS_HPP_
#define LEDGER_INVARIANTS_HPP_

#include "ledger_types.hpp"

namespace recon {
namespace invariants {

/**
 * Derived-field maintenance for ledger records.
 * Every store implementation calls these inside its commit so that the
 * stored totals, modes and statuses never drift from the amounts.
 */

/** simple when nothing is allocated, split when fully allocated, partial otherwise. */
ReconciliationMode deriveMode(Amount allocated, Amount total);

/**
 * Adds `delta` to the movement's allocated total.
 * Throws INVALID_STATE when the result leaves [0, |amount|], when a positive
 * delta targets a credit movement, or when the movement is cancelled.
 */
void applyMovementDelta(BankMovement& movement, Amount delta);

/**
 * Adds `delta` to the expense's reconciled total and refreshes its mode and
 * bank status. Throws INVALID_STATE when the result leaves [0, amount].
 */
void applyExpenseDelta(ExpenseRecord& expense, Amount delta);

/** Recomputes mode and bank status from the reconciled total. */
void refreshExpenseStatus(ExpenseRecord& expense);

/**
 * Adds a reimbursement to the advance and derives its status.
 * Throws INVALID_STATE for terminal advances or amounts above pending.
 */
void applyReimbursement(EmployeeAdvance& advance, Amount amount);

/** pending, partial or completed from the reimbursed total. */
AdvanceStatus deriveAdvanceStatus(Amount advance_amount, Amount reimbursed_amount);

/** Reimbursement status mirrored onto the advance's expense. */
ReimbursementStatus mirrorReimbursementStatus(AdvanceStatus status);

/**
 * Recomputes completeness of a split group and its rows.
 * Throws ALLOCATION_OVERFLOW when the rows exceed the target.
 */
void refreshSplitCompleteness(SplitGroup& group);

/** Share of `part` in `whole` in basis points, rounded down. */
int basisPoints(Amount part, Amount whole);

}  // namespace invariants
}  // namespace recon

#endif  // LEDGER_INVARIANTS_HPP_
