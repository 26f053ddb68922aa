#include "advance_ledger.hpp"

#include "concurrent/optimistic_retry.hpp"
#include "ledger_errors.hpp"
#include "ledger_invariants.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>

namespace recon {
namespace advances {

using observability::LogLevel;

namespace {

void requireOperation(const std::string& operation_id) {
  if (operation_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "An operation id is required");
  }
}

bool isOpen(const EmployeeAdvance& advance) {
  return advance.status == AdvanceStatus::PENDING || advance.status == AdvanceStatus::PARTIAL;
}

ExpenseFlagUpdate flagsFor(const ExpenseRecord& expense, const EmployeeAdvance& advance) {
  ExpenseFlagUpdate flags;
  flags.expense_id = expense.id;
  flags.expected_version = expense.version;
  if (advance.status == AdvanceStatus::CANCELLED) {
    flags.is_employee_advance = false;
    flags.advance_id.reset();
  } else {
    flags.is_employee_advance = true;
    flags.advance_id = advance.id;
  }
  flags.reimbursement_status = invariants::mirrorReimbursementStatus(advance.status);
  return flags;
}

}  // namespace

std::string toString(AgingPriority priority) {
  switch (priority) {
    case AgingPriority::NORMAL: return "normal";
    case AgingPriority::WARNING: return "warning";
    case AgingPriority::URGENT: return "urgent";
  }
  return "normal";
}

AdvanceLedger::AdvanceLedger(LedgerStore& store, allocation::AllocationEngine& allocation,
                             AdvanceConfig config)
    : store_(store), allocation_(allocation), config_(config) {
}

AdvanceOutcome AdvanceLedger::CreateAdvance(const NewAdvance& request) {
  requireOperation(request.operation_id);
  if (request.employee_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Advance requires an employee id");
  }
  if (request.amount <= 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Advance amount must be positive");
  }

  return concurrent::retryOnConflict(
      "create_advance", request.operation_id, config_.max_retries, [&]() -> AdvanceOutcome {
        if (store_.hasOperation(request.operation_id)) {
          auto existing = FindAdvanceForExpense(request.expense_id);
          if (!existing) {
            throw LedgerError(ErrorCode::NOT_FOUND,
                              "No advance recorded for expense " + request.expense_id);
          }
          return {*existing, true};
        }

        ExpenseRecord expense = store_.getExpense(request.expense_id);
        if (expense.is_employee_advance || expense.advance_id) {
          throw LedgerError(ErrorCode::CONFLICTING_RECONCILIATION_MODE,
                            "Expense " + expense.id + " already carries an advance");
        }
        if (expense.reconciled > 0) {
          throw LedgerError(ErrorCode::CONFLICTING_RECONCILIATION_MODE,
                            "Expense " + expense.id + " is already reconciled against the bank");
        }
        if (expense.split_group_id) {
          auto group = store_.findSplitGroup(*expense.split_group_id);
          if (group && group->status == SplitGroupStatus::OPEN) {
            throw LedgerError(ErrorCode::CONFLICTING_RECONCILIATION_MODE,
                              "Expense " + expense.id + " belongs to open split group " +
                              group->id);
          }
        }
        if (request.amount > expense.amount) {
          throw LedgerError(ErrorCode::INVALID_ARGUMENT,
                            "Advance of " + std::to_string(request.amount) +
                            " exceeds expense " + expense.id + " amount");
        }

        EmployeeAdvance advance;
        advance.id = nextAdvanceId(expense.id);
        advance.employee_id = request.employee_id;
        advance.employee_name = request.employee_name;
        advance.expense_id = expense.id;
        advance.advance_amount = request.amount;
        advance.currency = expense.currency;
        advance.channel = request.channel;
        advance.status = AdvanceStatus::PENDING;
        advance.advance_date = request.advance_date;
        advance.payment_method = request.payment_method;
        advance.notes = request.notes;

        LedgerTransaction transaction;
        transaction.operation_id = request.operation_id;
        transaction.advances.push_back({advance, 0});
        transaction.expense_flags.push_back(flagsFor(expense, advance));

        if (!store_.commit(transaction)) {
          return {GetAdvance(advance.id), true};
        }

        observability::getGlobalMetrics().incrementCounter("recon_advances_created_total");
        LOG_BUILDER(LogLevel::INFO, "Employee advance created")
            .correlation(request.operation_id)
            .field("advance_id", advance.id)
            .field("expense_id", expense.id)
            .field("employee_id", advance.employee_id)
            .field("amount", advance.advance_amount);
        return {GetAdvance(advance.id), false};
      });
}

AdvanceOutcome AdvanceLedger::RecordReimbursement(const ReimbursementRequest& request) {
  requireOperation(request.operation_id);
  if (request.amount <= 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Reimbursement amount must be positive");
  }

  return concurrent::retryOnConflict(
      "record_reimbursement", request.operation_id, config_.max_retries,
      [&]() -> AdvanceOutcome {
        if (store_.hasOperation(request.operation_id)) {
          return {GetAdvance(request.advance_id), true};
        }

        EmployeeAdvance advance = GetAdvance(request.advance_id);
        uint64_t expected_version = advance.version;
        invariants::applyReimbursement(advance, request.amount);
        advance.reimbursement_date = request.reimbursed_at;
        if (request.channel) {
          advance.channel = *request.channel;
        }
        if (request.movement_id) {
          advance.reimbursement_movement_id = request.movement_id;
        }
        if (!request.notes.empty()) {
          advance.notes = advance.notes.empty() ? request.notes
                                                : advance.notes + "\n" + request.notes;
        }

        ExpenseRecord expense = store_.getExpense(advance.expense_id);

        LedgerTransaction transaction;
        transaction.operation_id = request.operation_id;
        transaction.advances.push_back({advance, expected_version});
        transaction.expense_flags.push_back(flagsFor(expense, advance));
        if (request.movement_id) {
          allocation_.StageMovementAllocation(transaction, *request.movement_id, request.amount,
                                              request.operation_id);
        }

        if (!store_.commit(transaction)) {
          return {GetAdvance(request.advance_id), true};
        }

        EmployeeAdvance committed = GetAdvance(request.advance_id);
        observability::getGlobalMetrics().incrementCounter("recon_reimbursements_total");
        LOG_BUILDER(LogLevel::INFO, "Reimbursement recorded")
            .correlation(request.operation_id)
            .field("advance_id", committed.id)
            .field("amount", request.amount)
            .field("pending", committed.pending())
            .field("status", toString(committed.status));
        return {committed, false};
      });
}

AdvanceOutcome AdvanceLedger::CancelAdvance(const std::string& operation_id,
                                            const std::string& advance_id,
                                            const std::string& reason, Timestamp now) {
  requireOperation(operation_id);

  return concurrent::retryOnConflict(
      "cancel_advance", operation_id, config_.max_retries, [&]() -> AdvanceOutcome {
        if (store_.hasOperation(operation_id)) {
          return {GetAdvance(advance_id), true};
        }

        EmployeeAdvance advance = GetAdvance(advance_id);
        if (!isOpen(advance)) {
          throw LedgerError(ErrorCode::INVALID_STATE,
                            "Advance " + advance_id + " is " + toString(advance.status));
        }
        uint64_t expected_version = advance.version;
        advance.status = AdvanceStatus::CANCELLED;
        advance.cancellation_reason = reason;

        ExpenseRecord expense = store_.getExpense(advance.expense_id);

        LedgerTransaction transaction;
        transaction.operation_id = operation_id;
        transaction.advances.push_back({advance, expected_version});
        transaction.expense_flags.push_back(flagsFor(expense, advance));

        if (!store_.commit(transaction)) {
          return {GetAdvance(advance_id), true};
        }

        observability::getGlobalMetrics().incrementCounter("recon_advances_cancelled_total");
        LOG_BUILDER(LogLevel::INFO, "Employee advance cancelled")
            .correlation(operation_id)
            .field("advance_id", advance_id)
            .field("reason", reason)
            .field("at", static_cast<int64_t>(now));
        return {GetAdvance(advance_id), false};
      });
}

EmployeeAdvance AdvanceLedger::GetAdvance(const std::string& advance_id) const {
  auto advance = store_.findAdvance(advance_id);
  if (!advance) {
    throw LedgerError(ErrorCode::NOT_FOUND, "Advance not found: " + advance_id);
  }
  return *advance;
}

std::optional<EmployeeAdvance> AdvanceLedger::FindAdvanceForExpense(
    const std::string& expense_id) const {
  std::optional<EmployeeAdvance> latest;
  for (auto& advance : store_.listAdvances()) {
    if (advance.expense_id != expense_id) continue;
    if (isOpen(advance) || advance.status == AdvanceStatus::COMPLETED) {
      return advance;
    }
    if (!latest || advance.advance_date >= latest->advance_date) {
      latest = std::move(advance);
    }
  }
  return latest;
}

std::vector<EmployeeAdvance> AdvanceLedger::ListAdvances(
    std::optional<AdvanceStatus> status) const {
  std::vector<EmployeeAdvance> result;
  for (auto& advance : store_.listAdvances()) {
    if (!status || advance.status == *status) {
      result.push_back(std::move(advance));
    }
  }
  return result;
}

EmployeeAdvanceSummary AdvanceLedger::EmployeeSummary(const std::string& employee_id) const {
  EmployeeAdvanceSummary summary;
  summary.employee_id = employee_id;

  for (const auto& advance : store_.listAdvances()) {
    if (advance.employee_id != employee_id) continue;

    summary.total_advances++;
    if (summary.employee_name.empty()) {
      summary.employee_name = advance.employee_name;
    }

    if (advance.status == AdvanceStatus::CANCELLED) {
      summary.cancelled_advances++;
      continue;
    }
    summary.total_amount += advance.advance_amount;
    summary.total_reimbursed += advance.reimbursed_amount;
    summary.total_pending += advance.pending();

    if (advance.status == AdvanceStatus::COMPLETED) {
      summary.completed_advances++;
    } else {
      summary.open_advances++;
      if (!summary.oldest_pending_date || advance.advance_date < *summary.oldest_pending_date) {
        summary.oldest_pending_date = advance.advance_date;
      }
    }
  }

  if (summary.total_advances == 0) {
    throw LedgerError(ErrorCode::NOT_FOUND, "No advances for employee " + employee_id);
  }
  return summary;
}

std::vector<PendingAdvance> AdvanceLedger::PendingAdvances(Timestamp now) const {
  std::vector<PendingAdvance> result;
  for (auto& advance : store_.listAdvances()) {
    if (!isOpen(advance)) continue;

    PendingAdvance entry;
    entry.days_outstanding =
        static_cast<int>(std::max<Timestamp>(0, now - advance.advance_date) / kSecondsPerDay);
    entry.priority = priorityFor(entry.days_outstanding);
    entry.advance = std::move(advance);
    result.push_back(std::move(entry));
  }

  std::stable_sort(result.begin(), result.end(),
                   [](const PendingAdvance& a, const PendingAdvance& b) {
                     return a.days_outstanding > b.days_outstanding;
                   });
  return result;
}

AdvanceSummary AdvanceLedger::Summary() const {
  AdvanceSummary summary;
  std::map<std::string, Amount> pending_by_employee;

  for (const auto& advance : store_.listAdvances()) {
    summary.total_advances++;
    summary.by_status[toString(advance.status)]++;
    summary.by_channel[toString(advance.channel)]++;
    if (advance.status == AdvanceStatus::CANCELLED) continue;

    summary.total_amount += advance.advance_amount;
    summary.total_reimbursed += advance.reimbursed_amount;
    summary.total_pending += advance.pending();
    if (advance.pending() > 0) {
      pending_by_employee[advance.employee_id] += advance.pending();
    }
  }
  summary.employees_with_pending = pending_by_employee.size();
  return summary;
}

std::string AdvanceLedger::nextAdvanceId(const std::string& expense_id) const {
  std::string base = "adv-" + expense_id;
  if (!store_.findAdvance(base)) return base;

  for (int n = 2;; ++n) {
    std::string candidate = base + "-" + std::to_string(n);
    if (!store_.findAdvance(candidate)) return candidate;
  }
}

AgingPriority AdvanceLedger::priorityFor(int days_outstanding) const {
  if (days_outstanding > config_.urgent_after_days) return AgingPriority::URGENT;
  if (days_outstanding > config_.warning_after_days) return AgingPriority::WARNING;
  return AgingPriority::NORMAL;
}

}  // namespace advances
}  // namespace recon
