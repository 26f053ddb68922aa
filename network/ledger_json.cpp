#include "ledger_json.hpp"

#include "ledger_errors.hpp"

namespace recon {

namespace {

template <typename T>
nlohmann::json orNull(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json orNull(const std::optional<CaseStatus>& status) {
  return status ? nlohmann::json(toString(*status)) : nlohmann::json(nullptr);
}

}  // namespace

void to_json(nlohmann::json& j, const BankMovement& movement) {
  j = {
      {"id", movement.id},
      {"amount", movement.amount},
      {"currency", movement.currency},
      {"transaction_date", movement.transaction_date},
      {"description", movement.description},
      {"status", toString(movement.status)},
      {"reconciliation_mode", toString(movement.mode)},
      {"allocated", movement.allocated},
      {"unallocated", movement.unallocated()},
      {"split_group_id", orNull(movement.split_group_id)},
      {"version", movement.version},
  };
}

void to_json(nlohmann::json& j, const ExpenseRecord& expense) {
  j = {
      {"id", expense.id},
      {"amount", expense.amount},
      {"currency", expense.currency},
      {"expense_date", expense.expense_date},
      {"description", expense.description},
      {"reconciliation_mode", toString(expense.mode)},
      {"reconciled", expense.reconciled},
      {"pending", expense.pending()},
      {"bank_status", toString(expense.bank_status)},
      {"is_employee_advance", expense.is_employee_advance},
      {"advance_id", orNull(expense.advance_id)},
      {"reimbursement_status", toString(expense.reimbursement_status)},
      {"split_group_id", orNull(expense.split_group_id)},
      {"version", expense.version},
  };
}

void to_json(nlohmann::json& j, const SplitRow& row) {
  j = {
      {"expense_id", row.expense_id},
      {"movement_id", row.movement_id},
      {"allocated_amount", row.allocated_amount},
      {"percentage_bp", row.percentage_bp},
      {"is_complete", row.is_complete},
      {"created_by", row.created_by},
      {"created_at", row.created_at},
      {"notes", row.notes},
  };
}

void to_json(nlohmann::json& j, const SplitAnnotation& annotation) {
  j = {
      {"actor", annotation.actor},
      {"note", annotation.note},
      {"created_at", annotation.created_at},
  };
}

void to_json(nlohmann::json& j, const SplitGroup& group) {
  j = {
      {"id", group.id},
      {"type", toString(group.type)},
      {"anchor_id", group.anchor_id},
      {"target_amount", group.target_amount},
      {"allocated_total", group.allocatedTotal()},
      {"remaining", group.remaining()},
      {"rows", group.rows},
      {"status", toString(group.status)},
      {"is_complete", group.is_complete},
      {"created_by", group.created_by},
      {"created_at", group.created_at},
      {"updated_at", group.updated_at},
      {"finalized_at", orNull(group.finalized_at)},
      {"annotations", group.annotations},
      {"version", group.version},
  };
}

void to_json(nlohmann::json& j, const EmployeeAdvance& advance) {
  j = {
      {"id", advance.id},
      {"employee_id", advance.employee_id},
      {"employee_name", advance.employee_name},
      {"expense_id", advance.expense_id},
      {"advance_amount", advance.advance_amount},
      {"reimbursed_amount", advance.reimbursed_amount},
      {"pending_amount", advance.pending()},
      {"currency", advance.currency},
      {"reimbursement_channel", toString(advance.channel)},
      {"status", toString(advance.status)},
      {"advance_date", advance.advance_date},
      {"reimbursement_date", orNull(advance.reimbursement_date)},
      {"reimbursement_movement_id", orNull(advance.reimbursement_movement_id)},
      {"payment_method", advance.payment_method},
      {"notes", advance.notes},
      {"cancellation_reason", advance.cancellation_reason},
      {"version", advance.version},
  };
}

void to_json(nlohmann::json& j, const NonReconciliationCase& nr_case) {
  j = {
      {"id", nr_case.id},
      {"subject_kind", toString(nr_case.subject_kind)},
      {"subject_id", nr_case.subject_id},
      {"company_id", nr_case.company_id},
      {"reason_code", toString(nr_case.reason)},
      {"status", toString(nr_case.status)},
      {"escalation_level", nr_case.escalation_level},
      {"next_escalation_date", orNull(nr_case.next_escalation_date)},
      {"estimated_resolution_date", orNull(nr_case.estimated_resolution_date)},
      {"resolved_at", orNull(nr_case.resolved_at)},
      {"business_impact", toString(nr_case.business_impact)},
      {"resolution_priority", nr_case.resolution_priority},
      {"held_from", orNull(nr_case.held_from)},
      {"created_by", nr_case.created_by},
      {"created_at", nr_case.created_at},
      {"updated_at", nr_case.updated_at},
      {"notes", nr_case.notes},
      {"version", nr_case.version},
  };
}

void to_json(nlohmann::json& j, const CaseHistoryEntry& entry) {
  j = {
      {"sequence", entry.sequence},
      {"case_id", entry.case_id},
      {"action", toString(entry.action)},
      {"previous_status", orNull(entry.previous_status)},
      {"new_status", toString(entry.new_status)},
      {"previous_level", entry.previous_level},
      {"new_level", entry.new_level},
      {"performed_by", entry.performed_by},
      {"performed_at", entry.performed_at},
      {"notes", entry.notes},
      {"system_generated", entry.system_generated},
  };
}

namespace network {

BankMovement parseMovement(const nlohmann::json& payload) {
  BankMovement movement;
  movement.id = field<std::string>(payload, "id");
  movement.amount = field<Amount>(payload, "amount");
  movement.currency = fieldOr<std::string>(payload, "currency", "EUR");
  movement.transaction_date = fieldOr<Timestamp>(payload, "transaction_date", 0);
  movement.description = fieldOr<std::string>(payload, "description", "");
  if (movement.id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Movement id must not be empty");
  }
  if (movement.amount == 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Movement amount must not be zero");
  }
  return movement;
}

ExpenseRecord parseExpense(const nlohmann::json& payload) {
  ExpenseRecord expense;
  expense.id = field<std::string>(payload, "id");
  expense.amount = field<Amount>(payload, "amount");
  expense.currency = fieldOr<std::string>(payload, "currency", "EUR");
  expense.expense_date = fieldOr<Timestamp>(payload, "expense_date", 0);
  expense.description = fieldOr<std::string>(payload, "description", "");
  if (expense.id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense id must not be empty");
  }
  if (expense.amount <= 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense amount must be positive");
  }
  return expense;
}

std::vector<allocation::SplitMember> parseSplitMembers(const nlohmann::json& members) {
  if (!members.is_array()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Split members must be an array");
  }

  std::vector<allocation::SplitMember> result;
  for (const auto& item : members) {
    if (!item.is_object()) {
      throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Split member must be an object");
    }
    allocation::SplitMember member;
    member.expense_id = field<std::string>(item, "expense_id");
    member.movement_id = field<std::string>(item, "movement_id");
    member.amount = field<Amount>(item, "amount");
    if (item.contains("percentage_bp") && !item.at("percentage_bp").is_null()) {
      member.percentage_bp = field<int>(item, "percentage_bp");
    }
    member.notes = fieldOr<std::string>(item, "notes", "");
    result.push_back(std::move(member));
  }
  return result;
}

}  // namespace network

namespace allocation {

void to_json(nlohmann::json& j, const SplitOutcome& outcome) {
  j = {
      {"group_id", outcome.group_id},
      {"status", recon::toString(outcome.status)},
      {"is_complete", outcome.is_complete},
      {"target_amount", outcome.target_amount},
      {"allocated_total", outcome.allocated_total},
      {"remaining", outcome.remaining},
      {"replayed", outcome.replayed},
  };
}

void to_json(nlohmann::json& j, const SplitSummary& summary) {
  j = {
      {"total_groups", summary.total_groups},
      {"open", summary.open},
      {"complete", summary.complete},
      {"incomplete", summary.incomplete},
      {"finalized", summary.finalized},
      {"rejected", summary.rejected},
      {"by_type", summary.by_type},
      {"allocated_total", summary.allocated_total},
      {"target_total", summary.target_total},
  };
}

}  // namespace allocation

namespace advances {

void to_json(nlohmann::json& j, const PendingAdvance& pending) {
  j = pending.advance;
  j["days_outstanding"] = pending.days_outstanding;
  j["priority"] = toString(pending.priority);
}

void to_json(nlohmann::json& j, const EmployeeAdvanceSummary& summary) {
  j = {
      {"employee_id", summary.employee_id},
      {"employee_name", summary.employee_name},
      {"total_advances", summary.total_advances},
      {"open_advances", summary.open_advances},
      {"completed_advances", summary.completed_advances},
      {"cancelled_advances", summary.cancelled_advances},
      {"total_amount", summary.total_amount},
      {"total_reimbursed", summary.total_reimbursed},
      {"total_pending", summary.total_pending},
      {"oldest_pending_date", orNull(summary.oldest_pending_date)},
  };
}

void to_json(nlohmann::json& j, const AdvanceSummary& summary) {
  j = {
      {"total_advances", summary.total_advances},
      {"by_status", summary.by_status},
      {"by_channel", summary.by_channel},
      {"total_amount", summary.total_amount},
      {"total_reimbursed", summary.total_reimbursed},
      {"total_pending", summary.total_pending},
      {"employees_with_pending", summary.employees_with_pending},
  };
}

}  // namespace advances

namespace escalation {

void to_json(nlohmann::json& j, const ReasonInfo& info) {
  j = {
      {"code", recon::toString(info.code)},
      {"category", recon::toString(info.category)},
      {"typical_resolution_days", info.typical_resolution_days},
      {"description", info.description},
  };
}

void to_json(nlohmann::json& j, const EscalationRule& rule) {
  nlohmann::json codes = nlohmann::json::array();
  for (ReasonCode code : rule.reason_codes) codes.push_back(recon::toString(code));
  nlohmann::json categories = nlohmann::json::array();
  for (ReasonCategory category : rule.categories) categories.push_back(recon::toString(category));

  j = {
      {"rule_code", rule.rule_code},
      {"rule_name", rule.rule_name},
      {"company_id", rule.company_id},
      {"is_active", rule.is_active},
      {"reason_codes", codes},
      {"categories", categories},
      {"minimum_amount", orNull(rule.minimum_amount)},
      {"maximum_amount", orNull(rule.maximum_amount)},
      {"escalation_after_days", rule.escalation_after_days},
  };
}

void to_json(nlohmann::json& j, const SweepReport& report) {
  nlohmann::json failures = nlohmann::json::array();
  for (const auto& failure : report.failures) {
    failures.push_back(nlohmann::json{{"case_id", failure.case_id}, {"error", failure.error}});
  }
  j = {
      {"evaluated", report.evaluated},
      {"escalated", report.escalated},
      {"superseded", report.superseded},
      {"conflicts", report.conflicts},
      {"failures", failures},
  };
}

}  // namespace escalation

}  // namespace recon
