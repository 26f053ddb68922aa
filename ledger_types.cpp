#include "ledger_types.hpp"

#include <array>

namespace recon {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> parseFrom(const std::array<Enum, N>& values, const std::string& value) {
  for (Enum candidate : values) {
    if (toString(candidate) == value) {
      return candidate;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string toString(ReconciliationMode mode) {
  switch (mode) {
    case ReconciliationMode::SIMPLE: return "simple";
    case ReconciliationMode::SPLIT: return "split";
    case ReconciliationMode::PARTIAL: return "partial";
  }
  return "unknown";
}

std::string toString(MovementStatus status) {
  switch (status) {
    case MovementStatus::ACTIVE: return "active";
    case MovementStatus::CANCELLED: return "cancelled";
  }
  return "unknown";
}

std::string toString(BankStatus status) {
  switch (status) {
    case BankStatus::PENDING: return "pending";
    case BankStatus::RECONCILED: return "reconciled";
    case BankStatus::NON_RECONCILABLE: return "non_reconcilable";
  }
  return "unknown";
}

std::string toString(ReimbursementStatus status) {
  switch (status) {
    case ReimbursementStatus::NOT_REQUIRED: return "not_required";
    case ReimbursementStatus::PENDING: return "pending";
    case ReimbursementStatus::PARTIAL: return "partial";
    case ReimbursementStatus::COMPLETED: return "completed";
  }
  return "unknown";
}

std::string toString(SplitType type) {
  switch (type) {
    case SplitType::ONE_TO_MANY: return "one_to_many";
    case SplitType::MANY_TO_ONE: return "many_to_one";
  }
  return "unknown";
}

std::string toString(SplitGroupStatus status) {
  switch (status) {
    case SplitGroupStatus::OPEN: return "open";
    case SplitGroupStatus::FINALIZED: return "finalized";
    case SplitGroupStatus::REJECTED: return "rejected";
  }
  return "unknown";
}

std::string toString(ReimbursementChannel channel) {
  switch (channel) {
    case ReimbursementChannel::TRANSFER: return "transfer";
    case ReimbursementChannel::PAYROLL: return "payroll";
    case ReimbursementChannel::CASH: return "cash";
    case ReimbursementChannel::PENDING: return "pending";
  }
  return "unknown";
}

std::string toString(AdvanceStatus status) {
  switch (status) {
    case AdvanceStatus::PENDING: return "pending";
    case AdvanceStatus::PARTIAL: return "partial";
    case AdvanceStatus::COMPLETED: return "completed";
    case AdvanceStatus::CANCELLED: return "cancelled";
  }
  return "unknown";
}

std::string toString(CaseStatus status) {
  switch (status) {
    case CaseStatus::PENDING: return "pending";
    case CaseStatus::IN_PROGRESS: return "in_progress";
    case CaseStatus::ESCALATED: return "escalated";
    case CaseStatus::RESOLVED: return "resolved";
    case CaseStatus::DISMISSED: return "dismissed";
    case CaseStatus::ON_HOLD: return "on_hold";
    case CaseStatus::REQUIRES_APPROVAL: return "requires_approval";
  }
  return "unknown";
}

std::string toString(ReasonCategory category) {
  switch (category) {
    case ReasonCategory::MISSING_DATA: return "missing_data";
    case ReasonCategory::FORMAT_MISMATCH: return "format_mismatch";
    case ReasonCategory::AMOUNT_DISCREPANCY: return "amount_discrepancy";
    case ReasonCategory::DATE_INCONSISTENCY: return "date_inconsistency";
    case ReasonCategory::VENDOR_MISMATCH: return "vendor_mismatch";
    case ReasonCategory::DUPLICATE_SUSPECTED: return "duplicate_suspected";
    case ReasonCategory::SYSTEM_ERROR: return "system_error";
    case ReasonCategory::MANUAL_REVIEW_REQUIRED: return "manual_review_required";
    case ReasonCategory::EXTERNAL_DEPENDENCY: return "external_dependency";
  }
  return "unknown";
}

std::string toString(ReasonCode code) {
  switch (code) {
    case ReasonCode::MISSING_VENDOR: return "MISSING_VENDOR";
    case ReasonCode::MISSING_RECEIPT: return "MISSING_RECEIPT";
    case ReasonCode::MISSING_CATEGORY: return "MISSING_CATEGORY";
    case ReasonCode::MISSING_PROJECT: return "MISSING_PROJECT";
    case ReasonCode::INVALID_FORMAT: return "INVALID_FORMAT";
    case ReasonCode::ENCODING_ERROR: return "ENCODING_ERROR";
    case ReasonCode::CURRENCY_MISMATCH: return "CURRENCY_MISMATCH";
    case ReasonCode::AMOUNT_ZERO: return "AMOUNT_ZERO";
    case ReasonCode::AMOUNT_EXCESSIVE: return "AMOUNT_EXCESSIVE";
    case ReasonCode::AMOUNT_PRECISION: return "AMOUNT_PRECISION";
    case ReasonCode::DATE_FUTURE: return "DATE_FUTURE";
    case ReasonCode::DATE_TOO_OLD: return "DATE_TOO_OLD";
    case ReasonCode::DATE_FORMAT: return "DATE_FORMAT";
    case ReasonCode::VENDOR_NOT_FOUND: return "VENDOR_NOT_FOUND";
    case ReasonCode::VENDOR_INACTIVE: return "VENDOR_INACTIVE";
    case ReasonCode::DUPLICATE_SUSPECTED: return "DUPLICATE_SUSPECTED";
    case ReasonCode::CONFLICT_DETECTED: return "CONFLICT_DETECTED";
    case ReasonCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
    case ReasonCode::API_TIMEOUT: return "API_TIMEOUT";
    case ReasonCode::DATABASE_CONSTRAINT: return "DATABASE_CONSTRAINT";
    case ReasonCode::POLICY_VIOLATION: return "POLICY_VIOLATION";
    case ReasonCode::HIGH_RISK_VENDOR: return "HIGH_RISK_VENDOR";
    case ReasonCode::UNUSUAL_PATTERN: return "UNUSUAL_PATTERN";
    case ReasonCode::BANK_RECONCILIATION: return "BANK_RECONCILIATION";
    case ReasonCode::APPROVAL_PENDING: return "APPROVAL_PENDING";
    case ReasonCode::DOCUMENT_VERIFICATION: return "DOCUMENT_VERIFICATION";
  }
  return "UNKNOWN";
}

std::string toString(BusinessImpact impact) {
  switch (impact) {
    case BusinessImpact::LOW: return "low";
    case BusinessImpact::MEDIUM: return "medium";
    case BusinessImpact::HIGH: return "high";
    case BusinessImpact::CRITICAL: return "critical";
  }
  return "unknown";
}

std::string toString(SubjectKind kind) {
  switch (kind) {
    case SubjectKind::EXPENSE: return "expense";
    case SubjectKind::MOVEMENT: return "movement";
  }
  return "unknown";
}

std::string toString(HistoryAction action) {
  switch (action) {
    case HistoryAction::CREATED: return "created";
    case HistoryAction::STATUS_CHANGED: return "status_changed";
    case HistoryAction::ESCALATED: return "escalated";
    case HistoryAction::RESOLVED: return "resolved";
    case HistoryAction::DISMISSED: return "dismissed";
    case HistoryAction::HELD: return "held";
    case HistoryAction::RELEASED: return "released";
    case HistoryAction::COMMENTED: return "commented";
    case HistoryAction::SUPERSEDED: return "superseded";
  }
  return "unknown";
}

std::optional<ReconciliationMode> parseReconciliationMode(const std::string& value) {
  static const std::array<ReconciliationMode, 3> kValues = {
      ReconciliationMode::SIMPLE, ReconciliationMode::SPLIT, ReconciliationMode::PARTIAL};
  return parseFrom(kValues, value);
}

std::optional<MovementStatus> parseMovementStatus(const std::string& value) {
  static const std::array<MovementStatus, 2> kValues = {
      MovementStatus::ACTIVE, MovementStatus::CANCELLED};
  return parseFrom(kValues, value);
}

std::optional<BankStatus> parseBankStatus(const std::string& value) {
  static const std::array<BankStatus, 3> kValues = {
      BankStatus::PENDING, BankStatus::RECONCILED, BankStatus::NON_RECONCILABLE};
  return parseFrom(kValues, value);
}

std::optional<ReimbursementStatus> parseReimbursementStatus(const std::string& value) {
  static const std::array<ReimbursementStatus, 4> kValues = {
      ReimbursementStatus::NOT_REQUIRED, ReimbursementStatus::PENDING,
      ReimbursementStatus::PARTIAL, ReimbursementStatus::COMPLETED};
  return parseFrom(kValues, value);
}

std::optional<SplitType> parseSplitType(const std::string& value) {
  static const std::array<SplitType, 2> kValues = {
      SplitType::ONE_TO_MANY, SplitType::MANY_TO_ONE};
  return parseFrom(kValues, value);
}

std::optional<SplitGroupStatus> parseSplitGroupStatus(const std::string& value) {
  static const std::array<SplitGroupStatus, 3> kValues = {
      SplitGroupStatus::OPEN, SplitGroupStatus::FINALIZED, SplitGroupStatus::REJECTED};
  return parseFrom(kValues, value);
}

std::optional<ReimbursementChannel> parseReimbursementChannel(const std::string& value) {
  static const std::array<ReimbursementChannel, 4> kValues = {
      ReimbursementChannel::TRANSFER, ReimbursementChannel::PAYROLL,
      ReimbursementChannel::CASH, ReimbursementChannel::PENDING};
  return parseFrom(kValues, value);
}

std::optional<AdvanceStatus> parseAdvanceStatus(const std::string& value) {
  static const std::array<AdvanceStatus, 4> kValues = {
      AdvanceStatus::PENDING, AdvanceStatus::PARTIAL,
      AdvanceStatus::COMPLETED, AdvanceStatus::CANCELLED};
  return parseFrom(kValues, value);
}

std::optional<CaseStatus> parseCaseStatus(const std::string& value) {
  static const std::array<CaseStatus, 7> kValues = {
      CaseStatus::PENDING, CaseStatus::IN_PROGRESS, CaseStatus::ESCALATED,
      CaseStatus::RESOLVED, CaseStatus::DISMISSED, CaseStatus::ON_HOLD,
      CaseStatus::REQUIRES_APPROVAL};
  return parseFrom(kValues, value);
}

std::optional<ReasonCategory> parseReasonCategory(const std::string& value) {
  static const std::array<ReasonCategory, 9> kValues = {
      ReasonCategory::MISSING_DATA, ReasonCategory::FORMAT_MISMATCH,
      ReasonCategory::AMOUNT_DISCREPANCY, ReasonCategory::DATE_INCONSISTENCY,
      ReasonCategory::VENDOR_MISMATCH, ReasonCategory::DUPLICATE_SUSPECTED,
      ReasonCategory::SYSTEM_ERROR, ReasonCategory::MANUAL_REVIEW_REQUIRED,
      ReasonCategory::EXTERNAL_DEPENDENCY};
  return parseFrom(kValues, value);
}

std::optional<ReasonCode> parseReasonCode(const std::string& value) {
  static const std::array<ReasonCode, 26> kValues = {
      ReasonCode::MISSING_VENDOR, ReasonCode::MISSING_RECEIPT,
      ReasonCode::MISSING_CATEGORY, ReasonCode::MISSING_PROJECT,
      ReasonCode::INVALID_FORMAT, ReasonCode::ENCODING_ERROR,
      ReasonCode::CURRENCY_MISMATCH, ReasonCode::AMOUNT_ZERO,
      ReasonCode::AMOUNT_EXCESSIVE, ReasonCode::AMOUNT_PRECISION,
      ReasonCode::DATE_FUTURE, ReasonCode::DATE_TOO_OLD, ReasonCode::DATE_FORMAT,
      ReasonCode::VENDOR_NOT_FOUND, ReasonCode::VENDOR_INACTIVE,
      ReasonCode::DUPLICATE_SUSPECTED, ReasonCode::CONFLICT_DETECTED,
      ReasonCode::SYSTEM_ERROR, ReasonCode::API_TIMEOUT,
      ReasonCode::DATABASE_CONSTRAINT, ReasonCode::POLICY_VIOLATION,
      ReasonCode::HIGH_RISK_VENDOR, ReasonCode::UNUSUAL_PATTERN,
      ReasonCode::BANK_RECONCILIATION, ReasonCode::APPROVAL_PENDING,
      ReasonCode::DOCUMENT_VERIFICATION};
  return parseFrom(kValues, value);
}

std::optional<BusinessImpact> parseBusinessImpact(const std::string& value) {
  static const std::array<BusinessImpact, 4> kValues = {
      BusinessImpact::LOW, BusinessImpact::MEDIUM,
      BusinessImpact::HIGH, BusinessImpact::CRITICAL};
  return parseFrom(kValues, value);
}

std::optional<SubjectKind> parseSubjectKind(const std::string& value) {
  static const std::array<SubjectKind, 2> kValues = {
      SubjectKind::EXPENSE, SubjectKind::MOVEMENT};
  return parseFrom(kValues, value);
}

std::optional<HistoryAction> parseHistoryAction(const std::string& value) {
  static const std::array<HistoryAction, 9> kValues = {
      HistoryAction::CREATED, HistoryAction::STATUS_CHANGED, HistoryAction::ESCALATED,
      HistoryAction::RESOLVED, HistoryAction::DISMISSED, HistoryAction::HELD,
      HistoryAction::RELEASED, HistoryAction::COMMENTED, HistoryAction::SUPERSEDED};
  return parseFrom(kValues, value);
}

Amount SplitGroup::allocatedTotal() const {
  if (status == SplitGroupStatus::REJECTED) return 0;

  Amount total = 0;
  for (const auto& row : rows) {
    total += row.allocated_amount;
  }
  return total;
}

}  // namespace recon
