#ifndef LEDGER_TYPES_HPP_
#define LEDGER_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace recon {

// Amounts are integer minor currency units, timestamps are seconds since epoch.
using Amount = int64_t;
using Timestamp = int64_t;

constexpr Timestamp kSecondsPerDay = 86400;

enum class ReconciliationMode {
  SIMPLE,
  SPLIT,
  PARTIAL
};

enum class MovementStatus {
  ACTIVE,
  CANCELLED
};

enum class BankStatus {
  PENDING,
  RECONCILED,
  NON_RECONCILABLE
};

enum class ReimbursementStatus {
  NOT_REQUIRED,
  PENDING,
  PARTIAL,
  COMPLETED
};

enum class SplitType {
  ONE_TO_MANY,  // one movement funds many expenses
  MANY_TO_ONE   // many movements fund one expense
};

enum class SplitGroupStatus {
  OPEN,
  FINALIZED,
  REJECTED
};

enum class ReimbursementChannel {
  TRANSFER,
  PAYROLL,
  CASH,
  PENDING
};

enum class AdvanceStatus {
  PENDING,
  PARTIAL,
  COMPLETED,
  CANCELLED
};

enum class CaseStatus {
  PENDING,
  IN_PROGRESS,
  ESCALATED,
  RESOLVED,
  DISMISSED,
  ON_HOLD,
  REQUIRES_APPROVAL
};

enum class ReasonCategory {
  MISSING_DATA,
  FORMAT_MISMATCH,
  AMOUNT_DISCREPANCY,
  DATE_INCONSISTENCY,
  VENDOR_MISMATCH,
  DUPLICATE_SUSPECTED,
  SYSTEM_ERROR,
  MANUAL_REVIEW_REQUIRED,
  EXTERNAL_DEPENDENCY
};

enum class ReasonCode {
  MISSING_VENDOR,
  MISSING_RECEIPT,
  MISSING_CATEGORY,
  MISSING_PROJECT,
  INVALID_FORMAT,
  ENCODING_ERROR,
  CURRENCY_MISMATCH,
  AMOUNT_ZERO,
  AMOUNT_EXCESSIVE,
  AMOUNT_PRECISION,
  DATE_FUTURE,
  DATE_TOO_OLD,
  DATE_FORMAT,
  VENDOR_NOT_FOUND,
  VENDOR_INACTIVE,
  DUPLICATE_SUSPECTED,
  CONFLICT_DETECTED,
  SYSTEM_ERROR,
  API_TIMEOUT,
  DATABASE_CONSTRAINT,
  POLICY_VIOLATION,
  HIGH_RISK_VENDOR,
  UNUSUAL_PATTERN,
  BANK_RECONCILIATION,
  APPROVAL_PENDING,
  DOCUMENT_VERIFICATION
};

enum class BusinessImpact {
  LOW,
  MEDIUM,
  HIGH,
  CRITICAL
};

enum class SubjectKind {
  EXPENSE,
  MOVEMENT
};

enum class HistoryAction {
  CREATED,
  STATUS_CHANGED,
  ESCALATED,
  RESOLVED,
  DISMISSED,
  HELD,
  RELEASED,
  COMMENTED,
  SUPERSEDED
};

// Wire names are lower_snake_case, e.g. "one_to_many", "requires_approval".
std::string toString(ReconciliationMode mode);
std::string toString(MovementStatus status);
std::string toString(BankStatus status);
std::string toString(ReimbursementStatus status);
std::string toString(SplitType type);
std::string toString(SplitGroupStatus status);
std::string toString(ReimbursementChannel channel);
std::string toString(AdvanceStatus status);
std::string toString(CaseStatus status);
std::string toString(ReasonCategory category);
std::string toString(BusinessImpact impact);
std::string toString(SubjectKind kind);
std::string toString(HistoryAction action);

// Reason codes keep their catalog spelling, e.g. "MISSING_RECEIPT".
std::string toString(ReasonCode code);

std::optional<ReconciliationMode> parseReconciliationMode(const std::string& value);
std::optional<MovementStatus> parseMovementStatus(const std::string& value);
std::optional<BankStatus> parseBankStatus(const std::string& value);
std::optional<ReimbursementStatus> parseReimbursementStatus(const std::string& value);
std::optional<SplitType> parseSplitType(const std::string& value);
std::optional<SplitGroupStatus> parseSplitGroupStatus(const std::string& value);
std::optional<ReimbursementChannel> parseReimbursementChannel(const std::string& value);
std::optional<AdvanceStatus> parseAdvanceStatus(const std::string& value);
std::optional<CaseStatus> parseCaseStatus(const std::string& value);
std::optional<ReasonCategory> parseReasonCategory(const std::string& value);
std::optional<ReasonCode> parseReasonCode(const std::string& value);
std::optional<BusinessImpact> parseBusinessImpact(const std::string& value);
std::optional<SubjectKind> parseSubjectKind(const std::string& value);
std::optional<HistoryAction> parseHistoryAction(const std::string& value);

/**
 * A single transaction reported on a bank statement.
 * Negative amounts are debits (money leaving the company account).
 */
struct BankMovement {
  std::string id;
  Amount amount = 0;
  std::string currency = "EUR";
  Timestamp transaction_date = 0;
  std::string description;
  MovementStatus status = MovementStatus::ACTIVE;
  ReconciliationMode mode = ReconciliationMode::SIMPLE;
  Amount allocated = 0;
  std::optional<std::string> split_group_id;
  uint64_t version = 0;

  Amount magnitude() const { return amount < 0 ? -amount : amount; }
  Amount unallocated() const { return magnitude() - allocated; }
  bool isDebit() const { return amount < 0; }
};

/**
 * A recorded company or employee expenditure awaiting reconciliation.
 */
struct ExpenseRecord {
  std::string id;
  Amount amount = 0;
  std::string currency = "EUR";
  Timestamp expense_date = 0;
  std::string description;
  ReconciliationMode mode = ReconciliationMode::SIMPLE;
  Amount reconciled = 0;
  BankStatus bank_status = BankStatus::PENDING;
  bool is_employee_advance = false;
  std::optional<std::string> advance_id;
  ReimbursementStatus reimbursement_status = ReimbursementStatus::NOT_REQUIRED;
  std::optional<std::string> split_group_id;
  uint64_t version = 0;

  Amount pending() const { return amount - reconciled; }
};

/**
 * One (expense, movement) pairing inside a split group.
 */
struct SplitRow {
  std::string expense_id;
  std::string movement_id;
  Amount allocated_amount = 0;
  int percentage_bp = 0;  // basis points of the group target
  bool is_complete = false;
  std::string created_by;
  Timestamp created_at = 0;
  std::string notes;
};

struct SplitAnnotation {
  std::string actor;
  std::string note;
  Timestamp created_at = 0;
};

struct SplitGroup {
  std::string id;
  SplitType type = SplitType::ONE_TO_MANY;
  std::string anchor_id;
  Amount target_amount = 0;
  std::vector<SplitRow> rows;
  SplitGroupStatus status = SplitGroupStatus::OPEN;
  bool is_complete = false;
  std::string created_by;
  Timestamp created_at = 0;
  Timestamp updated_at = 0;
  std::optional<Timestamp> finalized_at;
  std::vector<SplitAnnotation> annotations;
  // Group each member pointed at before joining this one, put back on release.
  std::map<std::string, std::string> prior_movement_groups;
  std::map<std::string, std::string> prior_expense_groups;
  uint64_t version = 0;

  /** Sum of row allocations that are still held against the ledger. */
  Amount allocatedTotal() const;
  Amount remaining() const { return target_amount - allocatedTotal(); }

  /** True while the group holds its members: open and not yet complete. */
  bool blocksMembers() const { return status == SplitGroupStatus::OPEN && !is_complete; }
};

struct EmployeeAdvance {
  std::string id;
  std::string employee_id;
  std::string employee_name;
  std::string expense_id;
  Amount advance_amount = 0;
  Amount reimbursed_amount = 0;
  std::string currency = "EUR";
  ReimbursementChannel channel = ReimbursementChannel::PENDING;
  AdvanceStatus status = AdvanceStatus::PENDING;
  Timestamp advance_date = 0;
  std::optional<Timestamp> reimbursement_date;
  std::optional<std::string> reimbursement_movement_id;
  std::string payment_method;
  std::string notes;
  std::string cancellation_reason;
  uint64_t version = 0;

  Amount pending() const { return advance_amount - reimbursed_amount; }
};

struct NonReconciliationCase {
  std::string id;
  SubjectKind subject_kind = SubjectKind::EXPENSE;
  std::string subject_id;
  std::string company_id;
  ReasonCode reason = ReasonCode::MISSING_RECEIPT;
  CaseStatus status = CaseStatus::PENDING;
  int escalation_level = 1;
  std::optional<Timestamp> next_escalation_date;
  std::optional<Timestamp> estimated_resolution_date;
  std::optional<Timestamp> resolved_at;
  BusinessImpact business_impact = BusinessImpact::LOW;
  int resolution_priority = 3;
  std::optional<CaseStatus> held_from;
  std::string created_by;
  Timestamp created_at = 0;
  Timestamp updated_at = 0;
  std::string notes;
  uint64_t version = 0;

  bool isTerminal() const {
    return status == CaseStatus::RESOLVED || status == CaseStatus::DISMISSED;
  }
};

struct CaseHistoryEntry {
  uint64_t sequence = 0;
  std::string case_id;
  HistoryAction action = HistoryAction::CREATED;
  std::optional<CaseStatus> previous_status;
  CaseStatus new_status = CaseStatus::PENDING;
  int previous_level = 0;
  int new_level = 0;
  std::string performed_by;
  Timestamp performed_at = 0;
  std::string notes;
  bool system_generated = false;
};

}  // namespace recon

#endif  // LEDGER_TYPES_HPP_
