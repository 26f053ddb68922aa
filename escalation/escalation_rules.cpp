#include "escalation_rules.hpp"

#include "ledger_errors.hpp"

#include <algorithm>

namespace recon {
namespace escalation {

const std::vector<ReasonInfo>& reasonCatalog() {
  static const std::vector<ReasonInfo> catalog = {
      {ReasonCode::MISSING_VENDOR, ReasonCategory::MISSING_DATA, 14,
       "Vendor information is missing"},
      {ReasonCode::MISSING_RECEIPT, ReasonCategory::MISSING_DATA, 21,
       "Receipt or supporting document is missing"},
      {ReasonCode::MISSING_CATEGORY, ReasonCategory::MISSING_DATA, 7,
       "Expense category is not assigned"},
      {ReasonCode::MISSING_PROJECT, ReasonCategory::MISSING_DATA, 10,
       "Project or cost center is not assigned"},
      {ReasonCode::INVALID_FORMAT, ReasonCategory::FORMAT_MISMATCH, 5,
       "Data format is invalid"},
      {ReasonCode::ENCODING_ERROR, ReasonCategory::FORMAT_MISMATCH, 3,
       "Character encoding error"},
      {ReasonCode::CURRENCY_MISMATCH, ReasonCategory::FORMAT_MISMATCH, 7,
       "Currency does not match the bank movement"},
      {ReasonCode::AMOUNT_ZERO, ReasonCategory::AMOUNT_DISCREPANCY, 5,
       "Amount is zero"},
      {ReasonCode::AMOUNT_EXCESSIVE, ReasonCategory::AMOUNT_DISCREPANCY, 14,
       "Amount exceeds the allowed limit"},
      {ReasonCode::AMOUNT_PRECISION, ReasonCategory::AMOUNT_DISCREPANCY, 3,
       "Amount precision does not match"},
      {ReasonCode::DATE_FUTURE, ReasonCategory::DATE_INCONSISTENCY, 7,
       "Date lies in the future"},
      {ReasonCode::DATE_TOO_OLD, ReasonCategory::DATE_INCONSISTENCY, 14,
       "Date is older than the accepted window"},
      {ReasonCode::DATE_FORMAT, ReasonCategory::DATE_INCONSISTENCY, 3,
       "Date format is invalid"},
      {ReasonCode::VENDOR_NOT_FOUND, ReasonCategory::VENDOR_MISMATCH, 21,
       "Vendor is not registered"},
      {ReasonCode::VENDOR_INACTIVE, ReasonCategory::VENDOR_MISMATCH, 14,
       "Vendor is inactive"},
      {ReasonCode::DUPLICATE_SUSPECTED, ReasonCategory::DUPLICATE_SUSPECTED, 10,
       "Possible duplicate record"},
      {ReasonCode::CONFLICT_DETECTED, ReasonCategory::DUPLICATE_SUSPECTED, 14,
       "Conflicting records detected"},
      {ReasonCode::SYSTEM_ERROR, ReasonCategory::SYSTEM_ERROR, 7,
       "Internal processing error"},
      {ReasonCode::API_TIMEOUT, ReasonCategory::SYSTEM_ERROR, 5,
       "External service timed out"},
      {ReasonCode::DATABASE_CONSTRAINT, ReasonCategory::SYSTEM_ERROR, 3,
       "Database constraint violated"},
      {ReasonCode::POLICY_VIOLATION, ReasonCategory::MANUAL_REVIEW_REQUIRED, 21,
       "Expense policy violation"},
      {ReasonCode::HIGH_RISK_VENDOR, ReasonCategory::MANUAL_REVIEW_REQUIRED, 30,
       "Vendor is flagged as high risk"},
      {ReasonCode::UNUSUAL_PATTERN, ReasonCategory::MANUAL_REVIEW_REQUIRED, 14,
       "Unusual spending pattern"},
      {ReasonCode::BANK_RECONCILIATION, ReasonCategory::EXTERNAL_DEPENDENCY, 30,
       "Waiting for bank confirmation"},
      {ReasonCode::APPROVAL_PENDING, ReasonCategory::EXTERNAL_DEPENDENCY, 21,
       "Waiting for approval"},
      {ReasonCode::DOCUMENT_VERIFICATION, ReasonCategory::EXTERNAL_DEPENDENCY, 14,
       "Document verification in progress"},
  };
  return catalog;
}

const ReasonInfo& reasonInfo(ReasonCode code) {
  const auto& catalog = reasonCatalog();
  return catalog[static_cast<size_t>(code)];
}

ReasonCategory categoryOf(ReasonCode code) {
  return reasonInfo(code).category;
}

void validateRule(const EscalationRule& rule) {
  if (rule.rule_code.empty()) {
    throw LedgerError(ErrorCode::RULE_EVALUATION_ERROR, "Escalation rule without a code");
  }
  if (rule.escalation_after_days <= 0) {
    throw LedgerError(ErrorCode::RULE_EVALUATION_ERROR,
                      "Escalation rule " + rule.rule_code + " has non-positive escalation_after_days");
  }
  if (rule.minimum_amount && rule.maximum_amount &&
      *rule.minimum_amount > *rule.maximum_amount) {
    throw LedgerError(ErrorCode::RULE_EVALUATION_ERROR,
                      "Escalation rule " + rule.rule_code + " has minimum_amount above maximum_amount");
  }
}

namespace {

bool scopeMatches(const EscalationRule& rule, const RuleSubject& subject) {
  if (!rule.company_id.empty() && rule.company_id != subject.company_id) {
    return false;
  }
  if (!rule.reason_codes.empty() &&
      std::find(rule.reason_codes.begin(), rule.reason_codes.end(), subject.reason) ==
          rule.reason_codes.end()) {
    return false;
  }
  if (!rule.categories.empty() &&
      std::find(rule.categories.begin(), rule.categories.end(), categoryOf(subject.reason)) ==
          rule.categories.end()) {
    return false;
  }
  return true;
}

bool amountMatches(const EscalationRule& rule, Amount amount) {
  if (rule.minimum_amount && amount < *rule.minimum_amount) return false;
  if (rule.maximum_amount && amount > *rule.maximum_amount) return false;
  return true;
}

}  // namespace

RuleEvaluation evaluateRules(const std::vector<EscalationRule>& rules,
                             const RuleSubject& subject) {
  RuleEvaluation evaluation;

  for (const auto& rule : rules) {
    if (!rule.is_active || !scopeMatches(rule, subject)) continue;

    validateRule(rule);
    if (!amountMatches(rule, subject.amount)) continue;

    evaluation.escalation_after_days = rule.escalation_after_days;
    evaluation.matched_rule = rule.rule_code;
    return evaluation;
  }

  return evaluation;
}

}  // namespace escalation
}  // namespace recon
