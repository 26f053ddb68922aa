#ifndef ESCALATION_RULES_HPP_
#define ESCALATION_RULES_HPP_

#include "ledger_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace recon {
namespace escalation {

constexpr int kMaxEscalationLevel = 5;
constexpr int kDefaultEscalationAfterDays = 7;

/**
 * Catalog entry for a non-reconciliation reason.
 */
struct ReasonInfo {
  ReasonCode code;
  ReasonCategory category;
  int typical_resolution_days;
  std::string description;
};

/** The fixed reason catalog, in declaration order of ReasonCode. */
const std::vector<ReasonInfo>& reasonCatalog();

const ReasonInfo& reasonInfo(ReasonCode code);

ReasonCategory categoryOf(ReasonCode code);

/**
 * Company-scoped escalation rule. Empty filters match everything; an empty
 * company id applies to every company.
 */
struct EscalationRule {
  std::string rule_code;
  std::string rule_name;
  std::string company_id;
  bool is_active = true;
  std::vector<ReasonCode> reason_codes;
  std::vector<ReasonCategory> categories;
  std::optional<Amount> minimum_amount;
  std::optional<Amount> maximum_amount;
  int escalation_after_days = kDefaultEscalationAfterDays;
};

/**
 * What a rule is evaluated against.
 */
struct RuleSubject {
  std::string company_id;
  ReasonCode reason = ReasonCode::MISSING_RECEIPT;
  Amount amount = 0;
};

/**
 * Throws LedgerError(RULE_EVALUATION_ERROR) for a rule that cannot be
 * evaluated: no code, non-positive days, or an inverted amount range.
 */
void validateRule(const EscalationRule& rule);

/**
 * Result of evaluating a rule set against one subject.
 */
struct RuleEvaluation {
  int escalation_after_days = kDefaultEscalationAfterDays;
  std::string matched_rule;  // empty when the default applied
};

/**
 * Picks the first active rule whose scope matches the subject.
 * A malformed rule raises RULE_EVALUATION_ERROR once its company, reason and
 * category scope match, before its amount range is consulted.
 */
RuleEvaluation evaluateRules(const std::vector<EscalationRule>& rules,
                             const RuleSubject& subject);

}  // namespace escalation
}  // namespace recon

#endif  // ESCALATION_RULES_HPP_
