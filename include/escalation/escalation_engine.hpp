#ifndef ESCALATION_ENGINE_HPP_
#define ESCALATION_ENGINE_HPP_

#include "advances/advance_ledger.hpp"
#include "allocation/allocation_engine.hpp"
#include "escalation/escalation_rules.hpp"
#include "ledger_store.hpp"
#include "notifications/notification_dispatcher.hpp"

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace recon {
namespace escalation {

struct EscalationConfig {
  int max_retries = 3;
  int default_escalation_after_days = kDefaultEscalationAfterDays;  // when no rule matches
  std::vector<EscalationRule> rules;
  std::map<int, std::vector<notifications::NotificationRecipient>> recipients_by_level;
};

struct OpenCaseRequest {
  std::string operation_id;
  SubjectKind subject_kind = SubjectKind::EXPENSE;
  std::string subject_id;
  std::string company_id;
  ReasonCode reason = ReasonCode::MISSING_RECEIPT;
  BusinessImpact impact = BusinessImpact::LOW;
  int priority = 3;  // 1 (highest) to 4
  std::string actor;
  std::string notes;
};

struct CaseOutcome {
  NonReconciliationCase nr_case;
  bool replayed = false;
};

struct CaseFilter {
  std::optional<CaseStatus> status;
  std::optional<ReasonCategory> category;
  std::optional<std::string> subject_id;
  std::optional<std::string> company_id;
  std::optional<int> minimum_level;
  bool open_only = false;
};

struct SweepFailure {
  std::string case_id;
  std::string error;
};

/**
 * Result of one escalation sweep.
 */
struct SweepReport {
  size_t evaluated = 0;   // due cases looked at
  size_t escalated = 0;
  size_t superseded = 0;
  size_t conflicts = 0;   // version conflicts that forced a re-read
  std::vector<SweepFailure> failures;
};

/**
 * Workflow for cases that cannot be reconciled automatically.
 * Cases age through escalation levels 1..5 on a rule-driven schedule; every
 * status or level change appends to the case history in the same commit.
 */
class EscalationEngine {
 public:
  EscalationEngine(LedgerStore& store, allocation::AllocationEngine& allocation,
                   advances::AdvanceLedger& advances, notifications::NotificationSink* sink,
                   EscalationConfig config = EscalationConfig());

  // Non-copyable
  EscalationEngine(const EscalationEngine&) = delete;
  EscalationEngine& operator=(const EscalationEngine&) = delete;

  /**
   * Opens a case at level 1. Only one open case may exist per subject and
   * reason. The first matching rule decides the next escalation date; a rule
   * that fails to evaluate leaves the case without one.
   */
  CaseOutcome OpenCase(const OpenCaseRequest& request, Timestamp now);

  NonReconciliationCase StartWork(const std::string& case_id, const std::string& actor,
                                  Timestamp now);
  NonReconciliationCase Resolve(const std::string& case_id, const std::string& actor,
                                const std::string& notes, Timestamp now);
  NonReconciliationCase Dismiss(const std::string& case_id, const std::string& actor,
                                const std::string& notes, Timestamp now);
  NonReconciliationCase Hold(const std::string& case_id, const std::string& actor,
                             const std::string& notes, Timestamp now);
  NonReconciliationCase RequireApproval(const std::string& case_id, const std::string& actor,
                                        const std::string& notes, Timestamp now);

  /** Returns a held case to the status it was held from. */
  NonReconciliationCase Release(const std::string& case_id, const std::string& actor,
                                const std::string& notes, Timestamp now);

  NonReconciliationCase EscalateManually(const std::string& case_id, const std::string& actor,
                                         const std::string& notes, Timestamp now);
  NonReconciliationCase Comment(const std::string& case_id, const std::string& actor,
                                const std::string& note, Timestamp now);

  /**
   * Escalates every open case whose next escalation date has passed, or
   * closes it as superseded when its subject no longer needs attention.
   * Failures are isolated per case and reported.
   */
  SweepReport Sweep(Timestamp now);

  /** Closes every open case of a subject as superseded; returns how many. */
  size_t SupersedeCasesFor(SubjectKind kind, const std::string& subject_id,
                           const std::string& actor, Timestamp now);

  /** Adds or replaces (by rule code) a rule. RULE_EVALUATION_ERROR if malformed. */
  void AddRule(const EscalationRule& rule);
  std::vector<EscalationRule> ListRules() const;

  NonReconciliationCase GetCase(const std::string& case_id) const;
  std::vector<NonReconciliationCase> ListCases(const CaseFilter& filter = CaseFilter()) const;
  std::vector<CaseHistoryEntry> History(const std::string& case_id) const;
  const std::vector<ReasonInfo>& ReasonCatalog() const;

 private:
  using Mutation = std::function<void(NonReconciliationCase&)>;

  NonReconciliationCase transition(const std::string& case_id, const std::string& actor,
                                   const std::string& notes, Timestamp now,
                                   HistoryAction action, const Mutation& mutate);

  // Throws RULE_EVALUATION_ERROR when the first matching rule is malformed.
  std::optional<Timestamp> scheduledEscalation(const NonReconciliationCase& nr_case,
                                               Timestamp now) const;
  // Same, but a malformed rule is logged and leaves the case unscheduled.
  std::optional<Timestamp> nextEscalationDate(const NonReconciliationCase& nr_case,
                                              Timestamp now) const;
  Amount subjectAmount(SubjectKind kind, const std::string& subject_id) const;
  bool subjectSettled(const NonReconciliationCase& nr_case) const;
  bool isDue(const NonReconciliationCase& nr_case, Timestamp now) const;

  enum class SweepResult { SKIPPED, ESCALATED, SUPERSEDED };
  SweepResult sweepCase(const std::string& case_id, Timestamp now, SweepReport& report);

  void notify(notifications::NotificationType type, const NonReconciliationCase& nr_case,
              const CaseHistoryEntry& entry, Timestamp now);

  LedgerStore& store_;
  allocation::AllocationEngine& allocation_;
  advances::AdvanceLedger& advances_;
  notifications::NotificationSink* sink_;
  EscalationConfig config_;

  std::vector<EscalationRule> rules_;
  mutable std::shared_mutex rules_mutex_;
};

}  // namespace escalation
}  // namespace recon

#endif  // ESCALATION_ENGINE_HPP_
