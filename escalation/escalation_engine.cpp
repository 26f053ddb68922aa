#include "escalation_engine.hpp"

#include "concurrent/optimistic_retry.hpp"
#include "ledger_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <mutex>

namespace recon {
namespace escalation {

using observability::LogLevel;

namespace {

const char* const kSystemActor = "system";

bool isHeld(CaseStatus status) {
  return status == CaseStatus::ON_HOLD || status == CaseStatus::REQUIRES_APPROVAL;
}

bool isSweepable(CaseStatus status) {
  return status == CaseStatus::PENDING || status == CaseStatus::IN_PROGRESS ||
         status == CaseStatus::ESCALATED;
}

void requireOpen(const NonReconciliationCase& nr_case) {
  if (nr_case.isTerminal()) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Case " + nr_case.id + " is already " + toString(nr_case.status));
  }
}

void closeCase(NonReconciliationCase& nr_case, CaseStatus status, Timestamp now) {
  nr_case.status = status;
  nr_case.resolved_at = now;
  nr_case.next_escalation_date.reset();
  nr_case.held_from.reset();
}

std::string caseIdFor(SubjectKind kind, const std::string& subject_id, ReasonCode reason,
                      size_t ordinal) {
  return "nrc-" + toString(kind) + "-" + subject_id + "-" + toString(reason) + "-" +
         std::to_string(ordinal);
}

}  // namespace

EscalationEngine::EscalationEngine(LedgerStore& store, allocation::AllocationEngine& allocation,
                                   advances::AdvanceLedger& advances,
                                   notifications::NotificationSink* sink,
                                   EscalationConfig config)
    : store_(store),
      allocation_(allocation),
      advances_(advances),
      sink_(sink),
      config_(std::move(config)) {
  // Malformed rules are kept; they fail at evaluation and the case opens without a date.
  for (const auto& rule : config_.rules) {
    try {
      validateRule(rule);
    } catch (const LedgerError& e) {
      LOG_BUILDER(LogLevel::WARN, "Loaded malformed escalation rule")
          .field("rule_code", rule.rule_code)
          .field("error", e.what());
    }
  }
  rules_ = config_.rules;
}

CaseOutcome EscalationEngine::OpenCase(const OpenCaseRequest& request, Timestamp now) {
  if (request.operation_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "An operation id is required");
  }
  if (request.subject_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Case subject must not be empty");
  }
  if (request.priority < 1 || request.priority > 4) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Resolution priority must be between 1 and 4");
  }

  return concurrent::retryOnConflict(
      "open_case", request.operation_id, config_.max_retries, [&]() -> CaseOutcome {
        size_t previous_cases = 0;
        std::optional<NonReconciliationCase> open_case;
        std::optional<NonReconciliationCase> latest_case;
        for (auto& existing : store_.listCases()) {
          if (existing.subject_kind != request.subject_kind ||
              existing.subject_id != request.subject_id || existing.reason != request.reason) {
            continue;
          }
          previous_cases++;
          if (!latest_case || existing.created_at >= latest_case->created_at) {
            latest_case = existing;
          }
          if (!existing.isTerminal()) {
            open_case = std::move(existing);
          }
        }

        if (store_.hasOperation(request.operation_id)) {
          if (!latest_case) {
            throw LedgerError(ErrorCode::NOT_FOUND,
                              "No case recorded for subject " + request.subject_id);
          }
          return {*latest_case, true};
        }
        if (open_case) {
          throw LedgerError(ErrorCode::INVALID_STATE,
                            "Case " + open_case->id + " is already open for " +
                            request.subject_id + " with reason " + toString(request.reason));
        }

        bool subject_exists = request.subject_kind == SubjectKind::EXPENSE
            ? store_.findExpense(request.subject_id).has_value()
            : store_.findMovement(request.subject_id).has_value();
        if (!subject_exists) {
          throw LedgerError(ErrorCode::NOT_FOUND,
                            toString(request.subject_kind) + " not found: " + request.subject_id);
        }

        NonReconciliationCase nr_case;
        nr_case.id = caseIdFor(request.subject_kind, request.subject_id, request.reason,
                               previous_cases + 1);
        nr_case.subject_kind = request.subject_kind;
        nr_case.subject_id = request.subject_id;
        nr_case.company_id = request.company_id;
        nr_case.reason = request.reason;
        nr_case.status = CaseStatus::PENDING;
        nr_case.escalation_level = 1;
        nr_case.business_impact = request.impact;
        nr_case.resolution_priority = request.priority;
        nr_case.created_by = request.actor;
        nr_case.created_at = now;
        nr_case.updated_at = now;
        nr_case.notes = request.notes;
        nr_case.estimated_resolution_date =
            now + reasonInfo(request.reason).typical_resolution_days * kSecondsPerDay;
        nr_case.next_escalation_date = nextEscalationDate(nr_case, now);

        CaseHistoryEntry entry;
        entry.case_id = nr_case.id;
        entry.action = HistoryAction::CREATED;
        entry.new_status = CaseStatus::PENDING;
        entry.previous_level = 0;
        entry.new_level = 1;
        entry.performed_by = request.actor;
        entry.performed_at = now;
        entry.notes = request.notes;

        LedgerTransaction transaction;
        transaction.operation_id = request.operation_id;
        transaction.cases.push_back({nr_case, 0});
        transaction.history.push_back(entry);

        if (!store_.commit(transaction)) {
          return {GetCase(nr_case.id), true};
        }

        observability::getGlobalMetrics().incrementCounter("recon_cases_opened_total");
        LOG_BUILDER(LogLevel::INFO, "Non-reconciliation case opened")
            .correlation(request.operation_id)
            .field("case_id", nr_case.id)
            .field("reason", toString(nr_case.reason))
            .field("subject_id", nr_case.subject_id)
            .field("has_next_escalation", nr_case.next_escalation_date.has_value());
        return {GetCase(nr_case.id), false};
      });
}

NonReconciliationCase EscalationEngine::StartWork(const std::string& case_id,
                                                  const std::string& actor, Timestamp now) {
  return transition(case_id, actor, "", now, HistoryAction::STATUS_CHANGED,
                    [](NonReconciliationCase& nr_case) {
                      if (nr_case.status != CaseStatus::PENDING) {
                        throw LedgerError(ErrorCode::INVALID_STATE,
                                          "Only pending cases can be started, case " +
                                          nr_case.id + " is " + toString(nr_case.status));
                      }
                      nr_case.status = CaseStatus::IN_PROGRESS;
                    });
}

NonReconciliationCase EscalationEngine::Resolve(const std::string& case_id,
                                                const std::string& actor,
                                                const std::string& notes, Timestamp now) {
  return transition(case_id, actor, notes, now, HistoryAction::RESOLVED,
                    [now](NonReconciliationCase& nr_case) {
                      requireOpen(nr_case);
                      closeCase(nr_case, CaseStatus::RESOLVED, now);
                    });
}

NonReconciliationCase EscalationEngine::Dismiss(const std::string& case_id,
                                                const std::string& actor,
                                                const std::string& notes, Timestamp now) {
  return transition(case_id, actor, notes, now, HistoryAction::DISMISSED,
                    [now](NonReconciliationCase& nr_case) {
                      requireOpen(nr_case);
                      closeCase(nr_case, CaseStatus::DISMISSED, now);
                    });
}

NonReconciliationCase EscalationEngine::Hold(const std::string& case_id,
                                             const std::string& actor,
                                             const std::string& notes, Timestamp now) {
  return transition(case_id, actor, notes, now, HistoryAction::HELD,
                    [](NonReconciliationCase& nr_case) {
                      requireOpen(nr_case);
                      if (nr_case.status == CaseStatus::ON_HOLD) {
                        throw LedgerError(ErrorCode::INVALID_STATE,
                                          "Case " + nr_case.id + " is already on hold");
                      }
                      if (!isHeld(nr_case.status)) {
                        nr_case.held_from = nr_case.status;
                      }
                      nr_case.status = CaseStatus::ON_HOLD;
                      nr_case.next_escalation_date.reset();
                    });
}

NonReconciliationCase EscalationEngine::RequireApproval(const std::string& case_id,
                                                        const std::string& actor,
                                                        const std::string& notes,
                                                        Timestamp now) {
  return transition(case_id, actor, notes, now, HistoryAction::HELD,
                    [](NonReconciliationCase& nr_case) {
                      requireOpen(nr_case);
                      if (nr_case.status == CaseStatus::REQUIRES_APPROVAL) {
                        throw LedgerError(ErrorCode::INVALID_STATE,
                                          "Case " + nr_case.id + " already awaits approval");
                      }
                      if (!isHeld(nr_case.status)) {
                        nr_case.held_from = nr_case.status;
                      }
                      nr_case.status = CaseStatus::REQUIRES_APPROVAL;
                      nr_case.next_escalation_date.reset();
                    });
}

NonReconciliationCase EscalationEngine::Release(const std::string& case_id,
                                                const std::string& actor,
                                                const std::string& notes, Timestamp now) {
  return transition(case_id, actor, notes, now, HistoryAction::RELEASED,
                    [this, now](NonReconciliationCase& nr_case) {
                      if (!isHeld(nr_case.status)) {
                        throw LedgerError(ErrorCode::INVALID_STATE,
                                          "Case " + nr_case.id + " is not held");
                      }
                      nr_case.status = nr_case.held_from.value_or(CaseStatus::PENDING);
                      nr_case.held_from.reset();
                      nr_case.next_escalation_date = nextEscalationDate(nr_case, now);
                    });
}

NonReconciliationCase EscalationEngine::EscalateManually(const std::string& case_id,
                                                         const std::string& actor,
                                                         const std::string& notes,
                                                         Timestamp now) {
  return transition(case_id, actor, notes, now, HistoryAction::ESCALATED,
                    [this, now](NonReconciliationCase& nr_case) {
                      requireOpen(nr_case);
                      if (nr_case.escalation_level >= kMaxEscalationLevel) {
                        throw LedgerError(ErrorCode::INVALID_STATE,
                                          "Case " + nr_case.id + " is at the highest level");
                      }
                      nr_case.escalation_level++;
                      nr_case.status = CaseStatus::ESCALATED;
                      nr_case.held_from.reset();
                      nr_case.next_escalation_date = nextEscalationDate(nr_case, now);
                    });
}

NonReconciliationCase EscalationEngine::Comment(const std::string& case_id,
                                                const std::string& actor,
                                                const std::string& note, Timestamp now) {
  if (note.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Comment must not be empty");
  }
  return transition(case_id, actor, note, now, HistoryAction::COMMENTED,
                    [](NonReconciliationCase&) {});
}

SweepReport EscalationEngine::Sweep(Timestamp now) {
  observability::MetricsCollector::Timer timer(observability::getGlobalMetrics(),
                                               "recon_escalation_sweep_seconds");
  SweepReport report;

  for (const auto& nr_case : store_.listCases()) {
    if (!isDue(nr_case, now)) continue;
    report.evaluated++;

    try {
      switch (sweepCase(nr_case.id, now, report)) {
        case SweepResult::ESCALATED: report.escalated++; break;
        case SweepResult::SUPERSEDED: report.superseded++; break;
        case SweepResult::SKIPPED: break;
      }
    } catch (const std::exception& e) {
      auto ledger_error = dynamic_cast<const LedgerError*>(&e);
      if (ledger_error && ledger_error->code() == ErrorCode::RULE_EVALUATION_ERROR) {
        observability::getGlobalMetrics().incrementCounter("recon_rule_evaluation_errors_total");
      }
      report.failures.push_back({nr_case.id, e.what()});
      observability::getGlobalMetrics().incrementCounter("recon_sweep_failures_total");
      LOG_BUILDER(LogLevel::ERROR, "Escalation sweep failed for case")
          .field("case_id", nr_case.id)
          .field("error", e.what());
    }
  }

  observability::getGlobalMetrics().incrementCounter("recon_escalation_sweeps_total");
  LOG_BUILDER(LogLevel::INFO, "Escalation sweep finished")
      .field("evaluated", static_cast<uint64_t>(report.evaluated))
      .field("escalated", static_cast<uint64_t>(report.escalated))
      .field("superseded", static_cast<uint64_t>(report.superseded))
      .field("conflicts", static_cast<uint64_t>(report.conflicts))
      .field("failures", static_cast<uint64_t>(report.failures.size()));
  return report;
}

size_t EscalationEngine::SupersedeCasesFor(SubjectKind kind, const std::string& subject_id,
                                           const std::string& actor, Timestamp now) {
  size_t closed = 0;
  for (const auto& nr_case : store_.listCases()) {
    if (nr_case.subject_kind != kind || nr_case.subject_id != subject_id ||
        nr_case.isTerminal()) {
      continue;
    }
    transition(nr_case.id, actor, "subject settled", now, HistoryAction::SUPERSEDED,
               [now](NonReconciliationCase& current) {
                 requireOpen(current);
                 closeCase(current, CaseStatus::RESOLVED, now);
               });
    closed++;
  }
  return closed;
}

void EscalationEngine::AddRule(const EscalationRule& rule) {
  validateRule(rule);

  std::unique_lock<std::shared_mutex> lock(rules_mutex_);
  auto existing = std::find_if(rules_.begin(), rules_.end(), [&](const EscalationRule& r) {
    return r.rule_code == rule.rule_code;
  });
  if (existing != rules_.end()) {
    *existing = rule;
  } else {
    rules_.push_back(rule);
  }
  LOG_BUILDER(LogLevel::INFO, "Escalation rule registered")
      .field("rule_code", rule.rule_code)
      .field("escalation_after_days", rule.escalation_after_days);
}

std::vector<EscalationRule> EscalationEngine::ListRules() const {
  std::shared_lock<std::shared_mutex> lock(rules_mutex_);
  return rules_;
}

NonReconciliationCase EscalationEngine::GetCase(const std::string& case_id) const {
  auto nr_case = store_.findCase(case_id);
  if (!nr_case) {
    throw LedgerError(ErrorCode::NOT_FOUND, "Case not found: " + case_id);
  }
  return *nr_case;
}

std::vector<NonReconciliationCase> EscalationEngine::ListCases(const CaseFilter& filter) const {
  std::vector<NonReconciliationCase> result;
  for (auto& nr_case : store_.listCases()) {
    if (filter.status && nr_case.status != *filter.status) continue;
    if (filter.category && categoryOf(nr_case.reason) != *filter.category) continue;
    if (filter.subject_id && nr_case.subject_id != *filter.subject_id) continue;
    if (filter.company_id && nr_case.company_id != *filter.company_id) continue;
    if (filter.minimum_level && nr_case.escalation_level < *filter.minimum_level) continue;
    if (filter.open_only && nr_case.isTerminal()) continue;
    result.push_back(std::move(nr_case));
  }
  return result;
}

std::vector<CaseHistoryEntry> EscalationEngine::History(const std::string& case_id) const {
  GetCase(case_id);
  return store_.caseHistory(case_id);
}

const std::vector<ReasonInfo>& EscalationEngine::ReasonCatalog() const {
  return reasonCatalog();
}

NonReconciliationCase EscalationEngine::transition(const std::string& case_id,
                                                   const std::string& actor,
                                                   const std::string& notes, Timestamp now,
                                                   HistoryAction action,
                                                   const Mutation& mutate) {
  return concurrent::retryOnConflict(
      "case_" + toString(action), case_id, config_.max_retries, [&]() -> NonReconciliationCase {
        NonReconciliationCase nr_case = GetCase(case_id);
        uint64_t expected_version = nr_case.version;
        CaseStatus previous_status = nr_case.status;
        int previous_level = nr_case.escalation_level;

        mutate(nr_case);
        nr_case.updated_at = now;

        CaseHistoryEntry entry;
        entry.case_id = case_id;
        entry.action = action;
        entry.previous_status = previous_status;
        entry.new_status = nr_case.status;
        entry.previous_level = previous_level;
        entry.new_level = nr_case.escalation_level;
        entry.performed_by = actor.empty() ? kSystemActor : actor;
        entry.performed_at = now;
        entry.notes = notes;
        entry.system_generated = actor.empty() || actor == kSystemActor;

        LedgerTransaction transaction;
        transaction.cases.push_back({nr_case, expected_version});
        transaction.history.push_back(entry);
        store_.commit(transaction);

        observability::getGlobalMetrics().incrementCounter("recon_case_transitions_total");
        LOG_BUILDER(LogLevel::INFO, "Case updated")
            .correlation(case_id)
            .field("action", toString(action))
            .field("status", toString(nr_case.status))
            .field("level", nr_case.escalation_level)
            .field("actor", entry.performed_by);

        if (action == HistoryAction::ESCALATED) {
          notify(notifications::NotificationType::ESCALATION_OCCURRED, nr_case, entry, now);
        } else if (nr_case.status == CaseStatus::REQUIRES_APPROVAL &&
                   previous_status != CaseStatus::REQUIRES_APPROVAL) {
          notify(notifications::NotificationType::APPROVAL_REQUESTED, nr_case, entry, now);
        } else if (previous_status != nr_case.status) {
          notify(notifications::NotificationType::STATUS_CHANGE, nr_case, entry, now);
        }
        return GetCase(case_id);
      });
}

std::optional<Timestamp> EscalationEngine::scheduledEscalation(
    const NonReconciliationCase& nr_case, Timestamp now) const {
  if (nr_case.escalation_level >= kMaxEscalationLevel) {
    return std::nullopt;
  }

  RuleSubject subject;
  subject.company_id = nr_case.company_id;
  subject.reason = nr_case.reason;
  subject.amount = subjectAmount(nr_case.subject_kind, nr_case.subject_id);

  RuleEvaluation evaluation = evaluateRules(ListRules(), subject);
  int days = evaluation.matched_rule.empty() ? config_.default_escalation_after_days
                                             : evaluation.escalation_after_days;
  return now + days * kSecondsPerDay;
}

std::optional<Timestamp> EscalationEngine::nextEscalationDate(
    const NonReconciliationCase& nr_case, Timestamp now) const {
  try {
    return scheduledEscalation(nr_case, now);
  } catch (const LedgerError& e) {
    if (e.code() != ErrorCode::RULE_EVALUATION_ERROR) throw;

    observability::getGlobalMetrics().incrementCounter("recon_rule_evaluation_errors_total");
    LOG_BUILDER(LogLevel::ERROR, "Escalation rule evaluation failed")
        .correlation(nr_case.id)
        .field("reason", toString(nr_case.reason))
        .field("error", e.what());
    return std::nullopt;
  }
}

Amount EscalationEngine::subjectAmount(SubjectKind kind, const std::string& subject_id) const {
  if (kind == SubjectKind::EXPENSE) {
    auto expense = store_.findExpense(subject_id);
    return expense ? expense->amount : 0;
  }
  auto movement = store_.findMovement(subject_id);
  return movement ? movement->magnitude() : 0;
}

bool EscalationEngine::subjectSettled(const NonReconciliationCase& nr_case) const {
  if (nr_case.subject_kind == SubjectKind::MOVEMENT) {
    auto movement = store_.findMovement(nr_case.subject_id);
    if (!movement) return false;
    return movement->status == MovementStatus::CANCELLED ||
           (movement->magnitude() > 0 && movement->unallocated() == 0);
  }

  auto expense = store_.findExpense(nr_case.subject_id);
  if (!expense) return false;
  if (expense->bank_status == BankStatus::RECONCILED) return true;

  auto advance = advances_.FindAdvanceForExpense(expense->id);
  if (advance && advance->status != AdvanceStatus::CANCELLED) return true;

  if (expense->split_group_id) {
    SplitGroup group = allocation_.GetSplit(*expense->split_group_id);
    if (group.status == SplitGroupStatus::FINALIZED) return true;
  }
  return false;
}

bool EscalationEngine::isDue(const NonReconciliationCase& nr_case, Timestamp now) const {
  return isSweepable(nr_case.status) && nr_case.next_escalation_date &&
         *nr_case.next_escalation_date <= now;
}

EscalationEngine::SweepResult EscalationEngine::sweepCase(const std::string& case_id,
                                                          Timestamp now, SweepReport& report) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto current = store_.findCase(case_id);
      if (!current || !isDue(*current, now)) {
        return SweepResult::SKIPPED;
      }

      NonReconciliationCase nr_case = *current;
      uint64_t expected_version = nr_case.version;

      CaseHistoryEntry entry;
      entry.case_id = case_id;
      entry.previous_status = nr_case.status;
      entry.previous_level = nr_case.escalation_level;
      entry.performed_by = kSystemActor;
      entry.performed_at = now;
      entry.system_generated = true;

      SweepResult result;
      if (subjectSettled(nr_case)) {
        closeCase(nr_case, CaseStatus::RESOLVED, now);
        entry.action = HistoryAction::SUPERSEDED;
        entry.notes = "subject settled";
        result = SweepResult::SUPERSEDED;
      } else {
        // Evaluated before any change: a malformed rule leaves the case untouched.
        NonReconciliationCase escalated = nr_case;
        escalated.escalation_level = std::min(nr_case.escalation_level + 1, kMaxEscalationLevel);
        escalated.next_escalation_date = scheduledEscalation(escalated, now);
        escalated.status = CaseStatus::ESCALATED;
        nr_case = escalated;
        entry.action = HistoryAction::ESCALATED;
        entry.notes = "escalation due";
        result = SweepResult::ESCALATED;
      }
      nr_case.updated_at = now;
      entry.new_status = nr_case.status;
      entry.new_level = nr_case.escalation_level;

      LedgerTransaction transaction;
      transaction.cases.push_back({nr_case, expected_version});
      transaction.history.push_back(entry);
      store_.commit(transaction);

      if (result == SweepResult::ESCALATED) {
        observability::getGlobalMetrics().incrementCounter("recon_cases_escalated_total");
        LOG_BUILDER(LogLevel::INFO, "Case escalated")
            .correlation(case_id)
            .field("previous_level", entry.previous_level)
            .field("level", entry.new_level);
        notify(notifications::NotificationType::ESCALATION_OCCURRED, nr_case, entry, now);
      } else {
        observability::getGlobalMetrics().incrementCounter("recon_cases_superseded_total");
        LOG_BUILDER(LogLevel::INFO, "Case superseded").correlation(case_id);
        notify(notifications::NotificationType::STATUS_CHANGE, nr_case, entry, now);
      }
      return result;
    } catch (const LedgerError& e) {
      if (!e.isRetryable() || attempt >= config_.max_retries) throw;
      report.conflicts++;
      LOG_BUILDER(LogLevel::DEBUG, "Case changed during sweep, re-reading")
          .correlation(case_id)
          .field("attempt", attempt);
    }
  }
}

void EscalationEngine::notify(notifications::NotificationType type,
                              const NonReconciliationCase& nr_case,
                              const CaseHistoryEntry& entry, Timestamp now) {
  if (!sink_) return;

  auto recipients = config_.recipients_by_level.find(nr_case.escalation_level);
  if (recipients == config_.recipients_by_level.end()) return;

  nlohmann::json payload = {
      {"case_id", nr_case.id},
      {"subject_kind", toString(nr_case.subject_kind)},
      {"subject_id", nr_case.subject_id},
      {"company_id", nr_case.company_id},
      {"reason", toString(nr_case.reason)},
      {"status", toString(nr_case.status)},
      {"previous_level", entry.previous_level},
      {"escalation_level", nr_case.escalation_level},
      {"performed_by", entry.performed_by},
  };
  payload["next_escalation_date"] = nr_case.next_escalation_date
      ? nlohmann::json(*nr_case.next_escalation_date)
      : nlohmann::json(nullptr);

  std::string template_id;
  switch (type) {
    case notifications::NotificationType::ESCALATION_OCCURRED: template_id = "case_escalated"; break;
    case notifications::NotificationType::STATUS_CHANGE: template_id = "case_status_changed"; break;
    case notifications::NotificationType::APPROVAL_REQUESTED: template_id = "case_approval_requested"; break;
  }

  for (const auto& recipient : recipients->second) {
    notifications::NotificationRequest request;
    request.type = type;
    request.recipient = recipient;
    request.template_id = template_id;
    request.payload = payload;
    request.case_id = nr_case.id;
    request.created_at = now;
    sink_->enqueue(std::move(request));
  }
}

}  // namespace escalation
}  // namespace recon
