#include "analytics_aggregator.hpp"

#include "escalation/escalation_rules.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

namespace recon {
namespace analytics {

using observability::LogLevel;

namespace {

std::string agingBucket(Timestamp advance_date, Timestamp now) {
  Timestamp days = (now - advance_date) / kSecondsPerDay;
  if (days <= 7) return "0_7_days";
  if (days <= 15) return "8_15_days";
  if (days <= 30) return "16_30_days";
  return "over_30_days";
}

CaseAnalytics rollupCases(const std::vector<NonReconciliationCase>& cases, Timestamp now) {
  CaseAnalytics result;
  size_t escalated = 0;
  size_t timed = 0;
  double resolution_hours = 0.0;

  for (const auto& nr_case : cases) {
    result.total++;
    result.by_status[toString(nr_case.status)]++;
    result.by_category[toString(escalation::categoryOf(nr_case.reason))]++;
    result.by_reason[toString(nr_case.reason)]++;
    result.by_impact[toString(nr_case.business_impact)]++;
    result.by_level[nr_case.escalation_level]++;
    if (nr_case.escalation_level > 1) escalated++;

    if (nr_case.isTerminal()) {
      result.resolved++;
      if (nr_case.resolved_at) {
        resolution_hours += static_cast<double>(*nr_case.resolved_at - nr_case.created_at) / 3600.0;
        timed++;
      }
    } else {
      result.open++;
      if (nr_case.estimated_resolution_date && *nr_case.estimated_resolution_date < now) {
        result.overdue++;
      }
    }
  }

  if (result.total > 0) {
    result.escalation_rate = static_cast<double>(escalated) / result.total;
  }
  if (timed > 0) {
    result.average_resolution_hours = resolution_hours / timed;
  }
  return result;
}

SplitAnalytics rollupSplits(const std::vector<SplitGroup>& groups) {
  SplitAnalytics result;
  size_t live = 0;
  size_t complete = 0;

  for (const auto& group : groups) {
    result.total++;
    result.by_status[toString(group.status)]++;
    result.by_type[toString(group.type)]++;
    if (group.status == SplitGroupStatus::REJECTED) continue;

    live++;
    if (group.is_complete) complete++;
    result.allocated_total += group.allocatedTotal();
    result.target_total += group.target_amount;
  }

  if (live > 0) {
    result.completeness_rate = static_cast<double>(complete) / live;
  }
  return result;
}

AdvanceAnalytics rollupAdvances(const std::vector<EmployeeAdvance>& advances, Timestamp now) {
  AdvanceAnalytics result;
  for (const auto& advance : advances) {
    result.total++;
    std::string status = toString(advance.status);
    result.by_status[status]++;
    result.amount_by_status[status] += advance.advance_amount;

    if (advance.status == AdvanceStatus::PENDING || advance.status == AdvanceStatus::PARTIAL) {
      result.total_pending += advance.pending();
      result.aging[agingBucket(advance.advance_date, now)]++;
    }
  }
  return result;
}

LedgerAnalytics rollupLedger(const std::vector<BankMovement>& movements,
                             const std::vector<ExpenseRecord>& expenses) {
  LedgerAnalytics result;
  result.movements = movements.size();
  for (const auto& movement : movements) {
    if (movement.status == MovementStatus::ACTIVE && movement.isDebit()) {
      result.unallocated_total += movement.unallocated();
    }
  }

  result.expenses = expenses.size();
  for (const auto& expense : expenses) {
    switch (expense.bank_status) {
      case BankStatus::RECONCILED:
        result.reconciled_expenses++;
        break;
      case BankStatus::NON_RECONCILABLE:
        result.non_reconcilable_expenses++;
        break;
      case BankStatus::PENDING:
        result.pending_total += expense.pending();
        break;
    }
  }
  return result;
}

template <typename Map>
nlohmann::json countsJson(const Map& counts) {
  nlohmann::json object = nlohmann::json::object();
  for (const auto& [key, value] : counts) {
    object[key] = value;
  }
  return object;
}

}  // namespace

nlohmann::json toJson(const AnalyticsSnapshot& snapshot) {
  nlohmann::json levels = nlohmann::json::object();
  for (const auto& [level, count] : snapshot.cases.by_level) {
    levels[std::to_string(level)] = count;
  }

  return {
      {"generated_at", snapshot.generated_at},
      {"cases",
       {{"total", snapshot.cases.total},
        {"open", snapshot.cases.open},
        {"resolved", snapshot.cases.resolved},
        {"overdue", snapshot.cases.overdue},
        {"by_status", countsJson(snapshot.cases.by_status)},
        {"by_category", countsJson(snapshot.cases.by_category)},
        {"by_reason", countsJson(snapshot.cases.by_reason)},
        {"by_impact", countsJson(snapshot.cases.by_impact)},
        {"by_level", levels},
        {"escalation_rate", snapshot.cases.escalation_rate},
        {"average_resolution_hours", snapshot.cases.average_resolution_hours}}},
      {"splits",
       {{"total", snapshot.splits.total},
        {"by_status", countsJson(snapshot.splits.by_status)},
        {"by_type", countsJson(snapshot.splits.by_type)},
        {"completeness_rate", snapshot.splits.completeness_rate},
        {"allocated_total", snapshot.splits.allocated_total},
        {"target_total", snapshot.splits.target_total}}},
      {"advances",
       {{"total", snapshot.advances.total},
        {"by_status", countsJson(snapshot.advances.by_status)},
        {"amount_by_status", countsJson(snapshot.advances.amount_by_status)},
        {"total_pending", snapshot.advances.total_pending},
        {"aging", countsJson(snapshot.advances.aging)}}},
      {"ledger",
       {{"movements", snapshot.ledger.movements},
        {"expenses", snapshot.ledger.expenses},
        {"reconciled_expenses", snapshot.ledger.reconciled_expenses},
        {"non_reconcilable_expenses", snapshot.ledger.non_reconcilable_expenses},
        {"unallocated_total", snapshot.ledger.unallocated_total},
        {"pending_total", snapshot.ledger.pending_total}}},
  };
}

AnalyticsAggregator::AnalyticsAggregator(const LedgerStore& store) : store_(store) {
}

AnalyticsSnapshot AnalyticsAggregator::Rollup(Timestamp now) {
  observability::MetricsCollector::Timer timer(observability::getGlobalMetrics(),
                                               "recon_analytics_rollup_seconds");

  AnalyticsSnapshot snapshot;
  snapshot.generated_at = now;
  snapshot.cases = rollupCases(store_.listCases(), now);
  snapshot.splits = rollupSplits(store_.listSplitGroups());
  snapshot.advances = rollupAdvances(store_.listAdvances(), now);
  snapshot.ledger = rollupLedger(store_.listMovements(), store_.listExpenses());

  publishGauges(snapshot);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = snapshot;
  }

  LOG_BUILDER(LogLevel::DEBUG, "Analytics rollup complete")
      .field("cases", static_cast<uint64_t>(snapshot.cases.total))
      .field("split_groups", static_cast<uint64_t>(snapshot.splits.total))
      .field("advances", static_cast<uint64_t>(snapshot.advances.total));
  return snapshot;
}

std::optional<AnalyticsSnapshot> AnalyticsAggregator::Latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

void AnalyticsAggregator::publishGauges(const AnalyticsSnapshot& snapshot) const {
  auto& metrics = observability::getGlobalMetrics();

  metrics.setGauge("recon_cases_open", static_cast<double>(snapshot.cases.open));
  metrics.setGauge("recon_cases_overdue", static_cast<double>(snapshot.cases.overdue));
  metrics.setGauge("recon_cases_escalation_rate", snapshot.cases.escalation_rate);
  metrics.setGauge("recon_cases_average_resolution_hours",
                   snapshot.cases.average_resolution_hours);
  for (const auto& [level, count] : snapshot.cases.by_level) {
    metrics.setGauge("recon_cases_level_" + std::to_string(level), static_cast<double>(count));
  }

  metrics.setGauge("recon_split_groups_total", static_cast<double>(snapshot.splits.total));
  metrics.setGauge("recon_split_completeness_rate", snapshot.splits.completeness_rate);

  metrics.setGauge("recon_advances_pending_amount",
                   static_cast<double>(snapshot.advances.total_pending));
  metrics.setGauge("recon_ledger_unallocated_amount",
                   static_cast<double>(snapshot.ledger.unallocated_total));
  metrics.setGauge("recon_ledger_pending_amount",
                   static_cast<double>(snapshot.ledger.pending_total));
}

}  // namespace analytics
}  // namespace recon
