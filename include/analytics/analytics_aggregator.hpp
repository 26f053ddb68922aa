#ifndef ANALYTICS_AGGREGATOR_HPP_
#define ANALYTICS_AGGREGATOR_HPP_

#include "ledger_store.hpp"
#include "ledger_types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace recon {
namespace analytics {

struct CaseAnalytics {
  size_t total = 0;
  size_t open = 0;
  size_t resolved = 0;  // resolved or dismissed
  size_t overdue = 0;   // open past the estimated resolution date
  std::map<std::string, size_t> by_status;
  std::map<std::string, size_t> by_category;
  std::map<std::string, size_t> by_reason;
  std::map<std::string, size_t> by_impact;
  std::map<int, size_t> by_level;
  double escalation_rate = 0.0;           // share of cases above level 1
  double average_resolution_hours = 0.0;
};

struct SplitAnalytics {
  size_t total = 0;
  std::map<std::string, size_t> by_status;
  std::map<std::string, size_t> by_type;
  double completeness_rate = 0.0;  // over groups that are not rejected
  Amount allocated_total = 0;
  Amount target_total = 0;
};

struct AdvanceAnalytics {
  size_t total = 0;
  std::map<std::string, size_t> by_status;
  std::map<std::string, Amount> amount_by_status;
  Amount total_pending = 0;
  std::map<std::string, size_t> aging;  // open advances by days outstanding
};

struct LedgerAnalytics {
  size_t movements = 0;
  size_t expenses = 0;
  size_t reconciled_expenses = 0;
  size_t non_reconcilable_expenses = 0;
  Amount unallocated_total = 0;  // active debit movements
  Amount pending_total = 0;      // expenses still open for reconciliation
};

struct AnalyticsSnapshot {
  Timestamp generated_at = 0;
  CaseAnalytics cases;
  SplitAnalytics splits;
  AdvanceAnalytics advances;
  LedgerAnalytics ledger;
};

nlohmann::json toJson(const AnalyticsSnapshot& snapshot);

/**
 * Read-only rollups recomputed from the ledger store. Nothing here is
 * incrementally maintained, so a rollup is always consistent with the
 * records it was computed from.
 */
class AnalyticsAggregator {
 public:
  explicit AnalyticsAggregator(const LedgerStore& store);

  // Non-copyable
  AnalyticsAggregator(const AnalyticsAggregator&) = delete;
  AnalyticsAggregator& operator=(const AnalyticsAggregator&) = delete;

  /** Recomputes the snapshot, publishes gauges and keeps it as the latest. */
  AnalyticsSnapshot Rollup(Timestamp now);

  std::optional<AnalyticsSnapshot> Latest() const;

 private:
  void publishGauges(const AnalyticsSnapshot& snapshot) const;

  const LedgerStore& store_;
  std::optional<AnalyticsSnapshot> latest_;
  mutable std::mutex mutex_;
};

}  // namespace analytics
}  // namespace recon

#endif  // ANALYTICS_AGGREGATOR_HPP_
