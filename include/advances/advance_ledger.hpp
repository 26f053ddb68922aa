#ifndef ADVANCE_LEDGER_HPP_
#define ADVANCE_LEDGER_HPP_

#include "allocation/allocation_engine.hpp"
#include "ledger_store.hpp"
#include "ledger_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace recon {
namespace advances {

struct AdvanceConfig {
  int max_retries = 3;
  int warning_after_days = 7;
  int urgent_after_days = 15;
};

/**
 * Request to record that an employee paid an expense out of pocket.
 */
struct NewAdvance {
  std::string operation_id;
  std::string expense_id;
  std::string employee_id;
  std::string employee_name;
  Amount amount = 0;
  ReimbursementChannel channel = ReimbursementChannel::PENDING;
  std::string payment_method;
  std::string notes;
  Timestamp advance_date = 0;
};

struct ReimbursementRequest {
  std::string operation_id;
  std::string advance_id;
  Amount amount = 0;
  std::optional<std::string> movement_id;  // bank movement that paid the employee
  std::optional<ReimbursementChannel> channel;
  Timestamp reimbursed_at = 0;
  std::string notes;
};

struct AdvanceOutcome {
  EmployeeAdvance advance;
  bool replayed = false;
};

enum class AgingPriority {
  NORMAL,
  WARNING,
  URGENT
};

std::string toString(AgingPriority priority);

struct PendingAdvance {
  EmployeeAdvance advance;
  int days_outstanding = 0;
  AgingPriority priority = AgingPriority::NORMAL;
};

struct EmployeeAdvanceSummary {
  std::string employee_id;
  std::string employee_name;
  size_t total_advances = 0;
  size_t open_advances = 0;
  size_t completed_advances = 0;
  size_t cancelled_advances = 0;
  Amount total_amount = 0;
  Amount total_reimbursed = 0;
  Amount total_pending = 0;
  std::optional<Timestamp> oldest_pending_date;
};

struct AdvanceSummary {
  size_t total_advances = 0;
  std::map<std::string, size_t> by_status;
  std::map<std::string, size_t> by_channel;
  Amount total_amount = 0;
  Amount total_reimbursed = 0;
  Amount total_pending = 0;
  size_t employees_with_pending = 0;
};

/**
 * Lifecycle of employee advances: pending -> partial -> completed, or
 * pending/partial -> cancelled. Every state change commits together with
 * the linked expense flags, so the expense and its advance never disagree.
 */
class AdvanceLedger {
 public:
  AdvanceLedger(LedgerStore& store, allocation::AllocationEngine& allocation,
                AdvanceConfig config = AdvanceConfig());

  // Non-copyable
  AdvanceLedger(const AdvanceLedger&) = delete;
  AdvanceLedger& operator=(const AdvanceLedger&) = delete;

  /**
   * Creates the advance and flags its expense non-reconcilable.
   * CONFLICTING_RECONCILIATION_MODE if the expense is already (partly)
   * reconciled, sits in an open split group, or carries an advance.
   */
  AdvanceOutcome CreateAdvance(const NewAdvance& request);

  /**
   * Adds a reimbursement. With a movement id the movement is allocated the
   * same amount in the same commit.
   */
  AdvanceOutcome RecordReimbursement(const ReimbursementRequest& request);

  /**
   * Cancels a pending or partial advance; the expense goes back to normal
   * reconciliation.
   */
  AdvanceOutcome CancelAdvance(const std::string& operation_id, const std::string& advance_id,
                               const std::string& reason, Timestamp now);

  EmployeeAdvance GetAdvance(const std::string& advance_id) const;
  std::optional<EmployeeAdvance> FindAdvanceForExpense(const std::string& expense_id) const;
  std::vector<EmployeeAdvance> ListAdvances(std::optional<AdvanceStatus> status = std::nullopt) const;
  EmployeeAdvanceSummary EmployeeSummary(const std::string& employee_id) const;

  /** Open advances, oldest first, with their aging priority. */
  std::vector<PendingAdvance> PendingAdvances(Timestamp now) const;

  AdvanceSummary Summary() const;

 private:
  std::string nextAdvanceId(const std::string& expense_id) const;
  AgingPriority priorityFor(int days_outstanding) const;

  LedgerStore& store_;
  allocation::AllocationEngine& allocation_;
  AdvanceConfig config_;
};

}  // namespace advances
}  // namespace recon

#endif  // ADVANCE_LEDGER_HPP_
