#include "allocation_engine.hpp"

#include "concurrent/optimistic_retry.hpp"
#include "ledger_errors.hpp"
#include "ledger_invariants.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <limits>
#include <set>

namespace recon {
namespace allocation {

using observability::LogLevel;

namespace {

std::string deltaOperation(const std::string& operation_id, const std::string& kind,
                           const std::string& record_id) {
  return operation_id + "#" + kind + ":" + record_id;
}

void requireOperation(const std::string& operation_id) {
  if (operation_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "An operation id is required");
  }
}

void validateMembers(const SplitProposal& proposal) {
  requireOperation(proposal.operation_id);
  if (proposal.group_id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Split group id must not be empty");
  }
  if (proposal.members.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Split proposal has no members");
  }

  for (const auto& member : proposal.members) {
    if (member.expense_id.empty() || member.movement_id.empty()) {
      throw LedgerError(ErrorCode::INVALID_ARGUMENT,
                        "Every split member needs an expense and a movement");
    }
    if (member.amount <= 0) {
      throw LedgerError(ErrorCode::INVALID_ARGUMENT,
                        "Split member amounts must be positive (expense " +
                        member.expense_id + ", movement " + member.movement_id + ")");
    }
    if (member.percentage_bp && (*member.percentage_bp <= 0 || *member.percentage_bp > 10000)) {
      throw LedgerError(ErrorCode::INVALID_ARGUMENT,
                        "Split member percentage must be in (0, 100]");
    }
  }
}

// The "one" side shared by every member; mixed directions are rejected.
std::string resolveAnchor(const SplitProposal& proposal) {
  bool one_to_many = proposal.type == SplitType::ONE_TO_MANY;
  const auto& first = proposal.members.front();
  std::string anchor = one_to_many ? first.movement_id : first.expense_id;

  std::set<std::string> counterparts;
  for (const auto& member : proposal.members) {
    const std::string& shared = one_to_many ? member.movement_id : member.expense_id;
    const std::string& other = one_to_many ? member.expense_id : member.movement_id;

    if (shared != anchor) {
      throw LedgerError(ErrorCode::INVALID_SPLIT_TYPE,
                        "Members of " + toString(proposal.type) + " group " + proposal.group_id +
                        " do not share a single " + (one_to_many ? "movement" : "expense"));
    }
    if (!counterparts.insert(other).second) {
      throw LedgerError(ErrorCode::INVALID_SPLIT_TYPE,
                        "Duplicate member " + other + " in split group " + proposal.group_id);
    }
  }
  return anchor;
}

std::optional<std::string> priorGroup(const std::map<std::string, std::string>& links,
                                      const std::string& record_id) {
  auto it = links.find(record_id);
  if (it == links.end()) return std::nullopt;
  return it->second;
}

// Keeps the link a member had before joining, or the one a revised group already kept.
void rememberPriorGroup(std::map<std::string, std::string>& links, const std::string& record_id,
                        const std::optional<std::string>& current, const std::string& group_id,
                        const std::map<std::string, std::string>* previous_links) {
  if (previous_links) {
    auto kept = previous_links->find(record_id);
    if (kept != previous_links->end()) {
      links[record_id] = kept->second;
      return;
    }
  }
  if (current && *current != group_id) {
    links[record_id] = *current;
  }
}

Amount checkedAdd(Amount total, Amount amount, const std::string& group_id) {
  if (amount > std::numeric_limits<Amount>::max() - total) {
    throw LedgerError(ErrorCode::ALLOCATION_OVERFLOW,
                      "Split group " + group_id + " amounts overflow");
  }
  return total + amount;
}

}  // namespace

SplitOutcome outcomeOf(const SplitGroup& group, bool replayed) {
  SplitOutcome outcome;
  outcome.group_id = group.id;
  outcome.status = group.status;
  outcome.is_complete = group.is_complete;
  outcome.target_amount = group.target_amount;
  outcome.allocated_total = group.allocatedTotal();
  outcome.remaining = group.remaining();
  outcome.replayed = replayed;
  return outcome;
}

AllocationEngine::AllocationEngine(LedgerStore& store, AllocationConfig config)
    : store_(store), config_(config) {
}

SplitOutcome AllocationEngine::ProposeSplit(const SplitProposal& proposal, Timestamp now) {
  validateMembers(proposal);
  observability::MetricsCollector::Timer timer(observability::getGlobalMetrics(),
                                               "recon_propose_split_seconds");

  return concurrent::retryOnConflict(
      "propose_split", proposal.operation_id, config_.max_retries, [&]() -> SplitOutcome {
        if (store_.hasOperation(proposal.operation_id)) {
          return replayOutcome(proposal.group_id);
        }
        if (store_.findSplitGroup(proposal.group_id)) {
          throw LedgerError(ErrorCode::INVALID_STATE,
                            "Split group already exists: " + proposal.group_id);
        }

        LedgerTransaction transaction;
        transaction.operation_id = proposal.operation_id;
        SplitGroup group = stageSplit(transaction, proposal, nullptr, now);
        transaction.split_groups.push_back({group, 0});

        if (!store_.commit(transaction)) {
          return replayOutcome(proposal.group_id);
        }

        SplitGroup committed = GetSplit(proposal.group_id);
        observability::getGlobalMetrics().incrementCounter("recon_splits_proposed_total");
        LOG_BUILDER(LogLevel::INFO, "Split group proposed")
            .correlation(proposal.operation_id)
            .field("group_id", committed.id)
            .field("type", toString(committed.type))
            .field("members", static_cast<uint64_t>(committed.rows.size()))
            .field("target", committed.target_amount)
            .field("allocated", committed.allocatedTotal())
            .field("complete", committed.is_complete);
        return outcomeOf(committed);
      });
}

SplitOutcome AllocationEngine::ReviseSplit(const SplitProposal& proposal, Timestamp now) {
  validateMembers(proposal);

  return concurrent::retryOnConflict(
      "revise_split", proposal.operation_id, config_.max_retries, [&]() -> SplitOutcome {
        if (store_.hasOperation(proposal.operation_id)) {
          return replayOutcome(proposal.group_id);
        }

        SplitGroup previous = GetSplit(proposal.group_id);
        if (previous.status != SplitGroupStatus::OPEN || previous.is_complete) {
          throw LedgerError(ErrorCode::INVALID_STATE,
                            "Split group " + previous.id + " can only be revised while open and incomplete");
        }

        LedgerTransaction transaction;
        transaction.operation_id = proposal.operation_id;
        SplitGroup group = stageSplit(transaction, proposal, &previous, now);
        group.created_by = previous.created_by;
        group.created_at = previous.created_at;
        group.annotations = previous.annotations;
        transaction.split_groups.push_back({group, previous.version});

        if (!store_.commit(transaction)) {
          return replayOutcome(proposal.group_id);
        }

        SplitGroup committed = GetSplit(proposal.group_id);
        observability::getGlobalMetrics().incrementCounter("recon_splits_revised_total");
        LOG_BUILDER(LogLevel::INFO, "Split group revised")
            .correlation(proposal.operation_id)
            .field("group_id", committed.id)
            .field("members", static_cast<uint64_t>(committed.rows.size()))
            .field("allocated", committed.allocatedTotal())
            .field("complete", committed.is_complete);
        return outcomeOf(committed);
      });
}

SplitOutcome AllocationEngine::FinalizeOrReject(const std::string& operation_id,
                                                const std::string& group_id,
                                                SplitDecision decision,
                                                const std::string& actor, Timestamp now) {
  requireOperation(operation_id);

  return concurrent::retryOnConflict(
      "finalize_or_reject", operation_id, config_.max_retries, [&]() -> SplitOutcome {
        if (store_.hasOperation(operation_id)) {
          return replayOutcome(group_id);
        }

        SplitGroup group = GetSplit(group_id);
        if (decision == SplitDecision::FINALIZE && group.status != SplitGroupStatus::OPEN) {
          throw LedgerError(ErrorCode::INVALID_STATE,
                            "Split group " + group_id + " is " + toString(group.status));
        }
        if (decision == SplitDecision::REJECT && group.status == SplitGroupStatus::FINALIZED) {
          throw LedgerError(ErrorCode::INVALID_STATE,
                            "Split group " + group_id + " is finalized and cannot be rolled back");
        }
        if (decision == SplitDecision::REJECT && group.status == SplitGroupStatus::REJECTED) {
          return outcomeOf(group, true);
        }

        LedgerTransaction transaction;
        transaction.operation_id = operation_id;
        uint64_t expected_version = group.version;

        if (decision == SplitDecision::FINALIZE) {
          group.status = SplitGroupStatus::FINALIZED;
          group.finalized_at = now;
        } else {
          // Release every row; records can appear in several rows only on the anchor side.
          std::map<std::string, Amount> movement_release;
          std::map<std::string, Amount> expense_release;
          for (const auto& row : group.rows) {
            movement_release[row.movement_id] += row.allocated_amount;
            expense_release[row.expense_id] += row.allocated_amount;
          }
          for (const auto& [movement_id, amount] : movement_release) {
            AllocationDelta delta;
            delta.record_id = movement_id;
            delta.delta = -amount;
            delta.operation_id = deltaOperation(operation_id, "release-movement", movement_id);
            delta.expected_version = store_.getMovement(movement_id).version;
            delta.unlink_group = group.id;
            delta.restore_group = priorGroup(group.prior_movement_groups, movement_id);
            transaction.movement_deltas.push_back(delta);
          }
          for (const auto& [expense_id, amount] : expense_release) {
            AllocationDelta delta;
            delta.record_id = expense_id;
            delta.delta = -amount;
            delta.operation_id = deltaOperation(operation_id, "release-expense", expense_id);
            delta.expected_version = store_.getExpense(expense_id).version;
            delta.unlink_group = group.id;
            delta.restore_group = priorGroup(group.prior_expense_groups, expense_id);
            transaction.expense_deltas.push_back(delta);
          }
          group.status = SplitGroupStatus::REJECTED;
        }

        group.updated_at = now;
        group.annotations.push_back(
            {actor, decision == SplitDecision::FINALIZE ? "finalized" : "rejected", now});
        transaction.split_groups.push_back({group, expected_version});

        if (!store_.commit(transaction)) {
          return replayOutcome(group_id);
        }

        SplitGroup committed = GetSplit(group_id);
        observability::getGlobalMetrics().incrementCounter(
            decision == SplitDecision::FINALIZE ? "recon_splits_finalized_total"
                                                : "recon_splits_rejected_total");
        LOG_BUILDER(LogLevel::INFO, decision == SplitDecision::FINALIZE ? "Split group finalized"
                                                                         : "Split group rejected")
            .correlation(operation_id)
            .field("group_id", committed.id)
            .field("actor", actor)
            .field("complete", committed.is_complete);
        return outcomeOf(committed);
      });
}

SplitGroup AllocationEngine::AnnotateSplit(const std::string& operation_id,
                                           const std::string& group_id, const std::string& actor,
                                           const std::string& note, Timestamp now) {
  requireOperation(operation_id);
  if (note.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Annotation must not be empty");
  }

  return concurrent::retryOnConflict(
      "annotate_split", operation_id, config_.max_retries, [&]() -> SplitGroup {
        SplitGroup group = GetSplit(group_id);
        if (store_.hasOperation(operation_id)) {
          return group;
        }
        uint64_t expected_version = group.version;
        group.annotations.push_back({actor, note, now});

        LedgerTransaction transaction;
        transaction.operation_id = operation_id;
        transaction.split_groups.push_back({group, expected_version});
        if (!store_.commit(transaction)) {
          LOG_BUILDER(LogLevel::DEBUG, "Replayed split annotation").field("group_id", group_id);
        }
        return GetSplit(group_id);
      });
}

SplitGroup AllocationEngine::GetSplit(const std::string& group_id) const {
  auto group = store_.findSplitGroup(group_id);
  if (!group) {
    throw LedgerError(ErrorCode::NOT_FOUND, "Split group not found: " + group_id);
  }
  return *group;
}

std::vector<SplitGroup> AllocationEngine::ListSplits(std::optional<SplitGroupStatus> status) const {
  std::vector<SplitGroup> result;
  for (auto& group : store_.listSplitGroups()) {
    if (!status || group.status == *status) {
      result.push_back(std::move(group));
    }
  }
  return result;
}

SplitSummary AllocationEngine::Summary() const {
  SplitSummary summary;
  for (const auto& group : store_.listSplitGroups()) {
    summary.total_groups++;
    summary.by_type[toString(group.type)]++;

    switch (group.status) {
      case SplitGroupStatus::OPEN: summary.open++; break;
      case SplitGroupStatus::FINALIZED: summary.finalized++; break;
      case SplitGroupStatus::REJECTED: summary.rejected++; break;
    }
    if (group.status == SplitGroupStatus::REJECTED) continue;

    if (group.is_complete) {
      summary.complete++;
    } else {
      summary.incomplete++;
    }
    summary.allocated_total += group.allocatedTotal();
    summary.target_total += group.target_amount;
  }
  return summary;
}

void AllocationEngine::StageMovementAllocation(LedgerTransaction& transaction,
                                               const std::string& movement_id, Amount amount,
                                               const std::string& operation_id) const {
  if (amount <= 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Allocation amount must be positive");
  }

  BankMovement movement = store_.getMovement(movement_id);
  if (movement.status == MovementStatus::CANCELLED) {
    throw LedgerError(ErrorCode::INVALID_STATE, "Movement " + movement_id + " is cancelled");
  }
  if (!movement.isDebit()) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Movement " + movement_id + " is a credit and cannot fund expenses");
  }
  checkNotBlocked(movement.split_group_id, "", "movement " + movement_id);
  if (amount > movement.unallocated()) {
    throw LedgerError(ErrorCode::ALLOCATION_OVERFLOW,
                      "Movement " + movement_id + " has only " +
                      std::to_string(movement.unallocated()) + " unallocated");
  }

  AllocationDelta delta;
  delta.record_id = movement_id;
  delta.delta = amount;
  delta.operation_id = deltaOperation(operation_id, "movement", movement_id);
  delta.expected_version = movement.version;
  transaction.movement_deltas.push_back(delta);
}

SplitGroup AllocationEngine::stageSplit(LedgerTransaction& transaction,
                                        const SplitProposal& proposal,
                                        const SplitGroup* previous, Timestamp now) const {
  std::string anchor_id = resolveAnchor(proposal);
  bool one_to_many = proposal.type == SplitType::ONE_TO_MANY;

  // Amounts the previous rows hold per record; they become available again.
  std::map<std::string, Amount> released_movements;
  std::map<std::string, Amount> released_expenses;
  if (previous) {
    for (const auto& row : previous->rows) {
      released_movements[row.movement_id] += row.allocated_amount;
      released_expenses[row.expense_id] += row.allocated_amount;
    }
  }

  std::map<std::string, BankMovement> movements;
  std::map<std::string, ExpenseRecord> expenses;
  for (const auto& member : proposal.members) {
    if (!movements.count(member.movement_id)) {
      movements.emplace(member.movement_id, store_.getMovement(member.movement_id));
    }
    if (!expenses.count(member.expense_id)) {
      expenses.emplace(member.expense_id, store_.getExpense(member.expense_id));
    }
  }
  for (const auto& [id, amount] : released_movements) {
    if (!movements.count(id)) movements.emplace(id, store_.getMovement(id));
  }
  for (const auto& [id, amount] : released_expenses) {
    if (!expenses.count(id)) expenses.emplace(id, store_.getExpense(id));
  }

  const std::string& currency = one_to_many ? movements.at(anchor_id).currency
                                            : expenses.at(anchor_id).currency;

  for (const auto& member : proposal.members) {
    const BankMovement& movement = movements.at(member.movement_id);
    const ExpenseRecord& expense = expenses.at(member.expense_id);

    if (movement.currency != currency || expense.currency != currency) {
      throw LedgerError(ErrorCode::INVALID_STATE,
                        "Split group " + proposal.group_id + " mixes currencies");
    }
    if (movement.status == MovementStatus::CANCELLED) {
      throw LedgerError(ErrorCode::INVALID_STATE, "Movement " + movement.id + " is cancelled");
    }
    if (!movement.isDebit()) {
      throw LedgerError(ErrorCode::INVALID_STATE,
                        "Movement " + movement.id + " is a credit and cannot fund expenses");
    }
    if (expense.is_employee_advance || expense.bank_status == BankStatus::NON_RECONCILABLE) {
      throw LedgerError(ErrorCode::CONFLICTING_RECONCILIATION_MODE,
                        "Expense " + expense.id + " is awaiting advance reimbursement");
    }
    checkNotBlocked(movement.split_group_id, proposal.group_id, "movement " + movement.id);
    checkNotBlocked(expense.split_group_id, proposal.group_id, "expense " + expense.id);
  }

  auto releasedFor = [](const std::map<std::string, Amount>& released, const std::string& id) {
    auto it = released.find(id);
    return it == released.end() ? Amount{0} : it->second;
  };

  Amount target = one_to_many
      ? movements.at(anchor_id).unallocated() + releasedFor(released_movements, anchor_id)
      : expenses.at(anchor_id).pending() + releasedFor(released_expenses, anchor_id);
  if (target <= 0) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      (one_to_many ? "Movement " : "Expense ") + anchor_id +
                      " has nothing left to allocate");
  }

  Amount total = 0;
  for (const auto& member : proposal.members) {
    total = checkedAdd(total, member.amount, proposal.group_id);

    Amount available = one_to_many
        ? expenses.at(member.expense_id).pending() +
              releasedFor(released_expenses, member.expense_id)
        : movements.at(member.movement_id).unallocated() +
              releasedFor(released_movements, member.movement_id);
    if (member.amount > available) {
      throw LedgerError(ErrorCode::ALLOCATION_OVERFLOW,
                        "Member " + (one_to_many ? member.expense_id : member.movement_id) +
                        " has only " + std::to_string(available) + " open, " +
                        std::to_string(member.amount) + " requested");
    }
  }
  if (total > target) {
    throw LedgerError(ErrorCode::ALLOCATION_OVERFLOW,
                      "Split group " + proposal.group_id + " allocates " + std::to_string(total) +
                      " but only " + std::to_string(target) + " is open on " + anchor_id);
  }

  SplitGroup group;
  group.id = proposal.group_id;
  group.type = proposal.type;
  group.anchor_id = anchor_id;
  group.target_amount = target;
  group.status = SplitGroupStatus::OPEN;
  group.created_by = proposal.actor;
  group.created_at = now;
  group.updated_at = now;
  for (const auto& member : proposal.members) {
    SplitRow row;
    row.expense_id = member.expense_id;
    row.movement_id = member.movement_id;
    row.allocated_amount = member.amount;
    row.percentage_bp = member.percentage_bp ? *member.percentage_bp
                                             : invariants::basisPoints(member.amount, target);
    row.created_by = proposal.actor;
    row.created_at = now;
    row.notes = member.notes;
    group.rows.push_back(row);
  }
  invariants::refreshSplitCompleteness(group);

  // Net change per record against what the previous rows held.
  std::map<std::string, Amount> movement_net;
  std::map<std::string, Amount> expense_net;
  for (const auto& [id, amount] : released_movements) movement_net[id] -= amount;
  for (const auto& [id, amount] : released_expenses) expense_net[id] -= amount;

  std::set<std::string> member_movements;
  std::set<std::string> member_expenses;
  for (const auto& row : group.rows) {
    movement_net[row.movement_id] += row.allocated_amount;
    expense_net[row.expense_id] += row.allocated_amount;
    member_movements.insert(row.movement_id);
    member_expenses.insert(row.expense_id);
  }

  for (const auto& id : member_movements) {
    rememberPriorGroup(group.prior_movement_groups, id, movements.at(id).split_group_id, group.id,
                       previous ? &previous->prior_movement_groups : nullptr);
  }
  for (const auto& id : member_expenses) {
    rememberPriorGroup(group.prior_expense_groups, id, expenses.at(id).split_group_id, group.id,
                       previous ? &previous->prior_expense_groups : nullptr);
  }

  for (const auto& [id, net] : movement_net) {
    AllocationDelta delta;
    delta.record_id = id;
    delta.delta = net;
    delta.operation_id = deltaOperation(proposal.operation_id, "movement", id);
    delta.expected_version = movements.at(id).version;
    if (member_movements.count(id)) {
      delta.link_group = group.id;
    } else {
      delta.unlink_group = group.id;
      if (previous) delta.restore_group = priorGroup(previous->prior_movement_groups, id);
    }
    transaction.movement_deltas.push_back(delta);
  }
  for (const auto& [id, net] : expense_net) {
    AllocationDelta delta;
    delta.record_id = id;
    delta.delta = net;
    delta.operation_id = deltaOperation(proposal.operation_id, "expense", id);
    delta.expected_version = expenses.at(id).version;
    if (member_expenses.count(id)) {
      delta.link_group = group.id;
    } else {
      delta.unlink_group = group.id;
      if (previous) delta.restore_group = priorGroup(previous->prior_expense_groups, id);
    }
    transaction.expense_deltas.push_back(delta);
  }

  return group;
}

void AllocationEngine::checkNotBlocked(const std::optional<std::string>& split_group_id,
                                       const std::string& group_id,
                                       const std::string& record) const {
  if (!split_group_id || *split_group_id == group_id) return;

  auto other = store_.findSplitGroup(*split_group_id);
  if (other && other->blocksMembers()) {
    throw LedgerError(ErrorCode::ALREADY_ALLOCATED,
                      "The " + record + " already belongs to open split group " + other->id);
  }
}

SplitOutcome AllocationEngine::replayOutcome(const std::string& group_id) const {
  LOG_BUILDER(LogLevel::DEBUG, "Replayed split operation").field("group_id", group_id);
  return outcomeOf(GetSplit(group_id), true);
}

}  // namespace allocation
}  // namespace recon
