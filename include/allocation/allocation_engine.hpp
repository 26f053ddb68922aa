#ifndef ALLOCATION_ENGINE_HPP_
#define ALLOCATION_ENGINE_HPP_

#include "ledger_store.hpp"
#include "ledger_types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace recon {
namespace allocation {

/**
 * One proposed (expense, movement, amount) pairing.
 */
struct SplitMember {
  std::string expense_id;
  std::string movement_id;
  Amount amount = 0;
  std::optional<int> percentage_bp;  // derived from the target when absent
  std::string notes;
};

struct SplitProposal {
  std::string operation_id;
  std::string group_id;
  SplitType type = SplitType::ONE_TO_MANY;
  std::vector<SplitMember> members;
  std::string actor;
};

struct SplitOutcome {
  std::string group_id;
  SplitGroupStatus status = SplitGroupStatus::OPEN;
  bool is_complete = false;
  Amount target_amount = 0;
  Amount allocated_total = 0;
  Amount remaining = 0;
  bool replayed = false;  // operation id had already been committed
};

enum class SplitDecision {
  FINALIZE,
  REJECT
};

struct SplitSummary {
  size_t total_groups = 0;
  size_t open = 0;
  size_t complete = 0;
  size_t incomplete = 0;
  size_t finalized = 0;
  size_t rejected = 0;
  std::map<std::string, size_t> by_type;
  Amount allocated_total = 0;
  Amount target_total = 0;
};

struct AllocationConfig {
  int max_retries = 3;
};

/**
 * Creates, validates and completes split groups linking expenses and
 * movements. Every mutating call commits one LedgerTransaction, so either
 * all member totals and the group change together or nothing changes.
 * CONCURRENCY_CONFLICT is retried internally with fresh reads.
 */
class AllocationEngine {
 public:
  explicit AllocationEngine(LedgerStore& store, AllocationConfig config = AllocationConfig());

  // Non-copyable
  AllocationEngine(const AllocationEngine&) = delete;
  AllocationEngine& operator=(const AllocationEngine&) = delete;

  /**
   * Creates a split group. The "one" side is the shared movement for
   * ONE_TO_MANY and the shared expense for MANY_TO_ONE; its remaining open
   * amount becomes the group target.
   */
  SplitOutcome ProposeSplit(const SplitProposal& proposal, Timestamp now);

  /**
   * Replaces the members of an open, incomplete group. The old rows are
   * released and the new list is validated from scratch in one commit.
   */
  SplitOutcome ReviseSplit(const SplitProposal& proposal, Timestamp now);

  /**
   * FINALIZE seals an open group; REJECT releases every member allocation
   * of a group that is not finalized.
   */
  SplitOutcome FinalizeOrReject(const std::string& operation_id, const std::string& group_id,
                                SplitDecision decision, const std::string& actor, Timestamp now);

  /**
   * Appends an audit note. Allowed in every group status.
   * A repeated operation id leaves the notes unchanged.
   */
  SplitGroup AnnotateSplit(const std::string& operation_id, const std::string& group_id,
                           const std::string& actor, const std::string& note, Timestamp now);

  SplitGroup GetSplit(const std::string& group_id) const;
  std::vector<SplitGroup> ListSplits(std::optional<SplitGroupStatus> status = std::nullopt) const;
  SplitSummary Summary() const;

  /**
   * Adds a movement allocation outside any split group to `transaction`,
   * used when a bank movement reimburses an employee advance.
   */
  void StageMovementAllocation(LedgerTransaction& transaction, const std::string& movement_id,
                               Amount amount, const std::string& operation_id) const;

 private:
  SplitGroup stageSplit(LedgerTransaction& transaction, const SplitProposal& proposal,
                        const SplitGroup* previous, Timestamp now) const;
  void checkNotBlocked(const std::optional<std::string>& split_group_id,
                       const std::string& group_id, const std::string& record) const;
  SplitOutcome replayOutcome(const std::string& group_id) const;

  LedgerStore& store_;
  AllocationConfig config_;
};

SplitOutcome outcomeOf(const SplitGroup& group, bool replayed = false);

}  // namespace allocation
}  // namespace recon

#endif  // ALLOCATION_ENGINE_HPP_
