#include "ledger_commit.hpp"

#include "ledger_errors.hpp"
#include "ledger_invariants.hpp"

namespace recon {

namespace {

LedgerError versionConflict(const std::string& kind, const std::string& id,
                            uint64_t expected, uint64_t actual) {
  return LedgerError(ErrorCode::CONCURRENCY_CONFLICT,
                     kind + " " + id + " changed concurrently (expected version " +
                     std::to_string(expected) + ", found " + std::to_string(actual) + ")");
}

void applyLink(std::optional<std::string>& split_group_id, const AllocationDelta& delta) {
  if (delta.unlink_group && split_group_id == delta.unlink_group) {
    split_group_id = delta.restore_group;
  }
  if (delta.link_group) {
    split_group_id = delta.link_group;
  }
}

class Stager {
 public:
  Stager(CommitSource& source, StagedCommit& staged) : source_(source), staged_(staged) {}

  BankMovement& movement(const std::string& id, std::optional<uint64_t> expected) {
    auto it = staged_.movements.find(id);
    if (it == staged_.movements.end()) {
      auto loaded = source_.loadMovement(id);
      if (!loaded) {
        throw LedgerError(ErrorCode::NOT_FOUND, "Movement not found: " + id);
      }
      original_versions_["movement:" + id] = loaded->version;
      it = staged_.movements.emplace(id, *loaded).first;
    }
    checkVersion("Movement", id, "movement:" + id, expected);
    return it->second;
  }

  ExpenseRecord& expense(const std::string& id, std::optional<uint64_t> expected) {
    auto it = staged_.expenses.find(id);
    if (it == staged_.expenses.end()) {
      auto loaded = source_.loadExpense(id);
      if (!loaded) {
        throw LedgerError(ErrorCode::NOT_FOUND, "Expense not found: " + id);
      }
      original_versions_["expense:" + id] = loaded->version;
      it = staged_.expenses.emplace(id, *loaded).first;
    }
    checkVersion("Expense", id, "expense:" + id, expected);
    return it->second;
  }

  // False if this per-record delta was already applied, now or earlier.
  bool claimOperation(const std::string& kind, const AllocationDelta& delta) {
    if (delta.operation_id.empty()) return true;

    std::string key = recordOperationKey(kind, delta.record_id, delta.operation_id);
    if (claimed_.count(key) || source_.recordOperationApplied(key)) {
      return false;
    }
    claimed_.insert(key);
    staged_.record_operation_keys.push_back(key);
    return true;
  }

  void markDirty(const std::string& key) { dirty_.insert(key); }

  // Drops records whose deltas were all replays, bumps the rest once.
  void finish() {
    for (auto it = staged_.movements.begin(); it != staged_.movements.end();) {
      std::string key = "movement:" + it->first;
      if (!dirty_.count(key)) {
        it = staged_.movements.erase(it);
        continue;
      }
      it->second.version = original_versions_[key] + 1;
      ++it;
    }
    for (auto it = staged_.expenses.begin(); it != staged_.expenses.end();) {
      std::string key = "expense:" + it->first;
      if (!dirty_.count(key)) {
        it = staged_.expenses.erase(it);
        continue;
      }
      it->second.version = original_versions_[key] + 1;
      ++it;
    }
  }

 private:
  void checkVersion(const std::string& kind, const std::string& id,
                    const std::string& key, std::optional<uint64_t> expected) {
    if (!expected) return;
    uint64_t actual = original_versions_[key];
    if (*expected != actual) {
      throw versionConflict(kind, id, *expected, actual);
    }
  }

  CommitSource& source_;
  StagedCommit& staged_;
  std::map<std::string, uint64_t> original_versions_;
  std::set<std::string> claimed_;
  std::set<std::string> dirty_;
};

template <typename Record, typename Loader>
void stageVersioned(const std::vector<VersionedWrite<Record>>& writes, const std::string& kind,
                    Loader load, std::map<std::string, Record>& staged,
                    std::set<std::string>& inserted) {
  for (const auto& write : writes) {
    const std::string& id = write.record.id;
    if (id.empty()) {
      throw LedgerError(ErrorCode::INVALID_ARGUMENT, kind + " write without an id");
    }
    if (staged.count(id)) {
      throw LedgerError(ErrorCode::INVALID_ARGUMENT, kind + " " + id + " written twice in one commit");
    }

    auto current = load(id);
    if (write.expected_version == 0) {
      if (current) {
        throw LedgerError(ErrorCode::CONCURRENCY_CONFLICT, kind + " " + id + " already exists");
      }
      inserted.insert(id);
    } else if (!current) {
      throw LedgerError(ErrorCode::NOT_FOUND, kind + " not found: " + id);
    } else if (current->version != write.expected_version) {
      throw versionConflict(kind, id, write.expected_version, current->version);
    }

    Record record = write.record;
    record.version = write.expected_version + 1;
    staged.emplace(id, std::move(record));
  }
}

}  // namespace

std::string recordOperationKey(const std::string& kind, const std::string& record_id,
                               const std::string& operation_id) {
  return kind + ":" + record_id + ":" + operation_id;
}

StagedCommit stageCommit(const LedgerTransaction& transaction, CommitSource& source) {
  StagedCommit staged;
  Stager stager(source, staged);

  for (const auto& delta : transaction.movement_deltas) {
    BankMovement& movement = stager.movement(delta.record_id, delta.expected_version);
    if (!stager.claimOperation("movement", delta)) continue;
    invariants::applyMovementDelta(movement, delta.delta);
    applyLink(movement.split_group_id, delta);
    stager.markDirty("movement:" + delta.record_id);
  }

  for (const auto& delta : transaction.expense_deltas) {
    ExpenseRecord& expense = stager.expense(delta.record_id, delta.expected_version);
    if (!stager.claimOperation("expense", delta)) continue;
    invariants::applyExpenseDelta(expense, delta.delta);
    applyLink(expense.split_group_id, delta);
    stager.markDirty("expense:" + delta.record_id);
  }

  for (const auto& flags : transaction.expense_flags) {
    ExpenseRecord& expense = stager.expense(flags.expense_id, flags.expected_version);
    expense.is_employee_advance = flags.is_employee_advance;
    expense.advance_id = flags.advance_id;
    expense.reimbursement_status = flags.reimbursement_status;
    invariants::refreshExpenseStatus(expense);
    stager.markDirty("expense:" + flags.expense_id);
  }

  stageVersioned(transaction.split_groups, "Split group",
                 [&source](const std::string& id) { return source.loadSplitGroup(id); },
                 staged.split_groups, staged.inserted_split_groups);
  for (auto& [id, group] : staged.split_groups) {
    invariants::refreshSplitCompleteness(group);
  }

  stageVersioned(transaction.advances, "Advance",
                 [&source](const std::string& id) { return source.loadAdvance(id); },
                 staged.advances, staged.inserted_advances);
  for (auto& [id, advance] : staged.advances) {
    if (advance.reimbursed_amount < 0 || advance.reimbursed_amount > advance.advance_amount) {
      throw LedgerError(ErrorCode::INVALID_STATE,
                        "Advance " + id + " reimbursed amount out of range");
    }
    if (advance.status != AdvanceStatus::CANCELLED) {
      advance.status = invariants::deriveAdvanceStatus(advance.advance_amount,
                                                       advance.reimbursed_amount);
    }
  }

  stageVersioned(transaction.cases, "Case",
                 [&source](const std::string& id) { return source.loadCase(id); },
                 staged.cases, staged.inserted_cases);
  for (const auto& [id, nr_case] : staged.cases) {
    if (nr_case.escalation_level < 1 || nr_case.escalation_level > 5) {
      throw LedgerError(ErrorCode::INVALID_STATE,
                        "Case " + id + " escalation level out of range");
    }
  }

  staged.history = transaction.history;
  stager.finish();
  return staged;
}

}  // namespace recon
