#include "memory_ledger_store.hpp"

#include "ledger_commit.hpp"
#include "ledger_errors.hpp"
#include "ledger_invariants.hpp"

#include <algorithm>
#include <mutex>

namespace recon {

namespace {

template <typename Record>
std::optional<Record> findIn(const std::unordered_map<std::string, Record>& records,
                             const std::string& id) {
  auto it = records.find(id);
  if (it == records.end()) return std::nullopt;
  return it->second;
}

// Sorted by id so listings are stable across runs.
template <typename Record>
std::vector<Record> listOf(const std::unordered_map<std::string, Record>& records) {
  std::vector<Record> result;
  result.reserve(records.size());
  for (const auto& [id, record] : records) {
    result.push_back(record);
  }
  std::sort(result.begin(), result.end(),
            [](const Record& a, const Record& b) { return a.id < b.id; });
  return result;
}

}  // namespace

class InMemoryLedgerStore::Source : public CommitSource {
 public:
  explicit Source(const InMemoryLedgerStore& store) : store_(store) {}

  std::optional<BankMovement> loadMovement(const std::string& id) override {
    return findIn(store_.movements_, id);
  }
  std::optional<ExpenseRecord> loadExpense(const std::string& id) override {
    return findIn(store_.expenses_, id);
  }
  std::optional<SplitGroup> loadSplitGroup(const std::string& id) override {
    return findIn(store_.split_groups_, id);
  }
  std::optional<EmployeeAdvance> loadAdvance(const std::string& id) override {
    return findIn(store_.advances_, id);
  }
  std::optional<NonReconciliationCase> loadCase(const std::string& id) override {
    return findIn(store_.cases_, id);
  }
  bool recordOperationApplied(const std::string& key) override {
    return store_.record_operations_.count(key) > 0;
  }

 private:
  const InMemoryLedgerStore& store_;
};

void InMemoryLedgerStore::insertMovement(const BankMovement& movement) {
  if (movement.id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Movement id must not be empty");
  }

  BankMovement record = movement;
  record.allocated = 0;
  record.mode = ReconciliationMode::SIMPLE;
  record.split_group_id.reset();
  record.version = 1;

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!movements_.emplace(record.id, record).second) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Movement already exists: " + record.id);
  }
}

void InMemoryLedgerStore::insertExpense(const ExpenseRecord& expense) {
  if (expense.id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense id must not be empty");
  }
  if (expense.amount <= 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense amount must be positive");
  }

  ExpenseRecord record = expense;
  record.reconciled = 0;
  record.is_employee_advance = false;
  record.advance_id.reset();
  record.reimbursement_status = ReimbursementStatus::NOT_REQUIRED;
  record.split_group_id.reset();
  record.version = 1;
  invariants::refreshExpenseStatus(record);

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!expenses_.emplace(record.id, record).second) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense already exists: " + record.id);
  }
}

BankMovement InMemoryLedgerStore::cancelMovement(const std::string& movement_id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto it = movements_.find(movement_id);
  if (it == movements_.end()) {
    throw LedgerError(ErrorCode::NOT_FOUND, "Movement not found: " + movement_id);
  }
  BankMovement& movement = it->second;
  if (movement.allocated > 0) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Movement " + movement_id + " has allocations and cannot be cancelled");
  }
  if (movement.status != MovementStatus::CANCELLED) {
    movement.status = MovementStatus::CANCELLED;
    movement.version += 1;
  }
  return movement;
}

std::optional<BankMovement> InMemoryLedgerStore::findMovement(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(movements_, id);
}

std::optional<ExpenseRecord> InMemoryLedgerStore::findExpense(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(expenses_, id);
}

std::optional<SplitGroup> InMemoryLedgerStore::findSplitGroup(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(split_groups_, id);
}

std::optional<EmployeeAdvance> InMemoryLedgerStore::findAdvance(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(advances_, id);
}

std::optional<NonReconciliationCase> InMemoryLedgerStore::findCase(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return findIn(cases_, id);
}

std::vector<BankMovement> InMemoryLedgerStore::listMovements() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listOf(movements_);
}

std::vector<ExpenseRecord> InMemoryLedgerStore::listExpenses() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listOf(expenses_);
}

std::vector<SplitGroup> InMemoryLedgerStore::listSplitGroups() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listOf(split_groups_);
}

std::vector<EmployeeAdvance> InMemoryLedgerStore::listAdvances() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listOf(advances_);
}

std::vector<NonReconciliationCase> InMemoryLedgerStore::listCases() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return listOf(cases_);
}

std::vector<CaseHistoryEntry> InMemoryLedgerStore::caseHistory(const std::string& case_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = history_.find(case_id);
  if (it == history_.end()) return {};
  return it->second;
}

bool InMemoryLedgerStore::hasOperation(const std::string& operation_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return operations_.count(operation_id) > 0;
}

bool InMemoryLedgerStore::commit(const LedgerTransaction& transaction) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (!transaction.operation_id.empty() && operations_.count(transaction.operation_id)) {
    return false;
  }

  Source source(*this);
  StagedCommit staged = stageCommit(transaction, source);

  // Publish staged state.
  for (auto& [id, movement] : staged.movements) {
    movements_[id] = std::move(movement);
  }
  for (auto& [id, expense] : staged.expenses) {
    expenses_[id] = std::move(expense);
  }
  for (auto& [id, group] : staged.split_groups) {
    split_groups_[id] = std::move(group);
  }
  for (auto& [id, advance] : staged.advances) {
    advances_[id] = std::move(advance);
  }
  for (auto& [id, nr_case] : staged.cases) {
    cases_[id] = std::move(nr_case);
  }
  for (auto& entry : staged.history) {
    entry.sequence = next_history_sequence_++;
    history_[entry.case_id].push_back(entry);
  }
  for (const auto& key : staged.record_operation_keys) {
    record_operations_.insert(key);
  }
  if (!transaction.operation_id.empty()) {
    operations_.insert(transaction.operation_id);
  }
  return true;
}

}  // namespace recon
