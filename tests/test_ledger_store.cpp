#include "ledger_invariants.hpp"
#include "ledger_test_support.hpp"
#include "memory_ledger_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace recon;
using recon::test::debit;
using recon::test::expense;

// Test fixture for the in-memory ledger store
class LedgerStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.insertMovement(debit("mov-1", 1000));
    store_.insertExpense(expense("exp-1", 400));
  }

  InMemoryLedgerStore store_;
};

TEST_F(LedgerStoreTest, InsertResetsDerivedFields) {
  BankMovement movement = debit("mov-2", 500);
  movement.allocated = 300;
  movement.mode = ReconciliationMode::PARTIAL;
  movement.split_group_id = "grp-x";
  store_.insertMovement(movement);

  BankMovement stored = store_.getMovement("mov-2");
  EXPECT_EQ(stored.allocated, 0);
  EXPECT_EQ(stored.mode, ReconciliationMode::SIMPLE);
  EXPECT_FALSE(stored.split_group_id.has_value());
  EXPECT_EQ(stored.version, 1u);

  ExpenseRecord record = expense("exp-2", 250);
  record.reconciled = 250;
  record.is_employee_advance = true;
  store_.insertExpense(record);

  ExpenseRecord stored_expense = store_.getExpense("exp-2");
  EXPECT_EQ(stored_expense.reconciled, 0);
  EXPECT_FALSE(stored_expense.is_employee_advance);
  EXPECT_EQ(stored_expense.bank_status, BankStatus::PENDING);
}

TEST_F(LedgerStoreTest, DuplicateIdsAreRejected) {
  EXPECT_LEDGER_ERROR(store_.insertMovement(debit("mov-1", 10)), ErrorCode::INVALID_ARGUMENT);
  EXPECT_LEDGER_ERROR(store_.insertExpense(expense("exp-1", 10)), ErrorCode::INVALID_ARGUMENT);
  EXPECT_LEDGER_ERROR(store_.insertExpense(expense("exp-zero", 0)), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(LedgerStoreTest, MissingRecordsAreNotFound) {
  EXPECT_FALSE(store_.findMovement("nope").has_value());
  EXPECT_LEDGER_ERROR(store_.getMovement("nope"), ErrorCode::NOT_FOUND);
  EXPECT_LEDGER_ERROR(store_.getExpense("nope"), ErrorCode::NOT_FOUND);
  EXPECT_LEDGER_ERROR(store_.updateMovementAllocation("nope", 10, "op-1"), ErrorCode::NOT_FOUND);
}

TEST_F(LedgerStoreTest, MovementAllocationDerivesMode) {
  BankMovement movement = store_.updateMovementAllocation("mov-1", 300, "op-1");
  EXPECT_EQ(movement.allocated, 300);
  EXPECT_EQ(movement.unallocated(), 700);
  EXPECT_EQ(movement.mode, ReconciliationMode::PARTIAL);
  EXPECT_EQ(movement.version, 2u);

  movement = store_.updateMovementAllocation("mov-1", 700, "op-2");
  EXPECT_EQ(movement.unallocated(), 0);
  EXPECT_EQ(movement.mode, ReconciliationMode::SPLIT);

  movement = store_.updateMovementAllocation("mov-1", -1000, "op-3");
  EXPECT_EQ(movement.allocated, 0);
  EXPECT_EQ(movement.mode, ReconciliationMode::SIMPLE);
}

TEST_F(LedgerStoreTest, AllocationOutOfRangeIsRejected) {
  EXPECT_LEDGER_ERROR(store_.updateMovementAllocation("mov-1", 1001, "op-1"),
                      ErrorCode::INVALID_STATE);
  EXPECT_LEDGER_ERROR(store_.updateMovementAllocation("mov-1", -1, "op-2"),
                      ErrorCode::INVALID_STATE);
  EXPECT_LEDGER_ERROR(store_.updateExpenseReconciliation("exp-1", 401, "op-3"),
                      ErrorCode::INVALID_STATE);

  // Nothing was applied by the failed commits.
  EXPECT_EQ(store_.getMovement("mov-1").allocated, 0);
  EXPECT_EQ(store_.getMovement("mov-1").version, 1u);
  EXPECT_EQ(store_.getExpense("exp-1").reconciled, 0);
}

TEST_F(LedgerStoreTest, OperationIdMakesDeltaIdempotent) {
  store_.updateMovementAllocation("mov-1", 250, "op-1");
  BankMovement movement = store_.updateMovementAllocation("mov-1", 250, "op-1");

  EXPECT_EQ(movement.allocated, 250);
  EXPECT_EQ(movement.version, 2u);
  EXPECT_LEDGER_ERROR(store_.updateMovementAllocation("mov-1", 250, ""),
                      ErrorCode::INVALID_ARGUMENT);
}

TEST_F(LedgerStoreTest, ExpenseReconciliationDerivesStatus) {
  ExpenseRecord record = store_.updateExpenseReconciliation("exp-1", 100, "op-1");
  EXPECT_EQ(record.pending(), 300);
  EXPECT_EQ(record.mode, ReconciliationMode::PARTIAL);
  EXPECT_EQ(record.bank_status, BankStatus::PENDING);

  record = store_.updateExpenseReconciliation("exp-1", 300, "op-2");
  EXPECT_EQ(record.pending(), 0);
  EXPECT_EQ(record.mode, ReconciliationMode::SPLIT);
  EXPECT_EQ(record.bank_status, BankStatus::RECONCILED);
}

TEST_F(LedgerStoreTest, CreditMovementsCannotBeAllocated) {
  BankMovement credit = debit("mov-credit", 500);
  credit.amount = 500;
  store_.insertMovement(credit);

  EXPECT_LEDGER_ERROR(store_.updateMovementAllocation("mov-credit", 100, "op-1"),
                      ErrorCode::INVALID_STATE);
}

TEST_F(LedgerStoreTest, CancelMovement) {
  BankMovement cancelled = store_.cancelMovement("mov-1");
  EXPECT_EQ(cancelled.status, MovementStatus::CANCELLED);
  EXPECT_EQ(cancelled.version, 2u);

  // Cancelling again is a no-op
  cancelled = store_.cancelMovement("mov-1");
  EXPECT_EQ(cancelled.version, 2u);

  EXPECT_LEDGER_ERROR(store_.updateMovementAllocation("mov-1", 100, "op-1"),
                      ErrorCode::INVALID_STATE);
  EXPECT_LEDGER_ERROR(store_.cancelMovement("nope"), ErrorCode::NOT_FOUND);
}

TEST_F(LedgerStoreTest, AllocatedMovementCannotBeCancelled) {
  store_.updateMovementAllocation("mov-1", 100, "op-1");
  EXPECT_LEDGER_ERROR(store_.cancelMovement("mov-1"), ErrorCode::INVALID_STATE);
  EXPECT_EQ(store_.getMovement("mov-1").status, MovementStatus::ACTIVE);
}

TEST_F(LedgerStoreTest, CommitChecksExpectedVersions) {
  LedgerTransaction transaction;
  transaction.operation_id = "op-versioned";
  AllocationDelta delta;
  delta.record_id = "mov-1";
  delta.delta = 100;
  delta.expected_version = 7;
  transaction.movement_deltas.push_back(delta);

  EXPECT_LEDGER_ERROR(store_.commit(transaction), ErrorCode::CONCURRENCY_CONFLICT);
  EXPECT_FALSE(store_.hasOperation("op-versioned"));

  transaction.movement_deltas[0].expected_version = 1;
  EXPECT_TRUE(store_.commit(transaction));
  EXPECT_TRUE(store_.hasOperation("op-versioned"));

  // Replaying a committed operation changes nothing
  EXPECT_FALSE(store_.commit(transaction));
  EXPECT_EQ(store_.getMovement("mov-1").allocated, 100);
}

TEST_F(LedgerStoreTest, CommitIsAllOrNothing) {
  LedgerTransaction transaction;
  transaction.operation_id = "op-mixed";

  AllocationDelta movement_delta;
  movement_delta.record_id = "mov-1";
  movement_delta.delta = 400;
  transaction.movement_deltas.push_back(movement_delta);

  AllocationDelta expense_delta;
  expense_delta.record_id = "exp-1";
  expense_delta.delta = 500;  // more than the expense amount
  transaction.expense_deltas.push_back(expense_delta);

  EXPECT_LEDGER_ERROR(store_.commit(transaction), ErrorCode::INVALID_STATE);
  EXPECT_EQ(store_.getMovement("mov-1").allocated, 0);
  EXPECT_EQ(store_.getExpense("exp-1").reconciled, 0);
  EXPECT_FALSE(store_.hasOperation("op-mixed"));
}

TEST_F(LedgerStoreTest, VersionedInsertAndUpdate) {
  SplitGroup group;
  group.id = "grp-1";
  group.anchor_id = "mov-1";
  group.target_amount = 1000;

  LedgerTransaction insert;
  insert.split_groups.push_back({group, 0});
  ASSERT_TRUE(store_.commit(insert));

  auto stored = store_.findSplitGroup("grp-1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->version, 1u);
  EXPECT_FALSE(stored->is_complete);

  // A second insert of the same id is a conflict
  EXPECT_LEDGER_ERROR(store_.commit(insert), ErrorCode::CONCURRENCY_CONFLICT);

  LedgerTransaction stale;
  stale.split_groups.push_back({*stored, 5});
  EXPECT_LEDGER_ERROR(store_.commit(stale), ErrorCode::CONCURRENCY_CONFLICT);
}

TEST_F(LedgerStoreTest, HistoryIsAppendOnlyAndOrdered) {
  NonReconciliationCase nr_case;
  nr_case.id = "case-1";
  nr_case.subject_id = "exp-1";

  CaseHistoryEntry created;
  created.case_id = "case-1";
  created.action = HistoryAction::CREATED;
  created.new_level = 1;

  LedgerTransaction open;
  open.cases.push_back({nr_case, 0});
  open.history.push_back(created);
  ASSERT_TRUE(store_.commit(open));

  CaseHistoryEntry comment;
  comment.case_id = "case-1";
  comment.action = HistoryAction::COMMENTED;
  comment.notes = "called vendor";

  LedgerTransaction note;
  note.history.push_back(comment);
  ASSERT_TRUE(store_.commit(note));

  auto history = store_.caseHistory("case-1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].action, HistoryAction::CREATED);
  EXPECT_EQ(history[1].action, HistoryAction::COMMENTED);
  EXPECT_LT(history[0].sequence, history[1].sequence);
  EXPECT_TRUE(store_.caseHistory("case-unknown").empty());
}

TEST_F(LedgerStoreTest, CaseLevelOutOfRangeIsRejected) {
  NonReconciliationCase nr_case;
  nr_case.id = "case-bad";
  nr_case.escalation_level = 6;

  LedgerTransaction transaction;
  transaction.cases.push_back({nr_case, 0});
  EXPECT_LEDGER_ERROR(store_.commit(transaction), ErrorCode::INVALID_STATE);
  EXPECT_FALSE(store_.findCase("case-bad").has_value());
}

TEST_F(LedgerStoreTest, ConcurrentAllocationsNeverOverdraw) {
  const int num_threads = 8;
  const int allocations_per_thread = 50;
  std::atomic<int> applied{0};
  std::atomic<int> rejected{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t, &applied, &rejected, allocations_per_thread]() {
      for (int i = 0; i < allocations_per_thread; ++i) {
        try {
          store_.updateMovementAllocation(
              "mov-1", 5, "op-" + std::to_string(t) + "-" + std::to_string(i));
          applied.fetch_add(1);
        } catch (const LedgerError& e) {
          EXPECT_EQ(e.code(), ErrorCode::INVALID_STATE);
          rejected.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  // 400 attempts of 5 against 1000 available: exactly 200 fit.
  EXPECT_EQ(applied.load(), 200);
  EXPECT_EQ(rejected.load(), 200);
  BankMovement movement = store_.getMovement("mov-1");
  EXPECT_EQ(movement.allocated, 1000);
  EXPECT_EQ(movement.mode, ReconciliationMode::SPLIT);
}

// Invariant helpers
TEST(LedgerInvariantsTest, DeriveMode) {
  EXPECT_EQ(invariants::deriveMode(0, 500), ReconciliationMode::SIMPLE);
  EXPECT_EQ(invariants::deriveMode(200, 500), ReconciliationMode::PARTIAL);
  EXPECT_EQ(invariants::deriveMode(500, 500), ReconciliationMode::SPLIT);
}

TEST(LedgerInvariantsTest, AdvanceStatusFollowsAmounts) {
  EXPECT_EQ(invariants::deriveAdvanceStatus(1000, 0), AdvanceStatus::PENDING);
  EXPECT_EQ(invariants::deriveAdvanceStatus(1000, 400), AdvanceStatus::PARTIAL);
  EXPECT_EQ(invariants::deriveAdvanceStatus(1000, 1000), AdvanceStatus::COMPLETED);
  EXPECT_EQ(invariants::mirrorReimbursementStatus(AdvanceStatus::CANCELLED),
            ReimbursementStatus::NOT_REQUIRED);
}

TEST(LedgerInvariantsTest, SplitCompletenessAndBasisPoints) {
  SplitGroup group;
  group.id = "grp";
  group.target_amount = 500;
  SplitRow row;
  row.allocated_amount = 300;
  group.rows.push_back(row);

  invariants::refreshSplitCompleteness(group);
  EXPECT_FALSE(group.is_complete);

  row.allocated_amount = 200;
  group.rows.push_back(row);
  invariants::refreshSplitCompleteness(group);
  EXPECT_TRUE(group.is_complete);
  EXPECT_TRUE(group.rows[0].is_complete);

  group.rows.push_back(row);
  EXPECT_LEDGER_ERROR(invariants::refreshSplitCompleteness(group),
                      ErrorCode::ALLOCATION_OVERFLOW);

  EXPECT_EQ(invariants::basisPoints(300, 500), 6000);
  EXPECT_EQ(invariants::basisPoints(1, 3), 3333);
  EXPECT_EQ(invariants::basisPoints(1, 0), 0);
}

TEST(LedgerTypesTest, WireNamesRoundTrip) {
  EXPECT_EQ(toString(SplitType::ONE_TO_MANY), "one_to_many");
  EXPECT_EQ(toString(CaseStatus::REQUIRES_APPROVAL), "requires_approval");
  EXPECT_EQ(toString(ReasonCode::MISSING_RECEIPT), "MISSING_RECEIPT");
  EXPECT_EQ(parseSplitType("many_to_one"), SplitType::MANY_TO_ONE);
  EXPECT_EQ(parseReasonCode("BANK_RECONCILIATION"), ReasonCode::BANK_RECONCILIATION);
  EXPECT_FALSE(parseCaseStatus("closed").has_value());
}
