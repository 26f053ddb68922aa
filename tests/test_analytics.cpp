#include "advances/advance_ledger.hpp"
#include "allocation/allocation_engine.hpp"
#include "analytics/analytics_aggregator.hpp"
#include "escalation/escalation_engine.hpp"
#include "ledger_test_support.hpp"
#include "memory_ledger_store.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

using namespace recon;
using recon::test::daysAfterStart;
using recon::test::debit;
using recon::test::expense;
using recon::test::kStart;

// Test fixture with a small populated ledger
class AnalyticsAggregatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    allocation_ = std::make_unique<allocation::AllocationEngine>(store_);
    advances_ = std::make_unique<advances::AdvanceLedger>(store_, *allocation_);
    escalation_ = std::make_unique<escalation::EscalationEngine>(store_, *allocation_,
                                                                 *advances_, nullptr);
    aggregator_ = std::make_unique<analytics::AnalyticsAggregator>(store_);
  }

  void populate() {
    store_.insertMovement(debit("mov-card", 1000));
    store_.insertMovement(debit("mov-wire", 300));
    store_.insertExpense(expense("exp-a", 400));
    store_.insertExpense(expense("exp-b", 300));
    store_.insertExpense(expense("exp-c", 200));
    store_.insertExpense(expense("exp-trip", 5000));
    store_.insertExpense(expense("exp-lunch", 800));

    // Open and incomplete: 400 of 1000
    allocation::SplitProposal card;
    card.operation_id = "op-split-1";
    card.group_id = "grp-card";
    card.type = SplitType::ONE_TO_MANY;
    card.members.push_back({"exp-a", "mov-card", 400, std::nullopt, ""});
    allocation_->ProposeSplit(card, kStart);

    // Complete: exp-b fully covered by the wire
    allocation::SplitProposal wire;
    wire.operation_id = "op-split-2";
    wire.group_id = "grp-wire";
    wire.type = SplitType::MANY_TO_ONE;
    wire.members.push_back({"exp-b", "mov-wire", 300, std::nullopt, ""});
    allocation_->ProposeSplit(wire, kStart);

    advances::NewAdvance trip;
    trip.operation_id = "op-adv-1";
    trip.expense_id = "exp-trip";
    trip.employee_id = "emp-1";
    trip.amount = 5000;
    trip.advance_date = daysAfterStart(0);
    auto created = advances_->CreateAdvance(trip);

    advances::ReimbursementRequest partial;
    partial.operation_id = "op-adv-2";
    partial.advance_id = created.advance.id;
    partial.amount = 2000;
    advances_->RecordReimbursement(partial);

    advances::NewAdvance lunch;
    lunch.operation_id = "op-adv-3";
    lunch.expense_id = "exp-lunch";
    lunch.employee_id = "emp-2";
    lunch.amount = 800;
    lunch.advance_date = daysAfterStart(25);
    advances_->CreateAdvance(lunch);

    escalation::OpenCaseRequest receipt;
    receipt.operation_id = "op-case-1";
    receipt.subject_id = "exp-c";
    receipt.reason = ReasonCode::MISSING_RECEIPT;
    receipt.impact = BusinessImpact::HIGH;
    auto open = escalation_->OpenCase(receipt, kStart);
    escalation_->EscalateManually(open.nr_case.id, "alice", "", daysAfterStart(1));

    escalation::OpenCaseRequest duplicate;
    duplicate.operation_id = "op-case-2";
    duplicate.subject_id = "exp-a";
    duplicate.reason = ReasonCode::DUPLICATE_SUSPECTED;
    auto dup = escalation_->OpenCase(duplicate, kStart);
    escalation_->Resolve(dup.nr_case.id, "alice", "not a duplicate", kStart + 2 * 3600);
  }

  InMemoryLedgerStore store_;
  std::unique_ptr<allocation::AllocationEngine> allocation_;
  std::unique_ptr<advances::AdvanceLedger> advances_;
  std::unique_ptr<escalation::EscalationEngine> escalation_;
  std::unique_ptr<analytics::AnalyticsAggregator> aggregator_;
};

TEST_F(AnalyticsAggregatorTest, EmptyLedger) {
  EXPECT_FALSE(aggregator_->Latest().has_value());

  auto snapshot = aggregator_->Rollup(kStart);
  EXPECT_EQ(snapshot.cases.total, 0u);
  EXPECT_DOUBLE_EQ(snapshot.cases.escalation_rate, 0.0);
  EXPECT_DOUBLE_EQ(snapshot.splits.completeness_rate, 0.0);
  EXPECT_EQ(snapshot.ledger.movements, 0u);
  ASSERT_TRUE(aggregator_->Latest().has_value());
  EXPECT_EQ(aggregator_->Latest()->generated_at, kStart);
}

TEST_F(AnalyticsAggregatorTest, CaseBreakdown) {
  populate();
  auto cases = aggregator_->Rollup(daysAfterStart(30)).cases;

  EXPECT_EQ(cases.total, 2u);
  EXPECT_EQ(cases.open, 1u);
  EXPECT_EQ(cases.resolved, 1u);
  EXPECT_EQ(cases.by_status["escalated"], 1u);
  EXPECT_EQ(cases.by_status["resolved"], 1u);
  EXPECT_EQ(cases.by_category["missing_data"], 1u);
  EXPECT_EQ(cases.by_reason["DUPLICATE_SUSPECTED"], 1u);
  EXPECT_EQ(cases.by_impact["high"], 1u);
  EXPECT_EQ(cases.by_level[2], 1u);
  EXPECT_DOUBLE_EQ(cases.escalation_rate, 0.5);
  EXPECT_DOUBLE_EQ(cases.average_resolution_hours, 2.0);

  // MISSING_RECEIPT typically resolves in 21 days; at day 30 it is overdue
  EXPECT_EQ(cases.overdue, 1u);
}

TEST_F(AnalyticsAggregatorTest, SplitAndLedgerTotals) {
  populate();
  auto snapshot = aggregator_->Rollup(daysAfterStart(30));

  EXPECT_EQ(snapshot.splits.total, 2u);
  EXPECT_EQ(snapshot.splits.by_type["one_to_many"], 1u);
  EXPECT_DOUBLE_EQ(snapshot.splits.completeness_rate, 0.5);
  EXPECT_EQ(snapshot.splits.allocated_total, 700);
  EXPECT_EQ(snapshot.splits.target_total, 1300);

  EXPECT_EQ(snapshot.ledger.movements, 2u);
  EXPECT_EQ(snapshot.ledger.expenses, 5u);
  EXPECT_EQ(snapshot.ledger.reconciled_expenses, 2u);
  EXPECT_EQ(snapshot.ledger.non_reconcilable_expenses, 2u);
  EXPECT_EQ(snapshot.ledger.unallocated_total, 600);
  EXPECT_EQ(snapshot.ledger.pending_total, 200);
}

TEST_F(AnalyticsAggregatorTest, AdvanceAging) {
  populate();
  auto advances = aggregator_->Rollup(daysAfterStart(30)).advances;

  EXPECT_EQ(advances.total, 2u);
  EXPECT_EQ(advances.by_status["partial"], 1u);
  EXPECT_EQ(advances.by_status["pending"], 1u);
  EXPECT_EQ(advances.amount_by_status["partial"], 5000);
  EXPECT_EQ(advances.total_pending, 3800);
  EXPECT_EQ(advances.aging["over_30_days"], 0u);
  EXPECT_EQ(advances.aging["16_30_days"], 1u);
  EXPECT_EQ(advances.aging["0_7_days"], 1u);
}

TEST_F(AnalyticsAggregatorTest, SnapshotJsonAndGauges) {
  populate();
  auto snapshot = aggregator_->Rollup(daysAfterStart(30));
  nlohmann::json document = analytics::toJson(snapshot);

  EXPECT_EQ(document["generated_at"], daysAfterStart(30));
  EXPECT_EQ(document["cases"]["by_level"]["2"], 1);
  EXPECT_EQ(document["splits"]["allocated_total"], 700);
  EXPECT_EQ(document["advances"]["total_pending"], 3800);
  EXPECT_EQ(document["ledger"]["pending_total"], 200);

  auto& metrics = observability::getGlobalMetrics();
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("recon_cases_open"), 1.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("recon_advances_pending_amount"), 3800.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("recon_ledger_unallocated_amount"), 600.0);
}
