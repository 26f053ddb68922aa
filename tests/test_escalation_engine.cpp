#include "advances/advance_ledger.hpp"
#include "allocation/allocation_engine.hpp"
#include "escalation/escalation_engine.hpp"
#include "ledger_test_support.hpp"
#include "memory_ledger_store.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>

using namespace recon;
using namespace recon::escalation;
using recon::test::daysAfterStart;
using recon::test::debit;
using recon::test::expense;
using recon::test::kStart;

namespace {

// Collects notifications instead of delivering them.
class RecordingSink : public notifications::NotificationSink {
 public:
  void enqueue(notifications::NotificationRequest request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(std::move(request));
  }

  std::vector<notifications::NotificationRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<notifications::NotificationRequest> requests_;
};

EscalationRule missingReceiptRule() {
  EscalationRule rule;
  rule.rule_code = "MISSING_RECEIPT_14D";
  rule.rule_name = "Missing receipts escalate after two weeks";
  rule.reason_codes = {ReasonCode::MISSING_RECEIPT};
  rule.escalation_after_days = 14;
  return rule;
}

notifications::NotificationRecipient role(const std::string& name) {
  notifications::NotificationRecipient recipient;
  recipient.type = notifications::RecipientType::ROLE;
  recipient.identifier = name;
  return recipient;
}

}  // namespace

// Test fixture for the non-reconciliation case workflow
class EscalationEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    allocation_ = std::make_unique<allocation::AllocationEngine>(store_);
    advances_ = std::make_unique<advances::AdvanceLedger>(store_, *allocation_);

    EscalationConfig config;
    config.rules.push_back(missingReceiptRule());
    config.recipients_by_level[1] = {role("case_owner")};
    config.recipients_by_level[2] = {role("accounting_team")};
    config.recipients_by_level[3] = {role("finance_supervisor")};
    engine_ = std::make_unique<EscalationEngine>(store_, *allocation_, *advances_, &sink_,
                                                 config);

    store_.insertExpense(expense("exp-taxi", 4200));
    store_.insertMovement(debit("mov-1", 4200));
  }

  OpenCaseRequest openRequest(const std::string& operation_id,
                              ReasonCode reason = ReasonCode::MISSING_RECEIPT,
                              const std::string& subject_id = "exp-taxi") {
    OpenCaseRequest request;
    request.operation_id = operation_id;
    request.subject_kind = SubjectKind::EXPENSE;
    request.subject_id = subject_id;
    request.company_id = "acme";
    request.reason = reason;
    request.impact = BusinessImpact::MEDIUM;
    request.priority = 2;
    request.actor = "alice";
    request.notes = "no receipt uploaded";
    return request;
  }

  InMemoryLedgerStore store_;
  RecordingSink sink_;
  std::unique_ptr<allocation::AllocationEngine> allocation_;
  std::unique_ptr<advances::AdvanceLedger> advances_;
  std::unique_ptr<EscalationEngine> engine_;
};

TEST_F(EscalationEngineTest, OpenCaseStartsAtLevelOne) {
  auto outcome = engine_->OpenCase(openRequest("op-1"), kStart);
  const NonReconciliationCase& nr_case = outcome.nr_case;

  EXPECT_FALSE(outcome.replayed);
  EXPECT_EQ(nr_case.id, "nrc-expense-exp-taxi-MISSING_RECEIPT-1");
  EXPECT_EQ(nr_case.status, CaseStatus::PENDING);
  EXPECT_EQ(nr_case.escalation_level, 1);
  EXPECT_EQ(nr_case.next_escalation_date, std::optional<Timestamp>(daysAfterStart(14)));
  EXPECT_EQ(nr_case.estimated_resolution_date,
            std::optional<Timestamp>(
                kStart + reasonInfo(ReasonCode::MISSING_RECEIPT).typical_resolution_days *
                             kSecondsPerDay));
  EXPECT_EQ(nr_case.business_impact, BusinessImpact::MEDIUM);
  EXPECT_EQ(nr_case.created_by, "alice");

  auto history = engine_->History(nr_case.id);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].action, HistoryAction::CREATED);
  EXPECT_EQ(history[0].new_level, 1);
  EXPECT_FALSE(history[0].previous_status.has_value());
}

TEST_F(EscalationEngineTest, OneOpenCasePerSubjectAndReason) {
  auto first = engine_->OpenCase(openRequest("op-1"), kStart);

  EXPECT_LEDGER_ERROR(engine_->OpenCase(openRequest("op-2"), kStart), ErrorCode::INVALID_STATE);

  // A different reason is a different case
  auto vendor = engine_->OpenCase(openRequest("op-3", ReasonCode::MISSING_VENDOR), kStart);
  EXPECT_EQ(vendor.nr_case.id, "nrc-expense-exp-taxi-MISSING_VENDOR-1");

  // Once closed, the subject can be reopened under a new ordinal
  engine_->Dismiss(first.nr_case.id, "alice", "false alarm", kStart + 60);
  auto reopened = engine_->OpenCase(openRequest("op-4"), kStart + 120);
  EXPECT_EQ(reopened.nr_case.id, "nrc-expense-exp-taxi-MISSING_RECEIPT-2");

  // Replaying the original operation reports the latest case
  auto replay = engine_->OpenCase(openRequest("op-4"), kStart + 180);
  EXPECT_TRUE(replay.replayed);
  EXPECT_EQ(replay.nr_case.id, reopened.nr_case.id);
}

TEST_F(EscalationEngineTest, InvalidCasesAreRejected) {
  OpenCaseRequest request = openRequest("op-1");
  request.priority = 0;
  EXPECT_LEDGER_ERROR(engine_->OpenCase(request, kStart), ErrorCode::INVALID_ARGUMENT);
  request.priority = 5;
  EXPECT_LEDGER_ERROR(engine_->OpenCase(request, kStart), ErrorCode::INVALID_ARGUMENT);

  EXPECT_LEDGER_ERROR(engine_->OpenCase(openRequest(""), kStart), ErrorCode::INVALID_ARGUMENT);
  EXPECT_LEDGER_ERROR(
      engine_->OpenCase(openRequest("op-2", ReasonCode::MISSING_RECEIPT, "exp-missing"), kStart),
      ErrorCode::NOT_FOUND);

  OpenCaseRequest movement_case = openRequest("op-3", ReasonCode::BANK_RECONCILIATION, "exp-taxi");
  movement_case.subject_kind = SubjectKind::MOVEMENT;
  EXPECT_LEDGER_ERROR(engine_->OpenCase(movement_case, kStart), ErrorCode::NOT_FOUND);

  EXPECT_TRUE(engine_->ListCases().empty());
  EXPECT_LEDGER_ERROR(engine_->GetCase("nrc-missing"), ErrorCode::NOT_FOUND);
}

// A missing receipt case under a 14 day rule
TEST_F(EscalationEngineTest, SweepEscalatesOnlyWhenDue) {
  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);
  const std::string case_id = opened.nr_case.id;

  SweepReport early = engine_->Sweep(daysAfterStart(13));
  EXPECT_EQ(early.evaluated, 0u);
  EXPECT_EQ(engine_->GetCase(case_id).status, CaseStatus::PENDING);
  EXPECT_EQ(engine_->GetCase(case_id).escalation_level, 1);

  SweepReport due = engine_->Sweep(daysAfterStart(15));
  EXPECT_EQ(due.evaluated, 1u);
  EXPECT_EQ(due.escalated, 1u);
  EXPECT_TRUE(due.failures.empty());

  NonReconciliationCase escalated = engine_->GetCase(case_id);
  EXPECT_EQ(escalated.status, CaseStatus::ESCALATED);
  EXPECT_EQ(escalated.escalation_level, 2);
  EXPECT_EQ(escalated.next_escalation_date, std::optional<Timestamp>(daysAfterStart(29)));

  auto history = engine_->History(case_id);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[1].action, HistoryAction::ESCALATED);
  EXPECT_EQ(history[1].previous_level, 1);
  EXPECT_EQ(history[1].new_level, 2);
  EXPECT_EQ(history[1].performed_by, "system");
  EXPECT_TRUE(history[1].system_generated);

  auto sent = sink_.requests();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].type, notifications::NotificationType::ESCALATION_OCCURRED);
  EXPECT_EQ(sent[0].recipient.identifier, "accounting_team");
  EXPECT_EQ(sent[0].template_id, "case_escalated");
  EXPECT_EQ(sent[0].payload["escalation_level"], 2);
  EXPECT_EQ(sent[0].payload["previous_level"], 1);

  // Running the same sweep again changes nothing
  SweepReport repeat = engine_->Sweep(daysAfterStart(15));
  EXPECT_EQ(repeat.evaluated, 0u);
  EXPECT_EQ(engine_->GetCase(case_id).escalation_level, 2);
}

TEST_F(EscalationEngineTest, DefaultScheduleWhenNoRuleMatches) {
  auto opened = engine_->OpenCase(openRequest("op-1", ReasonCode::VENDOR_NOT_FOUND), kStart);
  EXPECT_EQ(opened.nr_case.next_escalation_date,
            std::optional<Timestamp>(daysAfterStart(kDefaultEscalationAfterDays)));
}

TEST_F(EscalationEngineTest, LevelIsCappedAtFive) {
  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);
  const std::string case_id = opened.nr_case.id;

  for (int level = 2; level <= kMaxEscalationLevel; ++level) {
    NonReconciliationCase nr_case =
        engine_->EscalateManually(case_id, "supervisor", "", daysAfterStart(level));
    EXPECT_EQ(nr_case.escalation_level, level);
  }

  NonReconciliationCase top = engine_->GetCase(case_id);
  EXPECT_EQ(top.escalation_level, kMaxEscalationLevel);
  EXPECT_FALSE(top.next_escalation_date.has_value());

  EXPECT_LEDGER_ERROR(engine_->EscalateManually(case_id, "supervisor", "", daysAfterStart(6)),
                      ErrorCode::INVALID_STATE);
  EXPECT_EQ(engine_->Sweep(daysAfterStart(400)).evaluated, 0u);
}

TEST_F(EscalationEngineTest, SweepSupersedesSettledSubjects) {
  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);

  allocation::SplitProposal proposal;
  proposal.operation_id = "op-2";
  proposal.group_id = "grp-taxi";
  proposal.type = SplitType::MANY_TO_ONE;
  proposal.members.push_back({"exp-taxi", "mov-1", 4200, std::nullopt, ""});
  allocation_->ProposeSplit(proposal, daysAfterStart(3));

  SweepReport report = engine_->Sweep(daysAfterStart(15));
  EXPECT_EQ(report.superseded, 1u);
  EXPECT_EQ(report.escalated, 0u);

  NonReconciliationCase closed = engine_->GetCase(opened.nr_case.id);
  EXPECT_EQ(closed.status, CaseStatus::RESOLVED);
  EXPECT_EQ(closed.resolved_at, std::optional<Timestamp>(daysAfterStart(15)));
  EXPECT_FALSE(closed.next_escalation_date.has_value());
  EXPECT_EQ(engine_->History(closed.id).back().action, HistoryAction::SUPERSEDED);
}

TEST_F(EscalationEngineTest, SupersedeClosesEveryOpenCaseOfASubject) {
  engine_->OpenCase(openRequest("op-1"), kStart);
  engine_->OpenCase(openRequest("op-2", ReasonCode::MISSING_VENDOR), kStart);
  store_.insertExpense(expense("exp-other", 100));
  engine_->OpenCase(openRequest("op-3", ReasonCode::MISSING_RECEIPT, "exp-other"), kStart);

  size_t closed = engine_->SupersedeCasesFor(SubjectKind::EXPENSE, "exp-taxi", "system",
                                             daysAfterStart(1));
  EXPECT_EQ(closed, 2u);

  CaseFilter open_only;
  open_only.open_only = true;
  auto remaining = engine_->ListCases(open_only);
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(remaining[0].subject_id, "exp-other");

  EXPECT_EQ(engine_->SupersedeCasesFor(SubjectKind::EXPENSE, "exp-taxi", "system",
                                       daysAfterStart(2)),
            0u);
}

TEST_F(EscalationEngineTest, HoldPausesEscalation) {
  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);
  const std::string case_id = opened.nr_case.id;

  engine_->StartWork(case_id, "alice", kStart + 60);
  NonReconciliationCase held = engine_->Hold(case_id, "alice", "waiting on vendor", kStart + 120);
  EXPECT_EQ(held.status, CaseStatus::ON_HOLD);
  EXPECT_FALSE(held.next_escalation_date.has_value());
  EXPECT_LEDGER_ERROR(engine_->Hold(case_id, "alice", "", kStart), ErrorCode::INVALID_STATE);

  EXPECT_EQ(engine_->Sweep(daysAfterStart(30)).evaluated, 0u);

  NonReconciliationCase released =
      engine_->Release(case_id, "alice", "vendor answered", daysAfterStart(30));
  EXPECT_EQ(released.status, CaseStatus::IN_PROGRESS);
  EXPECT_EQ(released.next_escalation_date, std::optional<Timestamp>(daysAfterStart(44)));
  EXPECT_LEDGER_ERROR(engine_->Release(case_id, "alice", "", kStart), ErrorCode::INVALID_STATE);
}

TEST_F(EscalationEngineTest, ApprovalRequestNotifiesCurrentLevel) {
  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);

  NonReconciliationCase waiting =
      engine_->RequireApproval(opened.nr_case.id, "alice", "write-off needed", kStart + 60);
  EXPECT_EQ(waiting.status, CaseStatus::REQUIRES_APPROVAL);
  EXPECT_EQ(engine_->History(waiting.id).back().action, HistoryAction::HELD);

  auto sent = sink_.requests();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].type, notifications::NotificationType::APPROVAL_REQUESTED);
  EXPECT_EQ(sent[0].recipient.identifier, "case_owner");
  EXPECT_EQ(sent[0].case_id, waiting.id);

  NonReconciliationCase released = engine_->Release(waiting.id, "controller", "", kStart + 120);
  EXPECT_EQ(released.status, CaseStatus::PENDING);
}

TEST_F(EscalationEngineTest, TerminalCasesRejectTransitions) {
  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);
  const std::string case_id = opened.nr_case.id;

  EXPECT_LEDGER_ERROR(engine_->Comment(case_id, "alice", "", kStart), ErrorCode::INVALID_ARGUMENT);
  engine_->Comment(case_id, "alice", "asked for the receipt", kStart + 10);

  NonReconciliationCase resolved = engine_->Resolve(case_id, "alice", "receipt found", kStart + 20);
  EXPECT_EQ(resolved.status, CaseStatus::RESOLVED);
  EXPECT_EQ(resolved.resolved_at, std::optional<Timestamp>(kStart + 20));

  EXPECT_LEDGER_ERROR(engine_->Resolve(case_id, "alice", "", kStart), ErrorCode::INVALID_STATE);
  EXPECT_LEDGER_ERROR(engine_->Dismiss(case_id, "alice", "", kStart), ErrorCode::INVALID_STATE);
  EXPECT_LEDGER_ERROR(engine_->StartWork(case_id, "alice", kStart), ErrorCode::INVALID_STATE);
  EXPECT_LEDGER_ERROR(engine_->EscalateManually(case_id, "alice", "", kStart),
                      ErrorCode::INVALID_STATE);

  auto history = engine_->History(case_id);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[1].action, HistoryAction::COMMENTED);
  EXPECT_EQ(history[1].notes, "asked for the receipt");
  EXPECT_EQ(history[2].previous_status, std::optional<CaseStatus>(CaseStatus::PENDING));
  EXPECT_EQ(history[2].new_status, CaseStatus::RESOLVED);
}

TEST_F(EscalationEngineTest, RulesCanBeAddedAndReplaced) {
  EscalationRule faster = missingReceiptRule();
  faster.escalation_after_days = 2;
  engine_->AddRule(faster);

  auto rules = engine_->ListRules();
  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0].escalation_after_days, 2);

  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);
  EXPECT_EQ(opened.nr_case.next_escalation_date, std::optional<Timestamp>(daysAfterStart(2)));

  EscalationRule broken;
  broken.rule_code = "BROKEN";
  broken.escalation_after_days = 0;
  EXPECT_LEDGER_ERROR(engine_->AddRule(broken), ErrorCode::RULE_EVALUATION_ERROR);

  EscalationRule inverted;
  inverted.rule_code = "INVERTED";
  inverted.minimum_amount = 1000;
  inverted.maximum_amount = 10;
  EXPECT_LEDGER_ERROR(engine_->AddRule(inverted), ErrorCode::RULE_EVALUATION_ERROR);
  EXPECT_EQ(engine_->ListRules().size(), 1u);
}

TEST_F(EscalationEngineTest, AmountRulesMatchTheSubject) {
  EscalationRule large;
  large.rule_code = "LARGE_3D";
  large.minimum_amount = 100000;
  large.escalation_after_days = 3;
  engine_->AddRule(large);

  store_.insertExpense(expense("exp-big", 250000));
  auto big = engine_->OpenCase(openRequest("op-1", ReasonCode::AMOUNT_EXCESSIVE, "exp-big"),
                               kStart);
  EXPECT_EQ(big.nr_case.next_escalation_date, std::optional<Timestamp>(daysAfterStart(3)));

  auto small = engine_->OpenCase(openRequest("op-2", ReasonCode::AMOUNT_EXCESSIVE), kStart);
  EXPECT_EQ(small.nr_case.next_escalation_date,
            std::optional<Timestamp>(daysAfterStart(kDefaultEscalationAfterDays)));
}

TEST(EscalationEngineConfigTest, MalformedRuleLeavesCaseUnscheduled) {
  InMemoryLedgerStore store;
  allocation::AllocationEngine allocation(store);
  advances::AdvanceLedger advances(store, allocation);

  EscalationRule malformed = missingReceiptRule();
  malformed.escalation_after_days = -1;
  EscalationConfig config;
  config.rules.push_back(malformed);
  EscalationEngine engine(store, allocation, advances, nullptr, config);

  store.insertExpense(expense("exp-1", 100));
  OpenCaseRequest request;
  request.operation_id = "op-1";
  request.subject_id = "exp-1";
  request.reason = ReasonCode::MISSING_RECEIPT;

  auto outcome = engine.OpenCase(request, kStart);
  EXPECT_EQ(outcome.nr_case.status, CaseStatus::PENDING);
  EXPECT_FALSE(outcome.nr_case.next_escalation_date.has_value());

  // Other reasons never reach the malformed rule
  request.operation_id = "op-2";
  request.reason = ReasonCode::MISSING_VENDOR;
  EXPECT_TRUE(engine.OpenCase(request, kStart).nr_case.next_escalation_date.has_value());
}

TEST(EscalationEngineConfigTest, MalformedRuleLeavesDueCaseUnescalated) {
  InMemoryLedgerStore store;
  allocation::AllocationEngine allocation(store);
  advances::AdvanceLedger advances(store, allocation);
  store.insertExpense(expense("exp-1", 100));
  store.insertExpense(expense("exp-2", 100));

  std::string receipt_case;
  std::string vendor_case;
  {
    EscalationEngine engine(store, allocation, advances, nullptr, EscalationConfig());
    OpenCaseRequest request;
    request.operation_id = "op-1";
    request.subject_id = "exp-1";
    request.reason = ReasonCode::MISSING_RECEIPT;
    receipt_case = engine.OpenCase(request, kStart).nr_case.id;

    request.operation_id = "op-2";
    request.subject_id = "exp-2";
    request.reason = ReasonCode::MISSING_VENDOR;
    vendor_case = engine.OpenCase(request, kStart).nr_case.id;
  }

  // The rule breaks after both cases were scheduled with the default seven days
  EscalationRule malformed = missingReceiptRule();
  malformed.escalation_after_days = -1;
  EscalationConfig config;
  config.rules.push_back(malformed);
  EscalationEngine engine(store, allocation, advances, nullptr, config);

  SweepReport report = engine.Sweep(daysAfterStart(8));
  EXPECT_EQ(report.evaluated, 2u);
  EXPECT_EQ(report.escalated, 1u);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].case_id, receipt_case);

  NonReconciliationCase untouched = engine.GetCase(receipt_case);
  EXPECT_EQ(untouched.status, CaseStatus::PENDING);
  EXPECT_EQ(untouched.escalation_level, 1);
  EXPECT_EQ(untouched.next_escalation_date, std::optional<Timestamp>(daysAfterStart(7)));
  EXPECT_EQ(engine.History(receipt_case).size(), 1u);

  EXPECT_EQ(engine.GetCase(vendor_case).status, CaseStatus::ESCALATED);
  EXPECT_EQ(engine.GetCase(vendor_case).escalation_level, 2);
}

TEST_F(EscalationEngineTest, ListCasesFilters) {
  store_.insertExpense(expense("exp-other", 100));
  auto receipt = engine_->OpenCase(openRequest("op-1"), kStart);
  engine_->OpenCase(openRequest("op-2", ReasonCode::DUPLICATE_SUSPECTED), kStart);
  OpenCaseRequest other = openRequest("op-3", ReasonCode::MISSING_RECEIPT, "exp-other");
  other.company_id = "globex";
  engine_->OpenCase(other, kStart);
  engine_->EscalateManually(receipt.nr_case.id, "alice", "", kStart + 60);

  CaseFilter by_category;
  by_category.category = ReasonCategory::MISSING_DATA;
  EXPECT_EQ(engine_->ListCases(by_category).size(), 2u);

  CaseFilter by_company;
  by_company.company_id = "globex";
  EXPECT_EQ(engine_->ListCases(by_company).size(), 1u);

  CaseFilter escalated;
  escalated.minimum_level = 2;
  auto high = engine_->ListCases(escalated);
  ASSERT_EQ(high.size(), 1u);
  EXPECT_EQ(high[0].id, receipt.nr_case.id);

  CaseFilter by_status;
  by_status.status = CaseStatus::PENDING;
  by_status.subject_id = std::string("exp-taxi");
  EXPECT_EQ(engine_->ListCases(by_status).size(), 1u);

  EXPECT_EQ(engine_->ReasonCatalog().size(), 26u);
}

TEST_F(EscalationEngineTest, ConcurrentTransitionsKeepHistoryComplete) {
  auto opened = engine_->OpenCase(openRequest("op-1"), kStart);
  const std::string case_id = opened.nr_case.id;

  const int num_threads = 4;
  const int comments_per_thread = 10;
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t, &case_id, comments_per_thread]() {
      for (int i = 0; i < comments_per_thread; ++i) {
        try {
          engine_->Comment(case_id, "user-" + std::to_string(t), "note " + std::to_string(i),
                           kStart + i);
        } catch (const LedgerError& e) {
          // Heavy contention may exhaust the retries; the history must still be consistent.
          EXPECT_EQ(e.code(), ErrorCode::CONCURRENCY_CONFLICT);
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  NonReconciliationCase nr_case = engine_->GetCase(case_id);
  auto history = engine_->History(case_id);
  // One CREATED entry plus one entry per committed comment, each bumping the version
  EXPECT_EQ(history.size(), nr_case.version);
  for (size_t i = 1; i < history.size(); ++i) {
    EXPECT_LT(history[i - 1].sequence, history[i].sequence);
  }
}
