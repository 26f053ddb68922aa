#include "advances/advance_ledger.hpp"
#include "allocation/allocation_engine.hpp"
#include "database/postgres_connection.hpp"
#include "database/postgres_ledger_store.hpp"
#include "ledger_test_support.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <thread>
#include <vector>

using namespace recon;
using recon::test::debit;
using recon::test::expense;
using recon::test::kStart;

namespace {

std::string envOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : fallback;
}

}  // namespace

// Runs against a scratch database named by RECON_TEST_PG_* variables.
// Every test starts from empty tables.
class PostgresLedgerStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!std::getenv("RECON_TEST_PG_HOST")) {
      GTEST_SKIP() << "RECON_TEST_PG_HOST not set";
    }

    database::ConnectionConfig config;
    config.host = envOr("RECON_TEST_PG_HOST", "localhost");
    config.port = std::stoi(envOr("RECON_TEST_PG_PORT", "5432"));
    config.database = envOr("RECON_TEST_PG_DATABASE", "recon_ledger_test");
    config.username = envOr("RECON_TEST_PG_USER", "recon_user");
    config.password = envOr("RECON_TEST_PG_PASSWORD", "");
    config.connection_timeout = 5;

    connection_ = std::make_shared<database::PostgresConnection>(config);
    ASSERT_TRUE(connection_->connect()) << connection_->getLastError();

    store_ = std::make_unique<database::PostgresLedgerStore>(connection_);
    ASSERT_TRUE(store_->initializeSchema(RECON_SOURCE_DIR "/database/schema.sql"));
    ASSERT_TRUE(store_->truncateAll());

    store_->insertMovement(debit("mov-1", 1000));
    store_->insertExpense(expense("exp-1", 400));
    store_->insertExpense(expense("exp-2", 600));
  }

  std::shared_ptr<database::PostgresConnection> connection_;
  std::unique_ptr<database::PostgresLedgerStore> store_;
};

TEST_F(PostgresLedgerStoreTest, RecordsRoundTrip) {
  BankMovement movement = store_->getMovement("mov-1");
  EXPECT_EQ(movement.amount, -1000);
  EXPECT_EQ(movement.allocated, 0);
  EXPECT_EQ(movement.version, 1u);
  EXPECT_EQ(movement.currency, "EUR");

  EXPECT_LEDGER_ERROR(store_->insertMovement(debit("mov-1", 5)), ErrorCode::INVALID_ARGUMENT);
  EXPECT_FALSE(store_->findExpense("exp-missing").has_value());
  EXPECT_EQ(store_->listExpenses().size(), 2u);
}

TEST_F(PostgresLedgerStoreTest, CommitReplayAndVersionConflict) {
  LedgerTransaction transaction;
  transaction.operation_id = "op-pg-1";
  AllocationDelta delta;
  delta.record_id = "mov-1";
  delta.delta = 400;
  delta.expected_version = 5;
  transaction.movement_deltas.push_back(delta);

  EXPECT_LEDGER_ERROR(store_->commit(transaction), ErrorCode::CONCURRENCY_CONFLICT);
  EXPECT_FALSE(store_->hasOperation("op-pg-1"));

  transaction.movement_deltas[0].expected_version = 1;
  EXPECT_TRUE(store_->commit(transaction));
  EXPECT_FALSE(store_->commit(transaction));

  BankMovement movement = store_->getMovement("mov-1");
  EXPECT_EQ(movement.allocated, 400);
  EXPECT_EQ(movement.version, 2u);
  EXPECT_EQ(movement.mode, ReconciliationMode::PARTIAL);
}

TEST_F(PostgresLedgerStoreTest, SplitGroupPersistsWithRows) {
  allocation::AllocationEngine engine(*store_);
  allocation::SplitProposal proposal;
  proposal.operation_id = "op-pg-split";
  proposal.group_id = "grp-pg";
  proposal.type = SplitType::ONE_TO_MANY;
  proposal.actor = "accountant";
  proposal.members.push_back({"exp-1", "mov-1", 400, std::nullopt, "hotel"});
  proposal.members.push_back({"exp-2", "mov-1", 600, std::nullopt, "flights"});

  auto outcome = engine.ProposeSplit(proposal, kStart);
  EXPECT_TRUE(outcome.is_complete);

  SplitGroup group = engine.GetSplit("grp-pg");
  ASSERT_EQ(group.rows.size(), 2u);
  EXPECT_EQ(group.allocatedTotal(), 1000);
  EXPECT_EQ(store_->getExpense("exp-2").bank_status, BankStatus::RECONCILED);
  EXPECT_EQ(store_->getMovement("mov-1").split_group_id, std::optional<std::string>("grp-pg"));

  engine.AnnotateSplit("op-pg-note", "grp-pg", "auditor", "checked invoices", kStart + 60);
  EXPECT_EQ(engine.GetSplit("grp-pg").annotations.size(), 1u);
}

TEST_F(PostgresLedgerStoreTest, ConcurrentReimbursementsSerialize) {
  allocation::AllocationEngine allocation(*store_);
  advances::AdvanceConfig config;
  config.max_retries = 50;
  advances::AdvanceLedger ledger(*store_, allocation, config);

  advances::NewAdvance request;
  request.operation_id = "op-pg-advance";
  request.expense_id = "exp-2";
  request.employee_id = "emp-1";
  request.amount = 600;
  request.advance_date = kStart;
  std::string advance_id = ledger.CreateAdvance(request).advance.id;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&ledger, &advance_id, t]() {
      advances::ReimbursementRequest reimbursement;
      reimbursement.operation_id = "op-pg-reimburse-" + std::to_string(t);
      reimbursement.advance_id = advance_id;
      reimbursement.amount = 150;
      ledger.RecordReimbursement(reimbursement);
    });
  }
  for (auto& thread : threads) thread.join();

  EmployeeAdvance advance = ledger.GetAdvance(advance_id);
  EXPECT_EQ(advance.reimbursed_amount, 600);
  EXPECT_EQ(advance.status, AdvanceStatus::COMPLETED);
}
