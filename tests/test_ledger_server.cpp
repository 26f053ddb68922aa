#include "ledger_server.hpp"
#include "ledger_test_support.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

using namespace recon;
using recon::test::daysAfterStart;
using recon::test::kStart;
using json = nlohmann::json;

// Test fixture driving the server through serialized requests
class LedgerServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config::LedgerConfig config;
    config.server.port = 0;
    server_ = std::make_unique<LedgerServer>(config, nullptr);
  }

  json send(const std::string& type, const std::string& request_id, json payload,
            Timestamp timestamp = kStart) {
    json request = {
        {"type", type},
        {"request_id", request_id},
        {"timestamp", timestamp},
        {"actor", "accountant"},
        {"payload", std::move(payload)},
    };
    return json::parse(server_->handleRequest(request.dump()));
  }

  void importMovement(const std::string& id, Amount amount) {
    json response = send("IMPORT_MOVEMENT", "import-" + id,
                         {{"id", id}, {"amount", amount}, {"currency", "EUR"},
                          {"transaction_date", kStart}, {"description", "card payment"}});
    ASSERT_EQ(response["status"], "success") << response.dump();
  }

  void importExpense(const std::string& id, Amount amount) {
    json response = send("IMPORT_EXPENSE", "import-" + id,
                         {{"id", id}, {"amount", amount}, {"currency", "EUR"},
                          {"expense_date", kStart}});
    ASSERT_EQ(response["status"], "success") << response.dump();
  }

  std::unique_ptr<LedgerServer> server_;
};

TEST_F(LedgerServerTest, Heartbeat) {
  json response = send("HEARTBEAT", "", json::object());
  EXPECT_EQ(response["status"], "success");
  EXPECT_EQ(response["timestamp"], kStart);
}

TEST_F(LedgerServerTest, ImportedRecordsStartUnreconciled) {
  importMovement("mov-1", -1000);
  importExpense("exp-1", 400);

  json movement = send("GET_MOVEMENT", "", {{"movement_id", "mov-1"}})["payload"];
  EXPECT_EQ(movement["allocated"], 0);
  EXPECT_EQ(movement["unallocated"], 1000);
  EXPECT_EQ(movement["reconciliation_mode"], "simple");

  json expense = send("GET_EXPENSE", "", {{"expense_id", "exp-1"}})["payload"];
  EXPECT_EQ(expense["pending"], 400);
  EXPECT_EQ(expense["bank_status"], "pending");
  EXPECT_TRUE(expense["split_group_id"].is_null());
}

TEST_F(LedgerServerTest, SplitRequestsRoundTrip) {
  importMovement("mov-1", -1000);
  importExpense("exp-a", 400);
  importExpense("exp-b", 600);

  json members = json::array({
      {{"expense_id", "exp-a"}, {"movement_id", "mov-1"}, {"amount", 400}},
      {{"expense_id", "exp-b"}, {"movement_id", "mov-1"}, {"amount", 600}},
  });
  json proposed = send("PROPOSE_SPLIT", "op-split",
                       {{"group_id", "grp-1"}, {"split_type", "one_to_many"},
                        {"members", members}});
  ASSERT_EQ(proposed["status"], "success") << proposed.dump();
  EXPECT_TRUE(proposed["payload"]["is_complete"].get<bool>());
  EXPECT_EQ(proposed["payload"]["remaining"], 0);
  EXPECT_FALSE(proposed["payload"]["replayed"].get<bool>());

  json replayed = send("PROPOSE_SPLIT", "op-split",
                       {{"group_id", "grp-1"}, {"split_type", "one_to_many"},
                        {"members", members}});
  EXPECT_TRUE(replayed["payload"]["replayed"].get<bool>());

  json finalized = send("FINALIZE_SPLIT", "op-finalize", {{"group_id", "grp-1"}});
  EXPECT_EQ(finalized["payload"]["status"], "finalized");

  json group = send("GET_SPLIT", "", {{"group_id", "grp-1"}})["payload"];
  EXPECT_EQ(group["rows"].size(), 2u);
  EXPECT_EQ(group["anchor_id"], "mov-1");

  json summary = send("SPLIT_SUMMARY", "", json::object())["payload"];
  EXPECT_EQ(summary["finalized"], 1);
}

TEST_F(LedgerServerTest, ErrorsBecomeStatuses) {
  importMovement("mov-1", -300);
  importExpense("exp-a", 500);

  json overflow = send("PROPOSE_SPLIT", "op-split",
                       {{"group_id", "grp-1"},
                        {"split_type", "many_to_one"},
                        {"members", json::array({{{"expense_id", "exp-a"},
                                                  {"movement_id", "mov-1"},
                                                  {"amount", 400}}})}});
  EXPECT_EQ(overflow["status"], "allocation_overflow");
  EXPECT_EQ(overflow["payload"]["error_code"], "ALLOCATION_OVERFLOW");
  EXPECT_FALSE(overflow["payload"]["retryable"].get<bool>());

  json missing = send("GET_EXPENSE", "", {{"expense_id", "exp-missing"}});
  EXPECT_EQ(missing["status"], "not_found");

  json bad_enum = send("LIST_SPLITS", "", {{"status", "sideways"}});
  EXPECT_EQ(bad_enum["status"], "invalid_request");

  json missing_field = send("PROPOSE_SPLIT", "op-2", {{"group_id", "grp-2"}});
  EXPECT_EQ(missing_field["status"], "invalid_request");
}

TEST_F(LedgerServerTest, MalformedRequestsAreAnsweredNotThrown) {
  auto& metrics = observability::getGlobalMetrics();
  double errors_before = metrics.counterValue("recon_request_errors_total");

  json response;
  ASSERT_NO_THROW(response = json::parse(server_->handleRequest("{this is not json")));
  EXPECT_EQ(response["status"], "invalid_request");

  response = json::parse(server_->handleRequest(R"({"type":"WITHDRAW"})"));
  EXPECT_EQ(response["status"], "invalid_request");

  EXPECT_DOUBLE_EQ(metrics.counterValue("recon_request_errors_total"), errors_before + 2);
}

TEST_F(LedgerServerTest, AdvanceSupersedesOpenCases) {
  importExpense("exp-trip", 85050);

  json opened = send("OPEN_CASE", "op-case",
                     {{"subject_kind", "expense"},
                      {"subject_id", "exp-trip"},
                      {"reason_code", "MISSING_RECEIPT"},
                      {"business_impact", "medium"}});
  ASSERT_EQ(opened["status"], "success") << opened.dump();
  std::string case_id = opened["payload"]["id"];
  EXPECT_EQ(opened["payload"]["escalation_level"], 1);

  json advance = send("CREATE_ADVANCE", "op-advance",
                      {{"expense_id", "exp-trip"},
                       {"employee_id", "emp-perez"},
                       {"employee_name", "J. Perez"},
                       {"amount", 85050},
                       {"reimbursement_channel", "transfer"},
                       {"advance_date", kStart}});
  ASSERT_EQ(advance["status"], "success") << advance.dump();
  EXPECT_EQ(advance["payload"]["status"], "pending");
  EXPECT_EQ(advance["payload"]["pending_amount"], 85050);

  json closed = send("GET_CASE", "", {{"case_id", case_id}})["payload"];
  EXPECT_EQ(closed["status"], "resolved");

  json history = send("CASE_HISTORY", "", {{"case_id", case_id}})["payload"]["history"];
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[1]["action"], "superseded");

  json reimbursed = send("RECORD_REIMBURSEMENT", "op-reimburse",
                         {{"advance_id", advance["payload"]["id"]}, {"amount", 85050}});
  EXPECT_EQ(reimbursed["payload"]["status"], "completed");
}

TEST_F(LedgerServerTest, CaseWorkflowAndSweep) {
  importExpense("exp-taxi", 4200);

  json rule = send("ADD_RULE", "op-rule",
                   {{"rule_code", "RECEIPTS_2D"},
                    {"rule_name", "Receipts escalate after two days"},
                    {"reason_codes", json::array({"MISSING_RECEIPT"})},
                    {"escalation_after_days", 2}});
  ASSERT_EQ(rule["status"], "success") << rule.dump();

  json opened = send("OPEN_CASE", "op-case",
                     {{"subject_kind", "expense"},
                      {"subject_id", "exp-taxi"},
                      {"reason_code", "MISSING_RECEIPT"}});
  std::string case_id = opened["payload"]["id"];
  EXPECT_EQ(opened["payload"]["next_escalation_date"], daysAfterStart(2));

  json sweep = send("RUN_SWEEP", "", json::object(), daysAfterStart(3));
  EXPECT_EQ(sweep["payload"]["escalated"], 1);

  json open_cases = send("LIST_CASES", "", {{"open_only", true}, {"minimum_level", 2}});
  ASSERT_EQ(open_cases["payload"]["cases"].size(), 1u);
  EXPECT_EQ(open_cases["payload"]["cases"][0]["status"], "escalated");

  json resolved = send("RESOLVE_CASE", "", {{"case_id", case_id}, {"notes", "receipt found"}},
                       daysAfterStart(4));
  EXPECT_EQ(resolved["payload"]["status"], "resolved");

  json again = send("HOLD_CASE", "", {{"case_id", case_id}});
  EXPECT_EQ(again["status"], "invalid_state");
}

TEST_F(LedgerServerTest, RejectsMalformedRules) {
  json never = send("ADD_RULE", "op-rule",
                    {{"rule_code", "NEVER"}, {"escalation_after_days", 0}});
  EXPECT_EQ(never["status"], "rule_evaluation_error");

  json unknown = send("ADD_RULE", "op-rule",
                      {{"rule_code", "UNKNOWN"}, {"reason_codes", json::array({"LOST_PEN"})}});
  EXPECT_EQ(unknown["status"], "invalid_request");

  json mistyped = send("ADD_RULE", "op-rule",
                       {{"rule_code", "MISTYPED"}, {"escalation_after_days", "soon"}});
  EXPECT_EQ(mistyped["status"], "invalid_request");

  json rules = send("LIST_RULES", "", json::object());
  EXPECT_EQ(rules["status"], "success");
  EXPECT_TRUE(rules["payload"]["rules"].empty());
}

TEST_F(LedgerServerTest, AnalyticsSnapshot) {
  importMovement("mov-1", -1000);
  importExpense("exp-a", 400);

  json response = send("GET_ANALYTICS", "", json::object());
  ASSERT_EQ(response["status"], "success");
  json snapshot = response["payload"];
  EXPECT_EQ(snapshot["generated_at"], kStart);
  EXPECT_EQ(snapshot["ledger"]["movements"], 1);
  EXPECT_EQ(snapshot["ledger"]["unallocated_total"], 1000);
  EXPECT_EQ(snapshot["ledger"]["pending_total"], 400);
  EXPECT_TRUE(server_->analytics().Latest().has_value());
}

TEST_F(LedgerServerTest, CancelledMovementCannotFundSplits) {
  importMovement("mov-1", -500);
  importExpense("exp-a", 500);

  json cancelled = send("CANCEL_MOVEMENT", "op-cancel", {{"movement_id", "mov-1"}});
  ASSERT_EQ(cancelled["status"], "success") << cancelled.dump();
  EXPECT_EQ(cancelled["payload"]["status"], "cancelled");

  json split = send("PROPOSE_SPLIT", "op-split",
                    {{"group_id", "grp-1"},
                     {"split_type", "many_to_one"},
                     {"members", json::array({{{"expense_id", "exp-a"},
                                               {"movement_id", "mov-1"},
                                               {"amount", 500}}})}});
  EXPECT_NE(split["status"], "success");
}
