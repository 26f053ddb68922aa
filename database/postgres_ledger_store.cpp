#include "postgres_ledger_store.hpp"

#include "ledger_commit.hpp"
#include "ledger_errors.hpp"
#include "ledger_invariants.hpp"
#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <map>
#include <sstream>

namespace recon {
namespace database {

using observability::LogLevel;
using Param = std::optional<std::string>;

namespace {

const char* kMovementColumns =
    "id, amount, currency, transaction_date, description, status, reconciliation_mode, "
    "allocated, split_group_id, version";

const char* kExpenseColumns =
    "id, amount, currency, expense_date, description, reconciliation_mode, reconciled, "
    "bank_status, is_employee_advance, advance_id, reimbursement_status, split_group_id, version";

const char* kSplitGroupColumns =
    "id, split_type, anchor_id, target_amount, status, is_complete, created_by, created_at, "
    "updated_at, finalized_at, annotations, prior_links, version";

const char* kSplitRowColumns =
    "group_id, position, expense_id, movement_id, allocated_amount, percentage_bp, is_complete, "
    "created_by, created_at, notes";

const char* kAdvanceColumns =
    "id, employee_id, employee_name, expense_id, advance_amount, reimbursed_amount, currency, "
    "reimbursement_channel, status, advance_date, reimbursement_date, reimbursement_movement_id, "
    "payment_method, notes, cancellation_reason, version";

const char* kCaseColumns =
    "id, subject_kind, subject_id, company_id, reason_code, status, escalation_level, "
    "next_escalation_date, estimated_resolution_date, resolved_at, business_impact, "
    "resolution_priority, held_from, created_by, created_at, updated_at, notes, version";

const char* kHistoryColumns =
    "sequence, case_id, action, previous_status, new_status, previous_level, new_level, "
    "performed_by, performed_at, notes, system_generated";

Param num(int64_t value) { return std::to_string(value); }
Param num(uint64_t value) { return std::to_string(value); }
Param num(int value) { return std::to_string(value); }
Param flag(bool value) { return std::string(value ? "true" : "false"); }

Param optNum(const std::optional<Timestamp>& value) {
  if (!value) return std::nullopt;
  return std::to_string(*value);
}

bool isConflictState(const std::string& sqlstate) {
  return sqlstate == "40001"      // serialization_failure
         || sqlstate == "40P01"   // deadlock_detected
         || sqlstate == "23505";  // unique_violation
}

/**
 * Typed access to one row of a result, by column name.
 */
class Row {
 public:
  Row(const PGresult* result, int row) : result_(result), row_(row) {}

  bool isNull(const char* column) const {
    return PQgetisnull(result_, row_, index(column)) == 1;
  }

  std::string text(const char* column) const {
    return PQgetvalue(result_, row_, index(column));
  }

  std::optional<std::string> optText(const char* column) const {
    if (isNull(column)) return std::nullopt;
    return text(column);
  }

  int64_t int64(const char* column) const {
    try {
      return std::stoll(text(column));
    } catch (const std::exception&) {
      throw LedgerError(ErrorCode::STORAGE_ERROR,
                        std::string("Column '") + column + "' is not an integer");
    }
  }

  std::optional<int64_t> optInt64(const char* column) const {
    if (isNull(column)) return std::nullopt;
    return int64(column);
  }

  bool boolean(const char* column) const { return text(column) == "t"; }

  template <typename Enum>
  Enum enumValue(const char* column,
                 std::optional<Enum> (*parse)(const std::string&)) const {
    std::string value = text(column);
    auto parsed = parse(value);
    if (!parsed) {
      throw LedgerError(ErrorCode::STORAGE_ERROR,
                        std::string("Unknown value '") + value + "' in column '" + column + "'");
    }
    return *parsed;
  }

 private:
  int index(const char* column) const {
    int i = PQfnumber(result_, column);
    if (i < 0) {
      throw LedgerError(ErrorCode::STORAGE_ERROR, std::string("Missing column '") + column + "'");
    }
    return i;
  }

  const PGresult* result_;
  int row_;
};

BankMovement movementFrom(const Row& row) {
  BankMovement movement;
  movement.id = row.text("id");
  movement.amount = row.int64("amount");
  movement.currency = row.text("currency");
  movement.transaction_date = row.int64("transaction_date");
  movement.description = row.text("description");
  movement.status = row.enumValue<MovementStatus>("status", parseMovementStatus);
  movement.mode = row.enumValue<ReconciliationMode>("reconciliation_mode", parseReconciliationMode);
  movement.allocated = row.int64("allocated");
  movement.split_group_id = row.optText("split_group_id");
  movement.version = static_cast<uint64_t>(row.int64("version"));
  return movement;
}

ExpenseRecord expenseFrom(const Row& row) {
  ExpenseRecord expense;
  expense.id = row.text("id");
  expense.amount = row.int64("amount");
  expense.currency = row.text("currency");
  expense.expense_date = row.int64("expense_date");
  expense.description = row.text("description");
  expense.mode = row.enumValue<ReconciliationMode>("reconciliation_mode", parseReconciliationMode);
  expense.reconciled = row.int64("reconciled");
  expense.bank_status = row.enumValue<BankStatus>("bank_status", parseBankStatus);
  expense.is_employee_advance = row.boolean("is_employee_advance");
  expense.advance_id = row.optText("advance_id");
  expense.reimbursement_status =
      row.enumValue<ReimbursementStatus>("reimbursement_status", parseReimbursementStatus);
  expense.split_group_id = row.optText("split_group_id");
  expense.version = static_cast<uint64_t>(row.int64("version"));
  return expense;
}

SplitRow splitRowFrom(const Row& row) {
  SplitRow split_row;
  split_row.expense_id = row.text("expense_id");
  split_row.movement_id = row.text("movement_id");
  split_row.allocated_amount = row.int64("allocated_amount");
  split_row.percentage_bp = static_cast<int>(row.int64("percentage_bp"));
  split_row.is_complete = row.boolean("is_complete");
  split_row.created_by = row.text("created_by");
  split_row.created_at = row.int64("created_at");
  split_row.notes = row.text("notes");
  return split_row;
}

SplitGroup splitGroupFrom(const Row& row) {
  SplitGroup group;
  group.id = row.text("id");
  group.type = row.enumValue<SplitType>("split_type", parseSplitType);
  group.anchor_id = row.text("anchor_id");
  group.target_amount = row.int64("target_amount");
  group.status = row.enumValue<SplitGroupStatus>("status", parseSplitGroupStatus);
  group.is_complete = row.boolean("is_complete");
  group.created_by = row.text("created_by");
  group.created_at = row.int64("created_at");
  group.updated_at = row.int64("updated_at");
  group.finalized_at = row.optInt64("finalized_at");
  group.version = static_cast<uint64_t>(row.int64("version"));

  try {
    auto annotations = nlohmann::json::parse(row.text("annotations"));
    for (const auto& item : annotations) {
      SplitAnnotation annotation;
      annotation.actor = item.at("actor").get<std::string>();
      annotation.note = item.at("note").get<std::string>();
      annotation.created_at = item.at("created_at").get<Timestamp>();
      group.annotations.push_back(std::move(annotation));
    }
  } catch (const nlohmann::json::exception& e) {
    throw LedgerError(ErrorCode::STORAGE_ERROR,
                      "Corrupt annotations on split group " + group.id + ": " + e.what());
  }

  try {
    auto links = nlohmann::json::parse(row.text("prior_links"));
    group.prior_movement_groups =
        links.value("movements", nlohmann::json::object()).get<std::map<std::string, std::string>>();
    group.prior_expense_groups =
        links.value("expenses", nlohmann::json::object()).get<std::map<std::string, std::string>>();
  } catch (const nlohmann::json::exception& e) {
    throw LedgerError(ErrorCode::STORAGE_ERROR,
                      "Corrupt prior links on split group " + group.id + ": " + e.what());
  }
  return group;
}

std::string priorLinksJson(const SplitGroup& group) {
  return nlohmann::json{{"movements", group.prior_movement_groups},
                        {"expenses", group.prior_expense_groups}}
      .dump();
}

std::string annotationsJson(const std::vector<SplitAnnotation>& annotations) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& annotation : annotations) {
    array.push_back(nlohmann::json{{"actor", annotation.actor},
                                   {"note", annotation.note},
                                   {"created_at", annotation.created_at}});
  }
  return array.dump();
}

EmployeeAdvance advanceFrom(const Row& row) {
  EmployeeAdvance advance;
  advance.id = row.text("id");
  advance.employee_id = row.text("employee_id");
  advance.employee_name = row.text("employee_name");
  advance.expense_id = row.text("expense_id");
  advance.advance_amount = row.int64("advance_amount");
  advance.reimbursed_amount = row.int64("reimbursed_amount");
  advance.currency = row.text("currency");
  advance.channel =
      row.enumValue<ReimbursementChannel>("reimbursement_channel", parseReimbursementChannel);
  advance.status = row.enumValue<AdvanceStatus>("status", parseAdvanceStatus);
  advance.advance_date = row.int64("advance_date");
  advance.reimbursement_date = row.optInt64("reimbursement_date");
  advance.reimbursement_movement_id = row.optText("reimbursement_movement_id");
  advance.payment_method = row.text("payment_method");
  advance.notes = row.text("notes");
  advance.cancellation_reason = row.text("cancellation_reason");
  advance.version = static_cast<uint64_t>(row.int64("version"));
  return advance;
}

NonReconciliationCase caseFrom(const Row& row) {
  NonReconciliationCase nr_case;
  nr_case.id = row.text("id");
  nr_case.subject_kind = row.enumValue<SubjectKind>("subject_kind", parseSubjectKind);
  nr_case.subject_id = row.text("subject_id");
  nr_case.company_id = row.text("company_id");
  nr_case.reason = row.enumValue<ReasonCode>("reason_code", parseReasonCode);
  nr_case.status = row.enumValue<CaseStatus>("status", parseCaseStatus);
  nr_case.escalation_level = static_cast<int>(row.int64("escalation_level"));
  nr_case.next_escalation_date = row.optInt64("next_escalation_date");
  nr_case.estimated_resolution_date = row.optInt64("estimated_resolution_date");
  nr_case.resolved_at = row.optInt64("resolved_at");
  nr_case.business_impact = row.enumValue<BusinessImpact>("business_impact", parseBusinessImpact);
  nr_case.resolution_priority = static_cast<int>(row.int64("resolution_priority"));
  if (!row.isNull("held_from")) {
    nr_case.held_from = row.enumValue<CaseStatus>("held_from", parseCaseStatus);
  }
  nr_case.created_by = row.text("created_by");
  nr_case.created_at = row.int64("created_at");
  nr_case.updated_at = row.int64("updated_at");
  nr_case.notes = row.text("notes");
  nr_case.version = static_cast<uint64_t>(row.int64("version"));
  return nr_case;
}

CaseHistoryEntry historyFrom(const Row& row) {
  CaseHistoryEntry entry;
  entry.sequence = static_cast<uint64_t>(row.int64("sequence"));
  entry.case_id = row.text("case_id");
  entry.action = row.enumValue<HistoryAction>("action", parseHistoryAction);
  if (!row.isNull("previous_status")) {
    entry.previous_status = row.enumValue<CaseStatus>("previous_status", parseCaseStatus);
  }
  entry.new_status = row.enumValue<CaseStatus>("new_status", parseCaseStatus);
  entry.previous_level = static_cast<int>(row.int64("previous_level"));
  entry.new_level = static_cast<int>(row.int64("new_level"));
  entry.performed_by = row.text("performed_by");
  entry.performed_at = row.int64("performed_at");
  entry.notes = row.text("notes");
  entry.system_generated = row.boolean("system_generated");
  return entry;
}

template <typename Record>
std::vector<Record> rowsOf(const PgResult& result, Record (*convert)(const Row&)) {
  std::vector<Record> records;
  int count = PQntuples(result.get());
  records.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i) {
    records.push_back(convert(Row(result.get(), i)));
  }
  return records;
}

template <typename Record>
std::optional<Record> firstOf(const PgResult& result, Record (*convert)(const Row&)) {
  if (PQntuples(result.get()) == 0) return std::nullopt;
  return convert(Row(result.get(), 0));
}

std::string selectById(const char* columns, const char* table, bool for_update) {
  std::string query = std::string("SELECT ") + columns + " FROM " + table + " WHERE id = $1";
  if (for_update) query += " FOR UPDATE";
  return query;
}

}  // namespace

// Row access for stageCommit inside the open transaction; rows are locked
// until COMMIT or ROLLBACK.
class PostgresLedgerStore::Source : public CommitSource {
 public:
  explicit Source(const PostgresLedgerStore& store) : store_(store) {}

  std::optional<BankMovement> loadMovement(const std::string& id) override {
    return store_.selectMovement(id, true);
  }
  std::optional<ExpenseRecord> loadExpense(const std::string& id) override {
    return store_.selectExpense(id, true);
  }
  std::optional<SplitGroup> loadSplitGroup(const std::string& id) override {
    return store_.selectSplitGroup(id, true);
  }
  std::optional<EmployeeAdvance> loadAdvance(const std::string& id) override {
    return store_.selectAdvance(id, true);
  }
  std::optional<NonReconciliationCase> loadCase(const std::string& id) override {
    return store_.selectCase(id, true);
  }
  bool recordOperationApplied(const std::string& key) override {
    auto result = store_.run("SELECT 1 FROM record_operations WHERE operation_key = $1", {key},
                             "record operation lookup");
    return PQntuples(result.get()) > 0;
  }

 private:
  const PostgresLedgerStore& store_;
};

PostgresLedgerStore::PostgresLedgerStore(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

bool PostgresLedgerStore::initializeSchema(const std::string& schema_path) {
  std::ifstream file(schema_path);
  if (!file.is_open()) {
    LOG_BUILDER(LogLevel::ERROR, "Schema file not found").field("path", schema_path);
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!conn_->executeQuery(buffer.str())) {
    LOG_BUILDER(LogLevel::ERROR, "Schema initialization failed").field("path", schema_path);
    return false;
  }
  LOG_BUILDER(LogLevel::INFO, "Ledger schema ready").field("path", schema_path);
  return true;
}

bool PostgresLedgerStore::truncateAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_->executeQuery(
      "TRUNCATE case_history, non_reconciliation_cases, employee_advances, split_rows, "
      "split_groups, expense_records, bank_movements, applied_operations, record_operations "
      "RESTART IDENTITY");
}

PgResult PostgresLedgerStore::run(const std::string& query,
                                  const PostgresConnection::Params& params,
                                  const std::string& context) const {
  PgResult result = conn_->executeParameterizedQuery(query, params);
  if (!result) {
    throw LedgerError(ErrorCode::STORAGE_ERROR,
                      context + " failed: " + conn_->getLastError());
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
    return result;
  }

  const char* sqlstate = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
  std::string state = sqlstate ? sqlstate : "";
  std::string message = context + " failed: " + PQresultErrorMessage(result.get());

  if (isConflictState(state)) {
    LOG_BUILDER(LogLevel::DEBUG, "Database conflict").field("sqlstate", state).field("context", context);
    throw LedgerError(ErrorCode::CONCURRENCY_CONFLICT, message);
  }
  LOG_BUILDER(LogLevel::ERROR, "Database statement failed")
      .field("sqlstate", state)
      .field("context", context);
  throw LedgerError(ErrorCode::STORAGE_ERROR, message);
}

void PostgresLedgerStore::insertMovement(const BankMovement& movement) {
  if (movement.id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Movement id must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run(
      "INSERT INTO bank_movements (id, amount, currency, transaction_date, description, status, "
      "reconciliation_mode, allocated, split_group_id, version) "
      "VALUES ($1, $2, $3, $4, $5, $6, 'simple', 0, NULL, 1) "
      "ON CONFLICT (id) DO NOTHING RETURNING id",
      {movement.id, num(movement.amount), movement.currency, num(movement.transaction_date),
       movement.description, toString(movement.status)},
      "movement import");
  if (PQntuples(result.get()) == 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Movement already exists: " + movement.id);
  }
}

void PostgresLedgerStore::insertExpense(const ExpenseRecord& expense) {
  if (expense.id.empty()) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense id must not be empty");
  }
  if (expense.amount <= 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense amount must be positive");
  }

  ExpenseRecord record = expense;
  record.reconciled = 0;
  invariants::refreshExpenseStatus(record);

  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run(
      "INSERT INTO expense_records (id, amount, currency, expense_date, description, "
      "reconciliation_mode, reconciled, bank_status, is_employee_advance, advance_id, "
      "reimbursement_status, split_group_id, version) "
      "VALUES ($1, $2, $3, $4, $5, $6, 0, $7, FALSE, NULL, 'not_required', NULL, 1) "
      "ON CONFLICT (id) DO NOTHING RETURNING id",
      {record.id, num(record.amount), record.currency, num(record.expense_date),
       record.description, toString(record.mode), toString(record.bank_status)},
      "expense import");
  if (PQntuples(result.get()) == 0) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Expense already exists: " + record.id);
  }
}

BankMovement PostgresLedgerStore::cancelMovement(const std::string& movement_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  TransactionGuard guard(*conn_);

  auto movement = selectMovement(movement_id, true);
  if (!movement) {
    throw LedgerError(ErrorCode::NOT_FOUND, "Movement not found: " + movement_id);
  }
  if (movement->allocated > 0) {
    throw LedgerError(ErrorCode::INVALID_STATE,
                      "Movement " + movement_id + " has allocations and cannot be cancelled");
  }
  if (movement->status == MovementStatus::CANCELLED) {
    guard.rollback();
    return *movement;
  }

  movement->status = MovementStatus::CANCELLED;
  movement->version += 1;
  writeMovement(*movement);

  if (!guard.commit()) {
    throw LedgerError(ErrorCode::STORAGE_ERROR, "Commit failed: " + conn_->getLastError());
  }
  return *movement;
}

std::optional<BankMovement> PostgresLedgerStore::findMovement(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selectMovement(id, false);
}

std::optional<ExpenseRecord> PostgresLedgerStore::findExpense(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selectExpense(id, false);
}

std::optional<SplitGroup> PostgresLedgerStore::findSplitGroup(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selectSplitGroup(id, false);
}

std::optional<EmployeeAdvance> PostgresLedgerStore::findAdvance(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selectAdvance(id, false);
}

std::optional<NonReconciliationCase> PostgresLedgerStore::findCase(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selectCase(id, false);
}

std::vector<BankMovement> PostgresLedgerStore::listMovements() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run(std::string("SELECT ") + kMovementColumns + " FROM bank_movements ORDER BY id",
                    {}, "movement listing");
  return rowsOf(result, movementFrom);
}

std::vector<ExpenseRecord> PostgresLedgerStore::listExpenses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run(std::string("SELECT ") + kExpenseColumns + " FROM expense_records ORDER BY id",
                    {}, "expense listing");
  return rowsOf(result, expenseFrom);
}

std::vector<SplitGroup> PostgresLedgerStore::listSplitGroups() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto groups_result = run(std::string("SELECT ") + kSplitGroupColumns +
                               " FROM split_groups ORDER BY id",
                           {}, "split group listing");
  std::vector<SplitGroup> groups = rowsOf(groups_result, splitGroupFrom);

  auto rows_result = run(std::string("SELECT ") + kSplitRowColumns +
                             " FROM split_rows ORDER BY group_id, position",
                         {}, "split row listing");
  std::map<std::string, std::vector<SplitRow>> rows_by_group;
  int count = PQntuples(rows_result.get());
  for (int i = 0; i < count; ++i) {
    Row row(rows_result.get(), i);
    rows_by_group[row.text("group_id")].push_back(splitRowFrom(row));
  }

  for (auto& group : groups) {
    auto it = rows_by_group.find(group.id);
    if (it != rows_by_group.end()) {
      group.rows = std::move(it->second);
    }
  }
  return groups;
}

std::vector<EmployeeAdvance> PostgresLedgerStore::listAdvances() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run(std::string("SELECT ") + kAdvanceColumns +
                        " FROM employee_advances ORDER BY id",
                    {}, "advance listing");
  return rowsOf(result, advanceFrom);
}

std::vector<NonReconciliationCase> PostgresLedgerStore::listCases() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run(std::string("SELECT ") + kCaseColumns +
                        " FROM non_reconciliation_cases ORDER BY id",
                    {}, "case listing");
  return rowsOf(result, caseFrom);
}

std::vector<CaseHistoryEntry> PostgresLedgerStore::caseHistory(const std::string& case_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run(std::string("SELECT ") + kHistoryColumns +
                        " FROM case_history WHERE case_id = $1 ORDER BY sequence",
                    {case_id}, "case history");
  return rowsOf(result, historyFrom);
}

bool PostgresLedgerStore::hasOperation(const std::string& operation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = run("SELECT 1 FROM applied_operations WHERE operation_id = $1", {operation_id},
                    "operation lookup");
  return PQntuples(result.get()) > 0;
}

bool PostgresLedgerStore::commit(const LedgerTransaction& transaction) {
  std::lock_guard<std::mutex> lock(mutex_);
  TransactionGuard guard(*conn_);

  if (!transaction.operation_id.empty()) {
    // Claiming the id blocks behind any other transaction holding it.
    auto claimed = run(
        "INSERT INTO applied_operations (operation_id) VALUES ($1) "
        "ON CONFLICT DO NOTHING RETURNING operation_id",
        {transaction.operation_id}, "operation claim");
    if (PQntuples(claimed.get()) == 0) {
      guard.rollback();
      return false;
    }
  }

  Source source(*this);
  StagedCommit staged = stageCommit(transaction, source);

  for (const auto& entry : staged.movements) {
    writeMovement(entry.second);
  }
  for (const auto& entry : staged.expenses) {
    writeExpense(entry.second);
  }
  for (const auto& entry : staged.split_groups) {
    writeSplitGroup(entry.second, staged.inserted_split_groups.count(entry.first) > 0);
  }
  for (const auto& entry : staged.advances) {
    writeAdvance(entry.second, staged.inserted_advances.count(entry.first) > 0);
  }
  for (const auto& entry : staged.cases) {
    writeCase(entry.second, staged.inserted_cases.count(entry.first) > 0);
  }
  for (const auto& entry : staged.history) {
    appendHistory(entry);
  }
  for (const auto& key : staged.record_operation_keys) {
    run("INSERT INTO record_operations (operation_key) VALUES ($1)", {key}, "record operation");
  }

  if (!guard.commit()) {
    throw LedgerError(ErrorCode::STORAGE_ERROR, "Commit failed: " + conn_->getLastError());
  }
  return true;
}

std::optional<BankMovement> PostgresLedgerStore::selectMovement(const std::string& id,
                                                                bool for_update) const {
  auto result = run(selectById(kMovementColumns, "bank_movements", for_update), {id},
                    "movement lookup");
  return firstOf(result, movementFrom);
}

std::optional<ExpenseRecord> PostgresLedgerStore::selectExpense(const std::string& id,
                                                                bool for_update) const {
  auto result = run(selectById(kExpenseColumns, "expense_records", for_update), {id},
                    "expense lookup");
  return firstOf(result, expenseFrom);
}

std::optional<SplitGroup> PostgresLedgerStore::selectSplitGroup(const std::string& id,
                                                                bool for_update) const {
  auto result = run(selectById(kSplitGroupColumns, "split_groups", for_update), {id},
                    "split group lookup");
  auto group = firstOf(result, splitGroupFrom);
  if (group) {
    group->rows = selectSplitRows(id);
  }
  return group;
}

std::vector<SplitRow> PostgresLedgerStore::selectSplitRows(const std::string& group_id) const {
  auto result = run(std::string("SELECT ") + kSplitRowColumns +
                        " FROM split_rows WHERE group_id = $1 ORDER BY position",
                    {group_id}, "split row lookup");
  return rowsOf(result, splitRowFrom);
}

std::optional<EmployeeAdvance> PostgresLedgerStore::selectAdvance(const std::string& id,
                                                                  bool for_update) const {
  auto result = run(selectById(kAdvanceColumns, "employee_advances", for_update), {id},
                    "advance lookup");
  return firstOf(result, advanceFrom);
}

std::optional<NonReconciliationCase> PostgresLedgerStore::selectCase(const std::string& id,
                                                                     bool for_update) const {
  auto result = run(selectById(kCaseColumns, "non_reconciliation_cases", for_update), {id},
                    "case lookup");
  return firstOf(result, caseFrom);
}

void PostgresLedgerStore::writeMovement(const BankMovement& movement) {
  run("UPDATE bank_movements SET status = $2, reconciliation_mode = $3, allocated = $4, "
      "split_group_id = $5, version = $6 WHERE id = $1",
      {movement.id, toString(movement.status), toString(movement.mode), num(movement.allocated),
       movement.split_group_id, num(movement.version)},
      "movement update");
}

void PostgresLedgerStore::writeExpense(const ExpenseRecord& expense) {
  run("UPDATE expense_records SET reconciliation_mode = $2, reconciled = $3, bank_status = $4, "
      "is_employee_advance = $5, advance_id = $6, reimbursement_status = $7, "
      "split_group_id = $8, version = $9 WHERE id = $1",
      {expense.id, toString(expense.mode), num(expense.reconciled), toString(expense.bank_status),
       flag(expense.is_employee_advance), expense.advance_id,
       toString(expense.reimbursement_status), expense.split_group_id, num(expense.version)},
      "expense update");
}

void PostgresLedgerStore::writeSplitGroup(const SplitGroup& group, bool insert) {
  PostgresConnection::Params params = {
      group.id, toString(group.type), group.anchor_id, num(group.target_amount),
      toString(group.status), flag(group.is_complete), group.created_by, num(group.created_at),
      num(group.updated_at), optNum(group.finalized_at), annotationsJson(group.annotations),
      priorLinksJson(group), num(group.version)};

  if (insert) {
    run(std::string("INSERT INTO split_groups (") + kSplitGroupColumns +
            ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::jsonb, $12::jsonb, $13)",
        params, "split group insert");
  } else {
    run("UPDATE split_groups SET split_type = $2, anchor_id = $3, target_amount = $4, "
        "status = $5, is_complete = $6, created_by = $7, created_at = $8, updated_at = $9, "
        "finalized_at = $10, annotations = $11::jsonb, prior_links = $12::jsonb, version = $13 "
        "WHERE id = $1",
        params, "split group update");
    run("DELETE FROM split_rows WHERE group_id = $1", {group.id}, "split row reset");
  }

  int position = 0;
  for (const auto& row : group.rows) {
    run(std::string("INSERT INTO split_rows (") + kSplitRowColumns +
            ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10)",
        {group.id, num(position++), row.expense_id, row.movement_id, num(row.allocated_amount),
         num(row.percentage_bp), flag(row.is_complete), row.created_by, num(row.created_at),
         row.notes},
        "split row insert");
  }
}

void PostgresLedgerStore::writeAdvance(const EmployeeAdvance& advance, bool insert) {
  PostgresConnection::Params params = {
      advance.id, advance.employee_id, advance.employee_name, advance.expense_id,
      num(advance.advance_amount), num(advance.reimbursed_amount), advance.currency,
      toString(advance.channel), toString(advance.status), num(advance.advance_date),
      optNum(advance.reimbursement_date), advance.reimbursement_movement_id,
      advance.payment_method, advance.notes, advance.cancellation_reason, num(advance.version)};

  if (insert) {
    run(std::string("INSERT INTO employee_advances (") + kAdvanceColumns +
            ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16)",
        params, "advance insert");
  } else {
    run("UPDATE employee_advances SET employee_id = $2, employee_name = $3, expense_id = $4, "
        "advance_amount = $5, reimbursed_amount = $6, currency = $7, "
        "reimbursement_channel = $8, status = $9, advance_date = $10, reimbursement_date = $11, "
        "reimbursement_movement_id = $12, payment_method = $13, notes = $14, "
        "cancellation_reason = $15, version = $16 WHERE id = $1",
        params, "advance update");
  }
}

void PostgresLedgerStore::writeCase(const NonReconciliationCase& nr_case, bool insert) {
  Param held_from;
  if (nr_case.held_from) held_from = toString(*nr_case.held_from);

  PostgresConnection::Params params = {
      nr_case.id, toString(nr_case.subject_kind), nr_case.subject_id, nr_case.company_id,
      toString(nr_case.reason), toString(nr_case.status), num(nr_case.escalation_level),
      optNum(nr_case.next_escalation_date), optNum(nr_case.estimated_resolution_date),
      optNum(nr_case.resolved_at), toString(nr_case.business_impact),
      num(nr_case.resolution_priority), held_from, nr_case.created_by, num(nr_case.created_at),
      num(nr_case.updated_at), nr_case.notes, num(nr_case.version)};

  if (insert) {
    run(std::string("INSERT INTO non_reconciliation_cases (") + kCaseColumns +
            ") VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, "
            "$17, $18)",
        params, "case insert");
  } else {
    run("UPDATE non_reconciliation_cases SET subject_kind = $2, subject_id = $3, "
        "company_id = $4, reason_code = $5, status = $6, escalation_level = $7, "
        "next_escalation_date = $8, estimated_resolution_date = $9, resolved_at = $10, "
        "business_impact = $11, resolution_priority = $12, held_from = $13, created_by = $14, "
        "created_at = $15, updated_at = $16, notes = $17, version = $18 WHERE id = $1",
        params, "case update");
  }
}

void PostgresLedgerStore::appendHistory(const CaseHistoryEntry& entry) {
  Param previous_status;
  if (entry.previous_status) previous_status = toString(*entry.previous_status);

  run("INSERT INTO case_history (case_id, action, previous_status, new_status, previous_level, "
      "new_level, performed_by, performed_at, notes, system_generated) "
      "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10)",
      {entry.case_id, toString(entry.action), previous_status, toString(entry.new_status),
       num(entry.previous_level), num(entry.new_level), entry.performed_by,
       num(entry.performed_at), entry.notes, flag(entry.system_generated)},
      "history append");
}

}  // namespace database
}  // namespace recon
