#include "ledger_server.hpp"

#include "database/postgres_connection.hpp"
#include "database/postgres_ledger_store.hpp"
#include "ledger_errors.hpp"
#include "memory_ledger_store.hpp"
#include "network/ledger_json.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <chrono>

namespace recon {

using network::field;
using network::fieldOr;
using network::protocol::MessageType;
using network::protocol::Status;
using observability::LogLevel;
using json = nlohmann::json;

namespace {

Timestamp currentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

template <typename Enum>
Enum enumField(const json& payload, const char* key,
               std::optional<Enum> (*parse)(const std::string&)) {
  std::string value = field<std::string>(payload, key);
  auto parsed = parse(value);
  if (!parsed) {
    throw LedgerError(ErrorCode::INVALID_ARGUMENT,
                      "Unknown value '" + value + "' for field '" + key + "'");
  }
  return *parsed;
}

template <typename Enum>
std::optional<Enum> optionalEnumField(const json& payload, const char* key,
                                      std::optional<Enum> (*parse)(const std::string&)) {
  if (!payload.contains(key) || payload.at(key).is_null()) return std::nullopt;
  return enumField(payload, key, parse);
}

std::optional<std::string> optionalText(const json& payload, const char* key) {
  if (!payload.contains(key) || payload.at(key).is_null()) return std::nullopt;
  return field<std::string>(payload, key);
}

json withReplayFlag(json payload, bool replayed) {
  payload["replayed"] = replayed;
  return payload;
}

}  // namespace

std::unique_ptr<LedgerStore> createLedgerStore(const config::LedgerConfig& config) {
  if (!config.database.enabled) {
    LOG_INFO("Using in-memory ledger store");
    return std::make_unique<InMemoryLedgerStore>();
  }

  database::ConnectionConfig connection_config;
  connection_config.host = config.database.host;
  connection_config.port = config.database.port;
  connection_config.database = config.database.name;
  connection_config.username = config.database.username;
  connection_config.password = config.database.password;
  connection_config.connection_timeout = config.database.connection_timeout;

  auto connection = std::make_shared<database::PostgresConnection>(connection_config);
  if (!connection->connect()) {
    throw LedgerError(ErrorCode::STORAGE_ERROR,
                      "Cannot connect to " + connection->getConnectionInfo());
  }

  auto store = std::make_unique<database::PostgresLedgerStore>(connection);
  if (!store->initializeSchema(config.database.schema_path)) {
    throw LedgerError(ErrorCode::STORAGE_ERROR,
                      "Cannot apply schema " + config.database.schema_path);
  }
  return store;
}

LedgerServer::LedgerServer(const config::LedgerConfig& config, std::unique_ptr<LedgerStore> store)
    : config_(config), store_(std::move(store)) {
  if (!store_) {
    store_ = std::make_unique<InMemoryLedgerStore>();
  }

  // Delivery channels live outside the ledger; record what would be sent.
  dispatcher_ = std::make_unique<notifications::NotificationDispatcher>(
      [](const notifications::NotificationRequest& notification) {
        LOG_BUILDER(LogLevel::INFO, "Notification delivered")
            .field("type", notifications::toString(notification.type))
            .field("recipient_type", notifications::toString(notification.recipient.type))
            .field("recipient", notification.recipient.identifier)
            .field("template_id", notification.template_id)
            .correlation(notification.case_id);
      });

  allocation::AllocationConfig allocation_config;
  allocation_config.max_retries = config_.allocation.max_retries;
  allocation_ = std::make_unique<allocation::AllocationEngine>(*store_, allocation_config);

  advances::AdvanceConfig advance_config;
  advance_config.max_retries = config_.advances.max_retries;
  advance_config.warning_after_days = config_.advances.warning_after_days;
  advance_config.urgent_after_days = config_.advances.urgent_after_days;
  advances_ = std::make_unique<advances::AdvanceLedger>(*store_, *allocation_, advance_config);

  escalation::EscalationConfig escalation_config;
  escalation_config.max_retries = config_.escalation.max_retries;
  escalation_config.default_escalation_after_days =
      config_.escalation.default_escalation_after_days;
  escalation_config.rules = config_.escalation.rules;
  escalation_config.recipients_by_level = config_.escalation.recipients_by_level;
  escalation_ = std::make_unique<escalation::EscalationEngine>(
      *store_, *allocation_, *advances_, dispatcher_.get(), escalation_config);

  analytics_ = std::make_unique<analytics::AnalyticsAggregator>(*store_);
  scheduler_ = std::make_unique<concurrent::PeriodicScheduler>();
  scheduleBackgroundTasks();

  // Create TCP server with request handler
  tcp_server_ = std::make_unique<network::TCPServer>(
      config_.server.port, [this](const std::string& request) {
        return handleRequest(request);
      });
}

LedgerServer::~LedgerServer() {
  stop();
}

bool LedgerServer::start() {
  LOG_BUILDER(LogLevel::INFO, "Starting ledger server").field("port", config_.server.port);

  // Start components in order
  if (!dispatcher_->start()) {
    LOG_ERROR("Failed to start notification dispatcher");
    return false;
  }

  if (!scheduler_->start()) {
    LOG_ERROR("Failed to start periodic scheduler");
    dispatcher_->stop();
    return false;
  }

  if (!tcp_server_->start()) {
    LOG_ERROR("Failed to start TCP server");
    scheduler_->stop();
    dispatcher_->stop();
    return false;
  }

  LOG_BUILDER(LogLevel::INFO, "Ledger server started").field("port", tcp_server_->getPort());
  return true;
}

void LedgerServer::stop() {
  bool was_running =
      tcp_server_->isRunning() || scheduler_->isRunning() || dispatcher_->isRunning();

  // Stop components in reverse order
  tcp_server_->stop();
  scheduler_->stop();
  dispatcher_->stop();

  if (was_running) {
    LOG_INFO("Ledger server stopped");
  }
}

LedgerServer::Stats LedgerServer::getStats() const {
  Stats stats;
  stats.is_running = tcp_server_->isRunning();
  stats.active_connections = tcp_server_->getConnectionCount();
  stats.notification_stats = dispatcher_->getStats();
  stats.scheduler_stats = scheduler_->getStats();
  return stats;
}

int LedgerServer::getPort() const {
  return tcp_server_->getPort();
}

void LedgerServer::scheduleBackgroundTasks() {
  bool sweep_scheduled = scheduler_->addTask(
      "escalation_sweep", std::chrono::seconds(config_.escalation.sweep_interval_seconds),
      [this]() { escalation_->Sweep(currentTime()); });
  if (!sweep_scheduled) {
    LOG_WARN("Escalation sweep not scheduled; run it with RUN_SWEEP");
  }

  bool rollup_scheduled = scheduler_->addTask(
      "analytics_rollup", std::chrono::seconds(config_.analytics.rollup_interval_seconds),
      [this]() { analytics_->Rollup(currentTime()); });
  if (!rollup_scheduled) {
    LOG_WARN("Analytics rollup not scheduled; snapshots are computed on request");
  }
}

std::string LedgerServer::handleRequest(const std::string& request_json) {
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "recon_request_duration_seconds");
  metrics.incrementCounter("recon_requests_total");

  Request request;
  try {
    request = network::protocol::deserializeRequest(request_json);
  } catch (const LedgerError& e) {
    metrics.incrementCounter("recon_request_errors_total");
    LOG_BUILDER(LogLevel::WARN, "Malformed request").field("error", e.what());
    return network::protocol::serializeResponse(Response::fromError(e, currentTime()));
  }

  try {
    return network::protocol::serializeResponse(dispatch(request));
  } catch (const LedgerError& e) {
    metrics.incrementCounter("recon_request_errors_total");
    LOG_BUILDER(e.code() == ErrorCode::STORAGE_ERROR ? LogLevel::ERROR : LogLevel::INFO,
                "Request rejected")
        .field("type", network::protocol::toString(request.type))
        .field("error_code", toString(e.code()))
        .field("error", e.what())
        .correlation(request.request_id);
    return network::protocol::serializeResponse(Response::fromError(e, request.timestamp));
  } catch (const std::exception& e) {
    metrics.incrementCounter("recon_request_errors_total");
    LOG_BUILDER(LogLevel::ERROR, "Request processing failed")
        .field("type", network::protocol::toString(request.type))
        .field("error", e.what())
        .correlation(request.request_id);
    return network::protocol::serializeResponse(
        Response::error(Status::ERROR, "Request processing failed", request.timestamp));
  }
}

network::protocol::Response LedgerServer::dispatch(const Request& request) {
  Timestamp now = request.timestamp > 0 ? request.timestamp : currentTime();

  switch (request.type) {
    case MessageType::IMPORT_MOVEMENT:
    case MessageType::IMPORT_EXPENSE:
    case MessageType::CANCEL_MOVEMENT:
    case MessageType::GET_MOVEMENT:
    case MessageType::GET_EXPENSE:
      return handleLedger(request, now);

    case MessageType::PROPOSE_SPLIT:
    case MessageType::REVISE_SPLIT:
    case MessageType::FINALIZE_SPLIT:
    case MessageType::REJECT_SPLIT:
    case MessageType::ANNOTATE_SPLIT:
    case MessageType::GET_SPLIT:
    case MessageType::LIST_SPLITS:
    case MessageType::SPLIT_SUMMARY:
      return handleSplit(request, now);

    case MessageType::CREATE_ADVANCE:
    case MessageType::RECORD_REIMBURSEMENT:
    case MessageType::CANCEL_ADVANCE:
    case MessageType::GET_ADVANCE:
    case MessageType::EMPLOYEE_SUMMARY:
    case MessageType::PENDING_ADVANCES:
    case MessageType::LIST_ADVANCES:
    case MessageType::ADVANCE_SUMMARY:
      return handleAdvance(request, now);

    case MessageType::GET_ANALYTICS:
      return Response::success("Analytics snapshot", now,
                               analytics::toJson(analytics_->Rollup(now)));

    case MessageType::HEARTBEAT:
      return Response::success("Heartbeat acknowledged", now);

    default:
      return handleCase(request, now);
  }
}

network::protocol::Response LedgerServer::handleLedger(const Request& request, Timestamp now) {
  const json& payload = request.payload;

  switch (request.type) {
    case MessageType::IMPORT_MOVEMENT: {
      BankMovement movement = network::parseMovement(payload);
      store_->insertMovement(movement);
      return Response::success("Movement imported", now, store_->getMovement(movement.id));
    }
    case MessageType::IMPORT_EXPENSE: {
      ExpenseRecord expense = network::parseExpense(payload);
      store_->insertExpense(expense);
      return Response::success("Expense imported", now, store_->getExpense(expense.id));
    }
    case MessageType::CANCEL_MOVEMENT: {
      std::string movement_id = field<std::string>(payload, "movement_id");
      BankMovement movement = store_->cancelMovement(movement_id);
      supersede(SubjectKind::MOVEMENT, movement_id, request.actor, now);
      return Response::success("Movement cancelled", now, movement);
    }
    case MessageType::GET_MOVEMENT:
      return Response::success("Movement", now,
                               store_->getMovement(field<std::string>(payload, "movement_id")));
    case MessageType::GET_EXPENSE:
      return Response::success("Expense", now,
                               store_->getExpense(field<std::string>(payload, "expense_id")));
    default:
      break;
  }
  throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Unsupported ledger request");
}

network::protocol::Response LedgerServer::handleSplit(const Request& request, Timestamp now) {
  const json& payload = request.payload;

  switch (request.type) {
    case MessageType::PROPOSE_SPLIT:
    case MessageType::REVISE_SPLIT: {
      allocation::SplitProposal proposal;
      proposal.operation_id = request.request_id;
      proposal.group_id = field<std::string>(payload, "group_id");
      proposal.type = enumField(payload, "split_type", parseSplitType);
      proposal.members = network::parseSplitMembers(field<json>(payload, "members"));
      proposal.actor = request.actor;

      bool revise = request.type == MessageType::REVISE_SPLIT;
      auto outcome = revise ? allocation_->ReviseSplit(proposal, now)
                            : allocation_->ProposeSplit(proposal, now);
      return Response::success(revise ? "Split revised" : "Split proposed", now, outcome);
    }
    case MessageType::FINALIZE_SPLIT:
    case MessageType::REJECT_SPLIT: {
      bool finalize = request.type == MessageType::FINALIZE_SPLIT;
      auto outcome = allocation_->FinalizeOrReject(
          request.request_id, field<std::string>(payload, "group_id"),
          finalize ? allocation::SplitDecision::FINALIZE : allocation::SplitDecision::REJECT,
          request.actor, now);
      return Response::success(finalize ? "Split finalized" : "Split rejected", now, outcome);
    }
    case MessageType::ANNOTATE_SPLIT:
      return Response::success(
          "Split annotated", now,
          allocation_->AnnotateSplit(request.request_id, field<std::string>(payload, "group_id"),
                                     request.actor, field<std::string>(payload, "note"), now));
    case MessageType::GET_SPLIT:
      return Response::success("Split group", now,
                               allocation_->GetSplit(field<std::string>(payload, "group_id")));
    case MessageType::LIST_SPLITS: {
      auto status = optionalEnumField(payload, "status", parseSplitGroupStatus);
      return Response::success("Split groups", now,
                               json{{"groups", allocation_->ListSplits(status)}});
    }
    case MessageType::SPLIT_SUMMARY:
      return Response::success("Split summary", now, allocation_->Summary());
    default:
      break;
  }
  throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Unsupported split request");
}

network::protocol::Response LedgerServer::handleAdvance(const Request& request, Timestamp now) {
  const json& payload = request.payload;

  switch (request.type) {
    case MessageType::CREATE_ADVANCE: {
      advances::NewAdvance advance;
      advance.operation_id = request.request_id;
      advance.expense_id = field<std::string>(payload, "expense_id");
      advance.employee_id = field<std::string>(payload, "employee_id");
      advance.employee_name = fieldOr<std::string>(payload, "employee_name", "");
      advance.amount = field<Amount>(payload, "amount");
      advance.channel = optionalEnumField(payload, "reimbursement_channel",
                                          parseReimbursementChannel)
                            .value_or(ReimbursementChannel::PENDING);
      advance.payment_method = fieldOr<std::string>(payload, "payment_method", "");
      advance.notes = fieldOr<std::string>(payload, "notes", "");
      advance.advance_date = fieldOr<Timestamp>(payload, "advance_date", now);

      auto outcome = advances_->CreateAdvance(advance);
      if (!outcome.replayed) {
        supersede(SubjectKind::EXPENSE, advance.expense_id, request.actor, now);
      }
      return Response::success("Advance created", now,
                               withReplayFlag(outcome.advance, outcome.replayed));
    }
    case MessageType::RECORD_REIMBURSEMENT: {
      advances::ReimbursementRequest reimbursement;
      reimbursement.operation_id = request.request_id;
      reimbursement.advance_id = field<std::string>(payload, "advance_id");
      reimbursement.amount = field<Amount>(payload, "amount");
      reimbursement.movement_id = optionalText(payload, "movement_id");
      reimbursement.channel =
          optionalEnumField(payload, "reimbursement_channel", parseReimbursementChannel);
      reimbursement.reimbursed_at = fieldOr<Timestamp>(payload, "reimbursed_at", now);
      reimbursement.notes = fieldOr<std::string>(payload, "notes", "");

      auto outcome = advances_->RecordReimbursement(reimbursement);
      return Response::success("Reimbursement recorded", now,
                               withReplayFlag(outcome.advance, outcome.replayed));
    }
    case MessageType::CANCEL_ADVANCE: {
      auto outcome = advances_->CancelAdvance(request.request_id,
                                              field<std::string>(payload, "advance_id"),
                                              fieldOr<std::string>(payload, "reason", ""), now);
      return Response::success("Advance cancelled", now,
                               withReplayFlag(outcome.advance, outcome.replayed));
    }
    case MessageType::GET_ADVANCE:
      return Response::success("Advance", now,
                               advances_->GetAdvance(field<std::string>(payload, "advance_id")));
    case MessageType::EMPLOYEE_SUMMARY:
      return Response::success(
          "Employee summary", now,
          advances_->EmployeeSummary(field<std::string>(payload, "employee_id")));
    case MessageType::PENDING_ADVANCES:
      return Response::success("Pending advances", now,
                               json{{"advances", advances_->PendingAdvances(now)}});
    case MessageType::LIST_ADVANCES: {
      auto status = optionalEnumField(payload, "status", parseAdvanceStatus);
      return Response::success("Advances", now,
                               json{{"advances", advances_->ListAdvances(status)}});
    }
    case MessageType::ADVANCE_SUMMARY:
      return Response::success("Advance summary", now, advances_->Summary());
    default:
      break;
  }
  throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Unsupported advance request");
}

network::protocol::Response LedgerServer::handleCase(const Request& request, Timestamp now) {
  const json& payload = request.payload;
  const std::string& actor = request.actor;

  switch (request.type) {
    case MessageType::OPEN_CASE: {
      escalation::OpenCaseRequest open;
      open.operation_id = request.request_id;
      open.subject_kind = enumField(payload, "subject_kind", parseSubjectKind);
      open.subject_id = field<std::string>(payload, "subject_id");
      open.company_id = fieldOr<std::string>(payload, "company_id", "");
      open.reason = enumField(payload, "reason_code", parseReasonCode);
      open.impact = optionalEnumField(payload, "business_impact", parseBusinessImpact)
                        .value_or(BusinessImpact::LOW);
      open.priority = fieldOr<int>(payload, "resolution_priority", 3);
      open.actor = actor;
      open.notes = fieldOr<std::string>(payload, "notes", "");

      auto outcome = escalation_->OpenCase(open, now);
      return Response::success("Case opened", now,
                               withReplayFlag(outcome.nr_case, outcome.replayed));
    }
    case MessageType::START_CASE:
      return Response::success(
          "Case in progress", now,
          escalation_->StartWork(field<std::string>(payload, "case_id"), actor, now));
    case MessageType::RESOLVE_CASE:
      return Response::success(
          "Case resolved", now,
          escalation_->Resolve(field<std::string>(payload, "case_id"), actor,
                               fieldOr<std::string>(payload, "notes", ""), now));
    case MessageType::DISMISS_CASE:
      return Response::success(
          "Case dismissed", now,
          escalation_->Dismiss(field<std::string>(payload, "case_id"), actor,
                               fieldOr<std::string>(payload, "notes", ""), now));
    case MessageType::HOLD_CASE:
      return Response::success(
          "Case on hold", now,
          escalation_->Hold(field<std::string>(payload, "case_id"), actor,
                            fieldOr<std::string>(payload, "notes", ""), now));
    case MessageType::REQUIRE_APPROVAL:
      return Response::success(
          "Case awaiting approval", now,
          escalation_->RequireApproval(field<std::string>(payload, "case_id"), actor,
                                       fieldOr<std::string>(payload, "notes", ""), now));
    case MessageType::RELEASE_CASE:
      return Response::success(
          "Case released", now,
          escalation_->Release(field<std::string>(payload, "case_id"), actor,
                               fieldOr<std::string>(payload, "notes", ""), now));
    case MessageType::ESCALATE_CASE:
      return Response::success(
          "Case escalated", now,
          escalation_->EscalateManually(field<std::string>(payload, "case_id"), actor,
                                        fieldOr<std::string>(payload, "notes", ""), now));
    case MessageType::COMMENT_CASE:
      return Response::success(
          "Comment added", now,
          escalation_->Comment(field<std::string>(payload, "case_id"), actor,
                               field<std::string>(payload, "note"), now));
    case MessageType::GET_CASE:
      return Response::success("Case", now,
                               escalation_->GetCase(field<std::string>(payload, "case_id")));
    case MessageType::CASE_HISTORY:
      return Response::success(
          "Case history", now,
          json{{"history", escalation_->History(field<std::string>(payload, "case_id"))}});
    case MessageType::LIST_CASES: {
      escalation::CaseFilter filter;
      filter.status = optionalEnumField(payload, "status", parseCaseStatus);
      filter.category = optionalEnumField(payload, "category", parseReasonCategory);
      filter.subject_id = optionalText(payload, "subject_id");
      filter.company_id = optionalText(payload, "company_id");
      if (payload.contains("minimum_level") && !payload.at("minimum_level").is_null()) {
        filter.minimum_level = field<int>(payload, "minimum_level");
      }
      filter.open_only = fieldOr<bool>(payload, "open_only", false);
      return Response::success("Cases", now, json{{"cases", escalation_->ListCases(filter)}});
    }
    case MessageType::ADD_RULE: {
      escalation::EscalationRule rule;
      try {
        rule = config::parseRule(payload);
      } catch (const std::runtime_error& e) {
        throw LedgerError(ErrorCode::INVALID_ARGUMENT, e.what());
      } catch (const json::exception& e) {
        throw LedgerError(ErrorCode::INVALID_ARGUMENT, std::string("Invalid rule: ") + e.what());
      }
      escalation_->AddRule(rule);
      return Response::success("Rule registered", now, rule);
    }
    case MessageType::LIST_RULES:
      return Response::success("Escalation rules", now,
                               json{{"rules", escalation_->ListRules()}});
    case MessageType::REASON_CODES:
      return Response::success("Reason codes", now,
                               json{{"reasons", escalation_->ReasonCatalog()}});
    case MessageType::RUN_SWEEP:
      return Response::success("Sweep finished", now, escalation_->Sweep(now));
    default:
      break;
  }
  throw LedgerError(ErrorCode::INVALID_ARGUMENT, "Unsupported request type");
}

void LedgerServer::supersede(SubjectKind kind, const std::string& subject_id,
                             const std::string& actor, Timestamp now) {
  try {
    size_t closed = escalation_->SupersedeCasesFor(kind, subject_id, actor, now);
    if (closed > 0) {
      LOG_BUILDER(LogLevel::INFO, "Superseded open cases")
          .field("subject_id", subject_id)
          .field("cases", static_cast<uint64_t>(closed));
    }
  } catch (const LedgerError& e) {
    LOG_BUILDER(LogLevel::WARN, "Superseding cases deferred to sweep")
        .field("subject_id", subject_id)
        .field("error", e.what());
  }
}

}  // namespace recon
