#include "protocol.hpp"

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace recon {
namespace network {
namespace protocol {

namespace {

constexpr std::array<MessageType, 39> kMessageTypes = {
    MessageType::IMPORT_MOVEMENT,  MessageType::IMPORT_EXPENSE,
    MessageType::CANCEL_MOVEMENT,  MessageType::GET_MOVEMENT,
    MessageType::GET_EXPENSE,      MessageType::PROPOSE_SPLIT,
    MessageType::REVISE_SPLIT,     MessageType::FINALIZE_SPLIT,
    MessageType::REJECT_SPLIT,     MessageType::ANNOTATE_SPLIT,
    MessageType::GET_SPLIT,        MessageType::CREATE_ADVANCE,
    MessageType::RECORD_REIMBURSEMENT, MessageType::CANCEL_ADVANCE,
    MessageType::GET_ADVANCE,      MessageType::EMPLOYEE_SUMMARY,
    MessageType::PENDING_ADVANCES, MessageType::OPEN_CASE,
    MessageType::START_CASE,       MessageType::RESOLVE_CASE,
    MessageType::DISMISS_CASE,     MessageType::HOLD_CASE,
    MessageType::REQUIRE_APPROVAL, MessageType::RELEASE_CASE,
    MessageType::ESCALATE_CASE,    MessageType::COMMENT_CASE,
    MessageType::GET_CASE,         MessageType::CASE_HISTORY,
    MessageType::REASON_CODES,     MessageType::RUN_SWEEP,
    MessageType::GET_ANALYTICS,    MessageType::HEARTBEAT,
    MessageType::LIST_SPLITS,      MessageType::SPLIT_SUMMARY,
    MessageType::LIST_ADVANCES,    MessageType::ADVANCE_SUMMARY,
    MessageType::LIST_CASES,       MessageType::ADD_RULE,
    MessageType::LIST_RULES,
};

constexpr std::array<Status, 12> kStatuses = {
    Status::SUCCESS,
    Status::NOT_FOUND,
    Status::INVALID_STATE,
    Status::ALLOCATION_OVERFLOW,
    Status::ALREADY_ALLOCATED,
    Status::INVALID_SPLIT_TYPE,
    Status::CONFLICTING_RECONCILIATION_MODE,
    Status::CONCURRENCY_CONFLICT,
    Status::RULE_EVALUATION_ERROR,
    Status::INVALID_REQUEST,
    Status::STORAGE_ERROR,
    Status::ERROR,
};

LedgerError malformed(const std::string& what) {
  return LedgerError(ErrorCode::INVALID_ARGUMENT, "Malformed message: " + what);
}

nlohmann::json parseObject(const std::string& json_str) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error& e) {
    throw malformed(e.what());
  }
  if (!j.is_object()) {
    throw malformed("expected a JSON object");
  }
  return j;
}

size_t readHeader(const std::string& buffer) {
  size_t message_size = 0;
  for (size_t i = 0; i < MessageFramer::kHeaderSize; ++i) {
    char c = buffer[i];
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      throw std::runtime_error("Invalid framed message: bad length header");
    }
    message_size = message_size * 16 +
                   static_cast<size_t>(std::isdigit(static_cast<unsigned char>(c))
                                           ? c - '0'
                                           : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
  }
  return message_size;
}

}  // namespace

std::string toString(MessageType type) {
  switch (type) {
    case MessageType::IMPORT_MOVEMENT: return "IMPORT_MOVEMENT";
    case MessageType::IMPORT_EXPENSE: return "IMPORT_EXPENSE";
    case MessageType::CANCEL_MOVEMENT: return "CANCEL_MOVEMENT";
    case MessageType::GET_MOVEMENT: return "GET_MOVEMENT";
    case MessageType::GET_EXPENSE: return "GET_EXPENSE";
    case MessageType::PROPOSE_SPLIT: return "PROPOSE_SPLIT";
    case MessageType::REVISE_SPLIT: return "REVISE_SPLIT";
    case MessageType::FINALIZE_SPLIT: return "FINALIZE_SPLIT";
    case MessageType::REJECT_SPLIT: return "REJECT_SPLIT";
    case MessageType::ANNOTATE_SPLIT: return "ANNOTATE_SPLIT";
    case MessageType::GET_SPLIT: return "GET_SPLIT";
    case MessageType::LIST_SPLITS: return "LIST_SPLITS";
    case MessageType::SPLIT_SUMMARY: return "SPLIT_SUMMARY";
    case MessageType::CREATE_ADVANCE: return "CREATE_ADVANCE";
    case MessageType::RECORD_REIMBURSEMENT: return "RECORD_REIMBURSEMENT";
    case MessageType::CANCEL_ADVANCE: return "CANCEL_ADVANCE";
    case MessageType::GET_ADVANCE: return "GET_ADVANCE";
    case MessageType::EMPLOYEE_SUMMARY: return "EMPLOYEE_SUMMARY";
    case MessageType::PENDING_ADVANCES: return "PENDING_ADVANCES";
    case MessageType::LIST_ADVANCES: return "LIST_ADVANCES";
    case MessageType::ADVANCE_SUMMARY: return "ADVANCE_SUMMARY";
    case MessageType::OPEN_CASE: return "OPEN_CASE";
    case MessageType::START_CASE: return "START_CASE";
    case MessageType::RESOLVE_CASE: return "RESOLVE_CASE";
    case MessageType::DISMISS_CASE: return "DISMISS_CASE";
    case MessageType::HOLD_CASE: return "HOLD_CASE";
    case MessageType::REQUIRE_APPROVAL: return "REQUIRE_APPROVAL";
    case MessageType::RELEASE_CASE: return "RELEASE_CASE";
    case MessageType::ESCALATE_CASE: return "ESCALATE_CASE";
    case MessageType::COMMENT_CASE: return "COMMENT_CASE";
    case MessageType::GET_CASE: return "GET_CASE";
    case MessageType::CASE_HISTORY: return "CASE_HISTORY";
    case MessageType::LIST_CASES: return "LIST_CASES";
    case MessageType::ADD_RULE: return "ADD_RULE";
    case MessageType::LIST_RULES: return "LIST_RULES";
    case MessageType::REASON_CODES: return "REASON_CODES";
    case MessageType::RUN_SWEEP: return "RUN_SWEEP";
    case MessageType::GET_ANALYTICS: return "GET_ANALYTICS";
    case MessageType::HEARTBEAT: return "HEARTBEAT";
  }
  return "UNKNOWN";
}

std::string toString(Status status) {
  switch (status) {
    case Status::SUCCESS: return "success";
    case Status::NOT_FOUND: return "not_found";
    case Status::INVALID_STATE: return "invalid_state";
    case Status::ALLOCATION_OVERFLOW: return "allocation_overflow";
    case Status::ALREADY_ALLOCATED: return "already_allocated";
    case Status::INVALID_SPLIT_TYPE: return "invalid_split_type";
    case Status::CONFLICTING_RECONCILIATION_MODE: return "conflicting_reconciliation_mode";
    case Status::CONCURRENCY_CONFLICT: return "concurrency_conflict";
    case Status::RULE_EVALUATION_ERROR: return "rule_evaluation_error";
    case Status::INVALID_REQUEST: return "invalid_request";
    case Status::STORAGE_ERROR: return "storage_error";
    case Status::ERROR: return "error";
  }
  return "error";
}

std::optional<MessageType> parseMessageType(const std::string& value) {
  for (MessageType type : kMessageTypes) {
    if (toString(type) == value) return type;
  }
  return std::nullopt;
}

std::optional<Status> parseStatus(const std::string& value) {
  for (Status status : kStatuses) {
    if (toString(status) == value) return status;
  }
  return std::nullopt;
}

Status statusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::NOT_FOUND: return Status::NOT_FOUND;
    case ErrorCode::INVALID_STATE: return Status::INVALID_STATE;
    case ErrorCode::ALLOCATION_OVERFLOW: return Status::ALLOCATION_OVERFLOW;
    case ErrorCode::ALREADY_ALLOCATED: return Status::ALREADY_ALLOCATED;
    case ErrorCode::INVALID_SPLIT_TYPE: return Status::INVALID_SPLIT_TYPE;
    case ErrorCode::CONFLICTING_RECONCILIATION_MODE: return Status::CONFLICTING_RECONCILIATION_MODE;
    case ErrorCode::CONCURRENCY_CONFLICT: return Status::CONCURRENCY_CONFLICT;
    case ErrorCode::RULE_EVALUATION_ERROR: return Status::RULE_EVALUATION_ERROR;
    case ErrorCode::INVALID_ARGUMENT: return Status::INVALID_REQUEST;
    case ErrorCode::STORAGE_ERROR: return Status::STORAGE_ERROR;
  }
  return Status::ERROR;
}

// Request helper methods
Request Request::make(MessageType type, const std::string& request_id, Timestamp timestamp,
                      const std::string& actor, nlohmann::json payload) {
  Request req;
  req.type = type;
  req.request_id = request_id;
  req.timestamp = timestamp;
  req.actor = actor;
  req.payload = std::move(payload);
  return req;
}

Request Request::heartbeat(Timestamp timestamp, const std::string& actor) {
  return make(MessageType::HEARTBEAT, "", timestamp, actor);
}

// Response helper methods
Response Response::success(const std::string& message, Timestamp timestamp,
                           nlohmann::json payload) {
  Response resp;
  resp.status = Status::SUCCESS;
  resp.message = message;
  resp.timestamp = timestamp;
  resp.payload = std::move(payload);
  return resp;
}

Response Response::error(Status status, const std::string& message, Timestamp timestamp) {
  Response resp;
  resp.status = status;
  resp.message = message;
  resp.timestamp = timestamp;
  resp.payload = nlohmann::json::object();
  return resp;
}

Response Response::fromError(const LedgerError& error, Timestamp timestamp) {
  Response resp = Response::error(statusFor(error.code()), error.what(), timestamp);
  resp.payload["error_code"] = recon::toString(error.code());
  resp.payload["retryable"] = error.isRetryable();
  return resp;
}

// Serialization functions
std::string serializeRequest(const Request& request) {
  nlohmann::json j;
  j["type"] = toString(request.type);
  j["request_id"] = request.request_id;
  j["timestamp"] = request.timestamp;
  j["actor"] = request.actor;
  j["payload"] = request.payload;
  return j.dump();
}

Request deserializeRequest(const std::string& json_str) {
  nlohmann::json j = parseObject(json_str);

  Request req;
  try {
    std::string type = j.at("type").get<std::string>();
    auto parsed = parseMessageType(type);
    if (!parsed) {
      throw malformed("unknown message type " + type);
    }
    req.type = *parsed;
    req.request_id = j.value("request_id", std::string());
    req.timestamp = j.value("timestamp", Timestamp{0});
    req.actor = j.value("actor", std::string());
    req.payload = j.value("payload", nlohmann::json::object());
  } catch (const nlohmann::json::exception& e) {
    throw malformed(e.what());
  }
  if (!req.payload.is_object()) {
    throw malformed("payload must be an object");
  }
  return req;
}

std::string serializeResponse(const Response& response) {
  nlohmann::json j;
  j["status"] = toString(response.status);
  j["message"] = response.message;
  j["timestamp"] = response.timestamp;
  j["payload"] = response.payload;
  return j.dump();
}

Response deserializeResponse(const std::string& json_str) {
  nlohmann::json j = parseObject(json_str);

  Response resp;
  try {
    std::string status = j.at("status").get<std::string>();
    resp.status = parseStatus(status).value_or(Status::ERROR);
    resp.message = j.value("message", std::string());
    resp.timestamp = j.value("timestamp", Timestamp{0});
    resp.payload = j.value("payload", nlohmann::json::object());
  } catch (const nlohmann::json::exception& e) {
    throw malformed(e.what());
  }
  return resp;
}

// Message framing implementation
std::string MessageFramer::frameMessage(const std::string& message) {
  std::stringstream ss;
  ss << std::setw(kHeaderSize) << std::setfill('0') << std::hex << message.size();
  ss << message;
  return ss.str();
}

std::string MessageFramer::unframeMessage(const std::string& framed_message) {
  if (framed_message.size() < kHeaderSize) {
    throw std::runtime_error("Invalid framed message: too short");
  }

  size_t message_size = readHeader(framed_message);
  if (framed_message.size() < kHeaderSize + message_size) {
    throw std::runtime_error("Invalid framed message: incomplete");
  }

  return framed_message.substr(kHeaderSize, message_size);
}

bool MessageFramer::isCompleteMessage(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) return false;
  return buffer.size() >= kHeaderSize + readHeader(buffer);
}

size_t MessageFramer::framedSize(const std::string& buffer) {
  if (buffer.size() < kHeaderSize) {
    throw std::runtime_error("Invalid framed message: too short");
  }
  return kHeaderSize + readHeader(buffer);
}

}  // namespace protocol
}  // namespace network
}  // namespace recon
