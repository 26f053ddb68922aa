#ifndef PROTOCOL_HPP_
#define PROTOCOL_HPP_

#include "ledger_errors.hpp"
#include "ledger_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace recon {
namespace network {
namespace protocol {

// Message types
enum class MessageType {
  IMPORT_MOVEMENT,
  IMPORT_EXPENSE,
  CANCEL_MOVEMENT,
  GET_MOVEMENT,
  GET_EXPENSE,
  PROPOSE_SPLIT,
  REVISE_SPLIT,
  FINALIZE_SPLIT,
  REJECT_SPLIT,
  ANNOTATE_SPLIT,
  GET_SPLIT,
  LIST_SPLITS,
  SPLIT_SUMMARY,
  CREATE_ADVANCE,
  RECORD_REIMBURSEMENT,
  CANCEL_ADVANCE,
  GET_ADVANCE,
  EMPLOYEE_SUMMARY,
  PENDING_ADVANCES,
  LIST_ADVANCES,
  ADVANCE_SUMMARY,
  OPEN_CASE,
  START_CASE,
  RESOLVE_CASE,
  DISMISS_CASE,
  HOLD_CASE,
  REQUIRE_APPROVAL,
  RELEASE_CASE,
  ESCALATE_CASE,
  COMMENT_CASE,
  GET_CASE,
  CASE_HISTORY,
  LIST_CASES,
  ADD_RULE,
  LIST_RULES,
  REASON_CODES,
  RUN_SWEEP,
  GET_ANALYTICS,
  HEARTBEAT
};

// Response status, one per error code plus success
enum class Status {
  SUCCESS,
  NOT_FOUND,
  INVALID_STATE,
  ALLOCATION_OVERFLOW,
  ALREADY_ALLOCATED,
  INVALID_SPLIT_TYPE,
  CONFLICTING_RECONCILIATION_MODE,
  CONCURRENCY_CONFLICT,
  RULE_EVALUATION_ERROR,
  INVALID_REQUEST,
  STORAGE_ERROR,
  ERROR
};

std::string toString(MessageType type);
std::string toString(Status status);
std::optional<MessageType> parseMessageType(const std::string& value);
std::optional<Status> parseStatus(const std::string& value);

Status statusFor(ErrorCode code);

struct Request {
  MessageType type = MessageType::HEARTBEAT;
  std::string request_id;  // doubles as the operation id of mutating requests
  Timestamp timestamp = 0;
  std::string actor;
  nlohmann::json payload = nlohmann::json::object();

  static Request make(MessageType type, const std::string& request_id, Timestamp timestamp,
                      const std::string& actor,
                      nlohmann::json payload = nlohmann::json::object());

  static Request heartbeat(Timestamp timestamp, const std::string& actor);
};

struct Response {
  Status status = Status::SUCCESS;
  std::string message;
  Timestamp timestamp = 0;
  nlohmann::json payload = nlohmann::json::object();

  static Response success(const std::string& message, Timestamp timestamp,
                          nlohmann::json payload = nlohmann::json::object());

  static Response error(Status status, const std::string& message, Timestamp timestamp);

  static Response fromError(const LedgerError& error, Timestamp timestamp);
};

// Serialization functions; malformed input raises LedgerError(INVALID_ARGUMENT)
std::string serializeRequest(const Request& request);
Request deserializeRequest(const std::string& json_str);

std::string serializeResponse(const Response& response);
Response deserializeResponse(const std::string& json_str);

// Message framing for TCP transport: 8 hex digits of length, then the body
class MessageFramer {
 public:
  static constexpr size_t kHeaderSize = 8;

  static std::string frameMessage(const std::string& message);
  static std::string unframeMessage(const std::string& framed_message);
  static bool isCompleteMessage(const std::string& buffer);

  /** Header plus body size of the first message in `buffer`. */
  static size_t framedSize(const std::string& buffer);
};

}  // namespace protocol
}  // namespace network
}  // namespace recon

#endif  // PROTOCOL_HPP_
