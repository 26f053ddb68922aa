#include "ledger_errors.hpp"

namespace recon {

std::string toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NOT_FOUND: return "NOT_FOUND";
    case ErrorCode::INVALID_STATE: return "INVALID_STATE";
    case ErrorCode::ALLOCATION_OVERFLOW: return "ALLOCATION_OVERFLOW";
    case ErrorCode::ALREADY_ALLOCATED: return "ALREADY_ALLOCATED";
    case ErrorCode::INVALID_SPLIT_TYPE: return "INVALID_SPLIT_TYPE";
    case ErrorCode::CONFLICTING_RECONCILIATION_MODE: return "CONFLICTING_RECONCILIATION_MODE";
    case ErrorCode::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
    case ErrorCode::RULE_EVALUATION_ERROR: return "RULE_EVALUATION_ERROR";
    case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
    case ErrorCode::STORAGE_ERROR: return "STORAGE_ERROR";
  }
  return "UNKNOWN";
}

}  // namespace recon
