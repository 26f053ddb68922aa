#ifndef LEDGER_ERRORS_HPP_
#define LEDGER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace recon {

enum class ErrorCode {
  NOT_FOUND,
  INVALID_STATE,
  ALLOCATION_OVERFLOW,
  ALREADY_ALLOCATED,
  INVALID_SPLIT_TYPE,
  CONFLICTING_RECONCILIATION_MODE,
  CONCURRENCY_CONFLICT,
  RULE_EVALUATION_ERROR,
  INVALID_ARGUMENT,
  STORAGE_ERROR
};

std::string toString(ErrorCode code);

/**
 * Error raised by the ledger and its engines.
 * Only CONCURRENCY_CONFLICT is retryable; everything else is a validation
 * or storage failure that the caller must handle.
 */
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const { return code_; }
  bool isRetryable() const { return code_ == ErrorCode::CONCURRENCY_CONFLICT; }

 private:
  ErrorCode code_;
};

}  // namespace recon

#endif  // LEDGER_ERRORS_HPP_
