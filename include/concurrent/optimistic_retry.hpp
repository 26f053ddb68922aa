#ifndef OPTIMISTIC_RETRY_HPP_
#define OPTIMISTIC_RETRY_HPP_

#include "ledger_errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <string>

namespace recon {
namespace concurrent {

/**
 * Runs `attempt` until it succeeds, retrying from scratch on
 * CONCURRENCY_CONFLICT up to `max_attempts` times. Every other error
 * propagates immediately. `attempt` must re-read whatever it depends on.
 */
template <typename Fn>
auto retryOnConflict(const std::string& operation, const std::string& correlation_id,
                     int max_attempts, Fn&& attempt) -> decltype(attempt()) {
  for (int tries = 1;; ++tries) {
    try {
      return attempt();
    } catch (const LedgerError& e) {
      if (!e.isRetryable()) throw;

      observability::getGlobalMetrics().incrementCounter("recon_concurrency_conflicts_total");
      if (tries >= max_attempts) {
        LOG_BUILDER(observability::LogLevel::WARN, "Giving up after concurrency conflicts")
            .correlation(correlation_id)
            .field("operation", operation)
            .field("attempts", tries);
        throw;
      }
      LOG_BUILDER(observability::LogLevel::DEBUG, "Concurrency conflict, retrying")
          .correlation(correlation_id)
          .field("operation", operation)
          .field("attempt", tries)
          .field("reason", e.what());
    }
  }
}

}  // namespace concurrent
}  // namespace recon

#endif  // OPTIMISTIC_RETRY_HPP_
