#ifndef LEDGER_SERVER_HPP_
#define LEDGER_SERVER_HPP_

#include "advances/advance_ledger.hpp"
#include "allocation/allocation_engine.hpp"
#include "analytics/analytics_aggregator.hpp"
#include "concurrent/periodic_scheduler.hpp"
#include "config/ledger_config.hpp"
#include "escalation/escalation_engine.hpp"
#include "ledger_store.hpp"
#include "network/protocol.hpp"
#include "network/tcp_server.hpp"
#include "notifications/notification_dispatcher.hpp"

#include <memory>
#include <string>

namespace recon {

/**
 * Builds the store selected by the configuration: PostgreSQL when
 * `database.enabled`, otherwise in memory.
 * Throws LedgerError(STORAGE_ERROR) if the database cannot be reached or
 * the schema cannot be applied.
 */
std::unique_ptr<LedgerStore> createLedgerStore(const config::LedgerConfig& config);

/**
 * Main ledger server that integrates all components.
 * Handles client connections, routes requests to the engines and runs the
 * escalation sweep and analytics rollup on a schedule.
 */
class LedgerServer {
 public:
  LedgerServer(const config::LedgerConfig& config, std::unique_ptr<LedgerStore> store);
  ~LedgerServer();

  // Non-copyable
  LedgerServer(const LedgerServer&) = delete;
  LedgerServer& operator=(const LedgerServer&) = delete;

  /**
   * Start the dispatcher, the scheduler and the TCP listener.
   */
  bool start();

  /**
   * Stop every component in reverse order.
   */
  void stop();

  /**
   * Get server statistics.
   */
  struct Stats {
    bool is_running;
    size_t active_connections;
    notifications::NotificationDispatcher::Stats notification_stats;
    concurrent::PeriodicScheduler::Stats scheduler_stats;
  };
  Stats getStats() const;

  /**
   * Get server port (the bound port once started).
   */
  int getPort() const;

  /**
   * Handle one serialized request and return the serialized response.
   * Never throws; failures become error responses.
   */
  std::string handleRequest(const std::string& request_json);

  /**
   * Routes a decoded request. LedgerError propagates to the caller.
   */
  network::protocol::Response dispatch(const network::protocol::Request& request);

  allocation::AllocationEngine& allocation() { return *allocation_; }
  advances::AdvanceLedger& advances() { return *advances_; }
  escalation::EscalationEngine& escalation() { return *escalation_; }
  analytics::AnalyticsAggregator& analytics() { return *analytics_; }
  notifications::NotificationDispatcher& dispatcher() { return *dispatcher_; }
  LedgerStore& store() { return *store_; }

 private:
  using Request = network::protocol::Request;
  using Response = network::protocol::Response;

  Response handleLedger(const Request& request, Timestamp now);
  Response handleSplit(const Request& request, Timestamp now);
  Response handleAdvance(const Request& request, Timestamp now);
  Response handleCase(const Request& request, Timestamp now);

  /**
   * Closes open cases of a subject that an operation just settled.
   * Failures are left to the next sweep.
   */
  void supersede(SubjectKind kind, const std::string& subject_id, const std::string& actor,
                 Timestamp now);

  void scheduleBackgroundTasks();

  config::LedgerConfig config_;

  // Core components
  std::unique_ptr<LedgerStore> store_;
  std::unique_ptr<notifications::NotificationDispatcher> dispatcher_;
  std::unique_ptr<allocation::AllocationEngine> allocation_;
  std::unique_ptr<advances::AdvanceLedger> advances_;
  std::unique_ptr<escalation::EscalationEngine> escalation_;
  std::unique_ptr<analytics::AnalyticsAggregator> analytics_;
  std::unique_ptr<concurrent::PeriodicScheduler> scheduler_;
  std::unique_ptr<network::TCPServer> tcp_server_;
};

}  // namespace recon

#endif  // LEDGER_SERVER_HPP_
