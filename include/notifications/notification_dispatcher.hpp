#ifndef NOTIFICATION_DISPATCHER_HPP_
#define NOTIFICATION_DISPATCHER_HPP_

#include "concurrent/lockfree_queue.hpp"
#include "ledger_types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace recon {
namespace notifications {

enum class RecipientType {
  USER,
  ROLE,
  EMAIL,
  WEBHOOK
};

enum class NotificationType {
  ESCALATION_OCCURRED,
  STATUS_CHANGE,
  APPROVAL_REQUESTED
};

std::string toString(RecipientType type);
std::string toString(NotificationType type);
std::optional<RecipientType> parseRecipientType(const std::string& value);

struct NotificationRecipient {
  RecipientType type = RecipientType::ROLE;
  std::string identifier;
};

/**
 * Outbound notification handed to the external delivery channel.
 */
struct NotificationRequest {
  NotificationType type = NotificationType::STATUS_CHANGE;
  NotificationRecipient recipient;
  std::string template_id;
  nlohmann::json payload;
  std::string case_id;
  Timestamp created_at = 0;
};

/**
 * Fire-and-forget sink used by the escalation engine.
 * enqueue() must not block on delivery.
 */
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;
  virtual void enqueue(NotificationRequest request) = 0;
};

/**
 * Queues notification requests and delivers them from a worker thread.
 * Delivery failures are logged and counted, never propagated to producers.
 */
class NotificationDispatcher : public NotificationSink {
 public:
  using DeliveryCallback = std::function<void(const NotificationRequest&)>;

  explicit NotificationDispatcher(DeliveryCallback delivery = nullptr);
  ~NotificationDispatcher() override;

  // Non-copyable
  NotificationDispatcher(const NotificationDispatcher&) = delete;
  NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

  /**
   * Start the delivery worker.
   */
  bool start();

  /**
   * Stop the worker and deliver whatever is still queued.
   */
  void stop();

  /**
   * Queue a request (thread-safe for multiple producers).
   */
  void enqueue(NotificationRequest request) override;

  /**
   * Set the delivery channel.
   */
  void setDeliveryCallback(DeliveryCallback delivery);

  /**
   * Deliver everything queued on the calling thread.
   * Only valid while the worker is stopped; returns the number delivered.
   */
  size_t drain();

  bool isRunning() const { return running_.load(); }

  struct Stats {
    size_t enqueued;
    size_t delivered;
    size_t failed;
    size_t queue_size;
  };
  Stats getStats() const;

 private:
  void deliveryWorker();
  bool deliver(const NotificationRequest& request);

  concurrent::LockFreeQueue<NotificationRequest> queue_;
  std::unique_ptr<std::thread> worker_thread_;
  std::atomic<bool> running_;

  DeliveryCallback delivery_;
  std::mutex delivery_mutex_;

  std::atomic<size_t> enqueued_;
  std::atomic<size_t> delivered_;
  std::atomic<size_t> failed_;
};

}  // namespace notifications
}  // namespace recon

#endif  // NOTIFICATION_DISPATCHER_HPP_
