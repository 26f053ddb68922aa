#include "notification_dispatcher.hpp"

#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <chrono>

namespace recon {
namespace notifications {

using observability::LogLevel;

std::string toString(RecipientType type) {
  switch (type) {
    case RecipientType::USER: return "user";
    case RecipientType::ROLE: return "role";
    case RecipientType::EMAIL: return "email";
    case RecipientType::WEBHOOK: return "webhook";
  }
  return "unknown";
}

std::string toString(NotificationType type) {
  switch (type) {
    case NotificationType::ESCALATION_OCCURRED: return "escalation_occurred";
    case NotificationType::STATUS_CHANGE: return "status_change";
    case NotificationType::APPROVAL_REQUESTED: return "approval_requested";
  }
  return "unknown";
}

std::optional<RecipientType> parseRecipientType(const std::string& value) {
  if (value == "user") return RecipientType::USER;
  if (value == "role") return RecipientType::ROLE;
  if (value == "email") return RecipientType::EMAIL;
  if (value == "webhook") return RecipientType::WEBHOOK;
  return std::nullopt;
}

NotificationDispatcher::NotificationDispatcher(DeliveryCallback delivery)
    : running_(false),
      delivery_(std::move(delivery)),
      enqueued_(0),
      delivered_(0),
      failed_(0) {
}

NotificationDispatcher::~NotificationDispatcher() {
  stop();
}

bool NotificationDispatcher::start() {
  if (running_) return true;

  running_ = true;
  worker_thread_ = std::make_unique<std::thread>(&NotificationDispatcher::deliveryWorker, this);

  LOG_INFO("Notification dispatcher started");
  return true;
}

void NotificationDispatcher::stop() {
  if (!running_) return;

  running_ = false;
  if (worker_thread_ && worker_thread_->joinable()) {
    worker_thread_->join();
  }
  worker_thread_.reset();

  size_t flushed = drain();
  LOG_BUILDER(LogLevel::INFO, "Notification dispatcher stopped")
      .field("flushed", static_cast<uint64_t>(flushed));
}

void NotificationDispatcher::enqueue(NotificationRequest request) {
  queue_.enqueue(std::move(request));
  enqueued_.fetch_add(1);
  observability::getGlobalMetrics().incrementCounter("recon_notifications_enqueued_total");
}

void NotificationDispatcher::setDeliveryCallback(DeliveryCallback delivery) {
  std::lock_guard<std::mutex> lock(delivery_mutex_);
  delivery_ = std::move(delivery);
}

size_t NotificationDispatcher::drain() {
  if (running_) return 0;

  size_t count = 0;
  while (auto request = queue_.dequeue()) {
    if (deliver(*request)) ++count;
  }
  return count;
}

NotificationDispatcher::Stats NotificationDispatcher::getStats() const {
  Stats stats;
  stats.enqueued = enqueued_.load();
  stats.delivered = delivered_.load();
  stats.failed = failed_.load();
  stats.queue_size = queue_.size();
  return stats;
}

void NotificationDispatcher::deliveryWorker() {
  while (running_) {
    auto request = queue_.dequeue();
    if (!request.has_value()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    deliver(*request);
  }
}

bool NotificationDispatcher::deliver(const NotificationRequest& request) {
  DeliveryCallback delivery;
  {
    std::lock_guard<std::mutex> lock(delivery_mutex_);
    delivery = delivery_;
  }

  try {
    if (delivery) {
      delivery(request);
    } else {
      LOG_BUILDER(LogLevel::INFO, "Notification request")
          .field("type", toString(request.type))
          .field("recipient_type", toString(request.recipient.type))
          .field("recipient", request.recipient.identifier)
          .field("template", request.template_id)
          .field("case_id", request.case_id);
    }
    delivered_.fetch_add(1);
    return true;
  } catch (const std::exception& e) {
    failed_.fetch_add(1);
    observability::getGlobalMetrics().incrementCounter("recon_notifications_failed_total");
    LOG_BUILDER(LogLevel::ERROR, "Notification delivery failed")
        .field("case_id", request.case_id)
        .field("recipient", request.recipient.identifier)
        .field("error", e.what());
    return false;
  }
}

}  // namespace notifications
}  // namespace recon
