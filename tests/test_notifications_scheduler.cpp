#include "concurrent/lockfree_queue.hpp"
#include "concurrent/periodic_scheduler.hpp"
#include "notifications/notification_dispatcher.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace recon;
using namespace recon::notifications;
using namespace std::chrono_literals;

namespace {

NotificationRequest escalationNotice(const std::string& case_id, const std::string& role) {
  NotificationRequest request;
  request.type = NotificationType::ESCALATION_OCCURRED;
  request.recipient.type = RecipientType::ROLE;
  request.recipient.identifier = role;
  request.template_id = "case_escalated";
  request.case_id = case_id;
  request.payload = {{"escalation_level", 2}};
  return request;
}

// Polls until the predicate holds or two seconds pass.
template <typename Predicate>
bool waitFor(Predicate predicate) {
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

}  // namespace

TEST(LockFreeQueueTest, BasicOperations) {
  concurrent::LockFreeQueue<int> queue;

  queue.enqueue(42);
  queue.enqueue(24);
  EXPECT_EQ(queue.size(), 2u);

  auto first = queue.dequeue();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 42);

  auto second = queue.dequeue();
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*second, 24);

  EXPECT_FALSE(queue.dequeue().has_value());
  EXPECT_TRUE(queue.empty());
}

TEST(LockFreeQueueTest, ManyProducersOneConsumer) {
  concurrent::LockFreeQueue<int> queue;
  const int num_producers = 4;
  const int items_per_producer = 1000;
  const int total = num_producers * items_per_producer;

  std::vector<std::thread> producers;
  for (int p = 0; p < num_producers; ++p) {
    producers.emplace_back([&queue, p]() {
      for (int i = 0; i < items_per_producer; ++i) {
        queue.enqueue(p * items_per_producer + i);
      }
    });
  }

  // Items of one producer arrive in the order it enqueued them
  std::vector<int> last_seen(num_producers, -1);
  int consumed = 0;
  bool ordered = true;
  while (consumed < total) {
    if (auto item = queue.dequeue()) {
      int producer = *item / items_per_producer;
      if (*item <= last_seen[producer]) ordered = false;
      last_seen[producer] = *item;
      consumed++;
    } else {
      std::this_thread::yield();
    }
  }

  for (auto& t : producers) t.join();
  EXPECT_TRUE(ordered);
  EXPECT_EQ(consumed, total);
  EXPECT_TRUE(queue.empty());
}

TEST(NotificationDispatcherTest, WireNames) {
  EXPECT_EQ(toString(RecipientType::WEBHOOK), "webhook");
  EXPECT_EQ(toString(NotificationType::APPROVAL_REQUESTED), "approval_requested");
  EXPECT_EQ(parseRecipientType("email"), RecipientType::EMAIL);
  EXPECT_FALSE(parseRecipientType("pager").has_value());
}

TEST(NotificationDispatcherTest, DrainDeliversQueuedRequests) {
  std::vector<std::string> delivered;
  NotificationDispatcher dispatcher([&](const NotificationRequest& request) {
    delivered.push_back(request.recipient.identifier);
  });

  dispatcher.enqueue(escalationNotice("nrc-1", "accounting_team"));
  dispatcher.enqueue(escalationNotice("nrc-2", "finance_supervisor"));

  EXPECT_EQ(dispatcher.getStats().queue_size, 2u);
  EXPECT_EQ(dispatcher.drain(), 2u);
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[0], "accounting_team");
  EXPECT_EQ(delivered[1], "finance_supervisor");

  auto stats = dispatcher.getStats();
  EXPECT_EQ(stats.enqueued, 2u);
  EXPECT_EQ(stats.delivered, 2u);
  EXPECT_EQ(stats.failed, 0u);
  EXPECT_EQ(stats.queue_size, 0u);
}

TEST(NotificationDispatcherTest, FailedDeliveryIsCountedNotPropagated) {
  NotificationDispatcher dispatcher([](const NotificationRequest& request) {
    if (request.case_id == "nrc-bad") throw std::runtime_error("webhook unreachable");
  });

  dispatcher.enqueue(escalationNotice("nrc-bad", "accounting_team"));
  dispatcher.enqueue(escalationNotice("nrc-good", "accounting_team"));

  EXPECT_NO_THROW(EXPECT_EQ(dispatcher.drain(), 1u));
  auto stats = dispatcher.getStats();
  EXPECT_EQ(stats.delivered, 1u);
  EXPECT_EQ(stats.failed, 1u);
}

TEST(NotificationDispatcherTest, WorkerDeliversFromManyProducers) {
  std::atomic<int> delivered{0};
  NotificationDispatcher dispatcher([&](const NotificationRequest&) { delivered++; });
  ASSERT_TRUE(dispatcher.start());
  EXPECT_TRUE(dispatcher.isRunning());
  EXPECT_EQ(dispatcher.drain(), 0u);

  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t) {
    producers.emplace_back([&dispatcher, t]() {
      for (int i = 0; i < 25; ++i) {
        dispatcher.enqueue(escalationNotice("nrc-" + std::to_string(t) + "-" +
                                            std::to_string(i), "case_owner"));
      }
    });
  }
  for (auto& producer : producers) producer.join();

  EXPECT_TRUE(waitFor([&]() { return delivered.load() == 100; }));
  dispatcher.stop();
  EXPECT_FALSE(dispatcher.isRunning());
  EXPECT_EQ(dispatcher.getStats().delivered, 100u);
}

TEST(NotificationDispatcherTest, StopFlushesTheQueue) {
  std::atomic<int> delivered{0};
  NotificationDispatcher dispatcher;
  ASSERT_TRUE(dispatcher.start());
  dispatcher.setDeliveryCallback([&](const NotificationRequest&) { delivered++; });

  for (int i = 0; i < 10; ++i) {
    dispatcher.enqueue(escalationNotice("nrc-" + std::to_string(i), "case_owner"));
  }
  dispatcher.stop();

  EXPECT_EQ(delivered.load(), 10);
  EXPECT_EQ(dispatcher.getStats().queue_size, 0u);
}

TEST(PeriodicSchedulerTest, RejectsInvalidTasks) {
  concurrent::PeriodicScheduler scheduler;
  EXPECT_TRUE(scheduler.addTask("sweep", 100ms, []() {}));
  EXPECT_FALSE(scheduler.addTask("sweep", 100ms, []() {}));
  EXPECT_FALSE(scheduler.addTask("rollup", 0ms, []() {}));
  EXPECT_FALSE(scheduler.addTask("rollup", 100ms, nullptr));
  EXPECT_EQ(scheduler.getStats().tasks, 1u);
}

TEST(PeriodicSchedulerTest, RunNowExecutesOnCaller) {
  concurrent::PeriodicScheduler scheduler;
  int runs = 0;
  scheduler.addTask("rollup", std::chrono::milliseconds(60000), [&runs]() { runs++; });

  EXPECT_TRUE(scheduler.runNow("rollup"));
  EXPECT_TRUE(scheduler.runNow("rollup"));
  EXPECT_FALSE(scheduler.runNow("missing"));
  EXPECT_EQ(runs, 2);
  EXPECT_EQ(scheduler.getStats().runs, 2u);
}

TEST(PeriodicSchedulerTest, ThrowingTaskKeepsItsSchedule) {
  concurrent::PeriodicScheduler scheduler;
  std::atomic<int> attempts{0};
  scheduler.addTask("sweep", 10ms, [&attempts]() {
    attempts++;
    throw std::runtime_error("store unavailable");
  });

  ASSERT_TRUE(scheduler.start());
  EXPECT_TRUE(waitFor([&]() { return attempts.load() >= 3; }));
  scheduler.stop();

  EXPECT_FALSE(scheduler.isRunning());
  EXPECT_GE(scheduler.getStats().failures, 3u);
}

TEST(PeriodicSchedulerTest, TasksRunOnTheirOwnIntervals) {
  concurrent::PeriodicScheduler scheduler;
  std::atomic<int> fast{0};
  std::atomic<int> slow{0};
  scheduler.addTask("fast", 10ms, [&fast]() { fast++; });
  scheduler.addTask("slow", std::chrono::milliseconds(60000), [&slow]() { slow++; });

  ASSERT_TRUE(scheduler.start());
  EXPECT_TRUE(waitFor([&]() { return fast.load() >= 5; }));
  scheduler.stop();

  EXPECT_EQ(slow.load(), 0);
}
