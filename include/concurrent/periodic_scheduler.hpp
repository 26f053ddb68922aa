#ifndef PERIODIC_SCHEDULER_HPP_
#define PERIODIC_SCHEDULER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace recon {
namespace concurrent {

/**
 * Runs named recurring tasks (escalation sweep, analytics rollup) on one
 * background thread. A task that throws is logged and counted; it keeps its
 * schedule.
 */
class PeriodicScheduler {
 public:
  using Task = std::function<void()>;

  PeriodicScheduler();
  ~PeriodicScheduler();

  // Non-copyable
  PeriodicScheduler(const PeriodicScheduler&) = delete;
  PeriodicScheduler& operator=(const PeriodicScheduler&) = delete;

  /**
   * Register a task. The first run happens one interval after start().
   * Returns false if the name is taken or the interval is not positive.
   */
  bool addTask(const std::string& name, std::chrono::milliseconds interval, Task task);

  /**
   * Start the scheduler thread.
   */
  bool start();

  /**
   * Stop the scheduler thread; a task already running finishes first.
   */
  void stop();

  /**
   * Run a task immediately on the calling thread.
   */
  bool runNow(const std::string& name);

  bool isRunning() const { return running_.load(); }

  struct Stats {
    size_t tasks;
    size_t runs;
    size_t failures;
  };
  Stats getStats() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct ScheduledTask {
    std::string name;
    std::chrono::milliseconds interval;
    Task task;
    Clock::time_point next_run;
    std::mutex run_mutex;  // one run of a task at a time
  };

  void schedulerThread();
  void execute(ScheduledTask& task);

  std::vector<std::unique_ptr<ScheduledTask>> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;

  std::unique_ptr<std::thread> thread_;
  std::atomic<bool> running_;

  std::atomic<size_t> runs_;
  std::atomic<size_t> failures_;
};

}  // namespace concurrent
}  // namespace recon

#endif  // PERIODIC_SCHEDULER_HPP_
