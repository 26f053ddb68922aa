#include "periodic_scheduler.hpp"

#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>

namespace recon {
namespace concurrent {

using observability::LogLevel;

PeriodicScheduler::PeriodicScheduler()
    : running_(false),
      runs_(0),
      failures_(0) {
}

PeriodicScheduler::~PeriodicScheduler() {
  stop();
}

bool PeriodicScheduler::addTask(const std::string& name, std::chrono::milliseconds interval,
                                Task task) {
  if (interval.count() <= 0 || !task) return false;

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& existing : tasks_) {
    if (existing->name == name) return false;
  }

  auto scheduled = std::make_unique<ScheduledTask>();
  scheduled->name = name;
  scheduled->interval = interval;
  scheduled->task = std::move(task);
  scheduled->next_run = Clock::now() + interval;
  tasks_.push_back(std::move(scheduled));
  wake_.notify_all();
  return true;
}

bool PeriodicScheduler::start() {
  if (running_) return true;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    for (auto& task : tasks_) {
      task->next_run = now + task->interval;
    }
    running_ = true;
  }

  thread_ = std::make_unique<std::thread>(&PeriodicScheduler::schedulerThread, this);
  LOG_BUILDER(LogLevel::INFO, "Periodic scheduler started")
      .field("tasks", static_cast<uint64_t>(getStats().tasks));
  return true;
}

void PeriodicScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
  }
  wake_.notify_all();

  if (thread_ && thread_->joinable()) {
    thread_->join();
  }
  thread_.reset();
  LOG_INFO("Periodic scheduler stopped");
}

bool PeriodicScheduler::runNow(const std::string& name) {
  ScheduledTask* target = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : tasks_) {
      if (task->name == name) {
        target = task.get();
        break;
      }
    }
  }
  if (!target) return false;

  execute(*target);
  return true;
}

PeriodicScheduler::Stats PeriodicScheduler::getStats() const {
  Stats stats;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats.tasks = tasks_.size();
  }
  stats.runs = runs_.load();
  stats.failures = failures_.load();
  return stats;
}

void PeriodicScheduler::schedulerThread() {
  std::unique_lock<std::mutex> lock(mutex_);

  while (running_) {
    if (tasks_.empty()) {
      wake_.wait(lock);
      continue;
    }

    auto next = std::min_element(tasks_.begin(), tasks_.end(),
                                 [](const auto& a, const auto& b) {
                                   return a->next_run < b->next_run;
                                 });
    ScheduledTask* due = next->get();

    if (Clock::now() < due->next_run) {
      wake_.wait_until(lock, due->next_run);
      continue;
    }

    due->next_run = Clock::now() + due->interval;
    lock.unlock();
    execute(*due);
    lock.lock();
  }
}

void PeriodicScheduler::execute(ScheduledTask& task) {
  std::lock_guard<std::mutex> run_lock(task.run_mutex);
  runs_.fetch_add(1);

  try {
    task.task();
  } catch (const std::exception& e) {
    failures_.fetch_add(1);
    observability::getGlobalMetrics().incrementCounter("recon_scheduled_task_failures_total");
    LOG_BUILDER(LogLevel::ERROR, "Scheduled task failed")
        .field("task", task.name)
        .field("error", e.what());
  }
}

}  // namespace concurrent
}  // namespace recon
