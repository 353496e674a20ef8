#include "core/maintenance.hpp"

#include <iostream>
#include <stdexcept>

#include "core/timestamp.hpp"

namespace fleet_hub::core {

MaintenanceWorker::~MaintenanceWorker() { stop(); }

void MaintenanceWorker::add_task(std::string name, const std::chrono::milliseconds every, TaskFn run,
                                 const std::int64_t first_due_ms) {
  if (every.count() <= 0) {
    throw std::invalid_argument("maintenance task interval must be positive: " + name);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.push_back(TaskRegistration{
      .name = std::move(name), .every = every, .run = std::move(run), .next_due_ms = first_due_ms});
}

std::size_t MaintenanceWorker::run_due(const std::int64_t now_ms) {
  std::vector<std::size_t> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < tasks_.size(); ++i) {
      if (tasks_[i].next_due_ms <= now_ms) {
        tasks_[i].next_due_ms = now_ms + tasks_[i].every.count();
        due.push_back(i);
      }
    }
  }

  // Tasks are only ever appended, so indices stay valid outside the lock.
  for (const auto index : due) {
    TaskFn run;
    std::string name;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      run = tasks_[index].run;
      name = tasks_[index].name;
    }

    bool failed = false;
    try {
      run(now_ms);
    } catch (const std::exception& ex) {
      failed = true;
      std::cerr << "[maintenance] task " << name << " failed: " << ex.what() << '\n';
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.runs;
    if (failed) {
      ++stats_.failures;
    }
  }
  return due.size();
}

void MaintenanceWorker::start(const std::chrono::milliseconds poll_interval) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
  }

  thread_ = std::thread([this, poll_interval] {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      lock.unlock();
      run_due(unix_timestamp_now_ms());
      lock.lock();
      wakeup_.wait_for(lock, poll_interval, [this] { return !running_; });
    }
  });
}

void MaintenanceWorker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wakeup_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

MaintenanceStats MaintenanceWorker::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::vector<std::string> MaintenanceWorker::task_names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(tasks_.size());
  for (const auto& task : tasks_) {
    names.push_back(task.name);
  }
  return names;
}

}  // namespace fleet_hub::core
