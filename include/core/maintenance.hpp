#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fleet_hub::core {

struct MaintenanceStats {
  std::size_t runs{0};
  std::size_t failures{0};
};

// Periodic housekeeping on one background thread. A failing task is logged
// and retried at its next due time.
class MaintenanceWorker {
 public:
  using TaskFn = std::function<void(std::int64_t now_ms)>;

  MaintenanceWorker() = default;
  ~MaintenanceWorker();

  MaintenanceWorker(const MaintenanceWorker&) = delete;
  MaintenanceWorker& operator=(const MaintenanceWorker&) = delete;

  void add_task(std::string name, std::chrono::milliseconds every, TaskFn run, std::int64_t first_due_ms = 0);

  // Runs every task due at `now_ms`; returns how many ran.
  std::size_t run_due(std::int64_t now_ms);

  void start(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));
  void stop();

  [[nodiscard]] MaintenanceStats stats() const;
  [[nodiscard]] std::vector<std::string> task_names() const;

 private:
  struct TaskRegistration {
    std::string name;
    std::chrono::milliseconds every;
    TaskFn run;
    std::int64_t next_due_ms;
  };

  mutable std::mutex mutex_;
  std::condition_variable wakeup_;
  std::vector<TaskRegistration> tasks_{};
  MaintenanceStats stats_{};
  bool running_{false};
  std::thread thread_{};
};

}  // namespace fleet_hub::core
