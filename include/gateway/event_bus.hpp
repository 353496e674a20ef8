#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "model/agent.hpp"
#include "model/metrics.hpp"

namespace fleet_hub::gateway {

enum class EventKind : std::uint8_t {
  AGENT_ONLINE = 0,
  AGENT_OFFLINE = 1,
  METRICS_UPDATED = 2,
};

// Notification method name pushed to subscribers.
const char* event_kind_name(EventKind kind) noexcept;

struct HubEvent {
  EventKind kind{EventKind::METRICS_UPDATED};
  std::string agent_id{};
  std::int64_t timestamp_ms{0};
  std::optional<model::AgentInfo> agent{};
  std::optional<model::MetricSnapshot> snapshot{};
};

enum class OverflowPolicy : std::uint8_t {
  DROP_OLDEST = 0,
  DISCONNECT = 1,
};

// Bounded per-subscriber queue. offer() never blocks.
class Subscription {
 public:
  Subscription(std::size_t capacity, OverflowPolicy policy);

  // nullopt on timeout or once closed and drained.
  std::optional<HubEvent> next(std::chrono::milliseconds timeout);
  // false once the subscription is closed.
  bool offer(const HubEvent& event);
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::uint64_t dropped() const;
  [[nodiscard]] std::size_t pending() const;

 private:
  const std::size_t capacity_;
  const OverflowPolicy policy_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<HubEvent> queue_{};
  std::uint64_t dropped_{0};
  bool closed_{false};
};

class EventBus {
 public:
  EventBus(std::size_t capacity, OverflowPolicy policy);

  std::shared_ptr<Subscription> subscribe();
  void unsubscribe(const std::shared_ptr<Subscription>& subscription);
  // Delivers to a snapshot of the subscriber list; closed subscribers are pruned.
  void publish(const HubEvent& event);
  // Closes every subscription.
  void close_all();

  [[nodiscard]] std::size_t subscriber_count() const;

 private:
  const std::size_t capacity_;
  const OverflowPolicy policy_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<Subscription>> subscribers_{};
};

}  // namespace fleet_hub::gateway
