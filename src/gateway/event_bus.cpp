#include "gateway/event_bus.hpp"

#include <algorithm>
#include <iostream>

namespace fleet_hub::gateway {

const char* event_kind_name(const EventKind kind) noexcept {
  switch (kind) {
    case EventKind::AGENT_ONLINE:
      return "agent.online";
    case EventKind::AGENT_OFFLINE:
      return "agent.offline";
    case EventKind::METRICS_UPDATED:
      return "metrics.update";
  }
  return "unknown";
}

Subscription::Subscription(const std::size_t capacity, const OverflowPolicy policy)
    : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

std::optional<HubEvent> Subscription::next(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) {
    return std::nullopt;
  }
  HubEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

bool Subscription::offer(const HubEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (queue_.size() >= capacity_) {
      if (policy_ == OverflowPolicy::DISCONNECT) {
        closed_ = true;
        queue_.clear();
        ready_.notify_all();
        return false;
      }
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(event);
  }
  ready_.notify_one();
  return true;
}

void Subscription::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  ready_.notify_all();
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::uint64_t Subscription::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::size_t Subscription::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

EventBus::EventBus(const std::size_t capacity, const OverflowPolicy policy) : capacity_(capacity), policy_(policy) {}

std::shared_ptr<Subscription> EventBus::subscribe() {
  auto subscription = std::make_shared<Subscription>(capacity_, policy_);
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back(subscription);
  return subscription;
}

void EventBus::unsubscribe(const std::shared_ptr<Subscription>& subscription) {
  if (!subscription) {
    return;
  }
  subscription->close();
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription), subscribers_.end());
}

void EventBus::publish(const HubEvent& event) {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets = subscribers_;
  }

  bool any_closed = false;
  for (const auto& subscription : targets) {
    if (!subscription->offer(event)) {
      any_closed = true;
    }
  }

  if (any_closed) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto before = subscribers_.size();
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [](const auto& subscription) { return subscription->closed(); }),
                       subscribers_.end());
    if (subscribers_.size() != before) {
      std::cerr << "[events] removed " << (before - subscribers_.size()) << " closed subscriber(s)\n";
    }
  }
}

void EventBus::close_all() {
  std::vector<std::shared_ptr<Subscription>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.swap(subscribers_);
  }
  for (const auto& subscription : targets) {
    subscription->close();
  }
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

}  // namespace fleet_hub::gateway
