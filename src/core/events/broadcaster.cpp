// File: src/core/events/broadcaster.cpp
#include "rc/core/events/broadcaster.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace rc {

ConnectionId Broadcaster::subscribe(std::shared_ptr<Observer> observer) {
  if (!observer) return 0;

  std::lock_guard<std::mutex> lock(mu_);
  if (!observer->deliver(Event{current_status_})) {
    spdlog::debug("Broadcaster: observer rejected status snapshot, not registered");
    return 0;
  }

  const ConnectionId id = next_id_++;
  observers_.emplace_back(id, std::move(observer));
  spdlog::debug("Broadcaster: observer {} subscribed ({} total)", id, observers_.size());
  return id;
}

void Broadcaster::unsubscribe(ConnectionId id) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = std::remove_if(observers_.begin(), observers_.end(),
                                 [id](const auto& entry) { return entry.first == id; });
  if (it != observers_.end()) {
    observers_.erase(it, observers_.end());
    spdlog::debug("Broadcaster: observer {} unsubscribed ({} left)", id, observers_.size());
  }
}

void Broadcaster::publish(const Event& e) {
  std::lock_guard<std::mutex> lock(mu_);

  if (const auto* st = std::get_if<StatusEvent>(&e)) current_status_ = *st;

  const auto it = std::remove_if(observers_.begin(), observers_.end(), [&e](const auto& entry) {
    if (entry.second->deliver(e)) return false;
    spdlog::debug("Broadcaster: delivery to observer {} failed, dropping it", entry.first);
    return true;
  });
  observers_.erase(it, observers_.end());
}

StatusEvent Broadcaster::current_status() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_status_;
}

std::size_t Broadcaster::observer_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return observers_.size();
}

}  // namespace rc
