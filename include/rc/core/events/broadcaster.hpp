// File: include/rc/core/events/broadcaster.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "rc/core/events/event.hpp"
#include "rc/core/events/event_sink.hpp"
#include "rc/core/types.hpp"

namespace rc {

// Fan-out hub between the relay/supervisor and every connected observer.
//
// Ordering contract:
//  - publish() delivers under the hub's mutex, so all observers see events in
//    one global publish order even with several concurrent publishers.
//  - subscribe() hands the observer the latest StatusEvent and registers it
//    in the same critical section: the observer sees the snapshot, then
//    exactly the events published after it.
//
// Observer::deliver() is required to be non-blocking, which is what keeps the
// mutex cheap. An observer that returns false is dropped on the spot.
class Broadcaster final : public EventPublisher {
 public:
  Broadcaster() = default;

  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  // Returns 0 if the snapshot delivery already failed (observer not registered).
  ConnectionId subscribe(std::shared_ptr<Observer> observer);
  void unsubscribe(ConnectionId id);

  void publish(const Event& e) override;

  [[nodiscard]] StatusEvent current_status() const;
  [[nodiscard]] std::size_t observer_count() const;

 private:
  mutable std::mutex mu_;
  std::vector<std::pair<ConnectionId, std::shared_ptr<Observer>>> observers_;
  ConnectionId next_id_{1};
  StatusEvent current_status_ = StatusEvent::stopped();
};

}  // namespace rc
