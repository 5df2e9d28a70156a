// File: include/rc/core/events/observer_channel.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "rc/core/events/event_sink.hpp"
#include "rc/core/status.hpp"

namespace rc {

// One connected observer: a bounded queue plus a delivery thread that drains
// it into an EventSink. deliver() only enqueues, so a slow sink never stalls
// the Broadcaster. The channel reports itself dead (deliver() == false) when
//  - the queue is full (observer fell too far behind), or
//  - the sink returned an error, or
//  - stop() was called.
// Events accepted before a full queue are still delivered; events queued
// behind a sink error are discarded.
class ObserverChannel final : public Observer {
 public:
  ObserverChannel(std::unique_ptr<EventSink> sink, std::size_t capacity);
  ~ObserverChannel() override;

  ObserverChannel(const ObserverChannel&) = delete;
  ObserverChannel& operator=(const ObserverChannel&) = delete;

  // Opens the sink and starts the delivery thread.
  Status start();

  // Delivers what is already queued, closes the sink, joins the thread.
  void stop() noexcept;

  bool deliver(const Event& e) override;

  [[nodiscard]] bool failed() const noexcept { return failed_.load(); }
  [[nodiscard]] std::size_t queue_size() const;

 private:
  void delivery_loop_();

  std::unique_ptr<EventSink> sink_;
  std::size_t capacity_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> queue_;
  bool stopping_{false};

  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};
  std::thread thread_;
};

}  // namespace rc
