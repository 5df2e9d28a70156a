// File: src/core/events/observer_channel.cpp
#include "rc/core/events/observer_channel.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace rc {

ObserverChannel::ObserverChannel(std::unique_ptr<EventSink> sink, std::size_t capacity)
    : sink_(std::move(sink)), capacity_(capacity > 0 ? capacity : 1) {}

ObserverChannel::~ObserverChannel() { stop(); }

Status ObserverChannel::start() {
  if (running_.load()) return Status::conflict("observer channel already started");
  if (!sink_) return Status::invalid_argument("observer channel has no sink");

  RC_RETURN_IF_ERROR(sink_->open());

  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = false;
  }
  running_.store(true);
  thread_ = std::thread(&ObserverChannel::delivery_loop_, this);
  return Status::ok_status();
}

void ObserverChannel::stop() noexcept {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
  running_.store(false);
}

bool ObserverChannel::deliver(const Event& e) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stopping_ || failed_.load()) return false;
    if (queue_.size() >= capacity_) {
      spdlog::warn("ObserverChannel: backlog of {} events, dropping observer", queue_.size());
      failed_.store(true);
      return false;
    }
    queue_.push_back(e);
  }
  cv_.notify_one();
  return true;
}

std::size_t ObserverChannel::queue_size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

void ObserverChannel::delivery_loop_() {
  // An overflow only refuses new events; what was accepted still goes out.
  // After a sink error the rest of the queue is discarded.
  bool sink_failed = false;
  while (true) {
    Event e;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });

      // stop() still gets everything queued before it.
      if (queue_.empty()) break;

      e = std::move(queue_.front());
      queue_.pop_front();
    }

    if (sink_failed) continue;

    Status st = sink_->emit(e);
    if (st.ok()) st = sink_->flush();
    if (!st.ok()) {
      spdlog::warn("ObserverChannel: sink failed: {}", st.message());
      sink_failed = true;
      failed_.store(true);
    }
  }

  sink_->close();
}

}  // namespace rc
