// File: tests/test_helpers.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "rc/core/config.hpp"
#include "rc/core/events/event.hpp"
#include "rc/core/events/event_sink.hpp"

namespace rc::test {

// mkdtemp()-backed scratch directory, removed on destruction.
class TempDir {
 public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  // Writes `content` to path()/name and returns the absolute path.
  std::string write_file(const std::string& name, const std::string& content,
                         bool executable = false) const;

 private:
  std::filesystem::path path_;
};

// Records every event it is handed, either as the publisher a relay or
// supervisor writes to, or as an observer registered on a Broadcaster.
class EventRecorder final : public EventPublisher, public Observer {
 public:
  void publish(const Event& e) override { record_(e); }
  bool deliver(const Event& e) override;

  // deliver() returns false from now on.
  void reject() {
    std::lock_guard<std::mutex> lock(mu_);
    accept_ = false;
  }

  std::vector<Event> events() const;
  std::vector<std::string> log_lines() const;
  std::vector<StatusEvent> statuses() const;
  std::size_t terminal_count() const;

  // Blocks until `pred(events)` holds or `timeout` elapses.
  bool wait_until(const std::function<bool(const std::vector<Event>&)>& pred,
                  std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

  // Convenience: until `n` StatusEvent{is_running:false} have been recorded.
  bool wait_for_terminal(std::size_t n = 1,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

 private:
  void record_(const Event& e);

  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  std::vector<Event> events_;
  bool accept_{true};
};

// Worker config that runs `script` with /bin/sh and a fast relay poll.
Config sh_worker_config(const std::string& script);

// Polls `pred` until it holds or `timeout` elapses.
bool eventually(const std::function<bool()>& pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(5));

}  // namespace rc::test
