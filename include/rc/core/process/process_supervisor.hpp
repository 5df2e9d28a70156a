// File: include/rc/core/process/process_supervisor.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "rc/core/config.hpp"
#include "rc/core/events/event.hpp"
#include "rc/core/events/event_sink.hpp"
#include "rc/core/process/output_relay.hpp"
#include "rc/core/process/worker_handle.hpp"
#include "rc/core/status.hpp"
#include "rc/core/types.hpp"

namespace rc {

enum class SupervisorPhase {
  kIdle,
  kStarting,
  kRunning,
  kStopping,
  kFailed,
};

const char* phase_name(SupervisorPhase phase) noexcept;

struct SupervisorState {
  SupervisorPhase phase = SupervisorPhase::kIdle;
  Pid pid = 0;             // kRunning / kStopping
  TimestampNs started_at;  // kRunning / kStopping
  std::string reason;      // kFailed
};

// What the control surface reports.
struct WorkerStatus {
  bool is_running = false;
  std::optional<Pid> pid;
};

// Owns lifecycle of the single worker.
//
// State machine:
//   Idle -> Starting -> Running -> Stopping -> Idle
//   Starting -> Failed -> Idle
//   Running  -> Idle            (relay saw the worker exit)
//
// mu_ guards state_ and run_ and is held only across transitions, never
// across process waits or thread joins. Events go to `events` while mu_ is
// held (publish never blocks), so a run's terminal StatusEvent always reaches
// observers before the next run's StatusEvent{is_running:true}.
class ProcessSupervisor {
 public:
  ProcessSupervisor(Config cfg, EventPublisher& events);
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  // Errors: conflict, not_found, environment_missing, internal (spawn failed).
  Result<Pid> start();

  // Errors: not_running, stop_timeout.
  Status stop();

  [[nodiscard]] WorkerStatus status() const;
  [[nodiscard]] SupervisorState state() const;

  // Reason of the most recent Starting -> Failed transition.
  [[nodiscard]] std::optional<std::string> last_failure() const;

  // Number of Running -> Idle / Stopping -> Idle convergences so far.
  [[nodiscard]] std::uint64_t completed_runs() const;

 private:
  struct Run {
    std::uint64_t id = 0;
    std::unique_ptr<WorkerHandle> handle;
    std::unique_ptr<OutputRelay> relay;
    std::thread thread;
    std::once_flag join_once;
    bool finished = false;  // guarded by ProcessSupervisor::mu_

    ~Run();
    void join();
  };

  Result<Pid> fail_start_(const Status& st);
  void on_relay_exit_(Run& run, const StatusEvent& terminal, RelayEnd end);
  bool terminate_and_wait_(WorkerHandle& handle);
  void transition_locked_(SupervisorState next);

  Config cfg_;
  EventPublisher& events_;

  mutable std::mutex mu_;
  SupervisorState state_;
  std::shared_ptr<Run> run_;
  std::uint64_t next_run_id_{1};
  std::uint64_t completed_runs_{0};
  std::optional<std::string> last_failure_;
};

}  // namespace rc
