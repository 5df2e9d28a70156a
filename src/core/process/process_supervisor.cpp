// File: src/core/process/process_supervisor.cpp
#include "rc/core/process/process_supervisor.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace rc {

const char* phase_name(SupervisorPhase phase) noexcept {
  switch (phase) {
    case SupervisorPhase::kIdle: return "idle";
    case SupervisorPhase::kStarting: return "starting";
    case SupervisorPhase::kRunning: return "running";
    case SupervisorPhase::kStopping: return "stopping";
    case SupervisorPhase::kFailed: return "failed";
  }
  return "unknown";
}

ProcessSupervisor::Run::~Run() { join(); }

void ProcessSupervisor::Run::join() {
  std::call_once(join_once, [this] {
    if (thread.joinable()) thread.join();
  });
}

ProcessSupervisor::ProcessSupervisor(Config cfg, EventPublisher& events)
    : cfg_(std::move(cfg)), events_(events) {}

ProcessSupervisor::~ProcessSupervisor() {
  bool running = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    running = state_.phase == SupervisorPhase::kRunning;
  }
  if (running) {
    const Status st = stop();
    if (!st.ok()) spdlog::warn("Supervisor: stop during shutdown failed: {}", st.message());
  }

  std::shared_ptr<Run> run;
  {
    std::lock_guard<std::mutex> lock(mu_);
    run = run_;
  }
  if (run) {
    run->relay->request_stop();
    run->join();
  }
}

void ProcessSupervisor::transition_locked_(SupervisorState next) {
  if (next.phase != state_.phase) {
    spdlog::info("Supervisor: {} -> {}", phase_name(state_.phase), phase_name(next.phase));
  }
  state_ = std::move(next);
}

Result<Pid> ProcessSupervisor::start() {
  std::shared_ptr<Run> previous;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.phase != SupervisorPhase::kIdle) {
      return Result<Pid>::err(Status::conflict(std::string("cannot start: worker is ") +
                                               phase_name(state_.phase)));
    }
    transition_locked_(SupervisorState{SupervisorPhase::kStarting, 0, {}, {}});
    previous = std::move(run_);
  }

  // The previous run is over (we were Idle); wait for its relay thread to
  // return, then let its handle go.
  if (previous) {
    previous->join();
    previous.reset();
  }

  auto spec_r = resolve_spawn_spec(cfg_.worker);
  if (!spec_r.ok()) return fail_start_(spec_r.status());

  const SpawnSpec& spec = spec_r.value();
  spdlog::info("Supervisor: starting worker in {}", spec.working_dir);
  for (std::size_t i = 0; i < spec.argv.size(); ++i) {
    spdlog::debug("  argv[{}]: '{}'", i, spec.argv[i]);
  }

  auto handle_r = WorkerHandle::spawn(spec);
  if (!handle_r.ok()) return fail_start_(handle_r.status());

  auto run = std::make_shared<Run>();
  run->handle = handle_r.take_value();
  run->relay = std::make_unique<OutputRelay>(cfg_.relay);
  const Pid pid = run->handle->pid();

  {
    std::lock_guard<std::mutex> lock(mu_);
    run->id = next_run_id_++;
    transition_locked_(SupervisorState{SupervisorPhase::kRunning, pid, wall_now_epoch_ns(), {}});
    events_.publish(Event{StatusEvent::running(pid)});

    Run* raw = run.get();
    try {
      run->thread = std::thread([this, raw] {
        raw->relay->run(*raw->handle, events_, [this, raw](const StatusEvent& terminal, RelayEnd end) {
          on_relay_exit_(*raw, terminal, end);
        });
      });
      run_ = std::move(run);
      return Result<Pid>::ok(pid);
    } catch (const std::system_error& e) {
      spdlog::error("Supervisor: cannot start relay thread: {}", e.what());
      run->finished = true;
      events_.publish(Event{StatusEvent::stopped()});
      transition_locked_(SupervisorState{SupervisorPhase::kFailed, 0, {}, e.what()});
      last_failure_ = std::string("relay thread: ") + e.what();
      transition_locked_(SupervisorState{});
    }
  }

  // Unmonitored worker: take it down again.
  if (!terminate_and_wait_(*run->handle)) {
    spdlog::error("Supervisor: pid {} did not exit after failed start", pid);
  }
  return Result<Pid>::err(Status::internal(*last_failure()));
}

Result<Pid> ProcessSupervisor::fail_start_(const Status& st) {
  spdlog::error("Supervisor: start failed ({}): {}", code_name(st.code()), st.message());

  std::lock_guard<std::mutex> lock(mu_);
  transition_locked_(SupervisorState{SupervisorPhase::kFailed, 0, {}, st.message()});
  last_failure_ = st.message();
  transition_locked_(SupervisorState{});
  return Result<Pid>::err(st);
}

Status ProcessSupervisor::stop() {
  std::shared_ptr<Run> run;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.phase != SupervisorPhase::kRunning) {
      return Status::not_running(std::string("cannot stop: worker is ") + phase_name(state_.phase));
    }
    run = run_;
    SupervisorState next = state_;
    next.phase = SupervisorPhase::kStopping;
    transition_locked_(std::move(next));
  }

  WorkerHandle& handle = *run->handle;
  spdlog::info("Supervisor: stopping pid {}", handle.pid());

  const Status sig = handle.terminate();
  if (!sig.ok()) spdlog::warn("Supervisor: {}", sig.message());

  bool exited = handle.wait_for_exit(std::chrono::milliseconds(cfg_.supervisor.stop_timeout_ms));
  if (!exited && cfg_.supervisor.escalate_to_kill) {
    spdlog::warn("Supervisor: pid {} ignored SIGTERM for {} ms, sending SIGKILL", handle.pid(),
                 cfg_.supervisor.stop_timeout_ms);
    const Status k = handle.kill();
    if (!k.ok()) spdlog::warn("Supervisor: {}", k.message());
    exited = handle.wait_for_exit(std::chrono::milliseconds(cfg_.supervisor.kill_timeout_ms));
  }

  if (!exited) {
    spdlog::warn("Supervisor: pid {} still running after stop timeout", handle.pid());
    return Status::stop_timeout("worker pid " + std::to_string(handle.pid()) +
                                " did not exit within " +
                                std::to_string(cfg_.supervisor.stop_timeout_ms) + " ms");
  }

  // The relay notices the exit on its next poll and converges the state.
  run->join();

  std::lock_guard<std::mutex> lock(mu_);
  if (run_ == run) {
    if (state_.phase == SupervisorPhase::kStopping) {
      transition_locked_(SupervisorState{});
      ++completed_runs_;
    }
    run_.reset();
  }
  spdlog::info("Supervisor: worker stopped");
  return Status::ok_status();
}

void ProcessSupervisor::on_relay_exit_(Run& run, const StatusEvent& terminal, RelayEnd end) {
  if (end != RelayEnd::kWorkerExited && !run.handle->has_exited()) {
    spdlog::warn("Supervisor: relay ended ({}) while pid {} is alive, terminating it",
                 relay_end_name(end), run.handle->pid());
    if (!terminate_and_wait_(*run.handle)) {
      spdlog::error("Supervisor: pid {} did not exit and is no longer supervised", run.handle->pid());
    }
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (run.finished) return;
  run.finished = true;

  if (run_.get() == &run && (state_.phase == SupervisorPhase::kRunning ||
                             state_.phase == SupervisorPhase::kStopping)) {
    transition_locked_(SupervisorState{});
    ++completed_runs_;
  }
  events_.publish(Event{terminal});
}

bool ProcessSupervisor::terminate_and_wait_(WorkerHandle& handle) {
  const Status sig = handle.terminate();
  if (!sig.ok()) spdlog::warn("Supervisor: {}", sig.message());
  if (handle.wait_for_exit(std::chrono::milliseconds(cfg_.supervisor.stop_timeout_ms))) return true;
  if (!cfg_.supervisor.escalate_to_kill) return false;

  const Status k = handle.kill();
  if (!k.ok()) spdlog::warn("Supervisor: {}", k.message());
  return handle.wait_for_exit(std::chrono::milliseconds(cfg_.supervisor.kill_timeout_ms));
}

WorkerStatus ProcessSupervisor::status() const {
  std::lock_guard<std::mutex> lock(mu_);
  WorkerStatus out;
  out.is_running = state_.phase == SupervisorPhase::kRunning ||
                   state_.phase == SupervisorPhase::kStopping;
  if (out.is_running) out.pid = state_.pid;
  return out;
}

SupervisorState ProcessSupervisor::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::optional<std::string> ProcessSupervisor::last_failure() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_failure_;
}

std::uint64_t ProcessSupervisor::completed_runs() const {
  std::lock_guard<std::mutex> lock(mu_);
  return completed_runs_;
}

}  // namespace rc
