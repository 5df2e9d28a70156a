// include/rc/core/config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "rc/core/status.hpp"

namespace rc {

// Units policy:
// - Timeouts in the YAML are seconds (double); stored as milliseconds here.
// - Sizes in bytes.

using DurationMs = std::int64_t;

constexpr DurationMs seconds_to_ms(double seconds) {
  return static_cast<DurationMs>(seconds * 1000.0);
}

// -----------------------------
// Worker (what gets spawned)
// -----------------------------
struct WorkerConfig {
  // Script or executable to run. Missing file => NotFound on start().
  std::string program;

  // Defaults to the directory containing `program` when empty.
  std::string working_dir;

  // Candidate interpreters, first resolvable wins. Empty => run `program` directly.
  std::vector<std::string> interpreters = {"venv/bin/python", "/usr/local/bin/python3",
                                           "/usr/bin/python3", "python3"};

  // Passed to the interpreter before `program` ("-u" keeps python unbuffered).
  std::vector<std::string> args = {"-u"};

  // Passed after `program`.
  std::vector<std::string> program_args;

  // Extra environment entries layered over the supervisor's environment.
  std::map<std::string, std::string> env;

  bool pythonpath_working_dir = true;  // PYTHONPATH=<working_dir>
  bool prepend_virtualenv_bin = true;  // PATH=$VIRTUAL_ENV/bin:$PATH
};

// -----------------------------
// Stop policy
// -----------------------------
struct SupervisorConfig {
  DurationMs stop_timeout_ms = seconds_to_ms(5.0);

  // Off by default: a worker that ignores SIGTERM is left for the relay to reconcile.
  bool escalate_to_kill = false;
  DurationMs kill_timeout_ms = seconds_to_ms(1.0);
};

// -----------------------------
// Output relay
// -----------------------------
struct RelayConfig {
  // Upper bound on how long the read loop waits before re-checking worker exit.
  int poll_interval_ms = 100;

  // Lines longer than this are emitted in chunks.
  std::size_t max_line_bytes = 64 * 1024;
};

// -----------------------------
// Fan-out
// -----------------------------
struct BroadcastConfig {
  // Per-observer backlog. A full queue drops the observer.
  std::size_t observer_queue_capacity = 1024;
};

// -----------------------------
// Logging
// -----------------------------
struct LoggingConfig {
  std::string level = "info";  // trace|debug|info|warn|error|off
  std::string file;            // optional extra sink
};

// -----------------------------
// Output (event log)
// -----------------------------
struct OutputConfig {
  // JSONL event log written by a file observer. Empty disables it.
  std::string events_path;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  WorkerConfig worker;
  SupervisorConfig supervisor;
  RelayConfig relay;
  BroadcastConfig broadcast;
  LoggingConfig logging;
  OutputConfig output;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.worker.program.empty()) {
    return Status::invalid_argument("worker.program must not be empty");
  }
  if (cfg.supervisor.stop_timeout_ms <= 0) {
    return Status::invalid_argument("supervisor.stop_timeout_s must be > 0");
  }
  if (cfg.supervisor.kill_timeout_ms <= 0) {
    return Status::invalid_argument("supervisor.kill_timeout_s must be > 0");
  }
  if (cfg.relay.poll_interval_ms <= 0) {
    return Status::invalid_argument("relay.poll_interval_ms must be > 0");
  }
  if (cfg.relay.max_line_bytes == 0) {
    return Status::invalid_argument("relay.max_line_bytes must be > 0");
  }
  if (cfg.broadcast.observer_queue_capacity == 0) {
    return Status::invalid_argument("broadcast.observer_queue_capacity must be > 0");
  }
  const std::string& lvl = cfg.logging.level;
  if (lvl != "trace" && lvl != "debug" && lvl != "info" && lvl != "warn" && lvl != "error" &&
      lvl != "off") {
    return Status::invalid_argument("logging.level must be one of trace|debug|info|warn|error|off");
  }
  return Status::ok_status();
}

}  // namespace rc
