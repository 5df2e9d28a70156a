// File: include/rc/core/process/worker_handle.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rc/core/config.hpp"
#include "rc/core/status.hpp"
#include "rc/core/types.hpp"

namespace rc {

// Owns one POSIX file descriptor; closes it on destruction.
class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
  ~FileDescriptor() { reset(); }

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
  int release() noexcept;
  void reset(int fd = -1) noexcept;

 private:
  int fd_{-1};
};

// Fully resolved command line for one worker run.
struct SpawnSpec {
  std::string executable;          // absolute path handed to execve
  std::vector<std::string> argv;   // argv[0] included
  std::vector<std::string> env;    // "KEY=VALUE"
  std::string working_dir;
};

// Turns the worker config into a SpawnSpec against the current environment.
// Errors:
//  - not_found:           worker.program does not exist
//  - environment_missing: no interpreter candidate resolves (or, with no
//                         interpreters configured, program is not executable)
Result<SpawnSpec> resolve_spawn_spec(const WorkerConfig& cfg);

// Looks `name` up the way a shell would: names containing '/' are taken
// relative to `base_dir`, bare names are searched on `path_env`.
std::optional<std::string> resolve_executable(const std::string& name, const std::string& base_dir,
                                              const std::string& path_env);

// A running worker process. stdout and stderr are merged into one pipe whose
// read end can be taken (once) by the relay.
//
// Reaping is internal and thread-safe: has_exited() and wait_for_exit() may be
// called from the relay thread and a control thread at the same time.
class WorkerHandle {
  // Only spawn() can name this, so only spawn() can construct.
  struct ConstructionToken {
    explicit ConstructionToken() = default;
  };

 public:
  static Result<std::unique_ptr<WorkerHandle>> spawn(const SpawnSpec& spec);

  WorkerHandle(ConstructionToken, Pid pid, FileDescriptor output) noexcept;
  ~WorkerHandle();

  WorkerHandle(const WorkerHandle&) = delete;
  WorkerHandle& operator=(const WorkerHandle&) = delete;

  [[nodiscard]] Pid pid() const noexcept { return pid_; }

  // Read end of the merged output pipe. Empty after the first call.
  FileDescriptor take_output() noexcept;

  // SIGTERM. No-op once the process has been reaped.
  Status terminate();

  // SIGKILL. No-op once the process has been reaped.
  Status kill();

  // Non-blocking: reaps the child if it has exited.
  bool has_exited();

  // Polls has_exited() until it is true or `timeout` elapses.
  bool wait_for_exit(std::chrono::milliseconds timeout);

  // Exit status once reaped; 128 + signal for signal deaths.
  [[nodiscard]] std::optional<int> exit_code() const;

 private:
  Status signal_(int sig, const char* name);

  Pid pid_;
  FileDescriptor output_;

  mutable std::mutex reap_mu_;
  std::atomic<bool> exited_{false};
  std::optional<int> exit_code_;
};

}  // namespace rc
