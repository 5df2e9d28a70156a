// File: src/core/process/worker_handle.cpp
#include "rc/core/process/worker_handle.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <map>
#include <memory>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char** environ;

namespace rc {
namespace {

namespace fs = std::filesystem;

std::string errno_text(int err) { return std::string(std::strerror(err)); }

bool is_executable_file(const fs::path& p) {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) return false;
  return ::access(p.c_str(), X_OK) == 0;
}

std::map<std::string, std::string> current_environment() {
  std::map<std::string, std::string> out;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    const std::string kv(*e);
    const auto eq = kv.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    out[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  return out;
}

// Written by the child to the exec-status pipe when it cannot exec.
struct ExecFailure {
  int stage;  // 1 = chdir, 2 = execve
  int err;
};

}  // namespace

// -----------------------------
// FileDescriptor
// -----------------------------

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) reset(other.release());
  return *this;
}

int FileDescriptor::release() noexcept {
  const int fd = fd_;
  fd_ = -1;
  return fd;
}

void FileDescriptor::reset(int fd) noexcept {
  if (fd_ >= 0) ::close(fd_);
  fd_ = fd;
}

// -----------------------------
// Resolution
// -----------------------------

std::optional<std::string> resolve_executable(const std::string& name, const std::string& base_dir,
                                              const std::string& path_env) {
  if (name.empty()) return std::nullopt;

  if (name.find('/') != std::string::npos) {
    fs::path p(name);
    if (p.is_relative()) p = fs::path(base_dir) / p;
    if (is_executable_file(p)) return p.lexically_normal().string();
    return std::nullopt;
  }

  std::size_t begin = 0;
  while (begin <= path_env.size()) {
    const std::size_t end = path_env.find(':', begin);
    const std::string dir =
        path_env.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
    if (!dir.empty()) {
      const fs::path candidate = fs::path(dir) / name;
      if (is_executable_file(candidate)) return candidate.string();
    }
    if (end == std::string::npos) break;
    begin = end + 1;
  }
  return std::nullopt;
}

Result<SpawnSpec> resolve_spawn_spec(const WorkerConfig& cfg) {
  if (cfg.program.empty()) {
    return Result<SpawnSpec>::err(Status::invalid_argument("worker.program is empty"));
  }

  std::error_code ec;
  const fs::path program = fs::absolute(cfg.program, ec).lexically_normal();
  if (ec || !fs::exists(program, ec)) {
    return Result<SpawnSpec>::err(Status::not_found("worker program not found: " + cfg.program));
  }

  SpawnSpec spec;
  spec.working_dir = cfg.working_dir.empty() ? program.parent_path().string() : cfg.working_dir;
  if (!fs::is_directory(spec.working_dir, ec)) {
    return Result<SpawnSpec>::err(
        Status::environment_missing("worker working directory missing: " + spec.working_dir));
  }

  // Environment: ours, then the python conveniences, then explicit overrides.
  std::map<std::string, std::string> env = current_environment();
  if (cfg.pythonpath_working_dir) env["PYTHONPATH"] = spec.working_dir;
  if (cfg.prepend_virtualenv_bin) {
    const auto venv = env.find("VIRTUAL_ENV");
    if (venv != env.end() && !venv->second.empty()) {
      const std::string bin = (fs::path(venv->second) / "bin").string();
      const auto path = env.find("PATH");
      env["PATH"] = (path == env.end() || path->second.empty()) ? bin : bin + ":" + path->second;
    }
  }
  for (const auto& [k, v] : cfg.env) env[k] = v;

  const auto path_it = env.find("PATH");
  const std::string path_env = path_it == env.end() ? std::string() : path_it->second;

  if (cfg.interpreters.empty()) {
    if (!is_executable_file(program)) {
      return Result<SpawnSpec>::err(
          Status::environment_missing("worker program is not executable: " + program.string()));
    }
    spec.executable = program.string();
    spec.argv.push_back(program.string());
  } else {
    for (const auto& candidate : cfg.interpreters) {
      auto resolved = resolve_executable(candidate, spec.working_dir, path_env);
      if (resolved) {
        spec.executable = *resolved;
        break;
      }
    }
    if (spec.executable.empty()) {
      std::string tried;
      for (const auto& c : cfg.interpreters) tried += (tried.empty() ? "" : ", ") + c;
      return Result<SpawnSpec>::err(
          Status::environment_missing("no worker interpreter found (tried: " + tried + ")"));
    }
    spec.argv.push_back(spec.executable);
    spec.argv.insert(spec.argv.end(), cfg.args.begin(), cfg.args.end());
    spec.argv.push_back(program.string());
  }
  spec.argv.insert(spec.argv.end(), cfg.program_args.begin(), cfg.program_args.end());

  spec.env.reserve(env.size());
  for (const auto& [k, v] : env) spec.env.push_back(k + "=" + v);

  return Result<SpawnSpec>::ok(std::move(spec));
}

// -----------------------------
// WorkerHandle
// -----------------------------

WorkerHandle::WorkerHandle(ConstructionToken, Pid pid, FileDescriptor output) noexcept
    : pid_(pid), output_(std::move(output)) {}

WorkerHandle::~WorkerHandle() {
  if (!has_exited()) {
    spdlog::warn("WorkerHandle: released while pid {} is still running", pid_);
  }
}

Result<std::unique_ptr<WorkerHandle>> WorkerHandle::spawn(const SpawnSpec& spec) {
  using R = Result<std::unique_ptr<WorkerHandle>>;

  if (spec.executable.empty() || spec.argv.empty()) {
    return R::err(Status::invalid_argument("spawn spec has no executable"));
  }

  int out_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
    return R::err(Status::io_error("failed to create output pipe: " + errno_text(errno)));
  }
  FileDescriptor out_read(out_pipe[0]);
  FileDescriptor out_write(out_pipe[1]);

  int status_pipe[2];
  if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
    return R::err(Status::io_error("failed to create exec status pipe: " + errno_text(errno)));
  }
  FileDescriptor status_read(status_pipe[0]);
  FileDescriptor status_write(status_pipe[1]);

  FileDescriptor dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
  if (!dev_null.valid()) {
    return R::err(Status::io_error("failed to open /dev/null: " + errno_text(errno)));
  }

  // Everything the child touches is prepared here: after fork() it may only
  // call async-signal-safe functions.
  std::vector<char*> argv;
  argv.reserve(spec.argv.size() + 1);
  for (const auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  std::vector<char*> envp;
  envp.reserve(spec.env.size() + 1);
  for (const auto& e : spec.env) envp.push_back(const_cast<char*>(e.c_str()));
  envp.push_back(nullptr);

  const char* exe = spec.executable.c_str();
  const char* wd = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

  const pid_t pid = ::fork();
  if (pid < 0) {
    return R::err(Status::internal("fork() failed: " + errno_text(errno)));
  }

  if (pid == 0) {
    // Child process
    ::signal(SIGPIPE, SIG_DFL);

    ::dup2(dev_null.get(), STDIN_FILENO);
    ::dup2(out_write.get(), STDOUT_FILENO);
    ::dup2(out_write.get(), STDERR_FILENO);

    ExecFailure failure{0, 0};
    if (wd != nullptr && ::chdir(wd) < 0) {
      failure = ExecFailure{1, errno};
    } else {
      ::execve(exe, argv.data(), envp.data());
      failure = ExecFailure{2, errno};
    }
    ssize_t ignored = ::write(status_write.get(), &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
  }

  // Parent process
  out_write.reset();
  status_write.reset();
  dev_null.reset();

  ExecFailure failure{0, 0};
  ssize_t n = 0;
  do {
    n = ::read(status_read.get(), &failure, sizeof(failure));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(failure))) {
    int wstatus = 0;
    while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {
    }
    const std::string what = failure.stage == 1 ? "chdir(" + spec.working_dir + ")"
                                                : "execve(" + spec.executable + ")";
    return R::err(Status::internal(what + " failed: " + errno_text(failure.err)));
  }

  spdlog::info("WorkerHandle: spawned {} (pid={})", spec.executable, pid);
  return R::ok(std::make_unique<WorkerHandle>(ConstructionToken{}, pid, std::move(out_read)));
}

FileDescriptor WorkerHandle::take_output() noexcept { return std::move(output_); }

Status WorkerHandle::terminate() { return signal_(SIGTERM, "SIGTERM"); }

Status WorkerHandle::kill() { return signal_(SIGKILL, "SIGKILL"); }

Status WorkerHandle::signal_(int sig, const char* name) {
  // Hold the reap lock so the pid cannot be reaped (and recycled) under us.
  std::lock_guard<std::mutex> lock(reap_mu_);
  if (exited_.load()) return Status::ok_status();

  if (::kill(static_cast<pid_t>(pid_), sig) != 0) {
    if (errno == ESRCH) return Status::ok_status();
    return Status::io_error(std::string("failed to send ") + name + " to pid " +
                            std::to_string(pid_) + ": " + errno_text(errno));
  }
  spdlog::debug("WorkerHandle: sent {} to pid {}", name, pid_);
  return Status::ok_status();
}

bool WorkerHandle::has_exited() {
  if (exited_.load()) return true;

  std::lock_guard<std::mutex> lock(reap_mu_);
  if (exited_.load()) return true;

  int wstatus = 0;
  const pid_t r = ::waitpid(static_cast<pid_t>(pid_), &wstatus, WNOHANG);
  if (r == static_cast<pid_t>(pid_)) {
    if (WIFEXITED(wstatus)) {
      exit_code_ = WEXITSTATUS(wstatus);
    } else if (WIFSIGNALED(wstatus)) {
      exit_code_ = 128 + WTERMSIG(wstatus);
    }
    exited_.store(true);
    spdlog::info("WorkerHandle: pid {} exited (code={})", pid_, exit_code_.value_or(-1));
  } else if (r < 0 && errno != EINTR) {
    // ECHILD: nothing left to wait for.
    spdlog::warn("WorkerHandle: waitpid({}) failed: {}", pid_, errno_text(errno));
    exited_.store(true);
  }
  return exited_.load();
}

bool WorkerHandle::wait_for_exit(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (has_exited()) return true;
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
  }
}

std::optional<int> WorkerHandle::exit_code() const {
  std::lock_guard<std::mutex> lock(reap_mu_);
  return exit_code_;
}

}  // namespace rc
