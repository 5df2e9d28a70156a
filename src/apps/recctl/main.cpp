// File: src/apps/recctl/main.cpp
#include <atomic>
#include <cerrno>
#include <csignal>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "rc/core/control/command_handler.hpp"
#include "rc/core/events/broadcaster.hpp"
#include "rc/core/events/jsonl_event_sink.hpp"
#include "rc/core/events/observer_channel.hpp"
#include "rc/core/process/process_supervisor.hpp"
#include "rc/core/util/config_loader.hpp"
#include "rc/core/util/line_sanitizer.hpp"
#include "rc/core/util/logging.hpp"

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) { g_shutdown.store(true); }

struct Args {
  std::string config_path;
  bool autostart{false};
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--autostart") {
      a.autostart = true;
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "recctl\n"
            << "  --config <path>\n"
            << "  [--autostart]\n"
            << "commands on stdin: start | stop | status | quit\n";
}

// stdout is shared between the console observer thread and command replies.
std::mutex g_stdout_mu;

class LockedStdoutSink final : public rc::EventSink {
 public:
  rc::Status open() override { return inner_.open(); }
  rc::Status emit(const rc::Event& e) override {
    std::lock_guard<std::mutex> lock(g_stdout_mu);
    return inner_.emit(e);
  }
  rc::Status flush() override {
    std::lock_guard<std::mutex> lock(g_stdout_mu);
    return inner_.flush();
  }
  void close() override { inner_.close(); }

 private:
  rc::JsonlEventSink inner_{std::cout};
};

void reply(const std::string& line) {
  std::lock_guard<std::mutex> lock(g_stdout_mu);
  std::cout << line << std::endl;
}

// Reads control commands from stdin without blocking signal handling:
// raw read(2) + LineAssembler, so nothing hides in a stdio buffer.
class CommandReader {
 public:
  // Returns false on EOF, read error or shutdown.
  bool next(std::string& out) {
    while (pending_.empty()) {
      if (eof_ || g_shutdown.load()) return false;

      pollfd pfd{STDIN_FILENO, POLLIN, 0};
      const int pr = ::poll(&pfd, 1, 200);
      if (pr < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      if (pr == 0) continue;

      char buf[1024];
      const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      if (n == 0) {
        eof_ = true;
        lines_.finish(collect_);
        continue;
      }
      lines_.feed(std::string_view(buf, static_cast<std::size_t>(n)), collect_);
    }
    out = std::move(pending_.front());
    pending_.pop_front();
    return true;
  }

 private:
  std::deque<std::string> pending_;
  rc::LineAssembler lines_{4096};
  rc::LineAssembler::LineFn collect_ = [this](std::string_view l) { pending_.emplace_back(l); };
  bool eof_{false};
};

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = rc::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  rc::Config cfg = cfg_r.take_value();

  const rc::Status st_log = rc::configure_logging(cfg.logging);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 1;
  }

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  rc::Broadcaster broadcaster;

  auto console = std::make_shared<rc::ObserverChannel>(std::make_unique<LockedStdoutSink>(),
                                                       cfg.broadcast.observer_queue_capacity);
  const rc::Status st_console = console->start();
  if (!st_console.ok()) {
    spdlog::error("console observer: {}", st_console.message());
    return 1;
  }
  if (broadcaster.subscribe(console) == 0) {
    spdlog::error("console observer rejected the status snapshot");
    return 1;
  }

  std::shared_ptr<rc::ObserverChannel> file_log;
  if (!cfg.output.events_path.empty()) {
    file_log = std::make_shared<rc::ObserverChannel>(
        std::make_unique<rc::JsonlEventSink>(cfg.output.events_path),
        cfg.broadcast.observer_queue_capacity);
    const rc::Status st_file = file_log->start();
    if (!st_file.ok()) {
      spdlog::error("event log: {}", st_file.message());
      return 1;
    }
    if (broadcaster.subscribe(file_log) == 0) {
      spdlog::error("event log observer rejected the status snapshot");
      return 1;
    }
    spdlog::info("Events: {}", cfg.output.events_path);
  }

  {
    rc::ProcessSupervisor supervisor(cfg, broadcaster);

    if (args.autostart) reply(rc::handle_command("start", supervisor));

    CommandReader commands;
    std::string line;
    while (commands.next(line)) {
      const std::string command(rc::trim_whitespace(line));
      if (command.empty()) continue;
      if (command == "quit" || command == "exit") break;
      reply(rc::handle_command(command, supervisor));
    }

    spdlog::info("Shutting down");
    if (supervisor.status().is_running) {
      const rc::Status st = supervisor.stop();
      if (!st.ok()) spdlog::warn("stop on shutdown: {}", st.message());
    }
  }  // supervisor joins its relay here

  console->stop();
  if (file_log) file_log->stop();
  return 0;
}
