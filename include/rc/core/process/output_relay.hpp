// File: include/rc/core/process/output_relay.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "rc/core/config.hpp"
#include "rc/core/events/event.hpp"
#include "rc/core/events/event_sink.hpp"
#include "rc/core/process/worker_handle.hpp"
#include "rc/core/types.hpp"

namespace rc {

// Splits a byte stream into lines. "\n" and "\r\n" end a line; a line that
// grows past max_line_bytes is cut and handed out in pieces.
class LineAssembler {
 public:
  using LineFn = std::function<void(std::string_view)>;

  explicit LineAssembler(std::size_t max_line_bytes);

  void feed(std::string_view bytes, const LineFn& on_line);

  // Hands out a trailing unterminated line, if any.
  void finish(const LineFn& on_line);

 private:
  std::size_t max_line_bytes_;
  std::string pending_;
};

enum class RelayEnd {
  kWorkerExited,   // worker reaped (possibly after end-of-stream)
  kStopRequested,  // request_stop() while the worker was still alive
  kReadError,      // poll/read failed; worker may still be alive
};

const char* relay_end_name(RelayEnd end) noexcept;

// Turns one worker's merged stdout/stderr into LogEvents.
//
// run() blocks the calling thread until the worker exits, the stream fails,
// or request_stop() is called. It owns the stream for the duration of the
// run and closes it before the terminal StatusEvent{is_running:false} goes
// out. With an ExitHook installed the terminal event is handed to the hook
// (which is expected to publish it); otherwise it is published directly.
class OutputRelay {
 public:
  using ExitHook = std::function<void(const StatusEvent& terminal, RelayEnd end)>;

  explicit OutputRelay(RelayConfig cfg);

  OutputRelay(const OutputRelay&) = delete;
  OutputRelay& operator=(const OutputRelay&) = delete;

  RelayEnd run(WorkerHandle& handle, EventPublisher& sink, const ExitHook& on_exit = {});

  void request_stop() noexcept { stop_requested_.store(true); }

  [[nodiscard]] SequenceNumber lines_published() const noexcept { return seq_.load(); }

 private:
  RelayEnd pump_(WorkerHandle& handle, int fd, LineAssembler& lines,
                 const LineAssembler::LineFn& emit);
  void drain_(int fd, LineAssembler& lines, const LineAssembler::LineFn& emit);
  RelayEnd await_exit_(WorkerHandle& handle);

  RelayConfig cfg_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<SequenceNumber> seq_{0};
};

}  // namespace rc
