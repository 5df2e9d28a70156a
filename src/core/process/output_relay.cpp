// File: src/core/process/output_relay.cpp
#include "rc/core/process/output_relay.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "rc/core/util/line_sanitizer.hpp"

namespace rc {
namespace {

constexpr std::size_t kReadChunk = 4096;

// Cap on what is still pulled out of the pipe once the worker is gone
// (a surviving grandchild could keep writing forever).
constexpr int kMaxDrainReads = 256;

bool is_utf8_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the sequence a UTF-8 lead byte announces; 1 for anything else.
std::size_t utf8_sequence_length(unsigned char lead) {
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 1;
}

// Where to cut `s` so that a multi-byte character at its end is not split.
// Returns s.size() when the tail is complete (or is not valid UTF-8 anyway).
std::size_t utf8_safe_cut(const std::string& s) {
  const std::size_t n = s.size();
  for (std::size_t back = 1; back <= 4 && back <= n; ++back) {
    const auto c = static_cast<unsigned char>(s[n - back]);
    if (is_utf8_continuation(c)) continue;
    const std::size_t lead_pos = n - back;
    if (lead_pos > 0 && lead_pos + utf8_sequence_length(c) > n) return lead_pos;
    return n;
  }
  return n;
}

}  // namespace

// -----------------------------
// LineAssembler
// -----------------------------

LineAssembler::LineAssembler(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes > 0 ? max_line_bytes : 1) {}

void LineAssembler::feed(std::string_view bytes, const LineFn& on_line) {
  for (const char c : bytes) {
    if (c == '\n') {
      if (!pending_.empty() && pending_.back() == '\r') pending_.pop_back();
      on_line(pending_);
      pending_.clear();
      continue;
    }
    pending_.push_back(c);
    if (pending_.size() >= max_line_bytes_) {
      // Keep an unfinished multi-byte character for the next piece.
      const std::size_t cut = utf8_safe_cut(pending_);
      on_line(std::string_view(pending_).substr(0, cut));
      pending_.erase(0, cut);
    }
  }
}

void LineAssembler::finish(const LineFn& on_line) {
  if (!pending_.empty() && pending_.back() == '\r') pending_.pop_back();
  if (!pending_.empty()) on_line(pending_);
  pending_.clear();
}

const char* relay_end_name(RelayEnd end) noexcept {
  switch (end) {
    case RelayEnd::kWorkerExited: return "worker_exited";
    case RelayEnd::kStopRequested: return "stop_requested";
    case RelayEnd::kReadError: return "read_error";
  }
  return "unknown";
}

// -----------------------------
// OutputRelay
// -----------------------------

OutputRelay::OutputRelay(RelayConfig cfg) : cfg_(std::move(cfg)) {}

RelayEnd OutputRelay::run(WorkerHandle& handle, EventPublisher& sink, const ExitHook& on_exit) {
  const Pid pid = handle.pid();
  spdlog::info("OutputRelay: monitoring output of pid {}", pid);

  seq_.store(0);
  LineAssembler lines(cfg_.max_line_bytes);
  const LineAssembler::LineFn emit = [this, &sink, pid](std::string_view raw) {
    const std::string clean(trim_whitespace(sanitize_line(raw)));
    if (clean.empty()) return;

    LogEvent ev;
    ev.sequence_number = seq_.load() + 1;
    ev.raw_text = std::string(raw);
    ev.sanitized_text = clean;
    ev.timestamp = wall_now_epoch_ns();
    seq_.store(ev.sequence_number);

    spdlog::debug("worker[{}]: {}", pid, ev.sanitized_text);
    sink.publish(Event{std::move(ev)});
  };

  RelayEnd end = RelayEnd::kReadError;
  {
    FileDescriptor stream = handle.take_output();
    if (!stream.valid()) {
      spdlog::error("OutputRelay: pid {} has no output stream to read", pid);
    } else {
      end = pump_(handle, stream.get(), lines, emit);
    }
    lines.finish(emit);
  }  // stream closed here on every path

  spdlog::info("OutputRelay: stopped monitoring pid {} ({}, {} lines)", pid, relay_end_name(end),
               seq_.load());

  const StatusEvent terminal = StatusEvent::stopped();
  if (on_exit) on_exit(terminal, end);
  else sink.publish(Event{terminal});
  return end;
}

RelayEnd OutputRelay::pump_(WorkerHandle& handle, int fd, LineAssembler& lines,
                            const LineAssembler::LineFn& emit) {
  std::array<char, kReadChunk> buf{};

  while (true) {
    if (stop_requested_.load()) return RelayEnd::kStopRequested;

    pollfd pfd{fd, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, cfg_.poll_interval_ms);
    if (pr < 0) {
      if (errno == EINTR) continue;
      spdlog::error("OutputRelay: poll failed on pid {}: {}", handle.pid(), std::strerror(errno));
      return RelayEnd::kReadError;
    }

    if (pr > 0) {
      const ssize_t n = ::read(fd, buf.data(), buf.size());
      if (n > 0) {
        lines.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)), emit);
      } else if (n == 0) {
        // End of stream: the worker closed its output, normally because it exited.
        return await_exit_(handle);
      } else if (errno != EINTR && errno != EAGAIN) {
        spdlog::error("OutputRelay: read failed on pid {}: {}", handle.pid(), std::strerror(errno));
        return RelayEnd::kReadError;
      }
    }

    if (handle.has_exited()) {
      drain_(fd, lines, emit);
      return RelayEnd::kWorkerExited;
    }
  }
}

void OutputRelay::drain_(int fd, LineAssembler& lines, const LineAssembler::LineFn& emit) {
  const int flags = ::fcntl(fd, F_GETFL);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    spdlog::warn("OutputRelay: cannot make stream non-blocking, skipping drain: {}",
                 std::strerror(errno));
    return;
  }

  std::array<char, kReadChunk> buf{};
  for (int i = 0; i < kMaxDrainReads; ++i) {
    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
      lines.feed(std::string_view(buf.data(), static_cast<std::size_t>(n)), emit);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    return;  // EOF, EAGAIN or error: nothing more to take
  }
}

RelayEnd OutputRelay::await_exit_(WorkerHandle& handle) {
  const auto interval = std::chrono::milliseconds(cfg_.poll_interval_ms);
  while (!handle.wait_for_exit(interval)) {
    if (stop_requested_.load()) return RelayEnd::kStopRequested;
  }
  return RelayEnd::kWorkerExited;
}

}  // namespace rc
