// File: include/rc/core/events/event.hpp
#pragma once

#include <optional>
#include <string>
#include <variant>

#include "rc/core/types.hpp"

namespace rc {

// One non-empty line of worker output. Immutable once produced by the relay.
struct LogEvent {
  SequenceNumber sequence_number = 0;  // 1-based, per worker run
  std::string raw_text;                // line as read, terminator removed
  std::string sanitized_text;          // escapes stripped, trimmed
  TimestampNs timestamp;
};

struct StatusEvent {
  bool is_running = false;
  std::optional<Pid> pid;
  TimestampNs timestamp;

  static StatusEvent running(Pid pid) { return StatusEvent{true, pid, wall_now_epoch_ns()}; }
  static StatusEvent stopped() { return StatusEvent{false, std::nullopt, wall_now_epoch_ns()}; }
};

using Event = std::variant<LogEvent, StatusEvent>;

inline bool is_status(const Event& e) { return std::holds_alternative<StatusEvent>(e); }
inline bool is_log(const Event& e) { return std::holds_alternative<LogEvent>(e); }

}  // namespace rc
