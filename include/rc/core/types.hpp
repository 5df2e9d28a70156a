// include/rc/core/types.hpp
#pragma once

#include <cstdint>
#include <string>

namespace rc {

// -----------------------------
// Basic identifiers
// -----------------------------

using Pid = std::int64_t;            // OS process id of the worker
using ConnectionId = std::uint64_t;  // assigned by Broadcaster::subscribe
using SequenceNumber = std::uint64_t;

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer nanoseconds since the Unix epoch (wall clock).

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

TimestampNs wall_now_epoch_ns();

}  // namespace rc
