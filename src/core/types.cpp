// File: src/core/types.cpp
#include "rc/core/types.hpp"

#include <chrono>

namespace rc {

TimestampNs wall_now_epoch_ns() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

}  // namespace rc
