// File: include/rc/core/events/event_sink.hpp
#pragma once

#include "rc/core/events/event.hpp"
#include "rc/core/status.hpp"
#include "rc/core/types.hpp"

namespace rc {

// Transport at the far end of one observer (a socket, a file, stdout).
// May block; only ever driven from that observer's own delivery thread.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open() = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

// What the Broadcaster fans out to.
// deliver() must not block: hand the event off and return.
// Returning false means the observer is gone and it will be unsubscribed.
class Observer {
 public:
  virtual ~Observer() = default;

  virtual bool deliver(const Event& e) = 0;
};

// Where the relay and supervisor push events.
class EventPublisher {
 public:
  virtual ~EventPublisher() = default;

  virtual void publish(const Event& e) = 0;
};

}  // namespace rc
