// File: include/rc/core/events/jsonl_event_sink.hpp
#pragma once

#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

#include "rc/core/events/event_sink.hpp"
#include "rc/core/status.hpp"

namespace rc {

// Escapes `s` for use inside a JSON string literal (no surrounding quotes).
// Bytes that are not well-formed UTF-8 are replaced by U+FFFD.
std::string json_escape(std::string_view s);

// One JSON object, no trailing newline:
//   {"type":"log","seq":3,"t_wall_ns":...,"data":"..."}
//   {"type":"status","t_wall_ns":...,"is_running":true,"pid":1234}
std::string format_event_json(const Event& e);

// JSONL sink for events.
// Writes one line per event either to a file (opened in append mode on open())
// or to a caller-owned stream such as std::cout.
class JsonlEventSink final : public EventSink {
 public:
  explicit JsonlEventSink(std::string path);
  explicit JsonlEventSink(std::ostream& out);
  ~JsonlEventSink() override;

  const std::string& path() const { return path_; }

  Status open() override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);

  bool open_{false};

  std::string path_;
  std::ofstream f_;
  std::ostream* out_{nullptr};
};

}  // namespace rc
