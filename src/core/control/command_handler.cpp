// File: src/core/control/command_handler.cpp
#include "rc/core/control/command_handler.hpp"

#include <sstream>

#include "rc/core/events/jsonl_event_sink.hpp"

namespace rc {

std::string format_error_reply(const std::string& command, const Status& st) {
  std::ostringstream ss;
  ss << "{\"type\":\"reply\",\"command\":\"" << json_escape(command) << "\",\"ok\":false,"
     << "\"error\":\"" << code_name(st.code()) << "\","
     << "\"message\":\"" << json_escape(st.message()) << "\"}";
  return ss.str();
}

std::string handle_command(const std::string& command, ProcessSupervisor& supervisor) {
  std::ostringstream ss;
  if (command == "start") {
    auto r = supervisor.start();
    if (!r.ok()) return format_error_reply(command, r.status());
    ss << "{\"type\":\"reply\",\"command\":\"start\",\"ok\":true,\"pid\":" << *r << "}";
    return ss.str();
  }
  if (command == "stop") {
    const Status st = supervisor.stop();
    if (!st.ok()) return format_error_reply(command, st);
    return "{\"type\":\"reply\",\"command\":\"stop\",\"ok\":true}";
  }
  if (command == "status") {
    const WorkerStatus ws = supervisor.status();
    ss << "{\"type\":\"reply\",\"command\":\"status\",\"ok\":true,\"is_running\":"
       << (ws.is_running ? "true" : "false");
    if (ws.pid) ss << ",\"pid\":" << *ws.pid;
    ss << "}";
    return ss.str();
  }
  return format_error_reply(command, Status::invalid_argument("unknown command: " + command));
}

}  // namespace rc
