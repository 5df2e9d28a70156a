// File: include/rc/core/control/command_handler.hpp
#pragma once

#include <string>

#include "rc/core/process/process_supervisor.hpp"
#include "rc/core/status.hpp"

namespace rc {

// One control command ("start", "stop", "status") applied to `supervisor`,
// answered with a single JSON reply line (no trailing newline):
//   {"type":"reply","command":"start","ok":true,"pid":1234}
//   {"type":"reply","command":"stop","ok":false,"error":"NotRunning","message":"..."}
// Unknown commands get an InvalidArgument reply.
std::string handle_command(const std::string& command, ProcessSupervisor& supervisor);

std::string format_error_reply(const std::string& command, const Status& st);

}  // namespace rc
