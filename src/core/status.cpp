// File: src/core/status.cpp
#include "rc/core/status.hpp"

namespace rc {

const char* code_name(Status::Code code) noexcept {
  switch (code) {
    case Status::Code::kOk: return "Ok";
    case Status::Code::kInvalidArgument: return "InvalidArgument";
    case Status::Code::kConflict: return "Conflict";
    case Status::Code::kNotRunning: return "NotRunning";
    case Status::Code::kStopTimeout: return "StopTimeout";
    case Status::Code::kNotFound: return "NotFound";
    case Status::Code::kEnvironmentMissing: return "EnvironmentMissing";
    case Status::Code::kIoError: return "IoError";
    case Status::Code::kParseError: return "ParseError";
    case Status::Code::kInternal: return "Internal";
  }
  return "Unknown";
}

}  // namespace rc
