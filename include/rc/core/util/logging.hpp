// include/rc/core/util/logging.hpp
#pragma once

#include "rc/core/config.hpp"
#include "rc/core/status.hpp"

namespace rc {

// Installs the process-wide spdlog default logger: colored stderr, plus a
// file sink when cfg.file is set. Safe to call more than once.
Status configure_logging(const LoggingConfig& cfg);

}  // namespace rc
