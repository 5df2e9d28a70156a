// include/rc/core/util/config_loader.hpp
#pragma once

#include <string>

#include "rc/core/config.hpp"
#include "rc/core/status.hpp"

namespace rc {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - A relative worker.program / working_dir / output / logging path is resolved
//   relative to the main config file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

}  // namespace rc
