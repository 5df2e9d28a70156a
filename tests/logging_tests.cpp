#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "rc/core/util/logging.hpp"
#include "test_helpers.hpp"

TEST_CASE("configure_logging tees into the configured file", "[logging]") {
  rc::test::TempDir dir;
  rc::LoggingConfig cfg;
  cfg.level = "debug";
  cfg.file = (dir.path() / "logs" / "recctl.log").string();

  REQUIRE(rc::configure_logging(cfg).ok());
  REQUIRE(spdlog::default_logger()->level() == spdlog::level::debug);

  spdlog::debug("supervisor test marker {}", 7);
  spdlog::default_logger()->flush();

  std::ifstream f(cfg.file);
  std::stringstream ss;
  ss << f.rdbuf();
  REQUIRE(ss.str().find("supervisor test marker 7") != std::string::npos);

  // Back to a quiet stderr-only logger for the rest of the run.
  rc::LoggingConfig quiet;
  quiet.level = "warn";
  REQUIRE(rc::configure_logging(quiet).ok());
  REQUIRE(spdlog::default_logger()->level() == spdlog::level::warn);
}
