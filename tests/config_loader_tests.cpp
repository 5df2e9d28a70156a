#include <catch2/catch.hpp>

#include <string>

#include "rc/core/util/config_loader.hpp"
#include "test_helpers.hpp"

using rc::Status;
using rc::test::TempDir;

TEST_CASE("Minimal config gets defaults and a resolved program path", "[config]") {
  TempDir dir;
  const std::string path = dir.write_file("recctl.yaml", "worker:\n  program: bot/main.py\n");

  auto r = rc::load_config(path);
  REQUIRE(r.ok());
  const rc::Config& cfg = r.value();

  REQUIRE(cfg.worker.program == (dir.path() / "bot/main.py").string());
  REQUIRE(cfg.worker.working_dir.empty());
  REQUIRE(cfg.worker.args == std::vector<std::string>{"-u"});
  REQUIRE(cfg.worker.interpreters.front() == "venv/bin/python");
  REQUIRE(cfg.supervisor.stop_timeout_ms == 5000);
  REQUIRE_FALSE(cfg.supervisor.escalate_to_kill);
  REQUIRE(cfg.relay.poll_interval_ms == 100);
  REQUIRE(cfg.broadcast.observer_queue_capacity == 1024);
  REQUIRE(cfg.logging.level == "info");
  REQUIRE(cfg.output.events_path.empty());
}

TEST_CASE("All sections are read", "[config]") {
  TempDir dir;
  const std::string path = dir.write_file("recctl.yaml",
                                          "worker:\n"
                                          "  program: /opt/bot/main.py\n"
                                          "  working_dir: /opt/bot\n"
                                          "  interpreters: [/bin/sh]\n"
                                          "  args: []\n"
                                          "  program_args: [--fast, --quiet]\n"
                                          "  env: {MODE: test}\n"
                                          "  pythonpath_working_dir: false\n"
                                          "supervisor:\n"
                                          "  stop_timeout_s: 2.5\n"
                                          "  escalate_to_kill: true\n"
                                          "  kill_timeout_s: 0.5\n"
                                          "relay:\n"
                                          "  poll_interval_ms: 25\n"
                                          "  max_line_bytes: 512\n"
                                          "broadcast:\n"
                                          "  observer_queue_capacity: 8\n"
                                          "logging:\n"
                                          "  level: debug\n"
                                          "output:\n"
                                          "  events_path: out/events.jsonl\n");

  auto r = rc::load_config(path);
  REQUIRE(r.ok());
  const rc::Config& cfg = r.value();

  REQUIRE(cfg.worker.program == "/opt/bot/main.py");
  REQUIRE(cfg.worker.working_dir == "/opt/bot");
  REQUIRE(cfg.worker.interpreters == std::vector<std::string>{"/bin/sh"});
  REQUIRE(cfg.worker.args.empty());
  REQUIRE(cfg.worker.program_args == std::vector<std::string>{"--fast", "--quiet"});
  REQUIRE(cfg.worker.env.at("MODE") == "test");
  REQUIRE_FALSE(cfg.worker.pythonpath_working_dir);
  REQUIRE(cfg.supervisor.stop_timeout_ms == 2500);
  REQUIRE(cfg.supervisor.escalate_to_kill);
  REQUIRE(cfg.supervisor.kill_timeout_ms == 500);
  REQUIRE(cfg.relay.poll_interval_ms == 25);
  REQUIRE(cfg.relay.max_line_bytes == 512);
  REQUIRE(cfg.broadcast.observer_queue_capacity == 8);
  REQUIRE(cfg.logging.level == "debug");
  REQUIRE(cfg.output.events_path == (dir.path() / "out/events.jsonl").string());
}

TEST_CASE("Includes are layered under the including file", "[config][includes]") {
  TempDir dir;
  dir.write_file("base/common.yaml",
                 "worker:\n"
                 "  program: /opt/bot/main.py\n"
                 "  interpreters: [/bin/sh]\n"
                 "supervisor:\n"
                 "  stop_timeout_s: 9\n");
  const std::string path = dir.write_file("recctl.yaml",
                                          "includes: [base/common.yaml]\n"
                                          "supervisor:\n"
                                          "  stop_timeout_s: 1\n");

  auto r = rc::load_config(path);
  REQUIRE(r.ok());
  REQUIRE(r->worker.program == "/opt/bot/main.py");
  REQUIRE(r->worker.interpreters == std::vector<std::string>{"/bin/sh"});
  REQUIRE(r->supervisor.stop_timeout_ms == 1000);
}

TEST_CASE("Config errors are reported, not thrown", "[config][errors]") {
  TempDir dir;

  SECTION("missing file") {
    auto r = rc::load_config((dir.path() / "nope.yaml").string());
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.status().code() == Status::Code::kNotFound);
  }

  SECTION("missing program") {
    const std::string path = dir.write_file("c.yaml", "relay:\n  poll_interval_ms: 10\n");
    auto r = rc::load_config(path);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.status().code() == Status::Code::kInvalidArgument);
  }

  SECTION("bad log level") {
    const std::string path =
        dir.write_file("c.yaml", "worker: {program: /x}\nlogging: {level: chatty}\n");
    auto r = rc::load_config(path);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.status().code() == Status::Code::kInvalidArgument);
  }

  SECTION("wrong value type") {
    const std::string path =
        dir.write_file("c.yaml", "worker: {program: /x}\nrelay: {poll_interval_ms: soon}\n");
    auto r = rc::load_config(path);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.status().code() == Status::Code::kParseError);
  }

  SECTION("malformed yaml") {
    const std::string path = dir.write_file("c.yaml", "worker: [unclosed\n");
    auto r = rc::load_config(path);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.status().code() == Status::Code::kParseError);
  }

  SECTION("includes that loop") {
    const std::string path = dir.write_file("c.yaml", "includes: [c.yaml]\nworker: {program: /x}\n");
    auto r = rc::load_config(path);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.status().code() == Status::Code::kInvalidArgument);
  }

  SECTION("non-positive stop timeout") {
    const std::string path =
        dir.write_file("c.yaml", "worker: {program: /x}\nsupervisor: {stop_timeout_s: 0}\n");
    auto r = rc::load_config(path);
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.status().code() == Status::Code::kInvalidArgument);
  }
}
