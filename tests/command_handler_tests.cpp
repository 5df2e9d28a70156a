#include <catch2/catch.hpp>

#include <string>

#include "rc/core/control/command_handler.hpp"
#include "rc/core/events/broadcaster.hpp"
#include "test_helpers.hpp"

using rc::Broadcaster;
using rc::ProcessSupervisor;
using rc::test::TempDir;
using rc::test::sh_worker_config;

TEST_CASE("Unknown commands are echoed back JSON-escaped", "[control]") {
  Broadcaster hub;
  ProcessSupervisor sup(sh_worker_config("/nonexistent/bot.sh"), hub);

  REQUIRE(rc::handle_command("bad\"cmd\\x", sup) ==
          "{\"type\":\"reply\",\"command\":\"bad\\\"cmd\\\\x\",\"ok\":false,"
          "\"error\":\"InvalidArgument\",\"message\":\"unknown command: bad\\\"cmd\\\\x\"}");

  REQUIRE(rc::format_error_reply("tab\there", rc::Status::conflict("busy")) ==
          "{\"type\":\"reply\",\"command\":\"tab\\there\",\"ok\":false,"
          "\"error\":\"Conflict\",\"message\":\"busy\"}");
}

TEST_CASE("Idle supervisor answers status and refuses stop", "[control]") {
  Broadcaster hub;
  ProcessSupervisor sup(sh_worker_config("/nonexistent/bot.sh"), hub);

  REQUIRE(rc::handle_command("status", sup) ==
          "{\"type\":\"reply\",\"command\":\"status\",\"ok\":true,\"is_running\":false}");

  const std::string stop = rc::handle_command("stop", sup);
  REQUIRE(stop.find("\"ok\":false") != std::string::npos);
  REQUIRE(stop.find("\"error\":\"NotRunning\"") != std::string::npos);

  const std::string start = rc::handle_command("start", sup);
  REQUIRE(start.find("\"error\":\"NotFound\"") != std::string::npos);
}

TEST_CASE("start, status and stop replies carry the worker pid", "[control]") {
  TempDir dir;
  const std::string script = dir.write_file("bot.sh", "exec sleep 30\n");

  Broadcaster hub;
  ProcessSupervisor sup(sh_worker_config(script), hub);

  const std::string start = rc::handle_command("start", sup);
  REQUIRE(start.rfind("{\"type\":\"reply\",\"command\":\"start\",\"ok\":true,\"pid\":", 0) == 0);

  const rc::WorkerStatus ws = sup.status();
  REQUIRE(ws.pid.has_value());
  REQUIRE(rc::handle_command("status", sup) ==
          "{\"type\":\"reply\",\"command\":\"status\",\"ok\":true,\"is_running\":true,\"pid\":" +
              std::to_string(*ws.pid) + "}");

  REQUIRE(rc::handle_command("stop", sup) == "{\"type\":\"reply\",\"command\":\"stop\",\"ok\":true}");
}
