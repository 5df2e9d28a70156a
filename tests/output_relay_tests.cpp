#include <catch2/catch.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "rc/core/events/jsonl_event_sink.hpp"
#include "rc/core/process/output_relay.hpp"
#include "test_helpers.hpp"

using rc::LineAssembler;
using rc::OutputRelay;
using rc::RelayEnd;
using rc::test::EventRecorder;
using rc::test::TempDir;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> assemble(std::size_t max, const std::vector<std::string>& chunks) {
  std::vector<std::string> out;
  LineAssembler lines(max);
  const LineAssembler::LineFn collect = [&out](std::string_view l) { out.emplace_back(l); };
  for (const auto& c : chunks) lines.feed(c, collect);
  lines.finish(collect);
  return out;
}

std::unique_ptr<rc::WorkerHandle> spawn_sh(const TempDir& dir, const std::string& body) {
  rc::WorkerConfig cfg;
  cfg.program = dir.write_file("worker.sh", body);
  cfg.interpreters = {"/bin/sh"};
  cfg.args.clear();

  auto spec = rc::resolve_spawn_spec(cfg);
  REQUIRE(spec.ok());
  auto handle = rc::WorkerHandle::spawn(spec.value());
  REQUIRE(handle.ok());
  return handle.take_value();
}

rc::RelayConfig fast_relay() {
  rc::RelayConfig cfg;
  cfg.poll_interval_ms = 20;
  return cfg;
}

}  // namespace

TEST_CASE("LineAssembler splits on LF and CRLF across chunks", "[relay][lines]") {
  REQUIRE(assemble(64, {"a\nb", "c\r", "\nd"}) == std::vector<std::string>{"a", "bc", "d"});
  REQUIRE(assemble(64, {"\n\n"}) == std::vector<std::string>{"", ""});
  REQUIRE(assemble(64, {"tail"}) == std::vector<std::string>{"tail"});
  REQUIRE(assemble(64, {}).empty());
}

TEST_CASE("LineAssembler cuts overlong lines", "[relay][lines]") {
  REQUIRE(assemble(4, {"abcdefghij\n"}) == std::vector<std::string>{"abcd", "efgh", "ij"});
}

TEST_CASE("LineAssembler never splits a UTF-8 character", "[relay][lines]") {
  // "\xC3\xA9" is e-acute, "\xE2\x82\xAC" is the euro sign.
  REQUIRE(assemble(4, {"abc\xC3\xA9\n"}) == std::vector<std::string>{"abc", "\xC3\xA9"});
  REQUIRE(assemble(4, {"ab\xE2", "\x82\xAC" "cd\n"}) ==
          std::vector<std::string>{"ab", "\xE2\x82\xAC" "c", "d"});

  // Pieces of a long line rendered as JSON stay well-formed.
  const auto pieces = assemble(4, {"abc\xC3\xA9\n"});
  rc::LogEvent ev;
  ev.sequence_number = 1;
  ev.sanitized_text = pieces[0];
  REQUIRE(rc::format_event_json(rc::Event{ev}).find("\"data\":\"abc\"}") != std::string::npos);
  ev.sanitized_text = pieces[1];
  REQUIRE(rc::format_event_json(rc::Event{ev}).find("\"data\":\"\xC3\xA9\"}") != std::string::npos);
}

TEST_CASE("Relay publishes sanitized lines then a terminal status", "[relay]") {
  TempDir dir;
  auto handle = spawn_sh(dir, "echo A\nprintf '\\033[31mB\\033[0m\\n'\nprintf '\\033[2K\\n'\necho\n");

  EventRecorder sink;
  OutputRelay relay(fast_relay());
  REQUIRE(relay.run(*handle, sink) == RelayEnd::kWorkerExited);

  const auto evs = sink.events();
  REQUIRE(evs.size() == 3);

  const auto& a = std::get<rc::LogEvent>(evs[0]);
  REQUIRE(a.sanitized_text == "A");
  REQUIRE(a.sequence_number == 1);

  const auto& b = std::get<rc::LogEvent>(evs[1]);
  REQUIRE(b.sanitized_text == "B");
  REQUIRE(b.raw_text == "\x1b[31mB\x1b[0m");
  REQUIRE(b.sequence_number == 2);
  REQUIRE(a.timestamp <= b.timestamp);

  const auto& last = std::get<rc::StatusEvent>(evs[2]);
  REQUIRE_FALSE(last.is_running);
  REQUIRE_FALSE(last.pid.has_value());

  REQUIRE(relay.lines_published() == 2);
  REQUIRE(handle->has_exited());
}

TEST_CASE("Relay keeps line order for bursts of output", "[relay]") {
  TempDir dir;
  auto handle = spawn_sh(dir, "i=1\nwhile [ $i -le 500 ]; do echo \"line $i\"; i=$((i+1)); done\n");

  EventRecorder sink;
  OutputRelay relay(fast_relay());
  REQUIRE(relay.run(*handle, sink) == RelayEnd::kWorkerExited);

  const auto lines = sink.log_lines();
  REQUIRE(lines.size() == 500);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    REQUIRE(lines[i] == "line " + std::to_string(i + 1));
  }
  REQUIRE(sink.terminal_count() == 1);
}

TEST_CASE("Relay hands the terminal status to the exit hook", "[relay]") {
  TempDir dir;
  auto handle = spawn_sh(dir, "echo only\nexit 1\n");

  EventRecorder sink;
  std::vector<RelayEnd> ends;
  OutputRelay relay(fast_relay());
  relay.run(*handle, sink, [&](const rc::StatusEvent& terminal, RelayEnd end) {
    REQUIRE_FALSE(terminal.is_running);
    ends.push_back(end);
  });

  REQUIRE(ends == std::vector<RelayEnd>{RelayEnd::kWorkerExited});
  REQUIRE(sink.terminal_count() == 0);  // the hook owns publication
  REQUIRE(sink.log_lines() == std::vector<std::string>{"only"});
}

TEST_CASE("request_stop ends the relay while the worker is alive", "[relay]") {
  TempDir dir;
  auto handle = spawn_sh(dir, "echo started\nexec sleep 30\n");

  EventRecorder sink;
  OutputRelay relay(fast_relay());
  RelayEnd end = RelayEnd::kReadError;
  std::thread t([&] { end = relay.run(*handle, sink); });

  REQUIRE(sink.wait_until([](const std::vector<rc::Event>& evs) { return !evs.empty(); }));
  relay.request_stop();
  t.join();

  REQUIRE(end == RelayEnd::kStopRequested);
  REQUIRE(sink.terminal_count() == 1);
  REQUIRE_FALSE(handle->has_exited());

  REQUIRE(handle->terminate().ok());
  REQUIRE(handle->wait_for_exit(5s));
}

TEST_CASE("Relay without a stream still terminates the run", "[relay]") {
  TempDir dir;
  auto handle = spawn_sh(dir, "exit 0\n");
  rc::FileDescriptor taken = handle->take_output();  // nothing left for the relay

  EventRecorder sink;
  OutputRelay relay(fast_relay());
  REQUIRE(relay.run(*handle, sink) == RelayEnd::kReadError);
  REQUIRE(sink.terminal_count() == 1);
  REQUIRE(handle->wait_for_exit(5s));
}
