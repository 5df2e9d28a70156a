// File: src/core/events/jsonl_event_sink.cpp
#include "rc/core/events/jsonl_event_sink.hpp"

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace rc {

namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";  // U+FFFD

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if the
// bytes there are not one (overlong forms and surrogates included).
std::size_t valid_utf8_length(std::string_view s, std::size_t i) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) lo = 0xA0;
    if (b0 == 0xED) hi = 0x9F;
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) lo = 0x90;
    if (b0 == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }
  if (i + len > s.size()) return 0;

  const auto b1 = static_cast<unsigned char>(s[i + 1]);
  if (b1 < lo || b1 > hi) return 0;
  for (std::size_t k = 2; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if (b < 0x80 || b > 0xBF) return 0;
  }
  return len;
}

}  // namespace

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char ch = s[i];
    const auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80) {
      // Invalid bytes become U+FFFD, one per byte.
      const std::size_t len = valid_utf8_length(s, i);
      if (len == 0) {
        out += kReplacementChar;
      } else {
        out.append(s.substr(i, len));
        i += len - 1;
      }
      continue;
    }
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (c < 0x20 || c == 0x7F) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

std::string format_event_json(const Event& e) {
  std::ostringstream ss;
  std::visit(
      [&ss](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, LogEvent>) {
          ss << "{"
             << "\"type\":\"log\","
             << "\"seq\":" << ev.sequence_number << ","
             << "\"t_wall_ns\":" << ev.timestamp.ns << ","
             << "\"data\":\"" << json_escape(ev.sanitized_text) << "\""
             << "}";
        } else {
          ss << "{"
             << "\"type\":\"status\","
             << "\"t_wall_ns\":" << ev.timestamp.ns << ","
             << "\"is_running\":" << (ev.is_running ? "true" : "false");
          if (ev.pid) ss << ",\"pid\":" << *ev.pid;
          ss << "}";
        }
      },
      e);
  return ss.str();
}

JsonlEventSink::JsonlEventSink(std::string path) : path_(std::move(path)) {}

JsonlEventSink::JsonlEventSink(std::ostream& out) : path_("<stream>"), out_(&out) {}

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open() {
  if (out_ != nullptr) {
    open_ = true;
    return Status{};
  }

  close();

  const std::filesystem::path parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return Status::io_error("failed creating '" + parent.string() + "': " + ec.message());
    }
  }

  f_.open(path_, std::ios::out | std::ios::app);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  open_ = true;
  return Status{};
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_argument("JsonlEventSink::emit called while not open");
  return write_line_(format_event_json(e));
}

Status JsonlEventSink::write_line_(const std::string& line) {
  std::ostream& os = out_ != nullptr ? *out_ : static_cast<std::ostream&>(f_);
  os << line << "\n";
  if (!os.good()) return Status::io_error("failed writing to '" + path_ + "'");
  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  std::ostream& os = out_ != nullptr ? *out_ : static_cast<std::ostream&>(f_);
  os.flush();
  if (!os.good()) return Status::io_error("failed flushing '" + path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  open_ = false;
}

}  // namespace rc
