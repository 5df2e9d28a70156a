// File: src/core/util/line_sanitizer.cpp
#include "rc/core/util/line_sanitizer.hpp"

namespace rc {
namespace {

constexpr unsigned char kEsc = 0x1B;
constexpr unsigned char kBel = 0x07;

enum class State {
  kText,
  kEscape,        // saw ESC
  kCsi,           // ESC [
  kNf,            // ESC <intermediate>
  kString,        // OSC / DCS / SOS / PM / APC body
  kStringEscape,  // ESC inside a string (possible ST)
};

bool is_intermediate(unsigned char c) { return c >= 0x20 && c <= 0x2F; }
bool is_csi_param(unsigned char c) { return c >= 0x30 && c <= 0x3F; }
bool is_csi_final(unsigned char c) { return c >= 0x40 && c <= 0x7E; }

bool opens_string(unsigned char c) {
  return c == ']' || c == 'P' || c == 'X' || c == '^' || c == '_';
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

}  // namespace

std::string sanitize_line(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  State st = State::kText;
  for (const char ch : text) {
    const auto c = static_cast<unsigned char>(ch);

    switch (st) {
      case State::kText:
        if (c == kEsc) st = State::kEscape;
        else out.push_back(ch);
        break;

      case State::kEscape:
        if (c == kEsc) break;  // restart: drop the first ESC
        if (c == '[') st = State::kCsi;
        else if (opens_string(c)) st = State::kString;
        else if (is_intermediate(c)) st = State::kNf;
        else if (c >= 0x30 && c <= 0x7E) st = State::kText;  // two-byte sequence
        else {
          // Not an escape after all: drop the ESC, keep the byte.
          out.push_back(ch);
          st = State::kText;
        }
        break;

      case State::kCsi:
        if (is_csi_final(c)) {
          st = State::kText;
        } else if (c == kEsc) {
          st = State::kEscape;
        } else if (!is_csi_param(c) && !is_intermediate(c)) {
          // Malformed: abandon the sequence and keep the byte.
          out.push_back(ch);
          st = State::kText;
        }
        break;

      case State::kNf:
        if (c >= 0x30 && c <= 0x7E) {
          st = State::kText;
        } else if (c == kEsc) {
          st = State::kEscape;
        } else if (!is_intermediate(c)) {
          out.push_back(ch);
          st = State::kText;
        }
        break;

      case State::kString:
        if (c == kBel) st = State::kText;
        else if (c == kEsc) st = State::kStringEscape;
        break;

      case State::kStringEscape:
        if (c == '\\') st = State::kText;
        else if (c != kEsc) st = State::kString;
        break;
    }
  }

  return out;
}

std::string_view trim_whitespace(std::string_view text) noexcept {
  std::size_t b = 0;
  std::size_t e = text.size();
  while (b < e && is_space(text[b])) ++b;
  while (e > b && is_space(text[e - 1])) --e;
  return text.substr(b, e - b);
}

}  // namespace rc
