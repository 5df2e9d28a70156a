// include/rc/core/util/line_sanitizer.hpp
#pragma once

#include <string>
#include <string_view>

namespace rc {

// Removes ANSI/VT escape sequences from `text`:
//  - CSI:  ESC [ <params 0x30-0x3F>* <intermediates 0x20-0x2F>* <final 0x40-0x7E>
//  - OSC / DCS / SOS / PM / APC strings, terminated by BEL or ESC '\'
//  - nF:   ESC <intermediates 0x20-0x2F>+ <final 0x30-0x7E>   (e.g. ESC ( B)
//  - two-byte ESC <0x30-0x7E>                                  (e.g. ESC 7, ESC M)
// Every ESC byte is dropped, so the result never contains one and
// sanitize_line(sanitize_line(x)) == sanitize_line(x).
// An unterminated sequence at the end of `text` is dropped.
std::string sanitize_line(std::string_view text);

// Strips leading/trailing ASCII whitespace (space, \t, \r, \n, \v, \f).
std::string_view trim_whitespace(std::string_view text) noexcept;

}  // namespace rc
