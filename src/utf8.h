//===- utf8.h - Internal UTF-8 helpers --------------------------*- C++ -*-===//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace either {
namespace utf8 {

/// True for code points that UTF-8 can carry: at most U+10FFFF and not a
/// surrogate.
constexpr bool isScalar(char32_t codepoint) {
  return codepoint <= 0x10FFFF && (codepoint < 0xD800 || codepoint > 0xDFFF);
}

/// Append the UTF-8 form of \p codepoint. Throws Error(InvalidValue) if it
/// is not a Unicode scalar value.
void append(std::string &out, char32_t codepoint);

inline std::string encode(char32_t codepoint) {
  std::string out;
  append(out, codepoint);
  return out;
}

bool isValid(std::string_view s);

/// The code point of a string holding exactly one, otherwise nullopt.
std::optional<char32_t> singleCodePoint(std::string_view s);

} // namespace utf8
} // namespace either
