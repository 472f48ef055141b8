//===- utf8.cpp - Internal UTF-8 helpers ----------------------------------===//

#include "utf8.h"

#include "either/error.h"

#include <cstddef>
#include <cstdint>

namespace either {
namespace utf8 {

void append(std::string &out, char32_t codepoint) {
  if (!isScalar(codepoint))
    throw Error::invalidValue(Unexpected::ofChar(codepoint), "a Unicode scalar value");
  auto cp = static_cast<uint32_t>(codepoint);
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Decodes one code point starting at s[pos] and advances pos past it.
// Rejects overlong forms, surrogates and values above U+10FFFF.
static std::optional<char32_t> next(std::string_view s, size_t &pos) {
  auto lead = static_cast<unsigned char>(s[pos]);
  size_t len;
  uint32_t cp;
  if (lead < 0x80) {
    ++pos;
    return static_cast<char32_t>(lead);
  } else if ((lead & 0xE0) == 0xC0) {
    len = 2;
    cp = lead & 0x1F;
  } else if ((lead & 0xF0) == 0xE0) {
    len = 3;
    cp = lead & 0x0F;
  } else if ((lead & 0xF8) == 0xF0) {
    len = 4;
    cp = lead & 0x07;
  } else {
    return std::nullopt;
  }
  if (pos + len > s.size())
    return std::nullopt;
  for (size_t i = 1; i < len; ++i) {
    auto c = static_cast<unsigned char>(s[pos + i]);
    if ((c & 0xC0) != 0x80)
      return std::nullopt;
    cp = (cp << 6) | (c & 0x3F);
  }
  static constexpr uint32_t minForLen[] = {0, 0, 0x80, 0x800, 0x10000};
  if (cp < minForLen[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    return std::nullopt;
  pos += len;
  return static_cast<char32_t>(cp);
}

bool isValid(std::string_view s) {
  size_t pos = 0;
  while (pos < s.size()) {
    if (!next(s, pos))
      return false;
  }
  return true;
}

std::optional<char32_t> singleCodePoint(std::string_view s) {
  if (s.empty())
    return std::nullopt;
  size_t pos = 0;
  auto cp = next(s, pos);
  if (!cp || pos != s.size())
    return std::nullopt;
  return cp;
}

} // namespace utf8
} // namespace either
