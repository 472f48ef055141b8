//===- error.cpp - Decode/encode error model ------------------------------===//

#include "either/error.h"

#include "utf8.h"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>
#include <utility>

namespace either {

std::string_view errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Syntax:
    return "syntax";
  case ErrorKind::InvalidType:
    return "invalid type";
  case ErrorKind::InvalidValue:
    return "invalid value";
  case ErrorKind::MissingField:
    return "missing field";
  case ErrorKind::Unsupported:
    return "unsupported";
  }
  return "unknown";
}

// ── Unexpected ──────────────────────────────────────────────────────────────

Unexpected Unexpected::ofBool(bool b) {
  return Unexpected{Kind::Bool, b};
}

Unexpected Unexpected::ofUnsigned(uint64_t n) {
  return Unexpected{Kind::Unsigned, n};
}

Unexpected Unexpected::ofSigned(int64_t n) {
  return Unexpected{Kind::Signed, n};
}

Unexpected Unexpected::ofFloat(double f) {
  return Unexpected{Kind::Float, f};
}

Unexpected Unexpected::ofChar(char32_t c) {
  return Unexpected{Kind::Char, c};
}

Unexpected Unexpected::ofStr(std::string s) {
  return Unexpected{Kind::Str, std::move(s)};
}

Unexpected Unexpected::ofKind(Kind kind) {
  return Unexpected{kind, std::monostate{}};
}

/// Shortest round-trip form, always with a decimal point or exponent so
/// that 1.0 does not read as an integer.
static std::string formatFloat(double f) {
  if (std::isnan(f))
    return "NaN";
  if (std::isinf(f))
    return f > 0 ? "inf" : "-inf";
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), f);
  if (res.ec != std::errc())
    return "?";
  std::string out(buf, res.ptr);
  if (out.find_first_of(".e") == std::string::npos)
    out += ".0";
  return out;
}

/// Text of a char payload. Non-scalar code points are shown escaped, since
/// they have no UTF-8 form.
static std::string charText(char32_t c) {
  if (utf8::isScalar(c))
    return utf8::encode(c);
  char esc[16];
  std::snprintf(esc, sizeof(esc), "\\u{%x}", static_cast<unsigned>(c));
  return esc;
}

static std::string quote(std::string_view s, char delim) {
  std::string out;
  out.push_back(delim);
  for (char c : s) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c == delim) {
        out.push_back('\\');
        out.push_back(c);
      } else if (static_cast<unsigned char>(c) < 0x20) {
        char esc[8];
        std::snprintf(esc, sizeof(esc), "\\u{%x}", static_cast<unsigned>(c));
        out += esc;
      } else {
        out.push_back(c);
      }
    }
  }
  out.push_back(delim);
  return out;
}

std::string Unexpected::describe() const {
  switch (kind) {
  case Kind::Bool:
    return std::string("boolean `") + (std::get<bool>(payload) ? "true" : "false") + "`";
  case Kind::Unsigned:
    return "integer `" + std::to_string(std::get<uint64_t>(payload)) + "`";
  case Kind::Signed:
    return "integer `" + std::to_string(std::get<int64_t>(payload)) + "`";
  case Kind::Float:
    return "floating point `" + formatFloat(std::get<double>(payload)) + "`";
  case Kind::Char:
    return "character `" + charText(std::get<char32_t>(payload)) + "`";
  case Kind::Str:
    return "string " + quote(std::get<std::string>(payload), '"');
  case Kind::Bytes:
    return "byte array";
  case Kind::Unit:
    return "unit value";
  case Kind::Option:
    return "Option value";
  case Kind::NewtypeStruct:
    return "newtype struct";
  case Kind::Seq:
    return "sequence";
  case Kind::Map:
    return "map";
  }
  return "unknown value";
}

std::string Unexpected::debugString() const {
  switch (kind) {
  case Kind::Bool:
    return std::string("Bool(") + (std::get<bool>(payload) ? "true" : "false") + ")";
  case Kind::Unsigned:
    return "Unsigned(" + std::to_string(std::get<uint64_t>(payload)) + ")";
  case Kind::Signed:
    return "Signed(" + std::to_string(std::get<int64_t>(payload)) + ")";
  case Kind::Float:
    return "Float(" + formatFloat(std::get<double>(payload)) + ")";
  case Kind::Char:
    return "Char(" + quote(charText(std::get<char32_t>(payload)), '\'') + ")";
  case Kind::Str:
    return "Str(" + quote(std::get<std::string>(payload), '"') + ")";
  case Kind::Bytes:
    return "Bytes";
  case Kind::Unit:
    return "Unit";
  case Kind::Option:
    return "Option";
  case Kind::NewtypeStruct:
    return "NewtypeStruct";
  case Kind::Seq:
    return "Seq";
  case Kind::Map:
    return "Map";
  }
  return "Unknown";
}

// ── Error ───────────────────────────────────────────────────────────────────

Error::Error(ErrorKind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {}

Error Error::syntax(const std::string &msg) {
  return Error(ErrorKind::Syntax, msg);
}

Error Error::invalidType(Unexpected actual, std::string_view expected) {
  Error err(ErrorKind::InvalidType,
            "invalid type: " + actual.describe() + ", expected " + std::string(expected));
  err.unexpected_ = std::move(actual);
  err.expected_ = std::string(expected);
  return err;
}

Error Error::invalidValue(Unexpected actual, std::string_view expected) {
  Error err(ErrorKind::InvalidValue,
            "invalid value: " + actual.describe() + ", expected " + std::string(expected));
  err.unexpected_ = std::move(actual);
  err.expected_ = std::string(expected);
  return err;
}

Error Error::missingField(std::string_view field) {
  return Error(ErrorKind::MissingField, "missing field `" + std::string(field) + "`");
}

Error Error::unsupported(const std::string &msg) {
  return Error(ErrorKind::Unsupported, msg);
}

} // namespace either
