//===- error.h - Decode/encode error model for either -----------*- C++ -*-===//
//
// Every failure in the library is reported as an either::Error. Shape
// mismatches additionally carry a description of the offending value and the
// static text naming the shapes that would have been accepted.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace either {

enum class ErrorKind {
  Syntax,       // malformed front-end input (JSON text, msgpack bytes)
  InvalidType,  // value of the wrong shape for the target type
  InvalidValue, // right shape, unacceptable content (out of range, bad UTF-8)
  MissingField, // required struct field absent
  Unsupported,  // value cannot be represented by the target front-end
};

std::string_view errorKindName(ErrorKind kind);

/// Description of an offending value, used only for error messages.
///
/// Integer widths fold to Unsigned/Signed and float widths to Float, so the
/// message reads the same whichever front-end produced the value.
struct Unexpected {
  enum class Kind {
    Bool,
    Unsigned,
    Signed,
    Float,
    Char,
    Str,
    Bytes,
    Unit,
    Option,
    NewtypeStruct,
    Seq,
    Map,
  };

  Kind kind = Kind::Unit;
  std::variant<std::monostate, bool, uint64_t, int64_t, double, char32_t, std::string> payload;

  static Unexpected ofBool(bool b);
  static Unexpected ofUnsigned(uint64_t n);
  static Unexpected ofSigned(int64_t n);
  static Unexpected ofFloat(double f);
  static Unexpected ofChar(char32_t c);
  static Unexpected ofStr(std::string s);
  /// For the payload-free kinds (Bytes, Unit, Option, NewtypeStruct, Seq, Map).
  static Unexpected ofKind(Kind kind);

  /// Human-readable form, e.g. "integer `18`" or "sequence".
  std::string describe() const;

  /// Variant form, e.g. "Unsigned(18)", "Bool(false)" or "Seq".
  std::string debugString() const;

  bool operator==(const Unexpected &) const = default;
};

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg);

  ErrorKind kind() const noexcept { return kind_; }

  /// The offending value, set for InvalidType and InvalidValue.
  const std::optional<Unexpected> &unexpected() const noexcept { return unexpected_; }

  /// What would have been accepted, set for InvalidType and InvalidValue.
  const std::string &expected() const noexcept { return expected_; }

  static Error syntax(const std::string &msg);
  static Error invalidType(Unexpected actual, std::string_view expected);
  static Error invalidValue(Unexpected actual, std::string_view expected);
  static Error missingField(std::string_view field);
  static Error unsupported(const std::string &msg);

private:
  ErrorKind kind_;
  std::optional<Unexpected> unexpected_;
  std::string expected_;
};

} // namespace either
