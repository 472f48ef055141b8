//===- value.h - Format-agnostic decoded value ------------------*- C++ -*-===//
//
// A Value is whatever a front-end decoder produced, independent of the type
// it will finally be decoded into. It is self-describing: its shape can be
// inspected without the original bytes, and it can be replayed through any
// typed decoder (see codec.h).
//
// Value model:
//   - Scalars: bool, u8..u64, i8..i64, f32, f64, char, string, bytes
//   - Unit, Option (empty or one inner value), Newtype (one inner value)
//   - Seq (ordered values), Map (ordered key/value pairs, keys of any shape)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "either/error.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace either {

/// Active alternative of a Value, in variant order.
enum class ValueKind : int {
  Bool,
  U8,
  U16,
  U32,
  U64,
  I8,
  I16,
  I32,
  I64,
  F32,
  F64,
  Char,
  String,
  Unit,
  Option,
  Newtype,
  Seq,
  Map,
  Bytes,
};

std::string_view kindName(ValueKind kind);

struct Value;

/// Owning heap slot for the recursive alternatives. Copies are deep.
class ValueBox {
public:
  ValueBox();
  explicit ValueBox(Value value);
  ValueBox(const ValueBox &other);
  ValueBox(ValueBox &&other) noexcept;
  ValueBox &operator=(const ValueBox &other);
  ValueBox &operator=(ValueBox &&other) noexcept;
  ~ValueBox();

  const Value *get() const { return ptr_.get(); }
  explicit operator bool() const { return ptr_ != nullptr; }

private:
  std::unique_ptr<Value> ptr_;
};

struct Unit {
  bool operator==(const Unit &) const = default;
};

/// Empty inner slot means None.
struct ValueOption {
  ValueBox inner;
};

struct ValueNewtype {
  ValueBox inner;
};

struct Bytes {
  std::vector<uint8_t> data;
  bool operator==(const Bytes &) const = default;
};

using ValueSeq = std::vector<Value>;
using ValueMap = std::vector<std::pair<Value, Value>>;

bool operator==(const ValueOption &a, const ValueOption &b);
bool operator==(const ValueNewtype &a, const ValueNewtype &b);

struct Value {
  using Storage = std::variant<bool, uint8_t, uint16_t, uint32_t, uint64_t, int8_t, int16_t,
                               int32_t, int64_t, float, double, char32_t, std::string, Unit,
                               ValueOption, ValueNewtype, ValueSeq, ValueMap, Bytes>;

  Storage v;

  Value() : v(Unit{}) {}
  explicit Value(Storage storage) : v(std::move(storage)) {}

  // Named constructors; the integer and char alternatives would make plain
  // converting constructors ambiguous.
  static Value boolean(bool b);
  static Value u8(uint8_t n);
  static Value u16(uint16_t n);
  static Value u32(uint32_t n);
  static Value u64(uint64_t n);
  static Value i8(int8_t n);
  static Value i16(int16_t n);
  static Value i32(int32_t n);
  static Value i64(int64_t n);
  static Value f32(float f);
  static Value f64(double f);
  static Value character(char32_t c);
  static Value string(std::string s);
  static Value unit();
  static Value none();
  static Value some(Value inner);
  static Value newtype(Value inner);
  static Value seq(ValueSeq items);
  static Value map(ValueMap entries);
  static Value bytes(std::vector<uint8_t> data);

  ValueKind kind() const { return static_cast<ValueKind>(v.index()); }

  bool isString() const { return std::holds_alternative<std::string>(v); }
  bool isBytes() const { return std::holds_alternative<Bytes>(v); }
  bool isSeq() const { return std::holds_alternative<ValueSeq>(v); }
  bool isMap() const { return std::holds_alternative<ValueMap>(v); }
  bool isUnit() const { return std::holds_alternative<Unit>(v); }

  template <typename T> const T *getIf() const { return std::get_if<T>(&v); }

  const std::string &asString() const { return std::get<std::string>(v); }
  const Bytes &asBytes() const { return std::get<Bytes>(v); }
  const ValueSeq &asSeq() const { return std::get<ValueSeq>(v); }
  const ValueMap &asMap() const { return std::get<ValueMap>(v); }

  bool operator==(const Value &other) const;
};

/// Describe the value for an error message. Integer widths fold to
/// Unsigned/Signed and float widths to Float.
Unexpected unexpected(const Value &value);

/// Look up a string key in a map value. Throws InvalidType if \p obj is not
/// a map; returns nullptr if the key is absent.
const Value *mapGet(const Value &obj, std::string_view key);

/// Like mapGet, but throws MissingField if the key is absent.
const Value &mapReq(const Value &obj, std::string_view key);

} // namespace either
