//===- codec.cpp - Built-in decoders and encoders over Value --------------===//
//
// Scalar decoders follow the usual self-describing rules: an integer target
// takes any integer in range, a float target also takes integers, a string
// target also takes chars and UTF-8 bytes. Everything else is an InvalidType
// error naming the target.
//
//===----------------------------------------------------------------------===//

#include "either/codec.h"

#include "utf8.h"

#include <limits>
#include <optional>
#include <type_traits>

namespace either {

// ── Integer helpers ─────────────────────────────────────────────────────────

static std::optional<uint64_t> asUnsigned(const Value &value) {
  switch (value.kind()) {
  case ValueKind::U8:
    return std::get<uint8_t>(value.v);
  case ValueKind::U16:
    return std::get<uint16_t>(value.v);
  case ValueKind::U32:
    return std::get<uint32_t>(value.v);
  case ValueKind::U64:
    return std::get<uint64_t>(value.v);
  default:
    return std::nullopt;
  }
}

static std::optional<int64_t> asSigned(const Value &value) {
  switch (value.kind()) {
  case ValueKind::I8:
    return std::get<int8_t>(value.v);
  case ValueKind::I16:
    return std::get<int16_t>(value.v);
  case ValueKind::I32:
    return std::get<int32_t>(value.v);
  case ValueKind::I64:
    return std::get<int64_t>(value.v);
  default:
    return std::nullopt;
  }
}

template <typename Int>
static void decodeInteger(const Value &value, Int &out, std::string_view expected) {
  using Limits = std::numeric_limits<Int>;
  if (auto u = asUnsigned(value)) {
    if (*u > static_cast<uint64_t>(Limits::max()))
      throw Error::invalidValue(Unexpected::ofUnsigned(*u), expected);
    out = static_cast<Int>(*u);
    return;
  }
  if (auto s = asSigned(value)) {
    bool fits;
    if constexpr (std::is_signed_v<Int>)
      fits = *s >= static_cast<int64_t>(Limits::min()) && *s <= static_cast<int64_t>(Limits::max());
    else
      fits = *s >= 0 && static_cast<uint64_t>(*s) <= static_cast<uint64_t>(Limits::max());
    if (!fits)
      throw Error::invalidValue(Unexpected::ofSigned(*s), expected);
    out = static_cast<Int>(*s);
    return;
  }
  throw Error::invalidType(unexpected(value), expected);
}

template <typename Float>
static void decodeFloat(const Value &value, Float &out, std::string_view expected) {
  if (const auto *f = value.getIf<float>()) {
    out = static_cast<Float>(*f);
    return;
  }
  if (const auto *d = value.getIf<double>()) {
    out = static_cast<Float>(*d);
    return;
  }
  if (auto u = asUnsigned(value)) {
    out = static_cast<Float>(*u);
    return;
  }
  if (auto s = asSigned(value)) {
    out = static_cast<Float>(*s);
    return;
  }
  throw Error::invalidType(unexpected(value), expected);
}

// ── Decoders ────────────────────────────────────────────────────────────────

void from_value(const Value &value, bool &out) {
  const auto *b = value.getIf<bool>();
  if (!b)
    throw Error::invalidType(unexpected(value), "a boolean");
  out = *b;
}

void from_value(const Value &value, uint8_t &out) {
  decodeInteger(value, out, "u8");
}

void from_value(const Value &value, uint16_t &out) {
  decodeInteger(value, out, "u16");
}

void from_value(const Value &value, uint32_t &out) {
  decodeInteger(value, out, "u32");
}

void from_value(const Value &value, uint64_t &out) {
  decodeInteger(value, out, "u64");
}

void from_value(const Value &value, int8_t &out) {
  decodeInteger(value, out, "i8");
}

void from_value(const Value &value, int16_t &out) {
  decodeInteger(value, out, "i16");
}

void from_value(const Value &value, int32_t &out) {
  decodeInteger(value, out, "i32");
}

void from_value(const Value &value, int64_t &out) {
  decodeInteger(value, out, "i64");
}

void from_value(const Value &value, float &out) {
  decodeFloat(value, out, "f32");
}

void from_value(const Value &value, double &out) {
  decodeFloat(value, out, "f64");
}

void from_value(const Value &value, char32_t &out) {
  if (const auto *c = value.getIf<char32_t>()) {
    if (!utf8::isScalar(*c))
      throw Error::invalidValue(Unexpected::ofChar(*c), "a Unicode scalar value");
    out = *c;
    return;
  }
  if (const auto *s = value.getIf<std::string>()) {
    auto cp = utf8::singleCodePoint(*s);
    if (!cp)
      throw Error::invalidValue(Unexpected::ofStr(*s), "a character");
    out = *cp;
    return;
  }
  throw Error::invalidType(unexpected(value), "a character");
}

void from_value(const Value &value, std::string &out) {
  if (const auto *s = value.getIf<std::string>()) {
    out = *s;
    return;
  }
  if (const auto *c = value.getIf<char32_t>()) {
    out = utf8::encode(*c);
    return;
  }
  if (const auto *b = value.getIf<Bytes>()) {
    std::string_view text(reinterpret_cast<const char *>(b->data.data()), b->data.size());
    if (!utf8::isValid(text))
      throw Error::invalidValue(Unexpected::ofKind(Unexpected::Kind::Bytes), "a string");
    out = std::string(text);
    return;
  }
  throw Error::invalidType(unexpected(value), "a string");
}

void from_value(const Value &value, Bytes &out) {
  if (const auto *b = value.getIf<Bytes>()) {
    out = *b;
    return;
  }
  if (const auto *s = value.getIf<std::string>()) {
    out.data.assign(s->begin(), s->end());
    return;
  }
  throw Error::invalidType(unexpected(value), "a byte array");
}

void from_value(const Value &value, Value &out) {
  out = value;
}

// ── Encoders ────────────────────────────────────────────────────────────────

void to_value(Value &out, bool in) {
  out = Value::boolean(in);
}

void to_value(Value &out, uint8_t in) {
  out = Value::u8(in);
}

void to_value(Value &out, uint16_t in) {
  out = Value::u16(in);
}

void to_value(Value &out, uint32_t in) {
  out = Value::u32(in);
}

void to_value(Value &out, uint64_t in) {
  out = Value::u64(in);
}

void to_value(Value &out, int8_t in) {
  out = Value::i8(in);
}

void to_value(Value &out, int16_t in) {
  out = Value::i16(in);
}

void to_value(Value &out, int32_t in) {
  out = Value::i32(in);
}

void to_value(Value &out, int64_t in) {
  out = Value::i64(in);
}

void to_value(Value &out, float in) {
  out = Value::f32(in);
}

void to_value(Value &out, double in) {
  out = Value::f64(in);
}

void to_value(Value &out, char32_t in) {
  out = Value::character(in);
}

void to_value(Value &out, const std::string &in) {
  out = Value::string(in);
}

void to_value(Value &out, const Bytes &in) {
  out = Value::bytes(in.data);
}

void to_value(Value &out, const Value &in) {
  out = in;
}

// ── Struct helpers ──────────────────────────────────────────────────────────

const ValueMap &expectMap(const Value &value, std::string_view expected) {
  const auto *entries = value.getIf<ValueMap>();
  if (!entries)
    throw Error::invalidType(unexpected(value), expected);
  return *entries;
}

} // namespace either
