//===- value.cpp - Format-agnostic decoded value --------------------------===//

#include "either/value.h"

namespace either {

std::string_view kindName(ValueKind kind) {
  switch (kind) {
  case ValueKind::Bool:
    return "bool";
  case ValueKind::U8:
    return "u8";
  case ValueKind::U16:
    return "u16";
  case ValueKind::U32:
    return "u32";
  case ValueKind::U64:
    return "u64";
  case ValueKind::I8:
    return "i8";
  case ValueKind::I16:
    return "i16";
  case ValueKind::I32:
    return "i32";
  case ValueKind::I64:
    return "i64";
  case ValueKind::F32:
    return "f32";
  case ValueKind::F64:
    return "f64";
  case ValueKind::Char:
    return "char";
  case ValueKind::String:
    return "string";
  case ValueKind::Unit:
    return "unit";
  case ValueKind::Option:
    return "option";
  case ValueKind::Newtype:
    return "newtype";
  case ValueKind::Seq:
    return "seq";
  case ValueKind::Map:
    return "map";
  case ValueKind::Bytes:
    return "bytes";
  }
  return "unknown";
}

// ── ValueBox ────────────────────────────────────────────────────────────────

ValueBox::ValueBox() = default;

ValueBox::ValueBox(Value value) : ptr_(std::make_unique<Value>(std::move(value))) {}

ValueBox::ValueBox(const ValueBox &other)
    : ptr_(other.ptr_ ? std::make_unique<Value>(*other.ptr_) : nullptr) {}

ValueBox::ValueBox(ValueBox &&other) noexcept = default;

ValueBox &ValueBox::operator=(const ValueBox &other) {
  if (this != &other)
    ptr_ = other.ptr_ ? std::make_unique<Value>(*other.ptr_) : nullptr;
  return *this;
}

ValueBox &ValueBox::operator=(ValueBox &&other) noexcept = default;

ValueBox::~ValueBox() = default;

static bool boxesEqual(const ValueBox &a, const ValueBox &b) {
  if (!a || !b)
    return !a && !b;
  return *a.get() == *b.get();
}

bool operator==(const ValueOption &a, const ValueOption &b) {
  return boxesEqual(a.inner, b.inner);
}

bool operator==(const ValueNewtype &a, const ValueNewtype &b) {
  return boxesEqual(a.inner, b.inner);
}

// ── Value ───────────────────────────────────────────────────────────────────

Value Value::boolean(bool b) {
  return Value(Storage(std::in_place_type<bool>, b));
}

Value Value::u8(uint8_t n) {
  return Value(Storage(std::in_place_type<uint8_t>, n));
}

Value Value::u16(uint16_t n) {
  return Value(Storage(std::in_place_type<uint16_t>, n));
}

Value Value::u32(uint32_t n) {
  return Value(Storage(std::in_place_type<uint32_t>, n));
}

Value Value::u64(uint64_t n) {
  return Value(Storage(std::in_place_type<uint64_t>, n));
}

Value Value::i8(int8_t n) {
  return Value(Storage(std::in_place_type<int8_t>, n));
}

Value Value::i16(int16_t n) {
  return Value(Storage(std::in_place_type<int16_t>, n));
}

Value Value::i32(int32_t n) {
  return Value(Storage(std::in_place_type<int32_t>, n));
}

Value Value::i64(int64_t n) {
  return Value(Storage(std::in_place_type<int64_t>, n));
}

Value Value::f32(float f) {
  return Value(Storage(std::in_place_type<float>, f));
}

Value Value::f64(double f) {
  return Value(Storage(std::in_place_type<double>, f));
}

Value Value::character(char32_t c) {
  return Value(Storage(std::in_place_type<char32_t>, c));
}

Value Value::string(std::string s) {
  return Value(Storage(std::in_place_type<std::string>, std::move(s)));
}

Value Value::unit() {
  return Value();
}

Value Value::none() {
  return Value(Storage(std::in_place_type<ValueOption>));
}

Value Value::some(Value inner) {
  return Value(Storage(std::in_place_type<ValueOption>, ValueOption{ValueBox(std::move(inner))}));
}

Value Value::newtype(Value inner) {
  return Value(
      Storage(std::in_place_type<ValueNewtype>, ValueNewtype{ValueBox(std::move(inner))}));
}

Value Value::seq(ValueSeq items) {
  return Value(Storage(std::in_place_type<ValueSeq>, std::move(items)));
}

Value Value::map(ValueMap entries) {
  return Value(Storage(std::in_place_type<ValueMap>, std::move(entries)));
}

Value Value::bytes(std::vector<uint8_t> data) {
  return Value(Storage(std::in_place_type<Bytes>, Bytes{std::move(data)}));
}

bool Value::operator==(const Value &other) const {
  return v == other.v;
}

// ── Classification ──────────────────────────────────────────────────────────

Unexpected unexpected(const Value &value) {
  using K = Unexpected::Kind;
  switch (value.kind()) {
  case ValueKind::Bool:
    return Unexpected::ofBool(std::get<bool>(value.v));
  case ValueKind::U8:
    return Unexpected::ofUnsigned(std::get<uint8_t>(value.v));
  case ValueKind::U16:
    return Unexpected::ofUnsigned(std::get<uint16_t>(value.v));
  case ValueKind::U32:
    return Unexpected::ofUnsigned(std::get<uint32_t>(value.v));
  case ValueKind::U64:
    return Unexpected::ofUnsigned(std::get<uint64_t>(value.v));
  case ValueKind::I8:
    return Unexpected::ofSigned(std::get<int8_t>(value.v));
  case ValueKind::I16:
    return Unexpected::ofSigned(std::get<int16_t>(value.v));
  case ValueKind::I32:
    return Unexpected::ofSigned(std::get<int32_t>(value.v));
  case ValueKind::I64:
    return Unexpected::ofSigned(std::get<int64_t>(value.v));
  case ValueKind::F32:
    return Unexpected::ofFloat(std::get<float>(value.v));
  case ValueKind::F64:
    return Unexpected::ofFloat(std::get<double>(value.v));
  case ValueKind::Char:
    return Unexpected::ofChar(std::get<char32_t>(value.v));
  case ValueKind::String:
    return Unexpected::ofStr(value.asString());
  case ValueKind::Unit:
    return Unexpected::ofKind(K::Unit);
  case ValueKind::Option:
    return Unexpected::ofKind(K::Option);
  case ValueKind::Newtype:
    return Unexpected::ofKind(K::NewtypeStruct);
  case ValueKind::Seq:
    return Unexpected::ofKind(K::Seq);
  case ValueKind::Map:
    return Unexpected::ofKind(K::Map);
  case ValueKind::Bytes:
    return Unexpected::ofKind(K::Bytes);
  }
  return Unexpected::ofKind(K::Unit);
}

// ── Map lookup ──────────────────────────────────────────────────────────────

const Value *mapGet(const Value &obj, std::string_view key) {
  const auto *entries = obj.getIf<ValueMap>();
  if (!entries)
    throw Error::invalidType(unexpected(obj), "a map");
  for (const auto &[k, val] : *entries) {
    const auto *name = k.getIf<std::string>();
    if (name && *name == key)
      return &val;
  }
  return nullptr;
}

const Value &mapReq(const Value &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  if (!v)
    throw Error::missingField(key);
  return *v;
}

} // namespace either
