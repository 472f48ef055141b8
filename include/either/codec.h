//===- codec.h - Typed decode/encode over Value -----------------*- C++ -*-===//
//
// decode<T>(value) replays an already-built Value through the typed decoder
// for T; encode<T>(x) builds the Value that T would produce. This is what
// lets a caller inspect a Value first and choose the target type afterwards.
//
// Types join the pipeline by providing, in their own namespace:
//
//   void from_value(const either::Value &value, T &out);
//   void to_value(either::Value &out, const T &in);
//
// Struct decoders usually start with expectMap() and read members with
// readField(); struct encoders append members with writeField().
//
//===----------------------------------------------------------------------===//

#pragma once

#include "either/error.h"
#include "either/value.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace either {

// ── Built-in decoders ───────────────────────────────────────────────────────

void from_value(const Value &value, bool &out);
void from_value(const Value &value, uint8_t &out);
void from_value(const Value &value, uint16_t &out);
void from_value(const Value &value, uint32_t &out);
void from_value(const Value &value, uint64_t &out);
void from_value(const Value &value, int8_t &out);
void from_value(const Value &value, int16_t &out);
void from_value(const Value &value, int32_t &out);
void from_value(const Value &value, int64_t &out);
void from_value(const Value &value, float &out);
void from_value(const Value &value, double &out);
void from_value(const Value &value, char32_t &out);
void from_value(const Value &value, std::string &out);
void from_value(const Value &value, Bytes &out);
void from_value(const Value &value, Value &out);

template <typename T> void from_value(const Value &value, std::vector<T> &out);
template <typename T> void from_value(const Value &value, std::optional<T> &out);
template <typename T> void from_value(const Value &value, std::map<std::string, T> &out);

// ── Built-in encoders ───────────────────────────────────────────────────────

void to_value(Value &out, bool in);
void to_value(Value &out, uint8_t in);
void to_value(Value &out, uint16_t in);
void to_value(Value &out, uint32_t in);
void to_value(Value &out, uint64_t in);
void to_value(Value &out, int8_t in);
void to_value(Value &out, int16_t in);
void to_value(Value &out, int32_t in);
void to_value(Value &out, int64_t in);
void to_value(Value &out, float in);
void to_value(Value &out, double in);
void to_value(Value &out, char32_t in);
void to_value(Value &out, const std::string &in);
void to_value(Value &out, const Bytes &in);
void to_value(Value &out, const Value &in);

template <typename T> void to_value(Value &out, const std::vector<T> &in);
template <typename T> void to_value(Value &out, const std::optional<T> &in);
template <typename T> void to_value(Value &out, const std::map<std::string, T> &in);

// ── Entry points ────────────────────────────────────────────────────────────

/// Decode a buffered Value as T. Errors from T's decoder propagate as-is.
template <typename T> T decode(const Value &value) {
  T out{};
  from_value(value, out);
  return out;
}

template <typename T> Value encode(const T &in) {
  Value out;
  to_value(out, in);
  return out;
}

// ── Struct helpers ──────────────────────────────────────────────────────────

/// Require a map value; otherwise throw InvalidType naming \p expected
/// (e.g. "struct Person").
const ValueMap &expectMap(const Value &value, std::string_view expected);

/// Decode a required member. Throws MissingField if absent.
template <typename T> void readField(const Value &obj, std::string_view key, T &out) {
  from_value(mapReq(obj, key), out);
}

/// Decode an optional member; an absent key leaves nullopt.
template <typename T>
void readField(const Value &obj, std::string_view key, std::optional<T> &out) {
  const auto *v = mapGet(obj, key);
  if (!v) {
    out.reset();
    return;
  }
  from_value(*v, out);
}

template <typename T> void writeField(ValueMap &obj, std::string_view key, const T &in) {
  obj.emplace_back(Value::string(std::string(key)), encode(in));
}

// ── Template definitions ────────────────────────────────────────────────────

template <typename T> void from_value(const Value &value, std::vector<T> &out) {
  const auto *items = value.getIf<ValueSeq>();
  if (!items)
    throw Error::invalidType(unexpected(value), "a sequence");
  out.clear();
  out.reserve(items->size());
  for (const auto &item : *items) {
    T elem{};
    from_value(item, elem);
    out.push_back(std::move(elem));
  }
}

template <typename T> void from_value(const Value &value, std::optional<T> &out) {
  if (value.isUnit()) {
    out.reset();
    return;
  }
  const Value *inner = &value;
  if (const auto *opt = value.getIf<ValueOption>()) {
    if (!opt->inner) {
      out.reset();
      return;
    }
    inner = opt->inner.get();
  }
  T elem{};
  from_value(*inner, elem);
  out = std::move(elem);
}

template <typename T> void from_value(const Value &value, std::map<std::string, T> &out) {
  const auto *entries = value.getIf<ValueMap>();
  if (!entries)
    throw Error::invalidType(unexpected(value), "a map");
  out.clear();
  for (const auto &[k, v] : *entries) {
    std::string key;
    from_value(k, key);
    T elem{};
    from_value(v, elem);
    out.insert_or_assign(std::move(key), std::move(elem));
  }
}

template <typename T> void to_value(Value &out, const std::vector<T> &in) {
  ValueSeq items;
  items.reserve(in.size());
  for (const auto &elem : in)
    items.push_back(encode(elem));
  out = Value::seq(std::move(items));
}

template <typename T> void to_value(Value &out, const std::optional<T> &in) {
  out = in ? Value::some(encode(*in)) : Value::none();
}

template <typename T> void to_value(Value &out, const std::map<std::string, T> &in) {
  ValueMap entries;
  entries.reserve(in.size());
  for (const auto &[k, v] : in)
    entries.emplace_back(Value::string(k), encode(v));
  out = Value::map(std::move(entries));
}

} // namespace either
