//===- dispatch.h - Shape-dispatch decoding for either-types ----*- C++ -*-===//
//
// Decoding an either-type is a one-shot, non-backtracking decision made on
// the top-level shape of the buffered Value:
//
//   string / bytes  -> StringCase    (never tried against S or V)
//   sequence        -> VecCase<V>    (decoded as V)
//   map             -> StructCase<S> (decoded as S)
//   anything else   -> Error(InvalidType) carrying the value and the
//                      expected-shape text
//
// Once a case is chosen, an error from the payload decoder propagates
// unchanged; no other case is attempted.
//
// StringOrStruct<S> reuses the three-way dispatcher with S in both payload
// slots and folds VecCase<S> into StructCase<S>, so a sequence decodes into S
// itself (S = std::vector<uint8_t> accepts [1, 2, 3] as its struct form).
//
// SingleOrVec<S> is a separate two-way split: a sequence decodes as
// std::vector<S>, anything else as a single S. It raises no shape error of
// its own; a bad shape surfaces as whatever error S's decoder throws.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "either/codec.h"
#include "either/either_types.h"
#include "either/error.h"
#include "either/value.h"

#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace either {

/// Top-level shape of a Value as seen by the dispatcher.
enum class Shape {
  String, // string or bytes
  Seq,
  Map,
  Other, // bool, numbers, char, unit, option, newtype
};

Shape shapeOf(const Value &value) noexcept;

/// Expected-shape text reported by the StringOrStructOrVec decoder.
inline constexpr std::string_view kExpectStringStructOrVec = "String, Struct or Vec";
/// Expected-shape text reported by the StringOrStruct decoder.
inline constexpr std::string_view kExpectStringOrStruct = "String or Struct";

/// Shared three-way dispatcher. \p expected is the text put in the shape
/// mismatch error.
template <typename S, typename V>
StringOrStructOrVec<S, V> dispatchStringStructOrVec(const Value &value,
                                                    std::string_view expected) {
  switch (shapeOf(value)) {
  case Shape::String:
    return {StringCase{decode<std::string>(value)}};
  case Shape::Seq:
    return {VecCase<V>{decode<V>(value)}};
  case Shape::Map:
    return {StructCase<S>{decode<S>(value)}};
  case Shape::Other:
    break;
  }
  throw Error::invalidType(unexpected(value), expected);
}

// ── Decoders ────────────────────────────────────────────────────────────────

template <typename S, typename V>
void from_value(const Value &value, StringOrStructOrVec<S, V> &out) {
  out = dispatchStringStructOrVec<S, V>(value, kExpectStringStructOrVec);
}

template <typename S> void from_value(const Value &value, StringOrStruct<S> &out) {
  auto dispatched = dispatchStringStructOrVec<S, S>(value, kExpectStringOrStruct);
  if (auto *str = std::get_if<StringCase>(&dispatched.kind)) {
    out.kind = std::move(*str);
  } else if (auto *st = std::get_if<StructCase<S>>(&dispatched.kind)) {
    out.kind = std::move(*st);
  } else {
    out.kind = StructCase<S>{std::move(std::get<VecCase<S>>(dispatched.kind).value)};
  }
}

template <typename S> void from_value(const Value &value, SingleOrVec<S> &out) {
  if (shapeOf(value) == Shape::Seq) {
    out.kind = VecCase<std::vector<S>>{decode<std::vector<S>>(value)};
    return;
  }
  out.kind = SingleCase<S>{decode<S>(value)};
}

// ── Encoders ────────────────────────────────────────────────────────────────

// The active payload is encoded as if it stood alone; no case tag is written.

template <typename S, typename V>
void to_value(Value &out, const StringOrStructOrVec<S, V> &in) {
  std::visit([&](const auto &c) { out = encode(c.value); }, in.kind);
}

template <typename S> void to_value(Value &out, const StringOrStruct<S> &in) {
  std::visit([&](const auto &c) { out = encode(c.value); }, in.kind);
}

template <typename S> void to_value(Value &out, const SingleOrVec<S> &in) {
  std::visit([&](const auto &c) { out = encode(c.value); }, in.kind);
}

} // namespace either
