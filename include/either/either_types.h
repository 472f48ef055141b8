//===- either_types.h - Fields that accept several wire shapes --*- C++ -*-===//
//
// The either-types let one data-model field accept alternative wire
// representations:
//
//   StringOrStruct<S>          "text"  | {...} decoded as S
//   StringOrStructOrVec<S, V>  "text"  | {...} decoded as S | [...] decoded as V
//   SingleOrVec<S>             x decoded as S | [...] decoded as std::vector<S>
//
// Each is a closed sum type: exactly one case is active. Encoding writes only
// the active payload, with no tag, so the output looks exactly like a value
// of the payload type. Decoding rules are in dispatch.h.
//
// Example:
//
//   struct Book {
//     either::StringOrStruct<Authors> authors;
//   };
//
//   if (const auto *name = book.authors.asString()) ...
//   else if (const auto *a = book.authors.asStruct()) ...
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace either {

// ── Cases ───────────────────────────────────────────────────────────────────

struct StringCase {
  std::string value;
  bool operator==(const StringCase &) const = default;
};

template <typename S> struct StructCase {
  S value;
  bool operator==(const StructCase &) const = default;
};

template <typename V> struct VecCase {
  V value;
  bool operator==(const VecCase &) const = default;
};

template <typename S> struct SingleCase {
  S value;
  bool operator==(const SingleCase &) const = default;
};

// ── StringOrStruct ──────────────────────────────────────────────────────────

template <typename S> struct StringOrStruct {
  std::variant<StringCase, StructCase<S>> kind;

  static StringOrStruct fromString(std::string s) { return {StringCase{std::move(s)}}; }
  static StringOrStruct fromStruct(S s) { return {StructCase<S>{std::move(s)}}; }

  bool isString() const { return std::holds_alternative<StringCase>(kind); }
  bool isStruct() const { return std::holds_alternative<StructCase<S>>(kind); }

  /// The string payload, or nullptr if another case is active.
  const std::string *asString() const {
    const auto *c = std::get_if<StringCase>(&kind);
    return c ? &c->value : nullptr;
  }
  const S *asStruct() const {
    const auto *c = std::get_if<StructCase<S>>(&kind);
    return c ? &c->value : nullptr;
  }

  bool operator==(const StringOrStruct &) const = default;
};

// ── StringOrStructOrVec ─────────────────────────────────────────────────────

template <typename S, typename V> struct StringOrStructOrVec {
  std::variant<StringCase, StructCase<S>, VecCase<V>> kind;

  static StringOrStructOrVec fromString(std::string s) { return {StringCase{std::move(s)}}; }
  static StringOrStructOrVec fromStruct(S s) { return {StructCase<S>{std::move(s)}}; }
  static StringOrStructOrVec fromVec(V v) { return {VecCase<V>{std::move(v)}}; }

  bool isString() const { return std::holds_alternative<StringCase>(kind); }
  bool isStruct() const { return std::holds_alternative<StructCase<S>>(kind); }
  bool isVec() const { return std::holds_alternative<VecCase<V>>(kind); }

  const std::string *asString() const {
    const auto *c = std::get_if<StringCase>(&kind);
    return c ? &c->value : nullptr;
  }
  const S *asStruct() const {
    const auto *c = std::get_if<StructCase<S>>(&kind);
    return c ? &c->value : nullptr;
  }
  const V *asVec() const {
    const auto *c = std::get_if<VecCase<V>>(&kind);
    return c ? &c->value : nullptr;
  }

  bool operator==(const StringOrStructOrVec &) const = default;
};

// ── SingleOrVec ─────────────────────────────────────────────────────────────

template <typename S> struct SingleOrVec {
  std::variant<SingleCase<S>, VecCase<std::vector<S>>> kind;

  static SingleOrVec fromSingle(S s) { return {SingleCase<S>{std::move(s)}}; }
  static SingleOrVec fromVec(std::vector<S> v) { return {VecCase<std::vector<S>>{std::move(v)}}; }

  bool isSingle() const { return std::holds_alternative<SingleCase<S>>(kind); }
  bool isVec() const { return std::holds_alternative<VecCase<std::vector<S>>>(kind); }

  const S *asSingle() const {
    const auto *c = std::get_if<SingleCase<S>>(&kind);
    return c ? &c->value : nullptr;
  }
  const std::vector<S> *asVec() const {
    const auto *c = std::get_if<VecCase<std::vector<S>>>(&kind);
    return c ? &c->value : nullptr;
  }

  /// All payload values: the single one, or every element of the vector.
  std::vector<S> values() const {
    if (const auto *one = asSingle())
      return {*one};
    return *asVec();
  }

  bool operator==(const SingleOrVec &) const = default;
};

} // namespace either
