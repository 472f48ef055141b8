//===- common.h - Shared fixtures for the either tests -----------*- C++ -*-===//
//
// Data-model types used across the decode/encode tests, with their codec
// functions written the way a library user would write them.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "either/either.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fixtures {

struct SimpleStruct {
  int32_t number = 0;
  std::string text;

  bool operator==(const SimpleStruct &) const = default;
};

inline void from_value(const either::Value &value, SimpleStruct &out) {
  either::expectMap(value, "struct SimpleStruct");
  either::readField(value, "number", out.number);
  either::readField(value, "text", out.text);
}

inline void to_value(either::Value &out, const SimpleStruct &in) {
  either::ValueMap obj;
  either::writeField(obj, "number", in.number);
  either::writeField(obj, "text", in.text);
  out = either::Value::map(std::move(obj));
}

struct MyType {
  std::optional<either::StringOrStruct<SimpleStruct>> string_or_struct;
  std::optional<either::StringOrStruct<std::vector<SimpleStruct>>> string_or_struct_with_vec;
  std::optional<either::StringOrStruct<std::vector<uint8_t>>> string_or_struct_with_vec_of_u8;
  std::optional<either::StringOrStructOrVec<SimpleStruct, std::vector<SimpleStruct>>>
      string_or_struct_or_vec;
};

inline void from_value(const either::Value &value, MyType &out) {
  either::expectMap(value, "struct MyType");
  either::readField(value, "string_or_struct", out.string_or_struct);
  either::readField(value, "string_or_struct_with_vec", out.string_or_struct_with_vec);
  either::readField(value, "string_or_struct_with_vec_of_u8", out.string_or_struct_with_vec_of_u8);
  either::readField(value, "string_or_struct_or_vec", out.string_or_struct_or_vec);
}

inline void to_value(either::Value &out, const MyType &in) {
  either::ValueMap obj;
  either::writeField(obj, "string_or_struct", in.string_or_struct);
  either::writeField(obj, "string_or_struct_with_vec", in.string_or_struct_with_vec);
  either::writeField(obj, "string_or_struct_with_vec_of_u8", in.string_or_struct_with_vec_of_u8);
  either::writeField(obj, "string_or_struct_or_vec", in.string_or_struct_or_vec);
  out = either::Value::map(std::move(obj));
}

/// A struct that could also be parsed from "First Last" text. Used to show
/// that a string shape is never handed to the struct decoder.
struct Person {
  std::string first_name;
  std::string last_name;

  bool operator==(const Person &) const = default;

  static std::optional<Person> parse(const std::string &s) {
    auto space = s.find(' ');
    if (space == std::string::npos)
      return std::nullopt;
    return Person{s.substr(0, space), s.substr(s.rfind(' ') + 1)};
  }
};

inline void from_value(const either::Value &value, Person &out) {
  either::expectMap(value, "struct Person");
  either::readField(value, "first_name", out.first_name);
  either::readField(value, "last_name", out.last_name);
}

inline void to_value(either::Value &out, const Person &in) {
  either::ValueMap obj;
  either::writeField(obj, "first_name", in.first_name);
  either::writeField(obj, "last_name", in.last_name);
  out = either::Value::map(std::move(obj));
}

/// Run \p fn and return the either::Error it threw, if any.
template <typename Fn> std::optional<either::Error> catchError(Fn &&fn) {
  try {
    fn();
  } catch (const either::Error &e) {
    return e;
  }
  return std::nullopt;
}

} // namespace fixtures
