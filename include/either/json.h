//===- json.h - JSON front-end (nlohmann/json) ------------------*- C++ -*-===//
//
// Turns JSON text into a Value and back. Object members keep document order.
//
//   null -> Unit        true/false -> Bool     string -> String
//   n >= 0 -> U64       n < 0 -> I64           1.5 -> F64
//   [...] -> Seq        {...} -> Map (string keys)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "either/codec.h"
#include "either/value.h"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace either {

struct JsonOptions {
  bool ignore_comments = false; // accept /* */ and // comments when parsing
  int indent = -1;              // -1: compact output; >= 0: pretty-print
  std::size_t max_depth = 128;  // nested arrays/objects accepted when parsing
};

/// Parse JSON text. Throws Error(Syntax) on malformed input or nesting
/// deeper than opts.max_depth.
Value parseJson(std::string_view text, const JsonOptions &opts = {});

/// Serialize a Value as JSON text. Throws Error(Unsupported) for values JSON
/// cannot hold (non-string map keys other than chars and integers, invalid
/// UTF-8 in strings).
std::string dumpJson(const Value &value, const JsonOptions &opts = {});

/// Conversions for callers that already hold an nlohmann document.
Value valueFromJson(const nlohmann::ordered_json &j, const JsonOptions &opts = {});
nlohmann::ordered_json valueToJson(const Value &value);

template <typename T> T fromJson(std::string_view text, const JsonOptions &opts = {}) {
  return decode<T>(parseJson(text, opts));
}

template <typename T> std::string toJson(const T &in, const JsonOptions &opts = {}) {
  return dumpJson(encode(in), opts);
}

} // namespace either
