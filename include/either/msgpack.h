//===- msgpack.h - msgpack front-end (msgpack-c) ----------------*- C++ -*-===//
//
// Turns msgpack bytes into a Value and back.
//
//   nil -> Unit          bool -> Bool          str -> String
//   positive int -> U64  negative int -> I64   bin -> Bytes
//   float32 -> F32       float64 -> F64
//   array -> Seq         map -> Map (keys of any shape)
//
// ext objects have no Value counterpart and are rejected.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "either/codec.h"
#include "either/value.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace either {

/// Upper bounds applied while unpacking; exceeding one is a syntax error.
struct MsgpackOptions {
  std::size_t max_array = 0xffffffff; // elements per array
  std::size_t max_map = 0xffffffff;   // entries per map
  std::size_t max_str = 0xffffffff;   // bytes per string
  std::size_t max_bin = 0xffffffff;   // bytes per bin
  std::size_t max_depth = 128;        // container nesting
};

/// Unpack exactly one msgpack object. Truncated input, trailing bytes and
/// limit overflows throw Error(Syntax); ext objects throw Error(Unsupported).
Value parseMsgpack(const uint8_t *data, std::size_t size, const MsgpackOptions &opts = {});

inline Value parseMsgpack(const std::vector<uint8_t> &data, const MsgpackOptions &opts = {}) {
  return parseMsgpack(data.data(), data.size(), opts);
}

std::vector<uint8_t> packMsgpack(const Value &value);

template <typename T>
T fromMsgpack(const uint8_t *data, std::size_t size, const MsgpackOptions &opts = {}) {
  return decode<T>(parseMsgpack(data, size, opts));
}

template <typename T>
T fromMsgpack(const std::vector<uint8_t> &data, const MsgpackOptions &opts = {}) {
  return decode<T>(parseMsgpack(data, opts));
}

template <typename T> std::vector<uint8_t> toMsgpack(const T &in) {
  return packMsgpack(encode(in));
}

} // namespace either
