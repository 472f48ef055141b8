//===- msgpack.cpp - msgpack front-end (msgpack-c) ------------------------===//

#include "either/msgpack.h"

#include "utf8.h"

#include <msgpack.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace either {

// ── Error helper ────────────────────────────────────────────────────────────

[[noreturn]] static void fail(const std::string &msg) {
  throw Error::syntax("msgpack syntax error: " + msg);
}

// ── msgpack -> Value ────────────────────────────────────────────────────────

static Value fromObject(const msgpack::object &obj) {
  switch (obj.type) {
  case msgpack::type::NIL:
    return Value::unit();
  case msgpack::type::BOOLEAN:
    return Value::boolean(obj.via.boolean);
  case msgpack::type::POSITIVE_INTEGER:
    return Value::u64(obj.via.u64);
  case msgpack::type::NEGATIVE_INTEGER:
    return Value::i64(obj.via.i64);
  case msgpack::type::FLOAT32:
    return Value::f32(static_cast<float>(obj.via.f64));
  case msgpack::type::FLOAT64:
    return Value::f64(obj.via.f64);
  case msgpack::type::STR:
    return Value::string(std::string(obj.via.str.ptr, obj.via.str.size));
  case msgpack::type::BIN: {
    const auto *p = reinterpret_cast<const uint8_t *>(obj.via.bin.ptr);
    return Value::bytes(std::vector<uint8_t>(p, p + obj.via.bin.size));
  }
  case msgpack::type::ARRAY: {
    ValueSeq items;
    items.reserve(obj.via.array.size);
    for (uint32_t i = 0; i < obj.via.array.size; ++i)
      items.push_back(fromObject(obj.via.array.ptr[i]));
    return Value::seq(std::move(items));
  }
  case msgpack::type::MAP: {
    ValueMap entries;
    entries.reserve(obj.via.map.size);
    for (uint32_t i = 0; i < obj.via.map.size; ++i) {
      const auto &kv = obj.via.map.ptr[i];
      entries.emplace_back(fromObject(kv.key), fromObject(kv.val));
    }
    return Value::map(std::move(entries));
  }
  case msgpack::type::EXT:
    throw Error::unsupported("msgpack ext type " + std::to_string(obj.via.ext.type()) +
                             " has no value representation");
  }
  fail("unknown object type " + std::to_string(static_cast<int>(obj.type)));
}

Value parseMsgpack(const uint8_t *data, std::size_t size, const MsgpackOptions &opts) {
  msgpack::unpack_limit limit(opts.max_array, opts.max_map, opts.max_str, opts.max_bin,
                              std::numeric_limits<std::size_t>::max(), opts.max_depth);
  std::size_t offset = 0;
  try {
    msgpack::object_handle oh = msgpack::unpack(reinterpret_cast<const char *>(data), size,
                                                offset, nullptr, nullptr, limit);
    if (offset != size)
      fail(std::to_string(size - offset) + " trailing bytes after value");
    return fromObject(oh.get());
  } catch (const msgpack::unpack_error &e) {
    fail(e.what());
  }
}

// ── Value -> msgpack ────────────────────────────────────────────────────────

static uint32_t checkedSize(std::size_t n, const char *what) {
  if (n > std::numeric_limits<uint32_t>::max())
    throw Error::unsupported(std::string(what) + " too large for msgpack: " + std::to_string(n));
  return static_cast<uint32_t>(n);
}

static void packString(msgpack::packer<msgpack::sbuffer> &pk, const std::string &s) {
  auto n = checkedSize(s.size(), "string");
  pk.pack_str(n);
  pk.pack_str_body(s.data(), n);
}

static void packValue(msgpack::packer<msgpack::sbuffer> &pk, const Value &value) {
  switch (value.kind()) {
  case ValueKind::Bool:
    if (std::get<bool>(value.v))
      pk.pack_true();
    else
      pk.pack_false();
    return;
  case ValueKind::U8:
    pk.pack_uint8(std::get<uint8_t>(value.v));
    return;
  case ValueKind::U16:
    pk.pack_uint16(std::get<uint16_t>(value.v));
    return;
  case ValueKind::U32:
    pk.pack_uint32(std::get<uint32_t>(value.v));
    return;
  case ValueKind::U64:
    pk.pack_uint64(std::get<uint64_t>(value.v));
    return;
  case ValueKind::I8:
    pk.pack_int8(std::get<int8_t>(value.v));
    return;
  case ValueKind::I16:
    pk.pack_int16(std::get<int16_t>(value.v));
    return;
  case ValueKind::I32:
    pk.pack_int32(std::get<int32_t>(value.v));
    return;
  case ValueKind::I64:
    pk.pack_int64(std::get<int64_t>(value.v));
    return;
  case ValueKind::F32:
    pk.pack_float(std::get<float>(value.v));
    return;
  case ValueKind::F64:
    pk.pack_double(std::get<double>(value.v));
    return;
  case ValueKind::Char:
    packString(pk, utf8::encode(std::get<char32_t>(value.v)));
    return;
  case ValueKind::String:
    packString(pk, value.asString());
    return;
  case ValueKind::Unit:
    pk.pack_nil();
    return;
  case ValueKind::Option: {
    const auto &opt = std::get<ValueOption>(value.v);
    if (opt.inner)
      packValue(pk, *opt.inner.get());
    else
      pk.pack_nil();
    return;
  }
  case ValueKind::Newtype: {
    const auto &nt = std::get<ValueNewtype>(value.v);
    if (nt.inner)
      packValue(pk, *nt.inner.get());
    else
      pk.pack_nil();
    return;
  }
  case ValueKind::Seq: {
    const auto &items = value.asSeq();
    pk.pack_array(checkedSize(items.size(), "array"));
    for (const auto &item : items)
      packValue(pk, item);
    return;
  }
  case ValueKind::Map: {
    const auto &entries = value.asMap();
    pk.pack_map(checkedSize(entries.size(), "map"));
    for (const auto &[k, v] : entries) {
      packValue(pk, k);
      packValue(pk, v);
    }
    return;
  }
  case ValueKind::Bytes: {
    const auto &bytes = value.asBytes().data;
    auto n = checkedSize(bytes.size(), "bin");
    pk.pack_bin(n);
    pk.pack_bin_body(reinterpret_cast<const char *>(bytes.data()), n);
    return;
  }
  }
}

std::vector<uint8_t> packMsgpack(const Value &value) {
  msgpack::sbuffer buf;
  msgpack::packer<msgpack::sbuffer> pk(&buf);
  packValue(pk, value);
  const auto *p = reinterpret_cast<const uint8_t *>(buf.data());
  return std::vector<uint8_t>(p, p + buf.size());
}

} // namespace either
