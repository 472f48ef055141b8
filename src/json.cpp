//===- json.cpp - JSON front-end (nlohmann/json) --------------------------===//

#include "either/json.h"

#include "utf8.h"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace either {

using Json = nlohmann::ordered_json;

// ── JSON -> Value ───────────────────────────────────────────────────────────

static Value fromJson(const Json &j, std::size_t depth, std::size_t maxDepth) {
  if (j.is_structured() && depth >= maxDepth)
    throw Error::syntax("JSON syntax error: nesting depth exceeds " + std::to_string(maxDepth));
  switch (j.type()) {
  case Json::value_t::null:
    return Value::unit();
  case Json::value_t::boolean:
    return Value::boolean(j.get<bool>());
  case Json::value_t::number_unsigned:
    return Value::u64(j.get<uint64_t>());
  case Json::value_t::number_integer: {
    auto n = j.get<int64_t>();
    // Parsed documents store non-negative integers as unsigned; keep that
    // rule for documents built by hand too.
    if (n >= 0)
      return Value::u64(static_cast<uint64_t>(n));
    return Value::i64(n);
  }
  case Json::value_t::number_float:
    return Value::f64(j.get<double>());
  case Json::value_t::string:
    return Value::string(j.get_ref<const std::string &>());
  case Json::value_t::binary: {
    const auto &bin = j.get_binary();
    return Value::bytes(std::vector<uint8_t>(bin.begin(), bin.end()));
  }
  case Json::value_t::array: {
    ValueSeq items;
    items.reserve(j.size());
    for (const auto &elem : j)
      items.push_back(fromJson(elem, depth + 1, maxDepth));
    return Value::seq(std::move(items));
  }
  case Json::value_t::object: {
    ValueMap entries;
    entries.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it)
      entries.emplace_back(Value::string(it.key()), fromJson(it.value(), depth + 1, maxDepth));
    return Value::map(std::move(entries));
  }
  case Json::value_t::discarded:
    break;
  }
  throw Error::syntax("JSON syntax error: discarded value");
}

Value valueFromJson(const Json &j, const JsonOptions &opts) {
  return fromJson(j, 0, opts.max_depth);
}

Value parseJson(std::string_view text, const JsonOptions &opts) {
  Json j;
  try {
    j = Json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/true,
                    opts.ignore_comments);
  } catch (const Json::parse_error &e) {
    throw Error::syntax(std::string("JSON syntax error: ") + e.what());
  }
  return valueFromJson(j, opts);
}

// ── Value -> JSON ───────────────────────────────────────────────────────────

/// JSON object keys must be strings; chars and integers are written in
/// their text form.
static std::string jsonKey(const Value &key) {
  switch (key.kind()) {
  case ValueKind::String:
    return key.asString();
  case ValueKind::Char:
    return utf8::encode(std::get<char32_t>(key.v));
  case ValueKind::U8:
  case ValueKind::U16:
  case ValueKind::U32:
  case ValueKind::U64:
    return std::to_string(decode<uint64_t>(key));
  case ValueKind::I8:
  case ValueKind::I16:
  case ValueKind::I32:
  case ValueKind::I64:
    return std::to_string(decode<int64_t>(key));
  default:
    break;
  }
  throw Error::unsupported("JSON object key must be a string, got " +
                           std::string(kindName(key.kind())));
}

Json valueToJson(const Value &value) {
  switch (value.kind()) {
  case ValueKind::Bool:
    return std::get<bool>(value.v);
  case ValueKind::U8:
  case ValueKind::U16:
  case ValueKind::U32:
  case ValueKind::U64:
    return decode<uint64_t>(value);
  case ValueKind::I8:
  case ValueKind::I16:
  case ValueKind::I32:
  case ValueKind::I64:
    return decode<int64_t>(value);
  case ValueKind::F32:
    return static_cast<double>(std::get<float>(value.v));
  case ValueKind::F64:
    return std::get<double>(value.v);
  case ValueKind::Char:
    return utf8::encode(std::get<char32_t>(value.v));
  case ValueKind::String:
    return value.asString();
  case ValueKind::Unit:
    return nullptr;
  case ValueKind::Option: {
    const auto &opt = std::get<ValueOption>(value.v);
    if (!opt.inner)
      return nullptr;
    return valueToJson(*opt.inner.get());
  }
  case ValueKind::Newtype: {
    const auto &nt = std::get<ValueNewtype>(value.v);
    if (!nt.inner)
      return nullptr;
    return valueToJson(*nt.inner.get());
  }
  case ValueKind::Seq: {
    Json arr = Json::array();
    for (const auto &item : value.asSeq())
      arr.push_back(valueToJson(item));
    return arr;
  }
  case ValueKind::Map: {
    Json obj = Json::object();
    for (const auto &[k, v] : value.asMap())
      obj[jsonKey(k)] = valueToJson(v);
    return obj;
  }
  case ValueKind::Bytes: {
    Json arr = Json::array();
    for (uint8_t b : value.asBytes().data)
      arr.push_back(b);
    return arr;
  }
  }
  throw Error::unsupported("unknown value kind");
}

std::string dumpJson(const Value &value, const JsonOptions &opts) {
  Json j = valueToJson(value);
  try {
    return j.dump(opts.indent);
  } catch (const Json::type_error &e) {
    throw Error::unsupported(std::string("JSON output error: ") + e.what());
  }
}

} // namespace either
