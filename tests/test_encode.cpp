//===- test_encode.cpp - Tests for either-type encoding -------------------===//
//
// Verifies that encoding writes only the active payload, so the output is
// indistinguishable from the payload encoded on its own, and that encoded
// output decodes back to the same case.
//
//===----------------------------------------------------------------------===//

#include "common.h"

#include <cstdio>
#include <string>
#include <vector>

using either::SingleOrVec;
using either::StringOrStruct;
using either::StringOrStructOrVec;
using fixtures::MyType;
using fixtures::SimpleStruct;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name)                                                                                 \
  do {                                                                                             \
    tests_run++;                                                                                   \
    printf("  test %s ... ", #name);                                                               \
  } while (0)

#define PASS()                                                                                     \
  do {                                                                                             \
    tests_passed++;                                                                                \
    printf("ok\n");                                                                                \
  } while (0)

#define FAIL(msg)                                                                                  \
  do {                                                                                             \
    printf("FAILED: %s\n", msg);                                                                   \
  } while (0)

static bool expectJson(const std::string &actual, const char *expected) {
  if (actual == expected)
    return true;
  printf("[%s] ", actual.c_str());
  return false;
}

//===----------------------------------------------------------------------===//
// StringOrStruct
//===----------------------------------------------------------------------===//

static void test_string_or_struct_string_value() {
  TEST(string_or_struct_string_value);

  auto value = StringOrStruct<SimpleStruct>::fromString("Some string");
  if (!expectJson(either::toJson(value), R"("Some string")")) {
    FAIL("wrong JSON");
    return;
  }
  PASS();
}

static void test_string_or_struct_struct_value() {
  TEST(string_or_struct_struct_value);

  auto value = StringOrStruct<SimpleStruct>::fromStruct({912, "some text"});
  if (!expectJson(either::toJson(value), R"({"number":912,"text":"some text"})")) {
    FAIL("wrong JSON");
    return;
  }
  PASS();
}

static void test_string_or_struct_struct_as_vec_value() {
  TEST(string_or_struct_struct_as_vec_value);

  auto value = StringOrStruct<std::vector<SimpleStruct>>::fromStruct(
      {{912, "some text"}, {100, ""}});
  if (!expectJson(either::toJson(value),
                  R"([{"number":912,"text":"some text"},{"number":100,"text":""}])")) {
    FAIL("wrong JSON");
    return;
  }
  PASS();
}

//===----------------------------------------------------------------------===//
// StringOrStructOrVec
//===----------------------------------------------------------------------===//

using Svec = StringOrStructOrVec<SimpleStruct, std::vector<SimpleStruct>>;

static void test_string_or_struct_or_vec_string_value() {
  TEST(string_or_struct_or_vec_string_value);

  if (!expectJson(either::toJson(Svec::fromString("Some string")), R"("Some string")")) {
    FAIL("wrong JSON");
    return;
  }
  PASS();
}

static void test_string_or_struct_or_vec_struct_value() {
  TEST(string_or_struct_or_vec_struct_value);

  if (!expectJson(either::toJson(Svec::fromStruct({912, "some text"})),
                  R"({"number":912,"text":"some text"})")) {
    FAIL("wrong JSON");
    return;
  }
  PASS();
}

static void test_string_or_struct_or_vec_vec_value() {
  TEST(string_or_struct_or_vec_vec_value);

  if (!expectJson(either::toJson(Svec::fromVec({{912, "some text"}, {100, ""}})),
                  R"([{"number":912,"text":"some text"},{"number":100,"text":""}])")) {
    FAIL("wrong JSON");
    return;
  }
  PASS();
}

//===----------------------------------------------------------------------===//
// SingleOrVec
//===----------------------------------------------------------------------===//

static void test_single_or_vec_values() {
  TEST(single_or_vec_values);

  auto single = SingleOrVec<SimpleStruct>::fromSingle({1, "a"});
  auto singleJson = either::toJson(single);
  if (!expectJson(singleJson, R"({"number":1,"text":"a"})")) {
    FAIL("a single value should be written without a wrapper");
    return;
  }
  // Readable by a decoder that only knows the payload type.
  if (!(either::fromJson<SimpleStruct>(singleJson) == SimpleStruct{1, "a"})) {
    FAIL("single output should decode as a plain struct");
    return;
  }

  auto many = SingleOrVec<SimpleStruct>::fromVec({{1, "a"}, {2, "b"}});
  auto manyJson = either::toJson(many);
  if (!expectJson(manyJson, R"([{"number":1,"text":"a"},{"number":2,"text":"b"}])")) {
    FAIL("a vec value should be written as a sequence");
    return;
  }
  if (!(either::fromJson<SingleOrVec<SimpleStruct>>(manyJson) == many) ||
      !(either::fromJson<SingleOrVec<SimpleStruct>>(singleJson) == single)) {
    FAIL("output should decode back to the same case");
    return;
  }
  PASS();
}

//===----------------------------------------------------------------------===//
// Round trips
//===----------------------------------------------------------------------===//

static void test_round_trip_json() {
  TEST(round_trip_json);

  auto structValue = StringOrStruct<SimpleStruct>::fromStruct({-7, "tab\there"});
  if (!(either::fromJson<StringOrStruct<SimpleStruct>>(either::toJson(structValue)) ==
        structValue)) {
    FAIL("Struct case should survive a JSON round trip");
    return;
  }

  // Escapes and multi-byte characters come back byte for byte.
  std::string text = "line\n\"quoted\" \\ \xc3\xbc\xe2\x82\xac \xf0\x9f\x98\x80";
  auto stringValue = StringOrStruct<SimpleStruct>::fromString(text);
  auto decoded = either::fromJson<StringOrStruct<SimpleStruct>>(either::toJson(stringValue));
  if (!decoded.isString() || *decoded.asString() != text) {
    FAIL("String case should survive a JSON round trip");
    return;
  }

  auto bytes = StringOrStruct<std::vector<uint8_t>>::fromStruct({0, 128, 255});
  if (!(either::fromJson<StringOrStruct<std::vector<uint8_t>>>(either::toJson(bytes)) == bytes)) {
    FAIL("Struct case over bytes should survive a JSON round trip");
    return;
  }
  PASS();
}

static void test_round_trip_msgpack() {
  TEST(round_trip_msgpack);

  auto vecValue = Svec::fromVec({{1, "x"}, {-2, "y"}});
  if (!(either::fromMsgpack<Svec>(either::toMsgpack(vecValue)) == vecValue)) {
    FAIL("Vec case should survive a msgpack round trip");
    return;
  }
  auto structValue = Svec::fromStruct({5, "z"});
  if (!(either::fromMsgpack<Svec>(either::toMsgpack(structValue)) == structValue)) {
    FAIL("Struct case should survive a msgpack round trip");
    return;
  }
  auto stringValue = Svec::fromString("abc");
  if (either::toMsgpack(stringValue) != either::toMsgpack(std::string("abc"))) {
    FAIL("String case should pack exactly like a plain string");
    return;
  }
  if (!(either::fromMsgpack<Svec>(either::toMsgpack(stringValue)) == stringValue)) {
    FAIL("String case should survive a msgpack round trip");
    return;
  }
  PASS();
}

static void test_my_type_round_trip() {
  TEST(my_type_round_trip);

  MyType original;
  original.string_or_struct = StringOrStruct<SimpleStruct>::fromString("s");
  original.string_or_struct_with_vec_of_u8 =
      StringOrStruct<std::vector<uint8_t>>::fromStruct({1, 5, 8});
  original.string_or_struct_or_vec = Svec::fromStruct({3, "t"});

  auto json = either::toJson(original);
  if (!expectJson(json, R"({"string_or_struct":"s","string_or_struct_with_vec":null,)"
                        R"("string_or_struct_with_vec_of_u8":[1,5,8],)"
                        R"("string_or_struct_or_vec":{"number":3,"text":"t"}})")) {
    FAIL("wrong JSON");
    return;
  }
  auto decoded = either::fromJson<MyType>(json);
  if (decoded.string_or_struct != original.string_or_struct ||
      decoded.string_or_struct_with_vec.has_value() ||
      decoded.string_or_struct_with_vec_of_u8 != original.string_or_struct_with_vec_of_u8 ||
      decoded.string_or_struct_or_vec != original.string_or_struct_or_vec) {
    FAIL("MyType should survive a JSON round trip");
    return;
  }
  PASS();
}

int main() {
  printf("=== either Encode Tests ===\n");

  test_string_or_struct_string_value();
  test_string_or_struct_struct_value();
  test_string_or_struct_struct_as_vec_value();
  test_string_or_struct_or_vec_string_value();
  test_string_or_struct_or_vec_struct_value();
  test_string_or_struct_or_vec_vec_value();
  test_single_or_vec_values();
  test_round_trip_json();
  test_round_trip_msgpack();
  test_my_type_round_trip();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
