/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTests
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>

using namespace Riposte;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.tryAsBool().value_or(false), true);

  JsonValue numberVal(3.5);
  BOOST_CHECK(numberVal.isNumber());
  BOOST_CHECK_CLOSE(numberVal.tryAsNumber().value_or(0.0), 3.5, 0.001);

  JsonValue stringVal(std::string("hello"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.tryAsString().value_or(""), "hello");
}

BOOST_AUTO_TEST_CASE(TestCheckedAccessorsOnMismatch) {
  JsonValue stringVal(std::string("42"));
  BOOST_CHECK(!stringVal.tryAsNumber().has_value());
  BOOST_CHECK(!stringVal.tryAsBool().has_value());
  BOOST_CHECK(stringVal.tryAsArray() == nullptr);
  BOOST_CHECK(stringVal.tryAsObject() == nullptr);
  BOOST_CHECK(stringVal.find("key") == nullptr);
  BOOST_CHECK_EQUAL(stringVal.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestIntegerAccess) {
  BOOST_CHECK_EQUAL(JsonValue(42.0).tryAsInt().value_or(0), 42);
  BOOST_CHECK_EQUAL(JsonValue(-7.0).tryAsInt().value_or(0), -7);
  BOOST_CHECK(!JsonValue(1.5).tryAsInt().has_value());
  BOOST_CHECK(!JsonValue(1e12).tryAsInt().has_value());
}

BOOST_AUTO_TEST_CASE(TestTypeNames) {
  BOOST_CHECK_EQUAL(std::string(toString(JsonType::Object)), "object");
  BOOST_CHECK_EQUAL(std::string(toString(JsonType::Number)), "number");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonParsingTests)

BOOST_AUTO_TEST_CASE(TestParseObject) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"name": "duelist", "level": 3, "alive": true,
                                 "tags": ["a", "b"], "extra": null})"));

  const JsonValue &root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 5u);
  BOOST_CHECK(root.hasKey("name"));
  BOOST_CHECK(!root.hasKey("missing"));

  BOOST_REQUIRE(root.find("level") != nullptr);
  BOOST_CHECK_EQUAL(root.find("level")->tryAsInt().value_or(0), 3);
  BOOST_CHECK(root.find("extra")->isNull());

  const JsonArray *tags = root.find("tags")->tryAsArray();
  BOOST_REQUIRE(tags != nullptr);
  BOOST_REQUIRE_EQUAL(tags->size(), 2u);
  BOOST_CHECK_EQUAL((*tags)[1].tryAsString().value_or(""), "b");
}

BOOST_AUTO_TEST_CASE(TestParseNumbers) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("[0, -1, 2.5, 1e3, -2.5E-1]"));
  const JsonArray *numbers = reader.getRoot().tryAsArray();
  BOOST_REQUIRE(numbers != nullptr);
  BOOST_REQUIRE_EQUAL(numbers->size(), 5u);
  BOOST_CHECK_EQUAL((*numbers)[1].tryAsNumber().value_or(0.0), -1.0);
  BOOST_CHECK_CLOSE((*numbers)[3].tryAsNumber().value_or(0.0), 1000.0, 0.001);
  BOOST_CHECK_CLOSE((*numbers)[4].tryAsNumber().value_or(0.0), -0.25, 0.001);
}

BOOST_AUTO_TEST_CASE(TestParseEscapes) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"(["line\nbreak", "quote\"", "\u00e9", "\ud83d\ude00"])"));
  const JsonArray *strings = reader.getRoot().tryAsArray();
  BOOST_REQUIRE(strings != nullptr);
  BOOST_CHECK_EQUAL((*strings)[0].tryAsString().value_or(""), "line\nbreak");
  BOOST_CHECK_EQUAL((*strings)[1].tryAsString().value_or(""), "quote\"");
  BOOST_CHECK_EQUAL((*strings)[2].tryAsString().value_or(""), "\xC3\xA9");
  BOOST_CHECK_EQUAL((*strings)[3].tryAsString().value_or(""), "\xF0\x9F\x98\x80");
}

BOOST_AUTO_TEST_CASE(TestRejectsMalformedInput) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.parse("{\"a\": 1,}"));
  BOOST_CHECK(!reader.parse("[1 2]"));
  BOOST_CHECK(!reader.parse("{\"a\" 1}"));
  BOOST_CHECK(!reader.parse("01"));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("{} extra"));
  BOOST_CHECK(!reader.parse("\"\\ud83d\""));
  BOOST_CHECK(!reader.parse("1e999"));
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"a\": ?\n}"));
  const std::string &error = reader.getLastError();
  BOOST_CHECK(error.find("line 2") != std::string::npos);
  BOOST_CHECK(error.find("column 8") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestFailedParseKeepsPreviousRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"kept\": true}"));
  BOOST_CHECK(!reader.parse("{broken"));
  BOOST_CHECK(reader.getRoot().hasKey("kept"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  const std::string deep(JsonReader::MAX_DEPTH + 2, '[');
  BOOST_CHECK(!reader.parse(deep + std::string(JsonReader::MAX_DEPTH + 2, ']')));

  const std::string shallow(8, '[');
  BOOST_CHECK(reader.parse(shallow + std::string(8, ']')));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonFileTests)

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "riposte_json_reader_test.json";
  {
    std::ofstream file(path);
    file << "{\"profiles\": {}}";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(path.string()));
  BOOST_CHECK(reader.getRoot().hasKey("profiles"));

  std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(TestMissingFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("does/not/exist.json"));
  BOOST_CHECK(reader.getLastError().find("does/not/exist.json") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
