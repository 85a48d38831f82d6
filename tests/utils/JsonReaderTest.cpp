/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace TinselEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.getType(), JsonType::Boolean);
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue doubleVal(3.14);
  BOOST_CHECK(doubleVal.isNumber());
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 3.14, 0.001);
  BOOST_CHECK_EQUAL(JsonValue(42.0).asInt(), 42);

  JsonValue stringVal(std::string("hello"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue number(7.5);
  BOOST_CHECK(number.tryAsNumber().has_value());
  BOOST_CHECK(!number.tryAsBool().has_value());
  BOOST_CHECK(!number.tryAsString().has_value());
  BOOST_CHECK(number.tryAsObject() == nullptr);

  // Missing keys and indices read as null instead of throwing
  BOOST_CHECK(number["missing"].isNull());
  BOOST_CHECK(number[3].isNull());
  BOOST_CHECK_EQUAL(number.size(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_REQUIRE(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_REQUIRE(reader.parse("-12.5e1"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), -125.0, 0.001);

  BOOST_REQUIRE(reader.parse("\"tinsel\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "tinsel");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_REQUIRE(reader.parse(R"("line\nbreak \"quoted\" tab\t slash\/")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "line\nbreak \"quoted\" tab\t slash/");

  // U+00E9 and a surrogate pair (U+1F384) encode to UTF-8
  BOOST_REQUIRE(reader.parse(R"("\u00e9")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9");

  BOOST_REQUIRE(reader.parse(R"("\ud83c\udf84")"));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x8E\x84");
}

BOOST_AUTO_TEST_CASE(TestNestedStructures) {
  JsonReader reader;
  const std::string json = R"({
    "tree": { "height": 30, "base_radius": 14.0 },
    "counts": [250, 8000, 350],
    "photo": { "path": "res/img/photo.jpg", "enabled": true }
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue& root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 3u);
  BOOST_CHECK(root.hasKey("tree"));
  BOOST_CHECK(!root.hasKey("snow"));

  BOOST_CHECK_EQUAL(root["tree"]["height"].asInt(), 30);
  BOOST_CHECK_CLOSE(root["tree"]["base_radius"].asNumber(), 14.0, 0.001);

  BOOST_CHECK(root["counts"].isArray());
  BOOST_CHECK_EQUAL(root["counts"].size(), 3u);
  BOOST_CHECK_EQUAL(root["counts"][1].asInt(), 8000);

  BOOST_CHECK_EQUAL(root["photo"]["path"].asString(), "res/img/photo.jpg");
  BOOST_CHECK(root["photo"]["enabled"].asBool());
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(" \n\t{ \"a\" :\r\n [ 1 , 2 ] } \n"));
  BOOST_CHECK_EQUAL(reader.getRoot()["a"].size(), 2u);
}

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"a\": 1,}"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("{\"a\" 1}"));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("01"));
  BOOST_CHECK(!reader.parse("{} extra"));
}

BOOST_AUTO_TEST_CASE(TestErrorPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"a\": @\n}"));
  const std::string& error = reader.getLastError();
  BOOST_CHECK(error.find("Line 2") != std::string::npos);

  reader.clearError();
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestDepthLimit) {
  JsonReader reader;
  std::string deep(100, '[');
  deep += std::string(100, ']');
  BOOST_CHECK(!reader.parse(deep));

  std::string shallow(10, '[');
  shallow += std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "tinsel_json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({ "graphics": { "vsync": false } })";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path.string()));
  BOOST_CHECK_EQUAL(reader.getRoot()["graphics"]["vsync"].asBool(), false);

  std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("definitely/not/here.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
