/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace TinselEngine {

namespace {
constexpr int MAX_DEPTH = 64;

const JsonValue &nullValue() {
  static const JsonValue null_value;
  return null_value;
}

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}
} // namespace

// JsonValue implementation
std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const auto *obj = tryAsObject();
  return obj != nullptr && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const auto *obj = tryAsObject();
  if (obj == nullptr)
    return nullValue();
  auto it = obj->find(key);
  return (it != obj->end()) ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *arr = std::get_if<JsonArray>(&m_value);
  if (arr == nullptr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Failed to open file: " + path;
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position < m_input.size()) {
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';
  char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (m_position < m_input.size() &&
         std::isspace(static_cast<unsigned char>(peek()))) {
    advance();
  }
}

bool JsonReader::expect(char c) {
  skipWhitespace();
  if (peek() != c) {
    return fail(std::format("Expected '{}'", c));
  }
  advance();
  return true;
}

bool JsonReader::matchLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (peek() != *p) {
      return fail(std::format("Invalid literal, expected '{}'", literal));
    }
    advance();
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  char c = peek();
  switch (c) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string s;
    if (!parseString(s))
      return false;
    out = JsonValue(std::move(s));
    return true;
  }
  case 't':
    if (!matchLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!matchLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!matchLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
      return parseNumber(out);
    }
    return fail(std::format("Unexpected character '{}'", c));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // {
  JsonObject obj;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(obj));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key");
    }
    std::string key;
    if (!parseString(key) || !expect(':'))
      return false;

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    obj[std::move(key)] = std::move(value);

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect('}'))
      return false;
    break;
  }

  out = JsonValue(std::move(obj));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // [
  JsonArray arr;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(arr));
    return true;
  }

  while (true) {
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    arr.push_back(std::move(value));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect(']'))
      return false;
    break;
  }

  out = JsonValue(std::move(arr));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (true) {
    if (m_position >= m_input.size()) {
      return fail("Unterminated string");
    }
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    char esc = advance();
    switch (esc) {
    case '"':  out += '"'; break;
    case '\\': out += '\\'; break;
    case '/':  out += '/'; break;
    case 'b':  out += '\b'; break;
    case 'f':  out += '\f'; break;
    case 'n':  out += '\n'; break;
    case 'r':  out += '\r'; break;
    case 't':  out += '\t'; break;
    case 'u': {
      uint32_t cp = 0;
      if (!parseHex4(cp))
        return false;
      // High surrogate followed by \uDC00..\uDFFF
      if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\') {
        advance();
        if (advance() != 'u')
          return fail("Invalid surrogate pair");
        uint32_t low = 0;
        if (!parseHex4(low))
          return false;
        if (low < 0xDC00 || low > 0xDFFF)
          return fail("Invalid low surrogate");
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, cp);
      break;
    }
    default:
      return fail(std::format("Invalid escape sequence '\\{}'", esc));
    }
  }
}

bool JsonReader::parseHex4(uint32_t &out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    char c = advance();
    out <<= 4;
    if (c >= '0' && c <= '9') {
      out |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      out |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      out |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid unicode escape");
    }
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  } else {
    return fail("Invalid number");
  }

  if (peek() == '.') {
    advance();
    if (!std::isdigit(static_cast<unsigned char>(peek())))
      return fail("Expected digit after decimal point");
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!std::isdigit(static_cast<unsigned char>(peek())))
      return fail("Expected digit in exponent");
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  double value = std::strtod(m_input.c_str() + start, nullptr);
  if (!std::isfinite(value)) {
    return fail("Number out of range");
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
  return false;
}

} // namespace TinselEngine
