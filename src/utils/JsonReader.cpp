/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include "core/Logger.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace BurrowSim {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

// Nesting limit for hand-edited data files
constexpr int MAX_DEPTH = 64;
} // namespace

JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  case 5:
    return JsonType::Object;
  default:
    return JsonType::Null;
  }
}

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

std::optional<int> JsonValue::tryAsInt() const {
  if (isNumber())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const auto *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const auto *obj = tryAsObject();
  if (!obj)
    return nullValue();
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *arr = tryAsArray();
  if (!arr || index >= arr->size())
    return nullValue();
  return (*arr)[index];
}

size_t JsonValue::size() const {
  if (const auto *arr = tryAsArray())
    return arr->size();
  if (const auto *obj = tryAsObject())
    return obj->size();
  return 0;
}

// JsonReader

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return fail(std::format("Failed to open file: {}", path));
  }
  std::stringstream buffer;
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

  JsonValue parsed;
  if (!parseValue(parsed, 0)) {
    return false;
  }
  skipWhitespace();
  if (m_position < m_input.size()) {
    return fail("Unexpected trailing characters");
  }
  m_root = std::move(parsed);
  return true;
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size())
    return '\0';
  const char c = m_input[m_position++];
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

bool JsonReader::expectLiteral(const char *literal) {
  for (const char *p = literal; *p; ++p) {
    if (advance() != *p) {
      return fail(std::format("Invalid literal, expected '{}'", literal));
    }
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }
  skipWhitespace();
  const char c = peek();
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
    out = JsonValue(true);
    return expectLiteral("true");
  case 'f':
    out = JsonValue(false);
    return expectLiteral("false");
  case 'n':
    out = JsonValue(nullptr);
    return expectLiteral("null");
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
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key))
      return false;
    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key");
    }
    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    obj[key] = std::move(value);

    skipWhitespace();
    const char next = advance();
    if (next == '}')
      break;
    if (next != ',') {
      return fail("Expected ',' or '}' in object");
    }
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
    const char next = advance();
    if (next == ']')
      break;
    if (next != ',') {
      return fail("Expected ',' or ']' in array");
    }
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
    const char c = advance();
    if (c == '"')
      return true;
    if (c == '\n') {
      return fail("Newline in string literal");
    }
    if (c != '\\') {
      out += c;
      continue;
    }
    const char esc = advance();
    switch (esc) {
    case '"':
      out += '"';
      break;
    case '\\':
      out += '\\';
      break;
    case '/':
      out += '/';
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u':
      if (!parseUnicodeEscape(out))
        return false;
      break;
    default:
      return fail(std::format("Invalid escape sequence '\\{}'", esc));
    }
  }
}

bool JsonReader::parseUnicodeEscape(std::string &out) {
  uint32_t codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    const char h = advance();
    codepoint <<= 4;
    if (h >= '0' && h <= '9')
      codepoint |= static_cast<uint32_t>(h - '0');
    else if (h >= 'a' && h <= 'f')
      codepoint |= static_cast<uint32_t>(h - 'a' + 10);
    else if (h >= 'A' && h <= 'F')
      codepoint |= static_cast<uint32_t>(h - 'A' + 10);
    else
      return fail("Invalid unicode escape");
  }

  // UTF-8 encode; surrogate pairs are not needed by the data files
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t start = m_position;
  if (peek() == '-')
    advance();
  if (!std::isdigit(static_cast<unsigned char>(peek()))) {
    return fail("Invalid number");
  }
  while (std::isdigit(static_cast<unsigned char>(peek())))
    advance();
  if (peek() == '.') {
    advance();
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Invalid number: expected digit after '.'");
    }
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
      return fail("Invalid number: malformed exponent");
    }
    while (std::isdigit(static_cast<unsigned char>(peek())))
      advance();
  }

  const std::string text = m_input.substr(start, m_position - start);
  char *end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || !std::isfinite(value)) {
    return fail(std::format("Invalid number '{}'", text));
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = std::format("{} at line {}, column {}", message, m_line,
                            m_column);
  CONFIG_DEBUG(std::format("JSON parse error: {}", m_lastError));
  return false;
}

} // namespace BurrowSim
