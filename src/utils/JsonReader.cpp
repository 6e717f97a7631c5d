/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace TrekEngine {

// JsonValue implementation
JsonType JsonValue::getType() const {
  if (std::holds_alternative<std::nullptr_t>(m_value))
    return JsonType::Null;
  if (std::holds_alternative<bool>(m_value))
    return JsonType::Boolean;
  if (std::holds_alternative<double>(m_value))
    return JsonType::Number;
  if (std::holds_alternative<std::string>(m_value))
    return JsonType::String;
  if (std::holds_alternative<JsonArray>(m_value))
    return JsonType::Array;
  return JsonType::Object;
}

bool JsonValue::isInteger() const {
  if (!isNumber())
    return false;
  double num = asNumber();
  return std::isfinite(num) && std::floor(num) == num &&
         std::abs(num) <= 2147483647.0;
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
  if (isInteger())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  if (!isObject())
    return false;
  const auto &obj = asObject();
  return obj.find(key) != obj.end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue null_value;
  if (!isObject())
    return null_value;
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : null_value;
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  static const JsonValue null_value;
  if (!isArray() || index >= asArray().size())
    return null_value;
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::ostringstream oss;
  writeToStream(oss);
  return oss.str();
}

namespace {

void writeEscaped(std::ostream &stream, const std::string &text) {
  stream << '"';
  for (unsigned char c : text) {
    switch (c) {
    case '"':
      stream << "\\\"";
      break;
    case '\\':
      stream << "\\\\";
      break;
    case '\n':
      stream << "\\n";
      break;
    case '\r':
      stream << "\\r";
      break;
    case '\t':
      stream << "\\t";
      break;
    case '\b':
      stream << "\\b";
      break;
    case '\f':
      stream << "\\f";
      break;
    default:
      if (c < 0x20) {
        stream << std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        stream << static_cast<char>(c);
      }
    }
  }
  stream << '"';
}

} // anonymous namespace

void JsonValue::writeToStream(std::ostream &stream) const {
  switch (getType()) {
  case JsonType::Null:
    stream << "null";
    break;
  case JsonType::Boolean:
    stream << (asBool() ? "true" : "false");
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      stream << static_cast<long long>(num);
    } else {
      stream << num;
    }
    break;
  }
  case JsonType::String:
    writeEscaped(stream, asString());
    break;
  case JsonType::Array: {
    stream << "[";
    const auto &arr = asArray();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        stream << ",";
      arr[i].writeToStream(stream);
    }
    stream << "]";
    break;
  }
  case JsonType::Object: {
    stream << "{";
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        stream << ",";
      first = false;
      writeEscaped(stream, key);
      stream << ":";
      value.writeToStream(stream);
    }
    stream << "}";
    break;
  }
  }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    m_root = JsonValue{};
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_depth = 0;
  m_root = JsonValue{};

  // Skip a UTF-8 byte order mark written by some editors
  if (m_input.size() >= 3 && m_input.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    m_position = 3;
  }

  skipWhitespace();
  if (atEnd()) {
    return setError("Empty JSON input");
  }

  JsonValue root;
  if (!parseValue(root)) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    return setError(std::format("Unexpected trailing character '{}'", peek()));
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::setError(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  return false;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
      break;
    }
    advance();
  }
}

bool JsonReader::consumeLiteral(const char *literal) {
  size_t length = std::strlen(literal);
  if (m_input.compare(m_position, length, literal) != 0) {
    return setError(std::format("Invalid literal, expected '{}'", literal));
  }
  for (size_t i = 0; i < length; ++i) {
    advance();
  }
  return true;
}

bool JsonReader::parseValue(JsonValue &out) {
  skipWhitespace();
  char c = peek();

  switch (c) {
  case '{':
    return parseObject(out);
  case '[':
    return parseArray(out);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!consumeLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!consumeLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!consumeLiteral("null"))
      return false;
    out = JsonValue(nullptr);
    return true;
  case '\0':
    if (atEnd())
      return setError("Unexpected end of input");
    return setError("Unexpected NUL character");
  default:
    if (c == '-' || (c >= '0' && c <= '9')) {
      return parseNumber(out);
    }
    return setError(std::format("Unexpected character '{}'", c));
  }
}

bool JsonReader::parseObject(JsonValue &out) {
  if (++m_depth > MAX_DEPTH) {
    return setError("Maximum nesting depth exceeded");
  }
  advance(); // '{'

  JsonObject object;
  skipWhitespace();
  if (peek() == '}') {
    advance();
    --m_depth;
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return setError("Expected string key in object");
    }

    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (peek() != ':') {
      return setError(std::format("Expected ':' after key '{}'", key));
    }
    advance();

    JsonValue value;
    if (!parseValue(value))
      return false;

    // Last duplicate key wins, as in most JSON readers
    object[std::move(key)] = std::move(value);

    skipWhitespace();
    char next = advance();
    if (next == '}')
      break;
    if (next != ',') {
      return setError("Expected ',' or '}' in object");
    }
  }

  --m_depth;
  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out) {
  if (++m_depth > MAX_DEPTH) {
    return setError("Maximum nesting depth exceeded");
  }
  advance(); // '['

  JsonArray array;
  skipWhitespace();
  if (peek() == ']') {
    advance();
    --m_depth;
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    char next = advance();
    if (next == ']')
      break;
    if (next != ',') {
      return setError("Expected ',' or ']' in array");
    }
  }

  --m_depth;
  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();

  while (!atEnd()) {
    char c = advance();

    if (c == '"') {
      return true;
    }

    if (static_cast<unsigned char>(c) < 0x20) {
      return setError("Unescaped control character in string");
    }

    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      break;
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
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
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseUnicodeEscape(codepoint))
        return false;

      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        // High surrogate must be followed by an escaped low surrogate
        if (peek() != '\\') {
          return setError("Unpaired high surrogate in string");
        }
        advance();
        if (advance() != 'u') {
          return setError("Unpaired high surrogate in string");
        }
        uint32_t low = 0;
        if (!parseUnicodeEscape(low))
          return false;
        if (low < 0xDC00 || low > 0xDFFF) {
          return setError("Invalid low surrogate in string");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        return setError("Unpaired low surrogate in string");
      }

      appendUtf8(out, codepoint);
      break;
    }
    default:
      return setError(std::format("Invalid escape sequence '\\{}'", escaped));
    }
  }

  return setError("Unterminated string");
}

bool JsonReader::parseUnicodeEscape(uint32_t &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return setError("Invalid unicode escape, expected 4 hex digits");
    }
    codepoint = (codepoint << 4) | digit;
    advance();
  }
  return true;
}

void JsonReader::appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    return setError("Invalid number, expected digit");
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return setError("Invalid number, expected digit after '.'");
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return setError("Invalid number, expected exponent digits");
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return setError(std::format("Number out of range: {}",
                                std::string(first, last)));
  }

  out = JsonValue(value);
  return true;
}

} // namespace TrekEngine
