#ifndef ARMGUARD_CORE_JSON_DOM_HPP_
#define ARMGUARD_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace armguard::core::json {

// STL-only JSON value used for configuration files.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;
};

// Recursive-descent parser. Diagnostics carry line/column so a malformed
// config file points the operator at the offending token.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    root = Value{};
    SkipWhitespace();
    if (!ParseValue(root, 0U, error)) {
      return false;
    }
    SkipWhitespace();
    if (pos_ < input_.size()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64U;

  bool ParseValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("nesting too deep", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    switch (input_[pos_]) {
    case '{':
      return ParseObject(value, depth, error);
    case '[':
      return ParseArray(value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    case 't':
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return ParseKeyword("true", error);
    case 'f':
      value.type = Value::Type::kBool;
      value.bool_value = false;
      return ParseKeyword("false", error);
    case 'n':
      value.type = Value::Type::kNull;
      return ParseKeyword("null", error);
    default:
      break;
    }

    const char c = input_[pos_];
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kObject;
    Next(); // '{'
    SkipWhitespace();
    if (Accept('}')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }
      SkipWhitespace();
      if (!Accept(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipWhitespace();
      Value member;
      if (!ParseValue(member, depth + 1U, error)) {
        return false;
      }
      value.object_value[key] = std::move(member);

      SkipWhitespace();
      if (Accept('}')) {
        return true;
      }
      if (!Accept(',')) {
        return Fail("expected ',' between object entries", error);
      }
    }
  }

  bool ParseArray(Value& value, std::size_t depth, std::string& error) {
    value.type = Value::Type::kArray;
    Next(); // '['
    SkipWhitespace();
    if (Accept(']')) {
      return true;
    }

    for (;;) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, depth + 1U, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Accept(']')) {
        return true;
      }
      if (!Accept(',')) {
        return Fail("expected ',' between array items", error);
      }
    }
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!Accept('"')) {
      return Fail("expected '\"' to start string", error);
    }

    while (pos_ < input_.size()) {
      const char c = Next();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      if (c != '\\') {
        output.push_back(c);
        continue;
      }
      if (pos_ >= input_.size()) {
        break;
      }

      const char esc = Next();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        output.push_back(esc);
        break;
      case 'b':
        output.push_back('\b');
        break;
      case 'f':
        output.push_back('\f');
        break;
      case 'n':
        output.push_back('\n');
        break;
      case 'r':
        output.push_back('\r');
        break;
      case 't':
        output.push_back('\t');
        break;
      case 'u':
        if (!ParseUnicodeEscape(output, error)) {
          return false;
        }
        break;
      default:
        return Fail("invalid escape sequence in string", error);
      }
    }

    return Fail("unterminated string literal", error);
  }

  // Basic-multilingual-plane escapes only; encoded as UTF-8.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    std::uint32_t code_point = 0;
    for (int i = 0; i < 4; ++i) {
      const char h = Next();
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;
    Accept('-');

    if (!Accept('0') && SkipDigits() == 0U) {
      return Fail("expected digits in number", error);
    }
    if (Accept('.') && SkipDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (Accept('e') || Accept('E')) {
      if (!Accept('+')) {
        Accept('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0' || !std::isfinite(output)) {
      return Fail("invalid numeric value", error);
    }
    return true;
  }

  bool ParseKeyword(std::string_view keyword, std::string& error) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return Fail("expected JSON value", error);
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
      Next();
    }
    return true;
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Next();
      ++count;
    }
    return count;
  }

  void SkipWhitespace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      Next();
    }
  }

  bool Accept(char expected) {
    if (pos_ >= input_.size() || input_[pos_] != expected) {
      return false;
    }
    Next();
    return true;
  }

  char Next() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

inline const Value* FindMember(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  return it == object.object_value.end() ? nullptr : &it->second;
}

inline const Value* FindPath(const Value& root, std::initializer_list<std::string_view> path) {
  const Value* cursor = &root;
  for (const std::string_view key : path) {
    cursor = FindMember(*cursor, key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

inline std::optional<double> AsFiniteNumber(const Value& value) {
  if (value.type != Value::Type::kNumber || !std::isfinite(value.number_value)) {
    return std::nullopt;
  }
  return value.number_value;
}

inline std::optional<std::uint64_t> AsNonNegativeInteger(const Value& value) {
  const std::optional<double> number = AsFiniteNumber(value);
  if (!number.has_value() || *number < 0.0 || std::floor(*number) != *number ||
      *number > 9.0e15) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(*number);
}

inline std::optional<std::string> AsString(const Value& value) {
  if (value.type != Value::Type::kString) {
    return std::nullopt;
  }
  return value.string_value;
}

} // namespace armguard::core::json

#endif // ARMGUARD_CORE_JSON_DOM_HPP_
