#include "evaluator/literal.hpp"

#include <ctype.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace {

using evaluator::Value;
using evaluator::parse_error;

static const constexpr int kMaxDepth = 500;
static const constexpr double kTolerance = 1e-9;

bool IsIdentifierStart(char c) {
  return isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentifierChar(char c) {
  return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void AppendUtf8(uint32_t code, std::string* out) {
  if (code < 0x80) {
    out->push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (code >> 6)));
    out->push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (code >> 12)));
    out->push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (code >> 18)));
    out->push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

class Parser {
 public:
  explicit Parser(absl::string_view text) : text_(text) {}

  // The whole text, where "a, b" is the tuple (a, b).
  Value ParseTop() {
    Value first = ParseValue(0);
    if (AtEnd()) return first;
    if (Peek() != ',') Fail("unexpected character");
    std::vector<Value> items;
    items.push_back(std::move(first));
    while (!AtEnd()) {
      Expect(',');
      if (AtEnd()) break;
      items.push_back(ParseValue(1));
    }
    return Value::Sequence(Value::Type::TUPLE, std::move(items));
  }

  Value ParseValue(int depth) {
    if (depth > kMaxDepth) Fail("nesting too deep");
    SkipSpaces();
    if (pos_ == text_.size()) Fail("unexpected end of input");
    char c = text_[pos_];
    if (c == '[') {
      pos_++;
      bool had_comma = false;
      return Value::Sequence(Value::Type::LIST,
                             ParseItems(']', depth, &had_comma));
    }
    if (c == '(') {
      pos_++;
      bool had_comma = false;
      std::vector<Value> items = ParseItems(')', depth, &had_comma);
      if (items.size() == 1 && !had_comma) return std::move(items[0]);
      return Value::Sequence(Value::Type::TUPLE, std::move(items));
    }
    if (c == '{') return ParseBrace(depth);
    if (c == '\'' || c == '"') return ParseString();
    if (isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '+' ||
        c == '-') {
      return ParseNumber();
    }
    if (IsIdentifierStart(c)) return ParseName();
    Fail("unexpected character");
  }

  // Consumes "name =" (but not "name ==") if it comes next.
  bool TryKeyword(std::string* name) {
    SkipSpaces();
    size_t start = pos_;
    if (pos_ == text_.size() || !IsIdentifierStart(text_[pos_])) return false;
    while (pos_ < text_.size() && IsIdentifierChar(text_[pos_])) pos_++;
    std::string identifier(text_.substr(start, pos_ - start));
    SkipSpaces();
    if (pos_ < text_.size() && text_[pos_] == '=' &&
        (pos_ + 1 == text_.size() || text_[pos_ + 1] != '=')) {
      pos_++;
      *name = std::move(identifier);
      return true;
    }
    pos_ = start;
    return false;
  }

  bool AtEnd() {
    SkipSpaces();
    return pos_ == text_.size();
  }

  char Peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  void Expect(char c) {
    SkipSpaces();
    if (Peek() != c) {
      Fail(absl::StrCat("expected '", std::string(1, c), "'"));
    }
    pos_++;
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw parse_error(absl::StrCat(what, " at position ", pos_));
  }

 private:
  void SkipSpaces() {
    while (pos_ < text_.size() &&
           isspace(static_cast<unsigned char>(text_[pos_]))) {
      pos_++;
    }
  }

  bool Consume(char c) {
    SkipSpaces();
    if (Peek() != c) return false;
    pos_++;
    return true;
  }

  std::vector<Value> ParseItems(char close, int depth, bool* had_comma) {
    std::vector<Value> items;
    if (Consume(close)) return items;
    while (true) {
      items.push_back(ParseValue(depth + 1));
      if (Consume(close)) return items;
      Expect(',');
      *had_comma = true;
      if (Consume(close)) return items;
    }
  }

  Value ParseBrace(int depth) {
    pos_++;
    if (Consume('}')) return Value::Dict({});
    Value first = ParseValue(depth + 1);
    if (Consume(':')) {
      std::vector<std::pair<Value, Value>> entries;
      Value value = ParseValue(depth + 1);
      entries.emplace_back(std::move(first), std::move(value));
      while (!Consume('}')) {
        Expect(',');
        if (Consume('}')) break;
        Value key = ParseValue(depth + 1);
        Expect(':');
        Value val = ParseValue(depth + 1);
        entries.emplace_back(std::move(key), std::move(val));
      }
      return Value::Dict(std::move(entries));
    }
    std::vector<Value> items;
    items.push_back(std::move(first));
    while (!Consume('}')) {
      Expect(',');
      if (Consume('}')) break;
      items.push_back(ParseValue(depth + 1));
    }
    return Value::Sequence(Value::Type::SET, std::move(items));
  }

  std::string ParseIdentifier() {
    size_t start = pos_;
    while (pos_ < text_.size() && IsIdentifierChar(text_[pos_])) pos_++;
    return std::string(text_.substr(start, pos_ - start));
  }

  Value ParseName() {
    std::string name = ParseIdentifier();
    if (name == "True" || name == "true") return Value::Bool(true);
    if (name == "False" || name == "false") return Value::Bool(false);
    if (name == "None" || name == "null") return Value::None();
    if (name == "inf" || name == "Infinity") {
      return Value::Float(std::numeric_limits<double>::infinity());
    }
    if (name == "nan" || name == "NaN") {
      return Value::Float(std::numeric_limits<double>::quiet_NaN());
    }
    if (name == "set" && Consume('(') && Consume(')')) {
      return Value::Sequence(Value::Type::SET, {});
    }
    Fail("unknown name " + name);
  }

  Value ParseNumber() {
    bool negative = false;
    if (text_[pos_] == '+' || text_[pos_] == '-') {
      negative = text_[pos_] == '-';
      pos_++;
    }
    if (pos_ < text_.size() && IsIdentifierStart(text_[pos_])) {
      Value value = ParseName();
      if (value.type != Value::Type::FLOAT) Fail("sign before a non-number");
      if (negative) value.float_value = -value.float_value;
      return value;
    }
    std::string number = negative ? "-" : "";
    bool is_float = false;
    bool has_digits = false;
    auto scan_digits = [&]() {
      while (pos_ < text_.size() &&
             (isdigit(static_cast<unsigned char>(text_[pos_])) ||
              text_[pos_] == '_')) {
        if (text_[pos_] != '_') {
          number.push_back(text_[pos_]);
          has_digits = true;
        }
        pos_++;
      }
    };
    scan_digits();
    if (Peek() == '.') {
      is_float = true;
      number.push_back('.');
      pos_++;
      scan_digits();
    }
    if (!has_digits) Fail("malformed number");
    if (Peek() == 'e' || Peek() == 'E') {
      is_float = true;
      number.push_back('e');
      pos_++;
      if (Peek() == '+' || Peek() == '-') number.push_back(text_[pos_++]);
      if (!isdigit(static_cast<unsigned char>(Peek()))) {
        Fail("malformed exponent");
      }
      while (isdigit(static_cast<unsigned char>(Peek()))) {
        number.push_back(text_[pos_++]);
      }
    }
    if (is_float) {
      double value = 0;
      if (!absl::SimpleAtod(number, &value)) Fail("malformed float");
      return Value::Float(value);
    }
    return Value::Int(number);
  }

  Value ParseString() {
    std::string out;
    while (Peek() == '\'' || Peek() == '"') {
      ParseQuoted(&out);
      SkipSpaces();
    }
    return Value::String(std::move(out));
  }

  uint32_t ParseHex(int count) {
    uint32_t code = 0;
    for (int i = 0; i < count; i++) {
      int digit = HexValue(Peek());
      if (digit == -1) Fail("malformed escape");
      code = code * 16 + digit;
      pos_++;
    }
    return code;
  }

  void ParseQuoted(std::string* out) {
    char quote = text_[pos_++];
    while (true) {
      if (pos_ == text_.size()) Fail("unterminated string");
      char c = text_[pos_++];
      if (c == quote) return;
      if (c == '\n') Fail("newline in string");
      if (c != '\\') {
        out->push_back(c);
        continue;
      }
      if (pos_ == text_.size()) Fail("unterminated string");
      char e = text_[pos_++];
      switch (e) {
        case '\n':
          break;
        case '\\':
        case '\'':
        case '"':
          out->push_back(e);
          break;
        case 'n':
          out->push_back('\n');
          break;
        case 't':
          out->push_back('\t');
          break;
        case 'r':
          out->push_back('\r');
          break;
        case 'a':
          out->push_back('\a');
          break;
        case 'b':
          out->push_back('\b');
          break;
        case 'f':
          out->push_back('\f');
          break;
        case 'v':
          out->push_back('\v');
          break;
        case 'x':
          AppendUtf8(ParseHex(2), out);
          break;
        case 'u':
          AppendUtf8(ParseHex(4), out);
          break;
        case 'U': {
          uint32_t code = ParseHex(8);
          if (code > 0x10FFFF) Fail("invalid code point");
          AppendUtf8(code, out);
          break;
        }
        default:
          if (e >= '0' && e <= '7') {
            uint32_t code = e - '0';
            for (int i = 0; i < 2 && Peek() >= '0' && Peek() <= '7'; i++) {
              code = code * 8 + (text_[pos_++] - '0');
            }
            AppendUtf8(code, out);
          } else {
            out->push_back('\\');
            out->push_back(e);
          }
      }
    }
  }

  absl::string_view text_;
  size_t pos_ = 0;
};

bool IsNumber(const Value& v) {
  return v.type == Value::Type::INT || v.type == Value::Type::FLOAT;
}

bool IsSequence(const Value& v) {
  return v.type == Value::Type::LIST || v.type == Value::Type::TUPLE;
}

double ToDouble(const Value& v) {
  if (v.type == Value::Type::FLOAT) return v.float_value;
  double value = 0;
  if (!absl::SimpleAtod(v.int_value, &value)) {
    value = v.int_value[0] == '-' ? -std::numeric_limits<double>::infinity()
                                  : std::numeric_limits<double>::infinity();
  }
  return value;
}

bool FloatEquals(double a, double b) {
  if (std::isnan(a) || std::isnan(b)) return std::isnan(a) && std::isnan(b);
  if (std::isinf(a) || std::isinf(b)) return a == b;
  return std::fabs(a - b) <=
         kTolerance * std::max({1.0, std::fabs(a), std::fabs(b)});
}

// Whether every element of a matches a distinct element of b.
template <typename T, typename Eq>
bool UnorderedEquals(const std::vector<T>& a, const std::vector<T>& b,
                     const Eq& eq) {
  if (a.size() != b.size()) return false;
  std::vector<bool> used(b.size());
  for (const T& x : a) {
    bool found = false;
    for (size_t i = 0; i < b.size(); i++) {
      if (!used[i] && eq(x, b[i])) {
        used[i] = found = true;
        break;
      }
    }
    if (!found) return false;
  }
  return true;
}

}  // namespace

namespace evaluator {

Value Value::Bool(bool value) {
  Value v;
  v.type = Type::BOOL;
  v.bool_value = value;
  return v;
}

Value Value::Int(std::string digits) {
  bool negative = !digits.empty() && digits[0] == '-';
  size_t start = negative ? 1 : 0;
  size_t first = digits.find_first_not_of('0', start);
  Value v;
  v.type = Type::INT;
  if (first == std::string::npos) {
    v.int_value = "0";
  } else {
    v.int_value = (negative ? "-" : "") + digits.substr(first);
  }
  return v;
}

Value Value::Float(double value) {
  Value v;
  v.type = Type::FLOAT;
  v.float_value = value;
  return v;
}

Value Value::String(std::string value) {
  Value v;
  v.type = Type::STRING;
  v.string_value = std::move(value);
  return v;
}

Value Value::Sequence(Type type, std::vector<Value> items) {
  Value v;
  v.type = type;
  v.items = std::move(items);
  return v;
}

Value Value::Dict(std::vector<std::pair<Value, Value>> entries) {
  Value v;
  v.type = Type::DICT;
  v.entries = std::move(entries);
  return v;
}

Value Parse(absl::string_view text) {
  Parser parser(text);
  return parser.ParseTop();
}

bool Equals(const Value& a, const Value& b) {
  if (a.type == Value::Type::INT && b.type == Value::Type::INT) {
    return a.int_value == b.int_value;
  }
  if (IsNumber(a) && IsNumber(b)) return FloatEquals(ToDouble(a), ToDouble(b));
  if (IsSequence(a) && IsSequence(b)) {
    if (a.items.size() != b.items.size()) return false;
    for (size_t i = 0; i < a.items.size(); i++) {
      if (!Equals(a.items[i], b.items[i])) return false;
    }
    return true;
  }
  if (a.type != b.type) return false;
  switch (a.type) {
    case Value::Type::NONE:
      return true;
    case Value::Type::BOOL:
      return a.bool_value == b.bool_value;
    case Value::Type::STRING:
      return a.string_value == b.string_value;
    case Value::Type::SET:
      return UnorderedEquals(a.items, b.items, Equals);
    case Value::Type::DICT:
      return UnorderedEquals(
          a.entries, b.entries,
          [](const std::pair<Value, Value>& x,
             const std::pair<Value, Value>& y) {
            return Equals(x.first, y.first) && Equals(x.second, y.second);
          });
    default:
      return false;
  }
}

Arguments ParseArguments(absl::string_view input) {
  Arguments args;
  Parser parser(input);
  if (parser.AtEnd()) return args;
  std::string name;
  if (!parser.TryKeyword(&name)) {
    args.positional.push_back(parser.ParseTop());
    return args;
  }
  std::set<std::string> seen;
  while (true) {
    if (!seen.insert(name).second) {
      throw parse_error("duplicate argument " + name);
    }
    args.keyword.emplace_back(name, parser.ParseValue(0));
    if (parser.AtEnd()) break;
    parser.Expect(',');
    if (parser.AtEnd()) break;
    if (!parser.TryKeyword(&name)) parser.Fail("expected name=value");
  }
  return args;
}

}  // namespace evaluator
