#ifndef EVALUATOR_LITERAL_HPP
#define EVALUATOR_LITERAL_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"

namespace evaluator {

class parse_error : public std::runtime_error {
 public:
  explicit parse_error(const std::string& msg) : std::runtime_error(msg) {}
};

// A Python literal: None, bool, arbitrary precision int, float, str, and
// (possibly nested) list, tuple, set and dict.
struct Value {
  enum class Type { NONE, BOOL, INT, FLOAT, STRING, LIST, TUPLE, SET, DICT };

  Type type = Type::NONE;
  bool bool_value = false;
  // Decimal digits, with a leading '-' for negative values and no leading
  // zeros.
  std::string int_value;
  double float_value = 0;
  // UTF-8 encoded.
  std::string string_value;
  // Elements of lists, tuples and sets.
  std::vector<Value> items;
  std::vector<std::pair<Value, Value>> entries;

  static Value None() { return Value(); }
  static Value Bool(bool value);
  static Value Int(std::string digits);
  static Value Float(double value);
  static Value String(std::string value);
  static Value Sequence(Type type, std::vector<Value> items);
  static Value Dict(std::vector<std::pair<Value, Value>> entries);
};

// Parses a single literal, surrounded by optional whitespace. A top-level
// sequence of comma-separated literals is a tuple, as in Python. Accepts
// both Python (True, False, None) and JSON (true, false, null) constants.
// Throws parse_error.
Value Parse(absl::string_view text);

// Structural equality. Ints compare exactly, floats (and ints against floats)
// with a relative tolerance of 1e-9, and NaN equals NaN. Bools are distinct
// from numbers. Lists equal tuples with the same elements. Sets and dicts are
// unordered.
bool Equals(const Value& a, const Value& b);

// Arguments of one call.
struct Arguments {
  std::vector<std::pair<std::string, Value>> keyword;
  std::vector<Value> positional;
};

// Parses the input of a test case: either "name=literal, name=literal", a
// single literal (one positional argument) or nothing. Throws parse_error.
Arguments ParseArguments(absl::string_view input);

}  // namespace evaluator

#endif
