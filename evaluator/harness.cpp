#include "evaluator/harness.hpp"

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace {

static const constexpr char* kScript = R"PY(
import ast
import importlib.util
import os
import sys
import traceback


def _decode(v):
    tag = v[0]
    if tag == "n":
        return None
    if tag == "b":
        return v[1]
    if tag == "i":
        return int(v[1])
    if tag == "f":
        return float(v[1])
    if tag == "s":
        return bytes.fromhex(v[1]).decode("utf-8", "surrogateescape")
    if tag == "l":
        return [_decode(x) for x in v[1]]
    if tag == "t":
        return tuple(_decode(x) for x in v[1])
    if tag == "S":
        return set(_decode(x) for x in v[1])
    if tag == "d":
        return {_decode(k): _decode(x) for k, x in v[1]}
    raise ValueError("unknown tag %r" % tag)


def _exit(out, code):
    out.flush()
    sys.stderr.flush()
    os._exit(code)


def _fail(out, code):
    e = sys.exc_info()[1]
    out.write("%s: %s\n%s" % (type(e).__name__, e, traceback.format_exc()))
    _exit(out, code)


def main():
    if hasattr(sys, "set_int_max_str_digits"):
        sys.set_int_max_str_digits(0)
    out = sys.stdout
    sys.stdout = sys.stderr
    mode, module_path, entry_point = sys.argv[1:4]
    sys.path.insert(0, os.getcwd())
    try:
        spec = importlib.util.spec_from_file_location("submission", module_path)
        module = importlib.util.module_from_spec(spec)
        sys.modules[spec.name] = module
        spec.loader.exec_module(module)
        func = eval(entry_point, vars(module))
        if not callable(func):
            raise TypeError("%s is not callable" % entry_point)
    except MemoryError:
        _fail(out, 3)
    except BaseException:
        _fail(out, 2)
    if mode == "check":
        _exit(out, 0)
    try:
        with open(sys.argv[4]) as f:
            kind, items = ast.literal_eval(f.read())
        if kind == "kw":
            result = func(**{k: _decode(v) for k, v in items})
        else:
            result = func(*[_decode(v) for v in items])
        text = repr(result)
    except MemoryError:
        _fail(out, 3)
    except BaseException:
        _fail(out, 1)
    out.write(text)
    _exit(out, 0)


main()
)PY";

void Encode(const evaluator::Value& value, std::string* out) {
  using Type = evaluator::Value::Type;
  switch (value.type) {
    case Type::NONE:
      absl::StrAppend(out, "('n',)");
      break;
    case Type::BOOL:
      absl::StrAppend(out, "('b',", value.bool_value ? "True" : "False", ")");
      break;
    case Type::INT:
      absl::StrAppend(out, "('i','", value.int_value, "')");
      break;
    case Type::FLOAT:
      absl::StrAppend(out, "('f','",
                      absl::StrFormat("%.17g", value.float_value), "')");
      break;
    case Type::STRING:
      absl::StrAppend(out, "('s','", absl::BytesToHexString(value.string_value),
                      "')");
      break;
    case Type::LIST:
    case Type::TUPLE:
    case Type::SET: {
      const char* tag = value.type == Type::LIST    ? "l"
                        : value.type == Type::TUPLE ? "t"
                                                    : "S";
      absl::StrAppend(out, "('", tag, "',[");
      for (const evaluator::Value& item : value.items) {
        Encode(item, out);
        out->push_back(',');
      }
      absl::StrAppend(out, "])");
      break;
    }
    case Type::DICT:
      absl::StrAppend(out, "('d',[");
      for (const auto& entry : value.entries) {
        out->push_back('(');
        Encode(entry.first, out);
        out->push_back(',');
        Encode(entry.second, out);
        absl::StrAppend(out, "),");
      }
      absl::StrAppend(out, "])");
      break;
  }
}

}  // namespace

namespace evaluator {

const char* Harness::Script() { return kScript; }

std::vector<std::string> Harness::CheckCommand(const std::string& python,
                                               const std::string& module_path,
                                               const std::string& entry_point) {
  return {python, "-I", "-B", "-c", kScript, "check", module_path, entry_point};
}

std::vector<std::string> Harness::CallCommand(const std::string& python,
                                              const std::string& module_path,
                                              const std::string& entry_point,
                                              const std::string& args_path) {
  return {python,      "-I",        "-B",        "-c", kScript, "call",
          module_path, entry_point, args_path};
}

std::string Harness::EncodeArguments(const Arguments& args) {
  std::string out;
  if (!args.keyword.empty()) {
    absl::StrAppend(&out, "('kw',[");
    for (const auto& arg : args.keyword) {
      absl::StrAppend(&out, "('", arg.first, "',");
      Encode(arg.second, &out);
      absl::StrAppend(&out, "),");
    }
  } else {
    absl::StrAppend(&out, "('pos',[");
    for (const Value& arg : args.positional) {
      Encode(arg, &out);
      out.push_back(',');
    }
  }
  absl::StrAppend(&out, "])");
  return out;
}

}  // namespace evaluator
