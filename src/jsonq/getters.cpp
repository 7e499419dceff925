#include <cmath>
#include <limits>
#include <stdexcept>

#include <jsonq/error.hpp>
#include <jsonq/query/evaluator.hpp>
#include <jsonq/query/parser.hpp>

#include <jsonq/shape.hpp>

#include <jsonq/getters.hpp>

namespace jsonq {

static std::optional<query::Match> evaluate_path(const Value & root, const std::string & path,
                                                 bool & optional) {
  auto parser = query::Parser();
  auto step = parser.parse(path);
  optional = step->root().optional;
  return query::evaluate(*step, root);
}

Value get(const Value & root, const std::string & path) {
  bool optional;
  auto match = evaluate_path(root, path, optional);
  if (!match.has_value()) {
    return Value();
  }
  if (!match->filtered) {
    return *match->values.front();
  }

  Value::Sequence survivors;
  survivors.reserve(match->values.size());
  for (auto value : match->values) {
    survivors.push_back(*value);
  }
  return Value(std::move(survivors));
}

std::vector<const Value *> select(const Value & root, const std::string & path) {
  bool optional;
  auto match = evaluate_path(root, path, optional);
  if (!match.has_value()) {
    return {};
  }
  if (!match->filtered && match->values.front()->is_sequence()) {
    std::vector<const Value *> elements;
    for (const auto & element : match->values.front()->as_sequence()) {
      elements.push_back(&element);
    }
    return elements;
  }
  return std::move(match->values);
}

static const Value *find_one(const Value & root, const std::string & path, bool & optional) {
  auto match = evaluate_path(root, path, optional);
  if (!match.has_value()) {
    return nullptr;
  }

  switch (match->values.size()) {
    case 0:
      if (optional) {
        return nullptr;
      }
      throw NotFoundError(path);
    case 1: return match->values.front();
    default: throw MultipleResultsError("jsonq: multiple results for '" + path + "'");
  }
}

const Value *find(const Value & root, const std::string & path) {
  bool optional;
  return find_one(root, path, optional);
}

const Value & get_one(const Value & root, const std::string & path) {
  auto value = find(root, path);
  if (value == nullptr) {
    throw NotFoundError(path);
  }
  return *value;
}

static TypeMismatchError make_type_error(const std::string & path, const Value & value,
                                         const char *expected) {
  return TypeMismatchError(path, value.type_name(),
    "value of '" + path + "' is not " + expected + ": " + value.type_name());
}

// Conversions shared by the typed getters and field extraction. `value` is
// nullptr when an optional path was missing.

static std::string string_value(const std::string & path, const Value *value, bool) {
  if (value == nullptr || value->is_null()) {
    return "";
  }
  if (!value->is_string()) {
    throw make_type_error(path, *value, "string");
  }
  return value->as_string();
}

static double number_value(const std::string & path, const Value *value, bool optional) {
  if (value == nullptr || (optional && value->is_null())) {
    return 0;
  }
  if (!value->is_number()) {
    throw make_type_error(path, *value, "number");
  }
  return value->as_number();
}

static int64_t integer_value(const std::string & path, const Value *value, bool optional) {
  if (value == nullptr || (optional && value->is_null())) {
    return 0;
  }
  if (!value->is_number()) {
    throw make_type_error(path, *value, "number");
  }

  // 2^63, the first double outside int64_t.
  constexpr double LIMIT = 9223372036854775808.0;

  auto truncated = std::trunc(value->as_number());
  if (std::isnan(truncated) || truncated >= LIMIT || truncated < -LIMIT) {
    throw TypeMismatchError(path, value->type_name(),
      "value of '" + path + "' is out of integer range");
  }
  return static_cast<int64_t>(truncated);
}

static int64_t int_value(const std::string & path, const Value *value, bool optional) {
  auto n = integer_value(path, value, optional);
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
    throw TypeMismatchError(path, value->type_name(),
      "value of '" + path + "' is out of int range");
  }
  return n;
}

static bool boolean_value(const std::string & path, const Value *value, bool optional) {
  if (value == nullptr || (optional && value->is_null())) {
    return false;
  }
  if (!value->is_boolean()) {
    throw make_type_error(path, *value, "boolean");
  }
  return value->as_boolean();
}

std::string get_string(const Value & root, const std::string & path) {
  bool optional;
  auto value = find_one(root, path, optional);
  return string_value(path, value, optional);
}

double get_number(const Value & root, const std::string & path) {
  bool optional;
  auto value = find_one(root, path, optional);
  return number_value(path, value, optional);
}

int64_t get_integer(const Value & root, const std::string & path) {
  bool optional;
  auto value = find_one(root, path, optional);
  return integer_value(path, value, optional);
}

bool get_boolean(const Value & root, const std::string & path) {
  bool optional;
  auto value = find_one(root, path, optional);
  return boolean_value(path, value, optional);
}

namespace detail {

std::optional<FieldValue> resolve_field(const Value & element, const std::string & path,
                                        FieldKind kind) {
  bool optional;
  auto value = find_one(element, path, optional);
  if (value == nullptr) {
    return std::nullopt;
  }

  switch (kind) {
    case FieldKind::String: return string_value(path, value, optional);
    case FieldKind::Number: return number_value(path, value, optional);
    case FieldKind::Integer: return integer_value(path, value, optional);
    case FieldKind::Int: return int_value(path, value, optional);
    case FieldKind::Boolean: return boolean_value(path, value, optional);
    case FieldKind::Unsupported: break;
  }
  throw std::logic_error("Unsupported fields can't be resolved");
}

} // namespace detail

} // namespace jsonq
