#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include <jsonq/error.hpp>

#include <jsonq/query/evaluator.hpp>

namespace jsonq::query {

static const Value *lookup(const PathStep & step, const Value & value, bool optional) {
  if (!value.is_mapping()) {
    auto path = to_string(step);
    throw TypeMismatchError(path, value.type_name(),
      "query '" + path + "' can't index " + value.type_name());
  }

  auto child = value.member(step.key);
  if (child == nullptr && !optional) {
    throw NotFoundError(to_string(step));
  }
  return child;
}

static std::optional<Match> evaluate_step(const PathStep & step, const Value & value, bool optional) {
  auto current = &value;

  if (step.left) {
    auto left = evaluate_step(*step.left, value, optional);
    if (!left.has_value()) {
      return std::nullopt;
    }
    // Only the last step can carry filters, so the left side is a single value.
    current = left->values.front();
  }

  auto child = lookup(step, *current, optional);
  if (child == nullptr) {
    return std::nullopt;
  }

  Match match;
  if (step.filters.empty()) {
    match.values.push_back(child);
    return match;
  }

  match.filtered = true;
  if (child->is_sequence()) {
    for (const auto & element : child->as_sequence()) {
      match.values.push_back(&element);
    }
  } else {
    match.values.push_back(child);
  }

  for (const auto & filter : step.filters) {
    std::vector<const Value *> survivors;
    for (size_t i = 0; i < match.values.size(); i++) {
      if (evaluate(filter, i, *match.values[i])) {
        survivors.push_back(match.values[i]);
      }
    }
    match.values = std::move(survivors);
  }

  return match;
}

std::optional<Match> evaluate(const PathStep & step, const Value & value) {
  return evaluate_step(step, value, step.root().optional);
}

static const Value & field_of(const Value & element, const Atom & field) {
  if (field.type != AtomType::String) {
    throw TypeMismatchError(to_string(field), "integer",
      "filter field " + to_string(field) + " is not a field name");
  }
  if (!element.is_mapping()) {
    throw TypeMismatchError(field.text, element.type_name(),
      "filter can't read field '" + field.text + "' of " + element.type_name());
  }
  auto value = element.member(field.text);
  if (value == nullptr) {
    throw NotFoundError(field.text);
  }
  return *value;
}

static std::string string_field(const Value & element, const Atom & field) {
  const auto & value = field_of(element, field);
  if (value.is_null()) {
    return "";
  }
  if (!value.is_string()) {
    throw TypeMismatchError(field.text, value.type_name(),
      "value of '" + field.text + "' is not string: " + value.type_name());
  }
  return value.as_string();
}

static double number_field(const Value & element, const Atom & field) {
  const auto & value = field_of(element, field);
  if (!value.is_number()) {
    throw TypeMismatchError(field.text, value.type_name(),
      "value of '" + field.text + "' is not number: " + value.type_name());
  }
  return value.as_number();
}

template <typename T>
static bool compare(CompareOp op, const T & lhs, const T & rhs) {
  switch (op) {
    case CompareOp::Eq: return lhs == rhs;
    case CompareOp::Neq: return lhs != rhs;
    case CompareOp::Lt: return lhs < rhs;
    case CompareOp::Le: return lhs <= rhs;
    case CompareOp::Gt: return lhs > rhs;
    case CompareOp::Ge: return lhs >= rhs;
    case CompareOp::Index: break;
  }
  throw std::logic_error("Index is not a comparison operator");
}

static bool evaluate_comparative(const filters::Comparative & comparative, size_t index,
                                 const Value & element) {
  if (comparative.op == CompareOp::Index) {
    if (comparative.left.type != AtomType::Integer) {
      throw TypeMismatchError(comparative.left.text, "string",
        "filter [" + to_string(comparative.left) + "] is not an integer index");
    }
    return comparative.left.integer >= 0 &&
           static_cast<uint64_t>(comparative.left.integer) == index;
  }

  const auto & literal = *comparative.right;
  switch (literal.type) {
    case AtomType::String: {
      return compare(comparative.op, string_field(element, comparative.left), literal.text);
    }
    case AtomType::Integer: {
      return compare(comparative.op, number_field(element, comparative.left),
                     static_cast<double>(literal.integer));
    }
  }
  throw std::logic_error("Unknown AtomType");
}

bool evaluate(const Filter & filter, size_t index, const Value & element) {
  return std::visit([&](auto &&arg) -> bool {
    using T = std::decay_t<decltype(arg)>;
    if constexpr (std::is_same_v<filters::Logical, T>) {
      switch (arg.op) {
        case LogicalOp::And:
          return evaluate(*arg.left, index, element) && evaluate(*arg.right, index, element);
        case LogicalOp::Or:
          return evaluate(*arg.left, index, element) || evaluate(*arg.right, index, element);
      }
      throw std::logic_error("Unknown LogicalOp");
    } else {
      return evaluate_comparative(arg, index, element);
    }
  }, filter.node);
}

} // namespace jsonq::query
