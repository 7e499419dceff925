#include <type_traits>

#include <jsonq/query/ast.hpp>
#include <jsonq/query/lexer.hpp>

namespace jsonq::query {

const PathStep & PathStep::root() const {
  auto step = this;
  while (step->left) step = step->left.get();
  return *step;
}

static const char *operator_text(LogicalOp op) {
  switch (op) {
    case LogicalOp::And: return "&&";
    case LogicalOp::Or: return "||";
  }
  return "?";
}

static const char *operator_text(CompareOp op) {
  switch (op) {
    case CompareOp::Eq: return "==";
    case CompareOp::Neq: return "!=";
    case CompareOp::Lt: return "<";
    case CompareOp::Le: return "<=";
    case CompareOp::Gt: return ">";
    case CompareOp::Ge: return ">=";
    case CompareOp::Index: return "";
  }
  return "?";
}

std::string to_string(const Atom & atom) {
  switch (atom.type) {
    case AtomType::String: return "\"" + atom.text + "\"";
    case AtomType::Integer: return std::to_string(atom.integer);
  }
  return "";
}

std::string to_string(const Filter & filter) {
  return std::visit([](auto &&arg) -> std::string {
    using T = std::decay_t<decltype(arg)>;
    if constexpr (std::is_same_v<filters::Logical, T>) {
      return to_string(*arg.left) + operator_text(arg.op) + to_string(*arg.right);
    } else {
      auto text = to_string(arg.left);
      if (arg.right.has_value()) {
        text += operator_text(arg.op) + to_string(*arg.right);
      }
      return text;
    }
  }, filter.node);
}

std::string to_string(const PathStep & step) {
  std::string text;
  if (step.left) {
    text = to_string(*step.left) + ".";
  }
  if (step.optional) {
    text += "?";
  }
  text += is_symbol(step.key) ? step.key : "\"" + step.key + "\"";
  for (const auto & filter : step.filters) {
    text += "[" + to_string(filter) + "]";
  }
  return text;
}

} // namespace jsonq::query
