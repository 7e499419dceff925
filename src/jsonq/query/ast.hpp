#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jsonq::query {

enum class AtomType {
  String,
  Integer
};

struct Atom {
  AtomType type;
  std::string text;
  int64_t integer = 0;
};

enum class LogicalOp {
  And,
  Or
};

enum class CompareOp {
  Eq,
  Neq,
  Lt,
  Le,
  Gt,
  Ge,
  Index
};

struct Filter;

namespace filters {
struct Logical {
  LogicalOp op;
  std::unique_ptr<Filter> left;
  std::unique_ptr<Filter> right;
};

// `left` names the field to compare; for CompareOp::Index it holds the
// positional index and `right` is empty.
struct Comparative {
  CompareOp op;
  Atom left;
  std::optional<Atom> right;
};
} // namespace filters

struct Filter {
  std::variant<
    filters::Logical,
    filters::Comparative
  > node;
};

// One dotted key of a path. Steps form a chain from the last key back to
// the first through `left`.
struct PathStep {
  std::unique_ptr<PathStep> left;
  std::string key;
  bool optional = false;
  std::vector<Filter> filters = {};

  const PathStep & root() const;
};

std::string to_string(const Atom & atom);
std::string to_string(const Filter & filter);
std::string to_string(const PathStep & step);

} // namespace jsonq::query
