#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <jsonq/query/ast.hpp>
#include <jsonq/value.hpp>

namespace jsonq::query {

// Values matched by a path. Points into the evaluated tree.
struct Match {
  // True when the last step carried filters: `values` holds the survivors
  // of the filters. Otherwise `values` holds exactly the looked-up value.
  bool filtered = false;
  std::vector<const Value *> values = {};
};

// Evaluates the path ending at `step` against `value`. An empty optional
// means a key of an optional path was missing.
std::optional<Match> evaluate(const PathStep & step, const Value & value);

// Evaluates a filter predicate for the element at `index` of the sequence
// being filtered.
bool evaluate(const Filter & filter, size_t index, const Value & element);

} // namespace jsonq::query
