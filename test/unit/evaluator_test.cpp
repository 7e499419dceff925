#include <optional>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include <jsonq/error.hpp>
#include <jsonq/query/evaluator.hpp>
#include <jsonq/query/parser.hpp>

#include "../test_utils.hpp"

using jsonq::Value;
using jsonq::query::Match;

static std::optional<Match> run(const std::string & query, const Value & value) {
  auto parser = jsonq::query::Parser();
  auto path = parser.parse(query);
  return jsonq::query::evaluate(*path, value);
}

static std::vector<std::string> names_of(const Match & match) {
  std::vector<std::string> names;
  for (auto value : match.values) {
    names.push_back(value->member("name")->as_string());
  }
  return names;
}

TEST_CASE("evaluates dotted paths to the stored value") {
  auto root = test_utils::issue_document();

  auto match = run("issue.fields.project", root);

  REQUIRE(match.has_value());
  REQUIRE_FALSE(match->filtered);
  REQUIRE(match->values.size() == 1);
  REQUIRE(match->values[0] == root.member("issue")->member("fields")->member("project"));
}

TEST_CASE("does not unwrap unfiltered sequences") {
  auto root = test_utils::assignee_changes();

  auto match = run("items", root);

  REQUIRE(match.has_value());
  REQUIRE(match->values.size() == 1);
  REQUIRE(match->values[0]->is_sequence());
}

TEST_CASE("reports missing keys with the full path") {
  auto root = test_utils::issue_document();

  try {
    run("issue.fields.missing", root);
    FAIL("expected a not found error");
  } catch (const jsonq::NotFoundError & e) {
    CHECK(e.path() == "issue.fields.missing");
  }

  CHECK_THROWS_AS(run("nonexistent", root), jsonq::NotFoundError);

  try {
    run("issue.\"a.b\"", root);
    FAIL("expected a not found error");
  } catch (const jsonq::NotFoundError & e) {
    CHECK(e.path() == "issue.\"a.b\"");
  }
}

TEST_CASE("reports indexing into non-mappings") {
  auto root = test_utils::issue_document();

  try {
    run("issue.count.value", root);
    FAIL("expected a type mismatch");
  } catch (const jsonq::TypeMismatchError & e) {
    CHECK(e.path() == "issue.count.value");
    CHECK(e.actual_type() == "number");
  }
}

TEST_CASE("yields no match for missing keys of optional paths") {
  auto root = test_utils::issue_document();

  CHECK_FALSE(run("?missing", root).has_value());
  CHECK_FALSE(run("?issue.missing.deeper", root).has_value());
  CHECK(run("?issue.key", root).has_value());

  CHECK_THROWS_AS(run("?issue.count.value", root), jsonq::TypeMismatchError);
}

TEST_CASE("filters sequences by field equality") {
  auto root = test_utils::prioritized_items();

  auto match = run("items[status==\"open\"]", root);

  REQUIRE(match.has_value());
  REQUIRE(match->filtered);
  REQUIRE(names_of(*match) == std::vector<std::string> { "low", "high" });

  match = run("items[status!=open]", root);
  REQUIRE(names_of(*match) == std::vector<std::string> { "edge", "mid" });

  match = run("items[priority==50]", root);
  REQUIRE(names_of(*match) == std::vector<std::string> { "mid" });
}

TEST_CASE("selects by positional index") {
  auto root = test_utils::prioritized_items();

  REQUIRE(names_of(*run("items[0]", root)) == std::vector<std::string> { "low" });
  REQUIRE(names_of(*run("items[3]", root)) == std::vector<std::string> { "mid" });
  REQUIRE(run("items[4]", root)->values.empty());
}

TEST_CASE("applies filters in order") {
  auto root = test_utils::prioritized_items();

  auto match = run("items[status==open][1]", root);
  REQUIRE(names_of(*match) == std::vector<std::string> { "high" });

  match = run("items[status==closed][1]", root);
  REQUIRE(match->values.empty());
}

TEST_CASE("distinguishes strict and inclusive numeric comparisons") {
  auto root = test_utils::prioritized_items();

  REQUIRE(names_of(*run("items[priority<100]", root)) ==
          std::vector<std::string> { "low", "mid" });
  REQUIRE(names_of(*run("items[priority<=100]", root)) ==
          std::vector<std::string> { "low", "edge", "mid" });
  REQUIRE(names_of(*run("items[priority>100]", root)) ==
          std::vector<std::string> { "high" });
  REQUIRE(names_of(*run("items[priority>=100]", root)) ==
          std::vector<std::string> { "edge", "high" });
}

TEST_CASE("strict and inclusive bounds pick different first elements") {
  auto root = Value::mapping({
    { "items", Value::sequence({
      Value::mapping({ { "name", "boundary" }, { "priority", 100 } }),
      Value::mapping({ { "name", "below" }, { "priority", 7 } }),
    }) },
  });

  REQUIRE(names_of(*run("items[priority<100][0]", root)) ==
          std::vector<std::string> { "below" });
  REQUIRE(names_of(*run("items[priority<=100][0]", root)) ==
          std::vector<std::string> { "boundary" });
}

TEST_CASE("orders strings lexicographically") {
  auto root = test_utils::prioritized_items();

  REQUIRE(names_of(*run("items[name<\"low\"]", root)) ==
          std::vector<std::string> { "edge", "high" });
  REQUIRE(names_of(*run("items[name<=low]", root)) ==
          std::vector<std::string> { "low", "edge", "high" });
  REQUIRE(names_of(*run("items[name>low]", root)) ==
          std::vector<std::string> { "mid" });
  REQUIRE(names_of(*run("items[name>=mid]", root)) ==
          std::vector<std::string> { "mid" });
}

TEST_CASE("combines predicates with logical operators") {
  auto root = test_utils::prioritized_items();

  REQUIRE(names_of(*run("items[status==open && priority>20]", root)) ==
          std::vector<std::string> { "high" });
  REQUIRE(names_of(*run("items[status==closed || priority<20]", root)) ==
          std::vector<std::string> { "low", "edge" });
  REQUIRE(names_of(*run("items[status==open || status==review && priority>=50]", root)) ==
          std::vector<std::string> { "high", "mid" });
}

TEST_CASE("rejects index filters that are not integers") {
  auto root = test_utils::issue_document();

  REQUIRE_THROWS_AS(run("issue.fields[project]", root), jsonq::TypeMismatchError);
}

TEST_CASE("filters a single mapping like a sequence of one") {
  auto root = test_utils::issue_document();

  auto match = run("issue[key==\"OP-1\"]", root);
  REQUIRE(match->filtered);
  REQUIRE(match->values.size() == 1);
  REQUIRE(match->values[0] == root.member("issue"));

  REQUIRE(run("issue[key==\"OP-2\"]", root)->values.empty());
  REQUIRE(run("issue[0]", root)->values.size() == 1);
}

TEST_CASE("propagates field lookup failures from filters") {
  auto root = test_utils::prioritized_items();

  CHECK_THROWS_AS(run("items[missing==1]", root), jsonq::NotFoundError);
  CHECK_THROWS_AS(run("items[name==1]", root), jsonq::TypeMismatchError);
  CHECK_THROWS_AS(run("items[priority==\"10\"]", root), jsonq::TypeMismatchError);
  CHECK_THROWS_AS(run("items[1==1]", root), jsonq::TypeMismatchError);
}

TEST_CASE("reads null fields as empty strings in filters") {
  auto root = test_utils::assignee_changes();

  auto match = run("items[fromString==\"\"]", root);
  REQUIRE(match->values.size() == 1);
  REQUIRE(match->values[0]->member("toString")->as_string() == "A");
}
