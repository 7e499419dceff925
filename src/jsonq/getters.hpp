#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <jsonq/value.hpp>

namespace jsonq {

// Paths are dotted keys with optional trailing filters, for example
// `issue.changelog.items[fieldId=="assignee"][0]`. A leading `?` makes the
// whole path optional: a missing key is then not an error.

// Returns a copy of the value at `path`. A filtered path yields a sequence
// of the surviving elements; a missing optional path yields null.
Value get(const Value & root, const std::string & path);

// Returns the values matched by `path`, flattening filter results. A
// missing optional path matches nothing.
std::vector<const Value *> select(const Value & root, const std::string & path);

// Returns the single value at `path`, or nullptr when an optional path is
// missing or its filters leave nothing. Otherwise a filtered path must
// leave exactly one element.
const Value *find(const Value & root, const std::string & path);

// As find(), but a missing optional path is a NotFoundError.
const Value & get_one(const Value & root, const std::string & path);

// Typed getters. Null reads as "" for strings. For optional paths, a
// missing key, an empty filter result or null yields "", 0 or false.
std::string get_string(const Value & root, const std::string & path);
double get_number(const Value & root, const std::string & path);
int64_t get_integer(const Value & root, const std::string & path);
bool get_boolean(const Value & root, const std::string & path);

} // namespace jsonq
