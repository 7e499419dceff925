#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jsonq {

struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed query text. Keeps the query and the offset where lexing or
// parsing stopped so callers can show what was read so far.
class SyntaxError : public Error {
public:
  SyntaxError(const std::string & query, size_t pos, const std::string & message);

  const std::string & query() const { return input; }
  size_t position() const { return pos; }

  std::string consumed() const { return input.substr(0, pos); }
  std::string remaining() const { return input.substr(pos); }
private:
  std::string input;
  size_t pos;
};

class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string & path);

  const std::string & path() const { return element_path; }
private:
  std::string element_path;
};

class TypeMismatchError : public Error {
public:
  TypeMismatchError(const std::string & path, const std::string & actual_type,
                    const std::string & message);

  const std::string & path() const { return element_path; }
  const std::string & actual_type() const { return type; }
private:
  std::string element_path;
  std::string type;
};

struct MultipleResultsError : Error {
  using Error::Error;
};

struct EmptySelectionError : Error {
  using Error::Error;
};

struct InvalidTargetError : Error {
  using Error::Error;
};

class UnsupportedFieldTypeError : public Error {
public:
  UnsupportedFieldTypeError(const std::string & field, const std::string & type);

  const std::string & field() const { return field_name; }
  const std::string & type() const { return type_name; }
private:
  std::string field_name;
  std::string type_name;
};

} // namespace jsonq
