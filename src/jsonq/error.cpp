#include <jsonq/error.hpp>

namespace jsonq {

static std::string describe_syntax_error(const std::string & query, size_t pos,
                                         const std::string & message) {
  if (pos == 0) {
    return "jsonq: " + message + " at the beginning of query '" + query + "'";
  }
  return "jsonq: " + message + " at " + std::to_string(pos) + ": '" +
         query.substr(0, pos) + "' <here> '" + query.substr(pos) + "'";
}

SyntaxError::SyntaxError(const std::string & query, size_t pos, const std::string & message)
  : Error(describe_syntax_error(query, pos, message))
  , input(query)
  , pos(pos < query.size() ? pos : query.size()) {}

NotFoundError::NotFoundError(const std::string & path)
  : Error("jsonq: element '" + path + "' not found")
  , element_path(path) {}

TypeMismatchError::TypeMismatchError(const std::string & path, const std::string & actual_type,
                                     const std::string & message)
  : Error("jsonq: " + message)
  , element_path(path)
  , type(actual_type) {}

UnsupportedFieldTypeError::UnsupportedFieldTypeError(const std::string & field,
                                                     const std::string & type)
  : Error("jsonq: field '" + field + "' has unsupported type " + type)
  , field_name(field)
  , type_name(type) {}

} // namespace jsonq
