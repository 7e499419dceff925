#pragma once

#include <memory>
#include <string>

#include <jsonq/query/lexer.hpp>
#include <jsonq/query/ast.hpp>
#include <jsonq/error.hpp>

namespace jsonq::query {

class Parser {
public:
  // Parses `['?'] key ('.' key)* filter*` and returns the last step of the
  // chain. Throws SyntaxError on malformed input.
  std::shared_ptr<PathStep> parse(const std::string & query);
private:
  std::unique_ptr<PathStep> parse_keys(Lexer & lexer);
  Filter parse_logical(Lexer & lexer);
  Filter parse_comparative(Lexer & lexer);
  Atom parse_atom(Lexer & lexer);

  void expect(Lexer & lexer, const Token & token, TokenType expected_type);

  SyntaxError make_unexpected_token_error(Lexer & lexer, const Token & token);
};

} // namespace jsonq::query
