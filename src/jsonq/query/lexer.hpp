#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace jsonq::query {

enum class TokenType {
  Dot,
  OpenBracket,
  CloseBracket,
  QuestionMark,
  And,
  Or,
  Eq,
  Neq,
  Lt,
  Le,
  Gt,
  Ge,
  String,
  Integer,
  End,
};

const char *token_type_name(TokenType type);

// True when `text` can be written as a key without quotes.
bool is_symbol(const std::string & text);

struct Token {
  TokenType type;
  size_t pos;
  std::string text;
  int64_t integer = 0;
};

class Lexer {
public:
  Lexer(const std::string & query)
    : input(query) {}

  Token consume();
  Token peek();

  // Pushes back the token returned by the last consume(). Only one token
  // of push-back is kept.
  void unget(Token token);

  size_t position() const { return pos; }
  const std::string & query() const { return input; }
private:
  size_t pos = 0;
  const std::string & input;
  std::optional<Token> pushed_back;

  void advance();
  Token next_token();

  Token single_character_token(TokenType type);
  Token two_character_token(TokenType type);
  Token one_or_two_character_token(char second, TokenType single_type, TokenType double_type);
  Token two_character_token_only(char second, TokenType type);

  Token string_token();
  Token symbol_token();
  Token integer_token();

  Token build_token(TokenType type, size_t start, size_t end);
};

} // namespace jsonq::query
