#include <cctype>
#include <charconv>
#include <stdexcept>

#include <jsonq/error.hpp>

#include <jsonq/query/lexer.hpp>

namespace jsonq::query {

const char *token_type_name(TokenType type) {
  switch (type) {
    case TokenType::Dot: return "'.'";
    case TokenType::OpenBracket: return "'['";
    case TokenType::CloseBracket: return "']'";
    case TokenType::QuestionMark: return "'?'";
    case TokenType::And: return "'&&'";
    case TokenType::Or: return "'||'";
    case TokenType::Eq: return "'=='";
    case TokenType::Neq: return "'!='";
    case TokenType::Lt: return "'<'";
    case TokenType::Le: return "'<='";
    case TokenType::Gt: return "'>'";
    case TokenType::Ge: return "'>='";
    case TokenType::String: return "string";
    case TokenType::Integer: return "integer";
    case TokenType::End: return "end of query";
  }
  throw std::logic_error("Unknown TokenType");
}

// Bytes of multi-byte UTF-8 sequences are accepted as letters so that
// non-ASCII keys can be written without quotes.
static bool is_symbol_start(char c) {
  auto u = static_cast<unsigned char>(c);
  return u >= 0x80 || std::isalpha(u);
}

static bool is_symbol_part(char c) {
  auto u = static_cast<unsigned char>(c);
  return is_symbol_start(c) || std::isdigit(u) || c == '_';
}

bool is_symbol(const std::string & text) {
  if (text.empty() || !is_symbol_start(text[0])) {
    return false;
  }
  for (size_t i = 1; i < text.length(); i++) {
    if (!is_symbol_part(text[i])) return false;
  }
  return true;
}

Token Lexer::consume() {
  if (pushed_back.has_value()) {
    auto token = pushed_back.value();
    pushed_back.reset();
    return token;
  }

  return next_token();
}

Token Lexer::peek() {
  auto token = consume();
  unget(token);
  return token;
}

void Lexer::unget(Token token) {
  if (pushed_back.has_value()) {
    throw std::logic_error("Lexer supports only one token of push-back");
  }
  pushed_back.emplace(std::move(token));
}

Token Lexer::next_token() {
  while (pos < input.length()) {
    switch (input[pos]) {
      case ' ': [[fallthrough]];
      case '\t': {
        advance();
        break;
      }
      case '.': return single_character_token(TokenType::Dot);
      case '[': return single_character_token(TokenType::OpenBracket);
      case ']': return single_character_token(TokenType::CloseBracket);
      case '?': return single_character_token(TokenType::QuestionMark);
      case '&': return two_character_token_only('&', TokenType::And);
      case '|': return two_character_token_only('|', TokenType::Or);
      case '=': return two_character_token_only('=', TokenType::Eq);
      case '!': return two_character_token_only('=', TokenType::Neq);
      case '<': return one_or_two_character_token('=', TokenType::Lt, TokenType::Le);
      case '>': return one_or_two_character_token('=', TokenType::Gt, TokenType::Ge);
      case '"': return string_token();
      default: {
        if (is_symbol_start(input[pos])) {
          return symbol_token();
        }

        if (std::isdigit(static_cast<unsigned char>(input[pos]))) {
          return integer_token();
        }

        throw SyntaxError(input, pos, std::string("unexpected character '") + input[pos] + "'");
      }
    }
  }

  return Token { TokenType::End, pos, "" };
}

Token Lexer::single_character_token(TokenType type) {
  auto start = pos;
  pos += 1;
  return Token { type, start, input.substr(start, 1) };
}

Token Lexer::two_character_token(TokenType type) {
  auto start = pos;
  pos += 2;
  return Token { type, start, input.substr(start, 2) };
}

Token Lexer::one_or_two_character_token(char second, TokenType single_type, TokenType double_type) {
  if ((pos + 1 < input.length()) && input[pos + 1] == second) {
    return two_character_token(double_type);
  }
  return single_character_token(single_type);
}

Token Lexer::two_character_token_only(char second, TokenType type) {
  if ((pos + 1 < input.length()) && input[pos + 1] == second) {
    return two_character_token(type);
  }
  throw SyntaxError(input, pos, std::string("unexpected character '") + input[pos] + "'");
}

// No escape processing: everything up to the next double quote is taken
// literally, backslashes included.
Token Lexer::string_token() {
  auto start = pos;
  advance();

  auto end = input.find('"', pos);
  if (end == std::string::npos) {
    throw SyntaxError(input, start, "unterminated string");
  }

  auto text = input.substr(pos, end - pos);
  pos = end + 1;
  return Token { TokenType::String, start, text };
}

Token Lexer::symbol_token() {
  size_t start = pos;

  while (pos < input.length() && is_symbol_part(input[pos])) advance();

  return build_token(TokenType::String, start, pos);
}

Token Lexer::integer_token() {
  size_t start = pos;

  while (pos < input.length() && std::isdigit(static_cast<unsigned char>(input[pos]))) advance();

  auto token = build_token(TokenType::Integer, start, pos);

  auto first = input.data() + start;
  auto last = input.data() + pos;
  auto [ptr, ec] = std::from_chars(first, last, token.integer);
  if (ec != std::errc() || ptr != last) {
    throw SyntaxError(input, start, "malformed integer '" + token.text + "'");
  }

  return token;
}

Token Lexer::build_token(TokenType type, size_t start, size_t end) {
  return Token { type, start, input.substr(start, end - start) };
}

void Lexer::advance() {
  pos++;
}

} // namespace jsonq::query
