#include <string>

#include <jsonq/query/lexer.hpp>
#include <jsonq/error.hpp>

#include <jsonq/query/parser.hpp>

namespace jsonq::query {

std::shared_ptr<PathStep> Parser::parse(const std::string & input) {
  Lexer lexer(input);

  std::shared_ptr<PathStep> path = parse_keys(lexer);

  while (true) {
    auto token = lexer.consume();
    if (token.type == TokenType::End) {
      break;
    }
    expect(lexer, token, TokenType::OpenBracket);
    path->filters.emplace_back(parse_logical(lexer));
  }

  return path;
}

std::unique_ptr<PathStep> Parser::parse_keys(Lexer & lexer) {
  auto token = lexer.consume();

  bool optional = false;
  if (token.type == TokenType::QuestionMark) {
    optional = true;
    token = lexer.consume();
  }
  expect(lexer, token, TokenType::String);

  auto step = std::make_unique<PathStep>();
  step->key = token.text;
  step->optional = optional;

  while (true) {
    token = lexer.consume();
    if (token.type != TokenType::Dot) {
      lexer.unget(token);
      break;
    }

    token = lexer.consume();
    expect(lexer, token, TokenType::String);

    auto next = std::make_unique<PathStep>();
    next->left = std::move(step);
    next->key = token.text;
    step = std::move(next);
  }

  return step;
}

// Consumes the closing bracket of the filter.
Filter Parser::parse_logical(Lexer & lexer) {
  auto left = parse_comparative(lexer);

  while (true) {
    auto token = lexer.consume();
    switch (token.type) {
      case TokenType::CloseBracket: {
        return left;
      }
      case TokenType::And: [[fallthrough]];
      case TokenType::Or: {
        auto right = parse_comparative(lexer);
        auto op = token.type == TokenType::And ? LogicalOp::And : LogicalOp::Or;
        left = Filter { filters::Logical {
          op,
          std::make_unique<Filter>(std::move(left)),
          std::make_unique<Filter>(std::move(right)),
        } };
        break;
      }
      default: {
        throw make_unexpected_token_error(lexer, token);
      }
    }
  }
}

static std::optional<CompareOp> comparison_operator(TokenType type) {
  switch (type) {
    case TokenType::Eq: return CompareOp::Eq;
    case TokenType::Neq: return CompareOp::Neq;
    case TokenType::Lt: return CompareOp::Lt;
    case TokenType::Le: return CompareOp::Le;
    case TokenType::Gt: return CompareOp::Gt;
    case TokenType::Ge: return CompareOp::Ge;
    default: return std::nullopt;
  }
}

Filter Parser::parse_comparative(Lexer & lexer) {
  auto left = parse_atom(lexer);

  auto token = lexer.consume();
  auto op = comparison_operator(token.type);
  if (!op.has_value()) {
    lexer.unget(token);
    return Filter { filters::Comparative { CompareOp::Index, left, std::nullopt } };
  }

  auto right = parse_atom(lexer);
  return Filter { filters::Comparative { *op, left, right } };
}

Atom Parser::parse_atom(Lexer & lexer) {
  auto token = lexer.consume();
  switch (token.type) {
    case TokenType::String: {
      return Atom { AtomType::String, token.text };
    }
    case TokenType::Integer: {
      return Atom { AtomType::Integer, token.text, token.integer };
    }
    default: {
      throw make_unexpected_token_error(lexer, token);
    }
  }
}

void Parser::expect(Lexer & lexer, const Token & token, TokenType expected_type) {
  if (token.type != expected_type) {
    throw make_unexpected_token_error(lexer, token);
  }
}

SyntaxError Parser::make_unexpected_token_error(Lexer & lexer, const Token & token) {
  return SyntaxError(lexer.query(), token.pos,
    std::string("unexpected ") + token_type_name(token.type));
}

} // namespace jsonq::query
