#include "msx/expression/parser.hpp"
#include "msx/core/expected_utils.hpp"

#include <cctype>
#include <charconv>
#include <fmt/format.h>

namespace msx::expression {

namespace {

auto is_identifier_start(char c) -> bool { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }
auto is_identifier_char(char c) -> bool { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }
auto is_digit(char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

auto describe(const Token& token) -> std::string {
  if (token.kind == TokenKind::End) {
    return "end of expression";
  }
  return fmt::format("'{}' at column {}", token.text, token.column);
}

class Parser {
private:
  std::string_view source_;
  std::vector<Token> tokens_;
  std::size_t position_ = 0;

  [[nodiscard]] auto current() const -> const Token& { return tokens_[position_]; }
  auto advance() -> const Token& { return tokens_[position_++]; }

  [[nodiscard]] auto error(std::string message) const -> std::unexpected<core::ExpressionCompileError> {
    return std::unexpected(core::ExpressionCompileError(message, std::string(source_)));
  }

  [[nodiscard]] static auto starts_operand(const Token& token) -> bool {
    return token.kind == TokenKind::Number || token.kind == TokenKind::Identifier ||
           token.kind == TokenKind::LeftParen;
  }

  // Diagnoses whatever follows a complete operand where `expected` was needed
  [[nodiscard]] auto unexpected_after_operand(std::string_view expected) const
      -> std::unexpected<core::ExpressionCompileError> {
    const Token& token = current();
    if (starts_operand(token)) {
      return error(fmt::format("implicit multiplication is not allowed before {}", describe(token)));
    }
    if (token.kind == TokenKind::RightParen) {
      return error(fmt::format("unbalanced ')' at column {}", token.column));
    }
    return error(fmt::format("expected {} but found {}", expected, describe(token)));
  }

  auto parse_sum() -> std::expected<NodePtr, core::ExpressionCompileError> {
    NodePtr left;
    MSX_TRY_ASSIGN(left, parse_product());
    while (current().kind == TokenKind::Plus || current().kind == TokenKind::Minus) {
      const NodeKind kind = advance().kind == TokenKind::Plus ? NodeKind::Add : NodeKind::Subtract;
      NodePtr right;
      MSX_TRY_ASSIGN(right, parse_product());
      left = make_binary(kind, std::move(left), std::move(right));
    }
    return left;
  }

  auto parse_product() -> std::expected<NodePtr, core::ExpressionCompileError> {
    NodePtr left;
    MSX_TRY_ASSIGN(left, parse_unary());
    while (current().kind == TokenKind::Star || current().kind == TokenKind::Slash) {
      const NodeKind kind = advance().kind == TokenKind::Star ? NodeKind::Multiply : NodeKind::Divide;
      NodePtr right;
      MSX_TRY_ASSIGN(right, parse_unary());
      left = make_binary(kind, std::move(left), std::move(right));
    }
    return left;
  }

  auto parse_unary() -> std::expected<NodePtr, core::ExpressionCompileError> {
    if (current().kind == TokenKind::Minus) {
      advance();
      NodePtr operand;
      MSX_TRY_ASSIGN(operand, parse_unary());
      return make_unary(NodeKind::Negate, std::move(operand));
    }
    if (current().kind == TokenKind::Plus) {
      advance();
      return parse_unary();
    }
    return parse_power();
  }

  // Right associative: the exponent may itself be signed or a power
  auto parse_power() -> std::expected<NodePtr, core::ExpressionCompileError> {
    NodePtr base;
    MSX_TRY_ASSIGN(base, parse_primary());
    if (current().kind != TokenKind::Caret) {
      return base;
    }
    advance();
    NodePtr exponent;
    MSX_TRY_ASSIGN(exponent, parse_unary());
    return make_binary(NodeKind::Power, std::move(base), std::move(exponent));
  }

  auto parse_primary() -> std::expected<NodePtr, core::ExpressionCompileError> {
    const Token& token = current();
    switch (token.kind) {
    case TokenKind::Number:
      advance();
      return make_number(token.value);

    case TokenKind::Identifier:
      return parse_identifier();

    case TokenKind::LeftParen: {
      const std::size_t column = advance().column;
      NodePtr inner;
      MSX_TRY_ASSIGN(inner, parse_sum());
      if (current().kind == TokenKind::End) {
        return error(fmt::format("missing ')' for '(' at column {}", column));
      }
      if (current().kind != TokenKind::RightParen) {
        return unexpected_after_operand("')'");
      }
      advance();
      return inner;
    }

    case TokenKind::End:
      return error("unexpected end of expression");

    default:
      return error(fmt::format("unexpected {}", describe(token)));
    }
  }

  auto parse_identifier() -> std::expected<NodePtr, core::ExpressionCompileError> {
    const Token token = advance();
    const BuiltinFunction* function = find_function(token.text);

    if (current().kind != TokenKind::LeftParen) {
      if (function != nullptr) {
        return error(fmt::format("function '{}' at column {} must be called with an argument", token.text,
                                 token.column));
      }
      return make_symbol(token.text);
    }

    if (function == nullptr) {
      return error(fmt::format("'{}' at column {} is not a function; implicit multiplication is not allowed",
                               token.text, token.column));
    }

    const std::size_t open_column = advance().column;
    NodePtr argument;
    MSX_TRY_ASSIGN(argument, parse_sum());
    if (current().kind == TokenKind::Comma) {
      return error(fmt::format("function '{}' takes exactly one argument", token.text));
    }
    if (current().kind == TokenKind::End) {
      return error(fmt::format("missing ')' for '(' at column {}", open_column));
    }
    if (current().kind != TokenKind::RightParen) {
      return unexpected_after_operand("')'");
    }
    advance();
    return make_call(*function, token.text, std::move(argument));
  }

public:
  Parser(std::string_view source, std::vector<Token> tokens) : source_(source), tokens_(std::move(tokens)) {}

  auto parse() -> std::expected<NodePtr, core::ExpressionCompileError> {
    if (current().kind == TokenKind::End) {
      return error("empty expression");
    }
    NodePtr root;
    MSX_TRY_ASSIGN(root, parse_sum());
    if (current().kind != TokenKind::End) {
      return unexpected_after_operand("an operator");
    }
    return root;
  }
};

} // namespace

auto tokenize(std::string_view expression) -> std::expected<std::vector<Token>, core::ExpressionCompileError> {
  std::vector<Token> tokens;
  std::size_t i = 0;
  const std::size_t n = expression.size();

  auto single = [&](TokenKind kind) {
    tokens.push_back(Token{kind, std::string(1, expression[i]), 0.0, i + 1});
    ++i;
  };

  while (i < n) {
    const char c = expression[i];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++i;
      continue;
    }

    const std::size_t start = i;

    if (is_digit(c) || (c == '.' && i + 1 < n && is_digit(expression[i + 1]))) {
      while (i < n && is_digit(expression[i])) {
        ++i;
      }
      if (i < n && expression[i] == '.') {
        ++i;
        while (i < n && is_digit(expression[i])) {
          ++i;
        }
      }
      if (i < n && (expression[i] == 'e' || expression[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < n && (expression[j] == '+' || expression[j] == '-')) {
          ++j;
        }
        if (j < n && is_digit(expression[j])) {
          i = j;
          while (i < n && is_digit(expression[i])) {
            ++i;
          }
        }
      }

      const std::string_view text = expression.substr(start, i - start);
      double value = 0.0;
      const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
      if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::unexpected(core::ExpressionCompileError(
            fmt::format("invalid number '{}' at column {}", text, start + 1), std::string(expression)));
      }
      tokens.push_back(Token{TokenKind::Number, std::string(text), value, start + 1});
      continue;
    }

    if (is_identifier_start(c)) {
      while (i < n && is_identifier_char(expression[i])) {
        ++i;
      }
      tokens.push_back(Token{TokenKind::Identifier, std::string(expression.substr(start, i - start)), 0.0, start + 1});
      continue;
    }

    switch (c) {
    case '+':
      single(TokenKind::Plus);
      break;
    case '-':
      single(TokenKind::Minus);
      break;
    case '*':
      if (i + 1 < n && expression[i + 1] == '*') {
        tokens.push_back(Token{TokenKind::Caret, "**", 0.0, start + 1});
        i += 2;
      } else {
        single(TokenKind::Star);
      }
      break;
    case '/':
      single(TokenKind::Slash);
      break;
    case '^':
      single(TokenKind::Caret);
      break;
    case '(':
      single(TokenKind::LeftParen);
      break;
    case ')':
      single(TokenKind::RightParen);
      break;
    case ',':
      single(TokenKind::Comma);
      break;
    default:
      return std::unexpected(core::ExpressionCompileError(
          fmt::format("unexpected character '{}' at column {}", c, start + 1), std::string(expression)));
    }
  }

  tokens.push_back(Token{TokenKind::End, {}, 0.0, n + 1});
  return tokens;
}

auto parse(std::string_view expression) -> std::expected<NodePtr, core::ExpressionCompileError> {
  std::vector<Token> tokens;
  MSX_TRY_ASSIGN(tokens, tokenize(expression));
  Parser parser(expression, std::move(tokens));
  return parser.parse();
}

} // namespace msx::expression
