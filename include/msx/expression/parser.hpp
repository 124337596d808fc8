#pragma once
#include "../core/exceptions.hpp"
#include "ast.hpp"
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace msx::expression {

enum class TokenKind { Number, Identifier, Plus, Minus, Star, Slash, Caret, LeftParen, RightParen, Comma, End };

struct Token {
  TokenKind kind;
  std::string text;
  double value = 0.0;
  std::size_t column = 0; // 1-based
};

[[nodiscard]] auto tokenize(std::string_view expression) -> std::expected<std::vector<Token>, core::ExpressionCompileError>;

/**
 * @brief Parse an infix expression into a tree
 *
 * Identifiers followed by '(' must be built-in functions; any other
 * identifier becomes a free symbol. Both '^' and '**' denote
 * exponentiation. Two operands written side by side are rejected rather
 * than multiplied. Errors report the 1-based column of the offending token.
 */
[[nodiscard]] auto parse(std::string_view expression) -> std::expected<NodePtr, core::ExpressionCompileError>;

} // namespace msx::expression
