#pragma once
#include "ast.hpp"
#include "expression_backend.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace msx::expression {

// Operations on expression trees
namespace symbolic {

[[nodiscard]] auto evaluate(const NodePtr& node, const core::SymbolValues& values)
    -> std::expected<double, core::ExpressionCompileError>;

[[nodiscard]] auto collect_symbols(const NodePtr& node) -> std::vector<std::string>;

// Replaces every occurrence of the named symbols by the given subtrees
[[nodiscard]] auto substitute(const NodePtr& node, const std::unordered_map<std::string, NodePtr>& replacements)
    -> NodePtr;

// Constant folding plus the identities x+0, x*1, x*0, x^1, x^0 and -(-x)
[[nodiscard]] auto simplify(const NodePtr& node) -> NodePtr;

[[nodiscard]] auto differentiate(const NodePtr& node, std::string_view symbol) -> NodePtr;

// Infix text that parses back to the same tree
[[nodiscard]] auto to_string(const NodePtr& node) -> std::string;

} // namespace symbolic

class SymbolicExpression final : public CompiledExpression {
private:
  std::string source_;
  NodePtr root_;
  std::vector<std::string> symbols_;

public:
  SymbolicExpression(std::string source, NodePtr root);

  [[nodiscard]] auto root() const noexcept -> const NodePtr& { return root_; }

  [[nodiscard]] auto source() const noexcept -> const std::string& override { return source_; }
  [[nodiscard]] auto free_symbols() const noexcept -> const std::vector<std::string>& override { return symbols_; }

  [[nodiscard]] auto evaluate(const core::SymbolValues& values) const
      -> std::expected<double, core::ExpressionCompileError> override;

  [[nodiscard]] auto derivative(std::string_view symbol) const
      -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> override;

  [[nodiscard]] auto to_string() const -> std::string override { return symbolic::to_string(root_); }

  [[nodiscard]] auto substitute(const std::unordered_map<std::string, NodePtr>& replacements) const
      -> SymbolicExpression;
  [[nodiscard]] auto simplified() const -> SymbolicExpression;
};

class SymbolicBackend final : public ExpressionBackend {
public:
  [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Symbolic; }
  [[nodiscard]] auto supports_derivatives() const noexcept -> bool override { return true; }

  [[nodiscard]] auto compile(std::string_view expression) const
      -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> override;
};

} // namespace msx::expression
