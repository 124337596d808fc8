#pragma once
#include "ast.hpp"
#include "expression_backend.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace msx::expression {

/**
 * @brief Expression flattened into a postfix program
 *
 * Evaluation runs the program on a small value stack. There is no tree left
 * to manipulate, so derivatives are not available.
 */
class NumericExpression final : public CompiledExpression {
public:
  enum class OpCode { PushConstant, PushSymbol, Negate, Add, Subtract, Multiply, Divide, Power, Call };

  struct Instruction {
    OpCode op;
    double constant = 0.0;
    std::size_t symbol = 0;               // index into free_symbols()
    UnaryFunction function = nullptr;
  };

private:
  std::string source_;
  std::vector<std::string> symbols_;
  std::vector<Instruction> program_;
  std::size_t max_depth_ = 0;

  void emit(const NodePtr& node, std::size_t depth);

public:
  NumericExpression(std::string source, const NodePtr& root);

  [[nodiscard]] auto program() const noexcept -> const std::vector<Instruction>& { return program_; }

  [[nodiscard]] auto source() const noexcept -> const std::string& override { return source_; }
  [[nodiscard]] auto free_symbols() const noexcept -> const std::vector<std::string>& override { return symbols_; }

  [[nodiscard]] auto evaluate(const core::SymbolValues& values) const
      -> std::expected<double, core::ExpressionCompileError> override;

  // Always fails
  [[nodiscard]] auto derivative(std::string_view symbol) const
      -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> override;

  [[nodiscard]] auto to_string() const -> std::string override { return source_; }
};

class NumericBackend final : public ExpressionBackend {
public:
  [[nodiscard]] auto kind() const noexcept -> BackendKind override { return BackendKind::Numeric; }
  [[nodiscard]] auto supports_derivatives() const noexcept -> bool override { return false; }

  [[nodiscard]] auto compile(std::string_view expression) const
      -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> override;
};

} // namespace msx::expression
