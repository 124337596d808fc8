#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace msx::expression {

// Expression compiled by a backend, ready to be evaluated many times
class CompiledExpression {
public:
  virtual ~CompiledExpression() = default;

  [[nodiscard]] virtual auto source() const noexcept -> const std::string& = 0;

  // Symbols the expression reads, in order of first appearance
  [[nodiscard]] virtual auto free_symbols() const noexcept -> const std::vector<std::string>& = 0;

  // Fails when a free symbol has no value in `values`
  [[nodiscard]] virtual auto evaluate(const core::SymbolValues& values) const
      -> std::expected<double, core::ExpressionCompileError> = 0;

  // Partial derivative with respect to one symbol
  [[nodiscard]] virtual auto derivative(std::string_view symbol) const
      -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> = 0;

  [[nodiscard]] virtual auto to_string() const -> std::string = 0;
};

enum class BackendKind { Symbolic, Numeric };

// Turns expression text into CompiledExpression objects
class ExpressionBackend {
public:
  virtual ~ExpressionBackend() = default;

  [[nodiscard]] virtual auto kind() const noexcept -> BackendKind = 0;
  [[nodiscard]] virtual auto supports_derivatives() const noexcept -> bool = 0;

  [[nodiscard]] virtual auto compile(std::string_view expression) const
      -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> = 0;
};

[[nodiscard]] auto backend_name(BackendKind kind) noexcept -> std::string_view;

// Accepts "symbolic" or "numeric", any letter case
[[nodiscard]] auto parse_backend_kind(std::string_view text) -> std::expected<BackendKind, core::ConfigurationError>;

// Factory function. Selecting the numeric backend writes a notice to std::cerr
// since derivatives are unavailable in that mode.
[[nodiscard]] auto create_backend(BackendKind kind) -> std::unique_ptr<ExpressionBackend>;

} // namespace msx::expression
