#include "msx/expression/expression_backend.hpp"
#include "msx/expression/builtin_functions.hpp"
#include "msx/expression/numeric_backend.hpp"
#include "msx/expression/symbolic_backend.hpp"

#include <fmt/format.h>
#include <iostream>

namespace msx::expression {

auto backend_name(BackendKind kind) noexcept -> std::string_view {
  return kind == BackendKind::Symbolic ? "symbolic" : "numeric";
}

auto parse_backend_kind(std::string_view text) -> std::expected<BackendKind, core::ConfigurationError> {
  const std::string name = lower_case(text);
  if (name == "symbolic") {
    return BackendKind::Symbolic;
  }
  if (name == "numeric") {
    return BackendKind::Numeric;
  }
  return std::unexpected(
      core::ConfigurationError(fmt::format("unknown expression backend '{}', expected symbolic or numeric", text)));
}

auto create_backend(BackendKind kind) -> std::unique_ptr<ExpressionBackend> {
  if (kind == BackendKind::Numeric) {
    std::cerr << "Warning: using the numeric expression backend; symbolic manipulation and Jacobians are disabled"
              << std::endl;
    return std::make_unique<NumericBackend>();
  }
  return std::make_unique<SymbolicBackend>();
}

} // namespace msx::expression
