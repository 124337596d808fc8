#pragma once
#include "../expression/expression_backend.hpp"
#include "application_types.hpp"
#include <expected>

namespace msx::core {

class EnvironmentManager {
public:
  // Read the environment once at startup
  [[nodiscard]] auto configure_environment() -> std::expected<void, ApplicationError>;

  // Backend requested through MSX_EXPRESSION_BACKEND, symbolic when unset
  [[nodiscard]] auto backend_kind() const noexcept -> expression::BackendKind { return backend_kind_; }

private:
  expression::BackendKind backend_kind_ = expression::BackendKind::Symbolic;

  [[nodiscard]] auto configure_expression_backend() -> std::expected<void, ApplicationError>;
};

} // namespace msx::core
