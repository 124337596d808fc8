#include "msx/core/environment_manager.hpp"
#include "msx/core/constants.hpp"
#include <cstdlib>
#include <iostream>

namespace msx::core {

auto EnvironmentManager::configure_environment() -> std::expected<void, ApplicationError> {
  return configure_expression_backend();
}

auto EnvironmentManager::configure_expression_backend() -> std::expected<void, ApplicationError> {
  const char* requested = std::getenv(constants::expression::backend_environment_variable);
  if (requested == nullptr || *requested == '\0') {
    backend_kind_ = expression::BackendKind::Symbolic;
    return {};
  }

  auto kind = expression::parse_backend_kind(requested);
  if (!kind) {
    return std::unexpected(ApplicationError{
        std::string(constants::expression::backend_environment_variable) + ": " + kind.error().message(),
        constants::application::exit_usage});
  }

  backend_kind_ = kind.value();
  std::cout << "Expression backend from environment: " << expression::backend_name(backend_kind_) << std::endl;
  return {};
}

} // namespace msx::core
