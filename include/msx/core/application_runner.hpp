#pragma once
#include "../expression/expression_backend.hpp"
#include "../model/reaction_model.hpp"
#include "application_types.hpp"
#include "environment_manager.hpp"
#include <expected>
#include <memory>
#include <string>

namespace msx::core {

/**
 * @brief Driver of the msx_check tool
 *
 * Loads a model file, compiles every term and reaction with the selected
 * expression backend and prints a summary of the model.
 */
class ApplicationRunner {
public:
  ApplicationRunner();
  ~ApplicationRunner();

  // Main application entry point
  [[nodiscard]] auto run(int argc, char* argv[]) -> ApplicationResult;

  [[nodiscard]] auto parse_command_line(int argc, char* argv[]) const
      -> std::expected<CommandLineArgs, ApplicationError>;

private:
  std::unique_ptr<EnvironmentManager> environment_manager_;

  [[nodiscard]] auto load_model(const std::string& model_file) const
      -> std::expected<std::unique_ptr<model::ReactionModel>, ApplicationError>;

  // Compile terms and reactions, then build the per-location evaluators
  [[nodiscard]] auto check_model(const model::ReactionModel& model, expression::BackendKind kind) const
      -> std::expected<void, ApplicationError>;

  auto display_usage(const std::string& program_name) const -> void;

  auto display_header() const -> void;

  auto display_model_summary(const model::ReactionModel& model) const -> void;

  auto handle_error(const ApplicationError& error) const -> ApplicationResult;
};

} // namespace msx::core
