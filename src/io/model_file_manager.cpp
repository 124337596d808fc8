#include "msx/io/model_file_manager.hpp"
#include "msx/io/yaml_writer.hpp"

#include <fmt/format.h>

namespace msx::io {

auto ModelFileManager::resolve_model_path(std::string_view model_file) const
    -> std::expected<std::filesystem::path, core::FileError> {
  std::filesystem::path path_candidate(model_file);

  if (!std::filesystem::exists(path_candidate)) {
    return std::unexpected(core::FileError{"could not locate model file", std::string(model_file)});
  }
  return std::filesystem::absolute(path_candidate);
}

auto ModelFileManager::load(std::string_view model_file)
    -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError> {

  auto path_result = resolve_model_path(model_file);
  if (!path_result) {
    return std::unexpected(
        core::ConfigurationError(fmt::format("Failed to resolve model path: {}", path_result.error().message())));
  }

  model_file_path_ = path_result.value();

  parser_ = std::make_unique<YamlParser>(model_file_path_.string());

  auto load_result = parser_->load();
  if (!load_result) {
    return std::unexpected(
        core::ConfigurationError(fmt::format("Failed to load YAML file: {}", load_result.error().message())));
  }

  return parser_->parse();
}

auto ModelFileManager::save(const model::ReactionModel& model, std::string_view model_file) const
    -> std::expected<void, core::FileError> {
  if (model_file.empty() && model_file_path_.empty()) {
    return std::unexpected(core::FileError{"no model file to write to", ""});
  }
  const std::filesystem::path target = model_file.empty() ? model_file_path_ : std::filesystem::path(model_file);
  return write_model(model, target);
}

} // namespace msx::io
