#pragma once
#include "../core/exceptions.hpp"
#include "../model/reaction_model.hpp"
#include "yaml_parser.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>

namespace msx::io {

class ModelFileManager {
private:
  std::unique_ptr<YamlParser> parser_;
  std::filesystem::path model_file_path_;

  [[nodiscard]] auto
  resolve_model_path(std::string_view model_file) const -> std::expected<std::filesystem::path, core::FileError>;

public:
  explicit ModelFileManager() = default;

  [[nodiscard]] auto load(std::string_view model_file)
      -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError>;

  // Writes to `model_file`, or back to the last loaded file when empty
  [[nodiscard]] auto save(const model::ReactionModel& model, std::string_view model_file = {}) const
      -> std::expected<void, core::FileError>;

  [[nodiscard]] auto model_file_path() const noexcept -> const std::filesystem::path& { return model_file_path_; }
};

} // namespace msx::io
