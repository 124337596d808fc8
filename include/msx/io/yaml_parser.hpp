#pragma once
#include "../core/enum_resolver.hpp"
#include "../core/exceptions.hpp"
#include "../model/reaction_model.hpp"
#include <expected>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

namespace msx::io {

/**
 * @brief Builds reaction models from YAML documents
 *
 * The document layout is the one produced by io::to_yaml: metadata, an
 * `options` block, one mapping per variable group keyed by name, one mapping
 * per reaction location keyed by species, and `network_data`.
 */
class YamlParser {
private:
  YAML::Node root_;
  std::string file_path_;

  template <typename T>
  [[nodiscard]] auto extract_value(const YAML::Node& node, std::string_view key) const
      -> std::expected<T, core::ConfigurationError>;

  template <typename T>
  [[nodiscard]] auto extract_optional(const YAML::Node& node, std::string_view key) const
      -> std::expected<std::optional<T>, core::ConfigurationError>;

  template <core::ResolvableEnum E>
  [[nodiscard]] auto extract_enum(const YAML::Node& node, std::string_view key, E default_value) const
      -> std::expected<E, core::ConfigurationError>;

  [[nodiscard]] auto parse_metadata(const YAML::Node& node, model::ReactionModel& model) const
      -> std::expected<void, core::ConfigurationError>;
  [[nodiscard]] auto parse_report(const YAML::Node& node) const
      -> std::expected<model::ReportOptions, core::ConfigurationError>;
  [[nodiscard]] auto parse_species(const YAML::Node& node, model::ReactionModel& model) const
      -> std::expected<void, core::ConfigurationError>;
  [[nodiscard]] auto parse_coefficients(const YAML::Node& node, model::VariableType type,
                                        model::ReactionModel& model) const
      -> std::expected<void, core::ConfigurationError>;
  [[nodiscard]] auto parse_terms(const YAML::Node& node, model::ReactionModel& model) const
      -> std::expected<void, core::ConfigurationError>;
  [[nodiscard]] auto parse_reactions(const YAML::Node& node, model::LocationType location,
                                     model::ReactionModel& model) const
      -> std::expected<void, core::ConfigurationError>;
  [[nodiscard]] auto parse_network_data(const YAML::Node& node, model::ReactionModel& model) const
      -> std::expected<void, core::ConfigurationError>;

public:
  YamlParser() = default;
  explicit YamlParser(std::string file_path) : file_path_(std::move(file_path)) {}

  [[nodiscard]] auto load() -> std::expected<void, core::FileError>;

  // Parses the loaded document
  [[nodiscard]] auto parse() const -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError>;

  [[nodiscard]] auto parse_model(const YAML::Node& node) const
      -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError>;

  // Missing keys keep their default value
  [[nodiscard]] auto parse_options(const YAML::Node& node) const
      -> std::expected<model::Options, core::ConfigurationError>;

  [[nodiscard]] static auto parse_note(const YAML::Node& node) -> std::expected<model::Note, core::ConfigurationError>;
};

// Lenient enum resolution for a YAML value: integers by value, strings by name
template <core::ResolvableEnum E>
[[nodiscard]] auto resolve_enum_node(const YAML::Node& node) -> E {
  if (!node.IsScalar()) {
    throw core::InvalidTypeError(fmt::format("{} must be given as a string or an integer", core::EnumTraits<E>::type_name));
  }
  int as_int = 0;
  if (YAML::convert<int>::decode(node, as_int)) {
    return core::get_enum<E>(as_int);
  }
  return core::get_enum<E>(node.Scalar());
}

// from_dict: rebuilds a model from the structure written by io::to_yaml
[[nodiscard]] auto from_yaml(const YAML::Node& node)
    -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError>;

// Implementation of template methods
template <typename T>
auto YamlParser::extract_value(const YAML::Node& node, std::string_view key) const
    -> std::expected<T, core::ConfigurationError> {
  try {
    if (!node[std::string(key)]) {
      return std::unexpected(core::ConfigurationError(fmt::format("Required field '{}' is missing", key)));
    }
    return node[std::string(key)].template as<T>();
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(fmt::format("Failed to parse field '{}': {}", key, e.what())));
  }
}

template <typename T>
auto YamlParser::extract_optional(const YAML::Node& node, std::string_view key) const
    -> std::expected<std::optional<T>, core::ConfigurationError> {
  const YAML::Node value = node[std::string(key)];
  if (!value || value.IsNull()) {
    return std::optional<T>{};
  }
  auto result = extract_value<T>(node, key);
  if (!result) {
    return std::unexpected(result.error());
  }
  return std::optional<T>(std::move(result.value()));
}

template <core::ResolvableEnum E>
auto YamlParser::extract_enum(const YAML::Node& node, std::string_view key, E default_value) const
    -> std::expected<E, core::ConfigurationError> {
  const YAML::Node value = node[std::string(key)];
  if (!value || value.IsNull()) {
    return default_value;
  }
  try {
    return resolve_enum_node<E>(value);
  } catch (const core::InvalidArgumentError& e) {
    return std::unexpected(core::ValidationError(key, e.message()));
  }
}

} // namespace msx::io
