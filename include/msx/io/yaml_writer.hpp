#pragma once
#include "../core/exceptions.hpp"
#include "../model/reaction_model.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace msx::io {

// Plain-data form of model objects. Enum values are written as lower case names.

[[nodiscard]] auto to_yaml(const model::Note& note) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::Species& species) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::Constant& constant) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::Parameter& parameter) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::OtherTerm& term) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::InternalVariable& variable) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::Variable& variable) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::Reaction& reaction) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::ReportOptions& report) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::Options& options) -> YAML::Node;
[[nodiscard]] auto to_yaml(const model::NetworkData& data) -> YAML::Node;

/**
 * @brief to_dict: the whole model as one mapping
 *
 * Keys: name, title, description, references, options, species, constants,
 * parameters, terms, pipe_reactions, tank_reactions, network_data. Reserved
 * names are not written. io::from_yaml reads the result back into an equal
 * model.
 */
[[nodiscard]] auto to_yaml(const model::ReactionModel& model) -> YAML::Node;

[[nodiscard]] auto emit_model(const model::ReactionModel& model) -> std::string;

[[nodiscard]] auto write_model(const model::ReactionModel& model, const std::filesystem::path& path)
    -> std::expected<void, core::FileError>;

} // namespace msx::io
