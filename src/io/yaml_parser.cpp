#include "msx/io/yaml_parser.hpp"
#include "msx/core/expected_utils.hpp"

#include <cmath>
#include <map>

namespace msx::io {

namespace {

// Name of a group entry: the mapping key, which must agree with an explicit `name`
auto entry_name(const YAML::const_iterator::value_type& item, std::string_view group)
    -> std::expected<std::string, core::ConfigurationError> {
  const auto key = item.first.as<std::string>();
  if (const auto explicit_name = item.second["name"]; explicit_name && explicit_name.as<std::string>() != key) {
    return std::unexpected(core::ValidationError(
        group, fmt::format("entry '{}' declares the name '{}'", key, explicit_name.as<std::string>())));
  }
  if (!item.second.IsMap()) {
    return std::unexpected(core::ValidationError(group, fmt::format("entry '{}' must be a mapping", key)));
  }
  return key;
}

auto require_map(const YAML::Node& node, std::string_view field) -> std::expected<void, core::ConfigurationError> {
  if (!node.IsMap()) {
    return std::unexpected(core::ValidationError(field, "must be a mapping"));
  }
  return {};
}

} // namespace

auto YamlParser::load() -> std::expected<void, core::FileError> {
  try {
    root_ = YAML::LoadFile(file_path_);
    return {};
  } catch (const YAML::BadFile&) {
    return std::unexpected(core::FileError{"Failed to open YAML file", file_path_});
  } catch (const YAML::ParserException& e) {
    return std::unexpected(core::FileError{fmt::format("YAML parsing error: {}", e.what()), file_path_});
  } catch (const std::exception& e) {
    return std::unexpected(
        core::FileError{fmt::format("Unexpected error during YAML load: {}", e.what()), file_path_});
  }
}

auto YamlParser::parse() const -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError> {
  if (!root_ || root_.IsNull()) {
    return std::unexpected(core::ConfigurationError("No YAML content loaded. Call load() first."));
  }
  return parse_model(root_);
}

auto YamlParser::parse_model(const YAML::Node& node) const
    -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError> {
  try {
    if (!node.IsMap()) {
      return std::unexpected(core::ConfigurationError("A model document must be a mapping"));
    }

    auto model = std::make_unique<model::ReactionModel>();

    MSX_TRY_VOID(parse_metadata(node, *model));

    if (node["options"]) {
      model::Options options;
      MSX_TRY_ASSIGN(options, parse_options(node["options"]));
      model->options() = std::move(options);
    }

    // Species first: reactions and network data refer to them
    if (node["species"]) {
      MSX_TRY_VOID(parse_species(node["species"], *model));
    }
    if (node["constants"]) {
      MSX_TRY_VOID(parse_coefficients(node["constants"], model::VariableType::Constant, *model));
    }
    if (node["parameters"]) {
      MSX_TRY_VOID(parse_coefficients(node["parameters"], model::VariableType::Parameter, *model));
    }
    if (node["terms"]) {
      MSX_TRY_VOID(parse_terms(node["terms"], *model));
    }
    if (node["pipe_reactions"]) {
      MSX_TRY_VOID(parse_reactions(node["pipe_reactions"], model::LocationType::Pipe, *model));
    }
    if (node["tank_reactions"]) {
      MSX_TRY_VOID(parse_reactions(node["tank_reactions"], model::LocationType::Tank, *model));
    }
    if (node["network_data"]) {
      MSX_TRY_VOID(parse_network_data(node["network_data"], *model));
    }

    return model;

  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ConfigurationError(fmt::format("YAML error in model document: {}", e.what())));
  } catch (const core::MsxException& e) {
    return std::unexpected(core::ConfigurationError(fmt::format("Invalid model definition: {}", e.message())));
  }
}

auto YamlParser::parse_note(const YAML::Node& node) -> std::expected<model::Note, core::ConfigurationError> {
  if (!node || node.IsNull()) {
    return model::Note{};
  }
  if (node.IsScalar()) {
    return model::Note(node.Scalar());
  }
  if (!node.IsMap()) {
    return std::unexpected(core::ValidationError("note", "must be a string or a mapping with 'pre' and 'post'"));
  }

  model::Note note;
  try {
    if (const auto pre = node["pre"]; pre) {
      if (pre.IsScalar()) {
        note.pre.push_back(pre.as<std::string>());
      } else {
        note.pre = pre.as<std::vector<std::string>>();
      }
    }
    if (const auto post = node["post"]; post && !post.IsNull()) {
      note.post = post.as<std::string>();
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ValidationError("note", e.what()));
  }
  return note;
}

auto YamlParser::parse_metadata(const YAML::Node& node, model::ReactionModel& model) const
    -> std::expected<void, core::ConfigurationError> {
  std::optional<std::string> text;

  MSX_TRY_ASSIGN(text, extract_optional<std::string>(node, "name"));
  model.set_name(text.value_or(""));
  MSX_TRY_ASSIGN(text, extract_optional<std::string>(node, "title"));
  model.set_title(text.value_or(""));
  MSX_TRY_ASSIGN(text, extract_optional<std::string>(node, "description"));
  model.set_description(text.value_or(""));

  if (const auto references = node["references"]; references && !references.IsNull()) {
    if (!references.IsSequence()) {
      return std::unexpected(core::ValidationError("references", "must be a list"));
    }
    model.references() = references.as<std::vector<std::string>>();
  }
  return {};
}

auto YamlParser::parse_options(const YAML::Node& node) const -> std::expected<model::Options, core::ConfigurationError> {
  model::Options options;
  if (!node || node.IsNull()) {
    return options;
  }
  MSX_TRY_VOID(require_map(node, "options"));

  try {
    std::optional<double> number;

    MSX_TRY_ASSIGN(number, extract_optional<double>(node, "timestep"));
    if (number) {
      options.set_timestep(static_cast<long long>(std::trunc(*number)));
    }

    auto area_units = options.area_units();
    auto rate_units = options.rate_units();
    auto solver = options.solver();
    auto coupling = options.coupling();
    auto compiler = options.compiler();
    MSX_TRY_ASSIGN(area_units, extract_enum(node, "area_units", area_units));
    MSX_TRY_ASSIGN(rate_units, extract_enum(node, "rate_units", rate_units));
    MSX_TRY_ASSIGN(solver, extract_enum(node, "solver", solver));
    MSX_TRY_ASSIGN(coupling, extract_enum(node, "coupling", coupling));
    MSX_TRY_ASSIGN(compiler, extract_enum(node, "compiler", compiler));
    options.set_area_units(area_units);
    options.set_rate_units(rate_units);
    options.set_solver(solver);
    options.set_coupling(coupling);
    options.set_compiler(compiler);

    MSX_TRY_ASSIGN(number, extract_optional<double>(node, "atol"));
    if (number) {
      options.set_atol(*number);
    }
    MSX_TRY_ASSIGN(number, extract_optional<double>(node, "rtol"));
    if (number) {
      options.set_rtol(*number);
    }

    std::optional<long long> integer;
    MSX_TRY_ASSIGN(integer, extract_optional<long long>(node, "segments"));
    if (integer) {
      options.set_segments(*integer);
    }
    MSX_TRY_ASSIGN(integer, extract_optional<long long>(node, "peclet"));
    if (integer) {
      options.set_peclet(*integer);
    }
  } catch (const core::InvalidArgumentError& e) {
    return std::unexpected(core::ValidationError("options", e.message()));
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ValidationError("options", e.what()));
  }

  if (const auto report = node["report"]; report && !report.IsNull()) {
    MSX_TRY_ASSIGN(options.report(), parse_report(report));
  }
  return options;
}

auto YamlParser::parse_report(const YAML::Node& node) const
    -> std::expected<model::ReportOptions, core::ConfigurationError> {
  MSX_TRY_VOID(require_map(node, "report"));
  model::ReportOptions report;

  try {
    MSX_TRY_ASSIGN(report.pagesize, extract_optional<int>(node, "pagesize"));
    MSX_TRY_ASSIGN(report.report_filename, extract_optional<std::string>(node, "report_filename"));

    if (const auto species = node["species"]; species && !species.IsNull()) {
      report.species = species.as<std::map<std::string, bool>>();
    }
    if (const auto precision = node["species_precision"]; precision && !precision.IsNull()) {
      report.species_precision = precision.as<std::map<std::string, int>>();
    }

    auto selection = [](const YAML::Node& value, std::string_view field)
        -> std::expected<model::ElementSelection, core::ConfigurationError> {
      if (!value || value.IsNull()) {
        return model::ElementSelection{};
      }
      if (value.IsScalar()) {
        if (core::normalize_enum_name(value.as<std::string>()) == "ALL") {
          return model::ElementSelection::everything();
        }
        return std::unexpected(core::ValidationError(field, "must be 'all' or a list of names"));
      }
      return model::ElementSelection{false, value.as<std::vector<std::string>>()};
    };

    MSX_TRY_ASSIGN(report.nodes, selection(node["nodes"], "nodes"));
    MSX_TRY_ASSIGN(report.links, selection(node["links"], "links"));
  } catch (const YAML::Exception& e) {
    return std::unexpected(core::ValidationError("report", e.what()));
  }
  return report;
}

auto YamlParser::parse_species(const YAML::Node& node, model::ReactionModel& model) const
    -> std::expected<void, core::ConfigurationError> {
  MSX_TRY_VOID(require_map(node, "species"));

  for (const auto& item : node) {
    std::string name;
    MSX_TRY_ASSIGN(name, entry_name(item, "species"));
    const YAML::Node& entry = item.second;

    if (!entry["species_type"]) {
      return std::unexpected(core::ValidationError("species", fmt::format("'{}' has no species_type", name)));
    }
    auto species_type = model::SpeciesType::Bulk;
    MSX_TRY_ASSIGN(species_type, extract_enum(entry, "species_type", species_type));

    std::optional<std::string> units;
    std::optional<double> atol;
    std::optional<double> rtol;
    std::optional<double> diffusivity;
    model::Note note;
    MSX_TRY_ASSIGN(units, extract_optional<std::string>(entry, "units"));
    MSX_TRY_ASSIGN(atol, extract_optional<double>(entry, "atol"));
    MSX_TRY_ASSIGN(rtol, extract_optional<double>(entry, "rtol"));
    MSX_TRY_ASSIGN(diffusivity, extract_optional<double>(entry, "diffusivity"));
    MSX_TRY_ASSIGN(note, parse_note(entry["note"]));

    model.add_species(name, species_type, units.value_or(""), atol, rtol, std::move(note), diffusivity);
  }
  return {};
}

auto YamlParser::parse_coefficients(const YAML::Node& node, model::VariableType type,
                                    model::ReactionModel& model) const
    -> std::expected<void, core::ConfigurationError> {
  const std::string group = type == model::VariableType::Constant ? "constants" : "parameters";
  MSX_TRY_VOID(require_map(node, group));

  for (const auto& item : node) {
    std::string name;
    MSX_TRY_ASSIGN(name, entry_name(item, group));
    const YAML::Node& entry = item.second;

    double global_value = 0.0;
    std::optional<std::string> units;
    model::Note note;
    MSX_TRY_ASSIGN(global_value, extract_value<double>(entry, "global_value"));
    MSX_TRY_ASSIGN(units, extract_optional<std::string>(entry, "units"));
    MSX_TRY_ASSIGN(note, parse_note(entry["note"]));

    core::SiteValues pipe_values;
    core::SiteValues tank_values;
    if (const auto pipes = entry["pipe_values"]; pipes && !pipes.IsNull()) {
      pipe_values = pipes.as<core::SiteValues>();
    }
    if (const auto tanks = entry["tank_values"]; tanks && !tanks.IsNull()) {
      tank_values = tanks.as<core::SiteValues>();
    }

    model.add_coefficient(type, name, global_value, units.value_or(""), std::move(pipe_values),
                          std::move(tank_values), std::move(note));
  }
  return {};
}

auto YamlParser::parse_terms(const YAML::Node& node, model::ReactionModel& model) const
    -> std::expected<void, core::ConfigurationError> {
  MSX_TRY_VOID(require_map(node, "terms"));

  for (const auto& item : node) {
    std::string name;
    std::string expression;
    model::Note note;
    MSX_TRY_ASSIGN(name, entry_name(item, "terms"));
    MSX_TRY_ASSIGN(expression, extract_value<std::string>(item.second, "expression"));
    MSX_TRY_ASSIGN(note, parse_note(item.second["note"]));
    model.add_other_term(name, std::move(expression), std::move(note));
  }
  return {};
}

auto YamlParser::parse_reactions(const YAML::Node& node, model::LocationType location,
                                 model::ReactionModel& model) const
    -> std::expected<void, core::ConfigurationError> {
  const std::string group = fmt::format("{}_reactions", core::enum_key(location));
  MSX_TRY_VOID(require_map(node, group));

  for (const auto& item : node) {
    const auto species = item.first.as<std::string>();
    const YAML::Node& entry = item.second;
    if (!entry.IsMap()) {
      return std::unexpected(core::ValidationError(group, fmt::format("entry '{}' must be a mapping", species)));
    }
    if (const auto declared = entry["species"]; declared && declared.as<std::string>() != species) {
      return std::unexpected(core::ValidationError(
          group, fmt::format("entry '{}' declares the species '{}'", species, declared.as<std::string>())));
    }
    if (!entry["dynamics"]) {
      return std::unexpected(core::ValidationError(group, fmt::format("reaction of '{}' has no dynamics", species)));
    }

    auto dynamics = model::DynamicsType::Rate;
    MSX_TRY_ASSIGN(dynamics, extract_enum(entry, "dynamics", dynamics));
    std::string expression;
    model::Note note;
    MSX_TRY_ASSIGN(expression, extract_value<std::string>(entry, "expression"));
    MSX_TRY_ASSIGN(note, parse_note(entry["note"]));

    model.add_reaction(species, location, dynamics, std::move(expression), std::move(note));
  }
  return {};
}

auto YamlParser::parse_network_data(const YAML::Node& node, model::ReactionModel& model) const
    -> std::expected<void, core::ConfigurationError> {
  MSX_TRY_VOID(require_map(node, "network_data"));
  auto& data = model.network_data();

  if (const auto quality = node["initial_quality"]; quality && !quality.IsNull()) {
    MSX_TRY_VOID(require_map(quality, "initial_quality"));
    for (const auto& item : quality) {
      const auto species = item.first.as<std::string>();
      auto it = data.initial_quality.find(species);
      if (it == data.initial_quality.end()) {
        return std::unexpected(
            core::ValidationError("initial_quality", fmt::format("'{}' is not a species", species)));
      }
      auto& target = it->second;
      std::optional<double> global_value;
      MSX_TRY_ASSIGN(global_value, extract_optional<double>(item.second, "global_value"));
      target.global_value = global_value.value_or(0.0);
      if (const auto nodes = item.second["node_values"]; nodes && !nodes.IsNull()) {
        target.node_values = nodes.as<core::SiteValues>();
      }
      if (const auto links = item.second["link_values"]; links && !links.IsNull()) {
        target.link_values = links.as<core::SiteValues>();
      }
    }
  }

  if (const auto sources = node["sources"]; sources && !sources.IsNull()) {
    MSX_TRY_VOID(require_map(sources, "sources"));
    for (const auto& item : sources) {
      const auto species = item.first.as<std::string>();
      auto it = data.sources.find(species);
      if (it == data.sources.end()) {
        return std::unexpected(core::ValidationError("sources", fmt::format("'{}' is not a species", species)));
      }
      MSX_TRY_VOID(require_map(item.second, "sources"));
      for (const auto& injection : item.second) {
        model::Source source;
        MSX_TRY_ASSIGN(source.source_type, extract_enum(injection.second, "source_type", model::SourceType::Concen));
        MSX_TRY_ASSIGN(source.strength, extract_value<double>(injection.second, "strength"));
        std::optional<std::string> pattern;
        MSX_TRY_ASSIGN(pattern, extract_optional<std::string>(injection.second, "pattern"));
        source.pattern = pattern.value_or("");
        it->second[injection.first.as<std::string>()] = std::move(source);
      }
    }
  }
  return {};
}

auto from_yaml(const YAML::Node& node)
    -> std::expected<std::unique_ptr<model::ReactionModel>, core::ConfigurationError> {
  YamlParser parser;
  return parser.parse_model(node);
}

} // namespace msx::io
