#include "msx/io/yaml_writer.hpp"
#include "msx/core/enum_resolver.hpp"

#include <fstream>
#include <variant>

namespace msx::io {

namespace {

auto site_values(const core::SiteValues& values) -> YAML::Node {
  YAML::Node node(YAML::NodeType::Map);
  for (const auto& [site, value] : values) {
    node[site] = value;
  }
  return node;
}

auto selection(const model::ElementSelection& elements) -> YAML::Node {
  if (elements.all) {
    return YAML::Node("all");
  }
  YAML::Node node(YAML::NodeType::Sequence);
  for (const auto& name : elements.names) {
    node.push_back(name);
  }
  return node;
}

void set_note(YAML::Node& node, const model::Note& note) {
  if (!note.empty()) {
    node["note"] = to_yaml(note);
  }
}

} // namespace

auto to_yaml(const model::Note& note) -> YAML::Node {
  if (!note.is_block()) {
    return YAML::Node(note.post);
  }
  YAML::Node node;
  node["pre"] = note.pre;
  node["post"] = note.post;
  return node;
}

auto to_yaml(const model::Species& species) -> YAML::Node {
  YAML::Node node;
  node["name"] = species.name();
  node["species_type"] = core::enum_key(species.species_type());
  node["units"] = species.units();
  if (const auto tolerances = species.get_tolerances()) {
    node["atol"] = tolerances->first;
    node["rtol"] = tolerances->second;
  }
  if (const auto diffusivity = species.diffusivity()) {
    node["diffusivity"] = *diffusivity;
  }
  set_note(node, species.note());
  return node;
}

auto to_yaml(const model::Constant& constant) -> YAML::Node {
  YAML::Node node;
  node["name"] = constant.name();
  node["global_value"] = constant.global_value();
  node["units"] = constant.units();
  set_note(node, constant.note());
  return node;
}

auto to_yaml(const model::Parameter& parameter) -> YAML::Node {
  YAML::Node node;
  node["name"] = parameter.name();
  node["global_value"] = parameter.global_value();
  node["units"] = parameter.units();
  if (!parameter.pipe_values().empty()) {
    node["pipe_values"] = site_values(parameter.pipe_values());
  }
  if (!parameter.tank_values().empty()) {
    node["tank_values"] = site_values(parameter.tank_values());
  }
  set_note(node, parameter.note());
  return node;
}

auto to_yaml(const model::OtherTerm& term) -> YAML::Node {
  YAML::Node node;
  node["name"] = term.name();
  node["expression"] = term.expression();
  set_note(node, term.note());
  return node;
}

auto to_yaml(const model::InternalVariable& variable) -> YAML::Node {
  YAML::Node node;
  node["name"] = variable.name();
  node["units"] = variable.units();
  set_note(node, variable.note());
  return node;
}

auto to_yaml(const model::Variable& variable) -> YAML::Node {
  YAML::Node node = std::visit([](const auto& v) { return to_yaml(v); }, variable);
  node["var_type"] = core::enum_key(model::variable_type(variable));
  return node;
}

auto to_yaml(const model::Reaction& reaction) -> YAML::Node {
  YAML::Node node;
  node["species"] = reaction.species();
  node["dynamics"] = core::enum_key(reaction.dynamics());
  node["expression"] = reaction.expression();
  set_note(node, reaction.note());
  return node;
}

auto to_yaml(const model::ReportOptions& report) -> YAML::Node {
  YAML::Node node(YAML::NodeType::Map);
  if (report.pagesize) {
    node["pagesize"] = *report.pagesize;
  }
  if (report.report_filename) {
    node["report_filename"] = *report.report_filename;
  }
  if (!report.species.empty()) {
    node["species"] = report.species;
  }
  if (!report.species_precision.empty()) {
    node["species_precision"] = report.species_precision;
  }
  if (!report.nodes.empty()) {
    node["nodes"] = selection(report.nodes);
  }
  if (!report.links.empty()) {
    node["links"] = selection(report.links);
  }
  return node;
}

auto to_yaml(const model::Options& options) -> YAML::Node {
  YAML::Node node;
  node["timestep"] = options.timestep();
  node["area_units"] = core::enum_key(options.area_units());
  node["rate_units"] = core::enum_key(options.rate_units());
  node["solver"] = core::enum_key(options.solver());
  node["coupling"] = core::enum_key(options.coupling());
  node["atol"] = options.atol();
  node["rtol"] = options.rtol();
  node["compiler"] = core::enum_key(options.compiler());
  node["segments"] = options.segments();
  node["peclet"] = options.peclet();
  node["report"] = to_yaml(options.report());
  return node;
}

auto to_yaml(const model::NetworkData& data) -> YAML::Node {
  YAML::Node node;

  YAML::Node quality(YAML::NodeType::Map);
  for (const auto& [species, initial] : data.initial_quality) {
    YAML::Node entry;
    entry["global_value"] = initial.global_value;
    if (!initial.node_values.empty()) {
      entry["node_values"] = site_values(initial.node_values);
    }
    if (!initial.link_values.empty()) {
      entry["link_values"] = site_values(initial.link_values);
    }
    quality[species] = entry;
  }
  node["initial_quality"] = quality;

  YAML::Node sources(YAML::NodeType::Map);
  for (const auto& [species, injections] : data.sources) {
    if (injections.empty()) {
      continue;
    }
    YAML::Node by_node;
    for (const auto& [node_name, source] : injections) {
      YAML::Node entry;
      entry["source_type"] = core::enum_key(source.source_type);
      entry["strength"] = source.strength;
      if (!source.pattern.empty()) {
        entry["pattern"] = source.pattern;
      }
      by_node[node_name] = entry;
    }
    sources[species] = by_node;
  }
  node["sources"] = sources;
  return node;
}

auto to_yaml(const model::ReactionModel& model) -> YAML::Node {
  YAML::Node node;
  node["name"] = model.name();
  node["title"] = model.title();
  node["description"] = model.description();
  node["references"] = YAML::Node(YAML::NodeType::Sequence);
  for (const auto& reference : model.references()) {
    node["references"].push_back(reference);
  }
  node["options"] = to_yaml(model.options());

  auto group = [&model](model::VariableType type) {
    YAML::Node entries(YAML::NodeType::Map);
    for (const auto& variable : model.variables(type)) {
      entries[model::variable_name(variable)] = std::visit([](const auto& v) { return to_yaml(v); }, variable);
    }
    return entries;
  };
  node["species"] = group(model::VariableType::Species);
  node["constants"] = group(model::VariableType::Constant);
  node["parameters"] = group(model::VariableType::Parameter);
  node["terms"] = group(model::VariableType::Term);

  auto reactions = [&model](model::LocationType location) {
    YAML::Node entries(YAML::NodeType::Map);
    for (const auto& reaction : model.reactions(location)) {
      entries[reaction.species()] = to_yaml(reaction);
    }
    return entries;
  };
  node["pipe_reactions"] = reactions(model::LocationType::Pipe);
  node["tank_reactions"] = reactions(model::LocationType::Tank);

  node["network_data"] = to_yaml(model.network_data());
  return node;
}

auto emit_model(const model::ReactionModel& model) -> std::string {
  YAML::Emitter out;
  out << to_yaml(model);
  return out.c_str();
}

auto write_model(const model::ReactionModel& model, const std::filesystem::path& path)
    -> std::expected<void, core::FileError> {
  std::ofstream file(path);
  if (!file) {
    return std::unexpected(core::FileError("Failed to open file for writing", path.string()));
  }
  file << emit_model(model) << '\n';
  if (!file) {
    return std::unexpected(core::FileError("Failed to write model file", path.string()));
  }
  return {};
}

} // namespace msx::io
