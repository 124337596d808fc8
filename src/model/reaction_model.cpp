#include "msx/model/reaction_model.hpp"
#include "msx/core/constants.hpp"
#include "msx/core/enum_resolver.hpp"
#include "msx/core/exceptions.hpp"
#include "msx/expression/builtin_functions.hpp"

#include <fmt/format.h>
#include <type_traits>

namespace msx::model {

namespace {

template <typename V>
constexpr auto group_for() -> std::string_view {
  if constexpr (std::is_same_v<V, Species>) {
    return ReactionModel::species_group;
  } else if constexpr (std::is_same_v<V, Constant>) {
    return ReactionModel::constant_group;
  } else if constexpr (std::is_same_v<V, Parameter>) {
    return ReactionModel::parameter_group;
  } else if constexpr (std::is_same_v<V, OtherTerm>) {
    return ReactionModel::term_group;
  } else {
    return ReactionModel::reserved_group;
  }
}

// Same keys, equal values; insertion order is not compared
template <typename T>
auto same_content(const registry::DisjointMapping<T>& a, const registry::DisjointMapping<T>& b) -> bool {
  if (a.size() != b.size()) {
    return false;
  }
  for (const auto& key : a.keys()) {
    const T* other = b.find(key);
    if (other == nullptr || !(*other == a.at(key))) {
      return false;
    }
  }
  return true;
}

} // namespace

ReactionModel::ReactionModel() {
  for (const auto group : {species_group, constant_group, parameter_group, term_group, reserved_group}) {
    variables_.add_disjoint_group(std::string(group));
  }

  for (const auto& hydraulic : constants::hydraulics::variables) {
    insert_variable(reserved_group, InternalVariable(std::string(hydraulic.name), {}, std::string(hydraulic.note)));
  }
  for (const auto& spelling : expression::function_spellings()) {
    insert_variable(reserved_group,
                    InternalVariable(spelling, {}, std::string(constants::expression::function_note)));
  }
  revision_ = 0;
}

auto ReactionModel::insert_variable(std::string_view group, Variable variable) -> Variable& {
  std::string key = variable_name(variable);
  auto& stored = variables_.add_item_to_group(std::string(group), std::move(key), std::move(variable));
  std::visit([this](auto& v) { v.model_ = this; }, stored);
  ++revision_;
  return stored;
}

template <typename V>
auto ReactionModel::get_typed(std::string_view name) -> V& {
  auto& variable = get_variable(name);
  if (auto* typed = std::get_if<V>(&variable)) {
    return *typed;
  }
  throw core::InvalidTypeError(fmt::format("'{}' is a {}, not a {}", name, core::enum_key(variable_type(variable)),
                                           core::enum_key(V::var_type)));
}

// ---------------------------------------------------------------------------
// Variables
// ---------------------------------------------------------------------------

auto ReactionModel::add_species(std::string name, SpeciesType species_type, std::string units,
                                std::optional<double> atol, std::optional<double> rtol, Note note,
                                std::optional<double> diffusivity) -> Species& {
  return std::get<Species>(add_variable(
      Species(std::move(name), species_type, std::move(units), atol, rtol, std::move(note), diffusivity)));
}

auto ReactionModel::add_bulk_species(std::string name, std::string units, std::optional<double> atol,
                                     std::optional<double> rtol, Note note) -> Species& {
  return add_species(std::move(name), SpeciesType::Bulk, std::move(units), atol, rtol, std::move(note));
}

auto ReactionModel::add_wall_species(std::string name, std::string units, std::optional<double> atol,
                                     std::optional<double> rtol, Note note) -> Species& {
  return add_species(std::move(name), SpeciesType::Wall, std::move(units), atol, rtol, std::move(note));
}

auto ReactionModel::add_constant(std::string name, double value, std::string units, Note note) -> Constant& {
  return std::get<Constant>(add_variable(Constant(std::move(name), value, std::move(units), std::move(note))));
}

auto ReactionModel::add_parameter(std::string name, double global_value, std::string units,
                                  core::SiteValues pipe_values, core::SiteValues tank_values, Note note)
    -> Parameter& {
  return std::get<Parameter>(add_variable(Parameter(std::move(name), global_value, std::move(units),
                                                    std::move(pipe_values), std::move(tank_values),
                                                    std::move(note))));
}

auto ReactionModel::add_coefficient(VariableType coeff_type, std::string name, double global_value,
                                    std::string units, core::SiteValues pipe_values, core::SiteValues tank_values,
                                    Note note) -> Variable& {
  switch (coeff_type) {
  case VariableType::Constant:
    if (!pipe_values.empty() || !tank_values.empty()) {
      throw core::InvalidTypeError(fmt::format("constant '{}' cannot have pipe or tank values", name));
    }
    return add_variable(Constant(std::move(name), global_value, std::move(units), std::move(note)));
  case VariableType::Parameter:
    return add_variable(Parameter(std::move(name), global_value, std::move(units), std::move(pipe_values),
                                  std::move(tank_values), std::move(note)));
  default:
    throw core::InvalidValueError(
        fmt::format("coefficients must be constants or parameters, got {}", core::enum_key(coeff_type)));
  }
}

auto ReactionModel::add_other_term(std::string name, std::string expression, Note note) -> OtherTerm& {
  return std::get<OtherTerm>(add_variable(OtherTerm(std::move(name), std::move(expression), std::move(note))));
}

auto ReactionModel::add_variable(Variable variable) -> Variable& {
  const std::string& name = variable_name(variable);
  if (variable_type(variable) == VariableType::Reserved) {
    throw core::InvalidTypeError(fmt::format("cannot add reserved variable '{}'", name));
  }
  // Already checked by the variable constructor; repeated for variables whose
  // name matches an entry registered by this model.
  expression::validate_user_name(name);
  if (variables_.contains(name)) {
    throw core::NameCollisionError(name);
  }

  const bool is_species = std::holds_alternative<Species>(variable);
  const std::string key = name;
  const auto group = std::visit([](const auto& v) { return group_for<std::decay_t<decltype(v)>>(); }, variable);
  auto& stored = insert_variable(group, std::move(variable));

  if (is_species) {
    network_data_.initial_quality.try_emplace(key);
    network_data_.sources.try_emplace(key);
  }
  return stored;
}

auto ReactionModel::add_variable(VariableType var_type, std::string name, const VariableSpec& spec) -> Variable& {
  switch (var_type) {
  case VariableType::Species:
    return add_variable(Species(std::move(name), spec.species_type, spec.units, spec.atol, spec.rtol, spec.note,
                                spec.diffusivity));
  case VariableType::Constant:
    return add_variable(Constant(std::move(name), spec.global_value, spec.units, spec.note));
  case VariableType::Parameter:
    return add_variable(
        Parameter(std::move(name), spec.global_value, spec.units, spec.pipe_values, spec.tank_values, spec.note));
  case VariableType::Term:
    return add_variable(OtherTerm(std::move(name), spec.expression, spec.note));
  case VariableType::Reserved:
    break;
  }
  throw core::InvalidTypeError(fmt::format("cannot create a {} variable named '{}'", core::enum_key(var_type), name));
}

void ReactionModel::remove_variable(std::string_view name) {
  const auto* variable = variables_.find(name);
  if (variable == nullptr) {
    throw core::UnknownReferenceError(fmt::format("variable '{}' is not defined", name));
  }
  if (variable_type(*variable) == VariableType::Reserved) {
    throw core::InvalidNameError(name, "reserved variables cannot be removed");
  }
  const bool is_species = std::holds_alternative<Species>(*variable);
  const std::string key(name);
  variables_.erase(key);
  ++revision_;

  if (is_species) {
    network_data_.initial_quality.erase(key);
    network_data_.sources.erase(key);
  }
}

auto ReactionModel::get_variable(std::string_view name) -> Variable& {
  if (auto* variable = variables_.find(name)) {
    return *variable;
  }
  throw core::UnknownReferenceError(fmt::format("variable '{}' is not defined", name));
}

auto ReactionModel::get_variable(std::string_view name) const -> const Variable& {
  if (const auto* variable = variables_.find(name)) {
    return *variable;
  }
  throw core::UnknownReferenceError(fmt::format("variable '{}' is not defined", name));
}

auto ReactionModel::get_species(std::string_view name) -> Species& { return get_typed<Species>(name); }
auto ReactionModel::get_constant(std::string_view name) -> Constant& { return get_typed<Constant>(name); }
auto ReactionModel::get_parameter(std::string_view name) -> Parameter& { return get_typed<Parameter>(name); }
auto ReactionModel::get_term(std::string_view name) -> OtherTerm& { return get_typed<OtherTerm>(name); }

auto ReactionModel::variables(std::optional<VariableType> var_type) const -> VariableRange {
  std::vector<VariableRange::Segment> segments;
  auto add = [&](std::string_view group) {
    segments.push_back({&variables_, &variables_.group(group).keys()});
  };

  if (!var_type) {
    for (const auto group : {species_group, constant_group, parameter_group, term_group}) {
      add(group);
    }
    return VariableRange(std::move(segments));
  }

  switch (*var_type) {
  case VariableType::Species:
    add(species_group);
    break;
  case VariableType::Constant:
    add(constant_group);
    break;
  case VariableType::Parameter:
    add(parameter_group);
    break;
  case VariableType::Term:
    add(term_group);
    break;
  case VariableType::Reserved:
    add(reserved_group);
    break;
  }
  return VariableRange(std::move(segments));
}

auto ReactionModel::names_in(std::string_view group) const -> std::vector<std::string> {
  return variables_.group(group).keys();
}

auto ReactionModel::variable_names() const -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto group : {species_group, constant_group, parameter_group, term_group}) {
    const auto& keys = variables_.group(group).keys();
    names.insert(names.end(), keys.begin(), keys.end());
  }
  return names;
}

// ---------------------------------------------------------------------------
// Reactions
// ---------------------------------------------------------------------------

auto ReactionModel::reactions_at(LocationType location) -> registry::DisjointMapping<Reaction>& {
  return location == LocationType::Pipe ? pipe_reactions_ : tank_reactions_;
}

auto ReactionModel::reactions_at(LocationType location) const -> const registry::DisjointMapping<Reaction>& {
  return location == LocationType::Pipe ? pipe_reactions_ : tank_reactions_;
}

auto ReactionModel::add_reaction(std::string species, LocationType location, DynamicsType dynamics,
                                 std::string expression, Note note) -> Reaction& {
  const auto* variable = variables_.find(species);
  if (variable == nullptr || !std::holds_alternative<Species>(*variable)) {
    throw core::UnknownReferenceError(fmt::format("'{}' is not a species of this model", species));
  }

  auto& table = reactions_at(location);
  if (table.contains(species)) {
    throw core::DuplicateReactionError(species, core::enum_key(location));
  }

  std::string key = species;
  auto& stored = table.add_item_to_group(
      std::nullopt, std::move(key),
      Reaction(std::move(species), location, dynamics, std::move(expression), std::move(note)));
  stored.model_ = this;
  ++revision_;
  return stored;
}

auto ReactionModel::add_pipe_reaction(std::string species, DynamicsType dynamics, std::string expression, Note note)
    -> Reaction& {
  return add_reaction(std::move(species), LocationType::Pipe, dynamics, std::move(expression), std::move(note));
}

auto ReactionModel::add_tank_reaction(std::string species, DynamicsType dynamics, std::string expression, Note note)
    -> Reaction& {
  return add_reaction(std::move(species), LocationType::Tank, dynamics, std::move(expression), std::move(note));
}

void ReactionModel::remove_reaction(std::string_view species, LocationType location) {
  if (reactions_at(location).erase(species)) {
    ++revision_;
  }
}

void ReactionModel::remove_reaction(std::string_view species, std::string_view location) {
  if (core::normalize_enum_name(location) == "ALL") {
    remove_reaction(species, LocationType::Pipe);
    remove_reaction(species, LocationType::Tank);
    return;
  }
  remove_reaction(species, core::get_enum<LocationType>(location));
}

auto ReactionModel::get_reaction(std::string_view species, LocationType location) -> Reaction* {
  return reactions_at(location).find(species);
}

auto ReactionModel::get_reaction(std::string_view species, LocationType location) const -> const Reaction* {
  return reactions_at(location).find(species);
}

auto ReactionModel::reactions(std::optional<LocationType> location) const -> ReactionRange {
  std::vector<ReactionRange::Segment> segments;
  if (!location || *location == LocationType::Pipe) {
    segments.push_back({&pipe_reactions_, &pipe_reactions_.keys()});
  }
  if (!location || *location == LocationType::Tank) {
    segments.push_back({&tank_reactions_, &tank_reactions_.keys()});
  }
  return ReactionRange(std::move(segments));
}

auto operator==(const ReactionModel& a, const ReactionModel& b) -> bool {
  return a.name_ == b.name_ && a.title_ == b.title_ && a.description_ == b.description_ &&
         a.references_ == b.references_ && a.options_ == b.options_ && a.network_data_ == b.network_data_ &&
         same_content(a.variables_, b.variables_) && same_content(a.pipe_reactions_, b.pipe_reactions_) &&
         same_content(a.tank_reactions_, b.tank_reactions_);
}

} // namespace msx::model
