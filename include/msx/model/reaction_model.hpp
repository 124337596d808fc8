#pragma once
#include "../core/containers.hpp"
#include "../registry/chained_range.hpp"
#include "../registry/disjoint_mapping.hpp"
#include "model_types.hpp"
#include "network_data.hpp"
#include "options.hpp"
#include "reactions.hpp"
#include "variables.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace msx::model {

// Arguments of the generic add_variable(type, name, spec) form. Fields not
// used by the requested kind are ignored.
struct VariableSpec {
  std::string units;
  SpeciesType species_type = SpeciesType::Bulk;
  std::optional<double> atol;
  std::optional<double> rtol;
  std::optional<double> diffusivity;
  double global_value = 0.0;
  core::SiteValues pipe_values;
  core::SiteValues tank_values;
  std::string expression;
  Note note;
};

using VariableRange = registry::ChainedRange<Variable>;
using ReactionRange = registry::ChainedRange<Reaction>;

/**
 * @brief Multi-species reaction model
 *
 * Owns every variable and reaction. All variable names share one namespace
 * that also holds the hydraulic variables and function names registered at
 * construction. Variables and reactions keep a non-owning pointer back to the
 * model, so a model can be neither copied nor moved.
 */
class ReactionModel {
public:
  static constexpr std::string_view species_group = "species";
  static constexpr std::string_view constant_group = "constants";
  static constexpr std::string_view parameter_group = "parameters";
  static constexpr std::string_view term_group = "terms";
  static constexpr std::string_view reserved_group = "reserved";

private:
  std::string name_;
  std::string title_;
  std::string description_;
  std::vector<std::string> references_;
  Options options_;
  NetworkData network_data_;

  registry::DisjointMapping<Variable> variables_;
  registry::DisjointMapping<Reaction> pipe_reactions_;
  registry::DisjointMapping<Reaction> tank_reactions_;

  std::uint64_t revision_ = 0;

  auto insert_variable(std::string_view group, Variable variable) -> Variable&;
  [[nodiscard]] auto reactions_at(LocationType location) -> registry::DisjointMapping<Reaction>&;
  [[nodiscard]] auto reactions_at(LocationType location) const -> const registry::DisjointMapping<Reaction>&;
  [[nodiscard]] auto names_in(std::string_view group) const -> std::vector<std::string>;

  template <typename V>
  [[nodiscard]] auto get_typed(std::string_view name) -> V&;

public:
  ReactionModel();
  ReactionModel(const ReactionModel&) = delete;
  auto operator=(const ReactionModel&) -> ReactionModel& = delete;
  ReactionModel(ReactionModel&&) = delete;
  auto operator=(ReactionModel&&) -> ReactionModel& = delete;
  ~ReactionModel() = default;

  // Metadata
  [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }
  [[nodiscard]] auto title() const noexcept -> const std::string& { return title_; }
  void set_title(std::string title) { title_ = std::move(title); }
  [[nodiscard]] auto description() const noexcept -> const std::string& { return description_; }
  void set_description(std::string description) { description_ = std::move(description); }
  [[nodiscard]] auto references() noexcept -> std::vector<std::string>& { return references_; }
  [[nodiscard]] auto references() const noexcept -> const std::vector<std::string>& { return references_; }

  [[nodiscard]] auto options() noexcept -> Options& { return options_; }
  [[nodiscard]] auto options() const noexcept -> const Options& { return options_; }

  [[nodiscard]] auto network_data() noexcept -> NetworkData& { return network_data_; }
  [[nodiscard]] auto network_data() const noexcept -> const NetworkData& { return network_data_; }

  // Incremented by every variable or reaction addition and removal
  [[nodiscard]] auto revision() const noexcept -> std::uint64_t { return revision_; }

  // ------------------------------------------------------------------
  // Variables
  // ------------------------------------------------------------------

  auto add_species(std::string name, SpeciesType species_type, std::string units,
                   std::optional<double> atol = std::nullopt, std::optional<double> rtol = std::nullopt,
                   Note note = {}, std::optional<double> diffusivity = std::nullopt) -> Species&;
  auto add_bulk_species(std::string name, std::string units, std::optional<double> atol = std::nullopt,
                        std::optional<double> rtol = std::nullopt, Note note = {}) -> Species&;
  auto add_wall_species(std::string name, std::string units, std::optional<double> atol = std::nullopt,
                        std::optional<double> rtol = std::nullopt, Note note = {}) -> Species&;

  auto add_constant(std::string name, double value, std::string units = {}, Note note = {}) -> Constant&;
  auto add_parameter(std::string name, double global_value, std::string units = {},
                     core::SiteValues pipe_values = {}, core::SiteValues tank_values = {}, Note note = {})
      -> Parameter&;

  /**
   * @brief Add a constant or a parameter
   * @throws core::InvalidValueError if coeff_type is neither CONSTANT nor PARAMETER
   * @throws core::InvalidTypeError if override values are given for a constant
   */
  auto add_coefficient(VariableType coeff_type, std::string name, double global_value, std::string units = {},
                       core::SiteValues pipe_values = {}, core::SiteValues tank_values = {}, Note note = {})
      -> Variable&;

  auto add_other_term(std::string name, std::string expression, Note note = {}) -> OtherTerm&;

  // Adds an already constructed variable. Reserved variables are rejected.
  auto add_variable(Variable variable) -> Variable&;
  auto add_variable(VariableType var_type, std::string name, const VariableSpec& spec) -> Variable&;

  /**
   * @brief Remove a user variable, and the network data of a species
   *
   * Reactions and expressions that mention the name are left untouched.
   * @throws core::UnknownReferenceError if the name is not defined
   * @throws core::InvalidNameError for reserved names
   */
  void remove_variable(std::string_view name);

  [[nodiscard]] auto has_variable(std::string_view name) const -> bool { return variables_.contains(name); }

  // @throws core::UnknownReferenceError if the name is not defined
  [[nodiscard]] auto get_variable(std::string_view name) -> Variable&;
  [[nodiscard]] auto get_variable(std::string_view name) const -> const Variable&;

  // Typed lookups, @throws core::InvalidTypeError when the variable is of another kind
  [[nodiscard]] auto get_species(std::string_view name) -> Species&;
  [[nodiscard]] auto get_constant(std::string_view name) -> Constant&;
  [[nodiscard]] auto get_parameter(std::string_view name) -> Parameter&;
  [[nodiscard]] auto get_term(std::string_view name) -> OtherTerm&;

  /**
   * @brief Lazy view of the variables
   *
   * Without a type: species, constants, parameters then terms, each in
   * insertion order. VariableType::Reserved gives the internal variables.
   */
  [[nodiscard]] auto variables(std::optional<VariableType> var_type = std::nullopt) const -> VariableRange;

  [[nodiscard]] auto variable_names() const -> std::vector<std::string>;
  [[nodiscard]] auto species_names() const -> std::vector<std::string> { return names_in(species_group); }
  [[nodiscard]] auto constant_names() const -> std::vector<std::string> { return names_in(constant_group); }
  [[nodiscard]] auto parameter_names() const -> std::vector<std::string> { return names_in(parameter_group); }
  [[nodiscard]] auto term_names() const -> std::vector<std::string> { return names_in(term_group); }

  // ------------------------------------------------------------------
  // Reactions
  // ------------------------------------------------------------------

  /**
   * @brief Define the dynamics of a species at a location
   * @throws core::UnknownReferenceError if `species` is not a defined species
   * @throws core::DuplicateReactionError if the species already has a reaction there
   */
  auto add_reaction(std::string species, LocationType location, DynamicsType dynamics, std::string expression,
                    Note note = {}) -> Reaction&;
  auto add_pipe_reaction(std::string species, DynamicsType dynamics, std::string expression, Note note = {})
      -> Reaction&;
  auto add_tank_reaction(std::string species, DynamicsType dynamics, std::string expression, Note note = {})
      -> Reaction&;

  // Removing an undefined reaction does nothing
  void remove_reaction(std::string_view species, LocationType location);

  // `location` is a location name or "all"
  // @throws core::InvalidValueError if the location cannot be resolved
  void remove_reaction(std::string_view species, std::string_view location);

  // nullptr when the species has no reaction at that location
  [[nodiscard]] auto get_reaction(std::string_view species, LocationType location) -> Reaction*;
  [[nodiscard]] auto get_reaction(std::string_view species, LocationType location) const -> const Reaction*;

  // Pipe reactions then tank reactions, each in insertion order
  [[nodiscard]] auto reactions(std::optional<LocationType> location = std::nullopt) const -> ReactionRange;

  [[nodiscard]] friend auto operator==(const ReactionModel& a, const ReactionModel& b) -> bool;
};

} // namespace msx::model
