#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../model/reaction_model.hpp"
#include "expression_compiler.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace msx::expression {

// Hydraulic variable values for one pipe segment or tank at one time step
struct HydraulicState {
  double D = 0.0;   // diameter
  double Kc = 0.0;  // roughness coefficient
  double Q = 0.0;   // flow rate
  double U = 0.0;   // velocity
  double Re = 0.0;  // Reynolds number
  double Us = 0.0;  // shear velocity
  double Ff = 0.0;  // friction factor
  double Av = 0.0;  // area per unit volume
  double Len = 0.0; // length

  void bind(core::SymbolValues& values) const;
};

/**
 * @brief Right-hand sides of all reactions of a model at one location
 *
 * Species are indexed in registry order. Entry i of the right-hand side is
 * the value of the reaction expression of species i (0 when the species has
 * no reaction at this location); dynamics() tells how it is to be
 * interpreted. The evaluator keeps compiled expressions: rebuild it after the
 * model changes.
 */
class ReactionSystemEvaluator {
private:
  struct Partial {
    std::string symbol;
    CompiledPtr expression;
  };

  struct CompiledItem {
    std::string name;
    CompiledPtr expression;
    std::vector<Partial> partials; // species and term symbols only
  };

  const model::ReactionModel* model_;
  model::LocationType location_;
  bool has_jacobian_;
  std::vector<std::string> species_;
  std::unordered_map<std::string, std::size_t> species_index_;
  std::vector<CompiledItem> terms_;                        // dependency order
  std::vector<std::optional<CompiledItem>> reactions_;     // one per species
  std::vector<std::optional<model::DynamicsType>> dynamics_;

  ReactionSystemEvaluator(const model::ReactionModel& model, model::LocationType location, bool has_jacobian);

  [[nodiscard]] auto make_item(std::string name, CompiledPtr expression) const
      -> std::expected<CompiledItem, core::ExpressionCompileError>;

  [[nodiscard]] auto bind(const core::SpeciesVector& concentrations, const HydraulicState& hydraulics,
                          std::optional<std::string_view> site) const -> core::SymbolValues;

  [[nodiscard]] auto gradient(const CompiledItem& item, const core::SymbolValues& values,
                              const std::unordered_map<std::string, core::SpeciesVector>& term_gradients) const
      -> std::expected<core::SpeciesVector, core::ExpressionCompileError>;

public:
  /**
   * @brief Compile every term and every reaction at `location`
   *
   * The Jacobian is available when the compiler's backend supports derivatives.
   */
  [[nodiscard]] static auto create(const ExpressionCompiler& compiler, model::LocationType location)
      -> std::expected<ReactionSystemEvaluator, core::ExpressionCompileError>;

  [[nodiscard]] auto location() const noexcept -> model::LocationType { return location_; }
  [[nodiscard]] auto species() const noexcept -> const std::vector<std::string>& { return species_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return species_.size(); }
  [[nodiscard]] auto has_jacobian() const noexcept -> bool { return has_jacobian_; }

  // Dynamics of species i, std::nullopt when it has no reaction here
  [[nodiscard]] auto dynamics(std::size_t index) const -> std::optional<model::DynamicsType> {
    return dynamics_.at(index);
  }

  /**
   * @param concentrations One value per species, registry order
   * @param site Pipe or tank name used to pick parameter overrides
   * @throws core::InvalidValueError if the vector size does not match
   */
  [[nodiscard]] auto rhs(const core::SpeciesVector& concentrations, const HydraulicState& hydraulics,
                         std::optional<std::string_view> site = std::nullopt) const
      -> std::expected<core::SpeciesVector, core::ExpressionCompileError>;

  // d(rhs_i)/d(c_j); fails when the backend has no derivatives
  [[nodiscard]] auto jacobian(const core::SpeciesVector& concentrations, const HydraulicState& hydraulics,
                              std::optional<std::string_view> site = std::nullopt) const
      -> std::expected<core::SpeciesJacobian, core::ExpressionCompileError>;
};

} // namespace msx::expression
