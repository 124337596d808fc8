#include "msx/expression/reaction_evaluator.hpp"
#include "msx/core/enum_resolver.hpp"
#include "msx/core/expected_utils.hpp"

#include <fmt/format.h>

namespace msx::expression {

void HydraulicState::bind(core::SymbolValues& values) const {
  values["D"] = D;
  values["Kc"] = Kc;
  values["Q"] = Q;
  values["U"] = U;
  values["Re"] = Re;
  values["Us"] = Us;
  values["Ff"] = Ff;
  values["Av"] = Av;
  values["Len"] = Len;
}

ReactionSystemEvaluator::ReactionSystemEvaluator(const model::ReactionModel& model, model::LocationType location,
                                                 bool has_jacobian)
    : model_(&model), location_(location), has_jacobian_(has_jacobian), species_(model.species_names()) {
  for (std::size_t i = 0; i < species_.size(); ++i) {
    species_index_[species_[i]] = i;
  }
  reactions_.resize(species_.size());
  dynamics_.resize(species_.size());
}

auto ReactionSystemEvaluator::make_item(std::string name, CompiledPtr expression) const
    -> std::expected<CompiledItem, core::ExpressionCompileError> {
  CompiledItem item{std::move(name), std::move(expression), {}};
  if (!has_jacobian_) {
    return item;
  }

  for (const auto& symbol : item.expression->free_symbols()) {
    const bool is_species = species_index_.contains(symbol);
    const bool is_term = model_->has_variable(symbol) &&
                         model::variable_type(model_->get_variable(symbol)) == model::VariableType::Term;
    if (!is_species && !is_term) {
      continue;
    }
    std::unique_ptr<CompiledExpression> partial;
    MSX_TRY_ASSIGN(partial, item.expression->derivative(symbol));
    item.partials.push_back(Partial{symbol, CompiledPtr(std::move(partial))});
  }
  return item;
}

auto ReactionSystemEvaluator::create(const ExpressionCompiler& compiler, model::LocationType location)
    -> std::expected<ReactionSystemEvaluator, core::ExpressionCompileError> {
  const auto& model = compiler.reaction_model();
  ReactionSystemEvaluator evaluator(model, location, compiler.backend().supports_derivatives());

  std::vector<std::string> order;
  MSX_TRY_ASSIGN(order, compiler.term_order());
  for (auto& name : order) {
    const auto& term = std::get<model::OtherTerm>(model.get_variable(name));
    CompiledPtr compiled;
    MSX_TRY_ASSIGN(compiled, compiler.compile_term(term));
    CompiledItem item;
    MSX_TRY_ASSIGN(item, evaluator.make_item(std::move(name), std::move(compiled)));
    evaluator.terms_.push_back(std::move(item));
  }

  for (const auto& reaction : model.reactions(location)) {
    const auto species = evaluator.species_index_.find(reaction.species());
    if (species == evaluator.species_index_.end()) {
      return std::unexpected(core::ExpressionCompileError(
          fmt::format("{} reaction of '{}' refers to a species that is no longer defined",
                      core::enum_key(location), reaction.species()),
          reaction.expression()));
    }
    const std::size_t index = species->second;

    CompiledPtr compiled;
    MSX_TRY_ASSIGN(compiled, compiler.compile_reaction(reaction));
    CompiledItem item;
    MSX_TRY_ASSIGN(item, evaluator.make_item(reaction.species(), std::move(compiled)));
    evaluator.reactions_[index] = std::move(item);
    evaluator.dynamics_[index] = reaction.dynamics();
  }
  return evaluator;
}

auto ReactionSystemEvaluator::bind(const core::SpeciesVector& concentrations, const HydraulicState& hydraulics,
                                   std::optional<std::string_view> site) const -> core::SymbolValues {
  if (static_cast<std::size_t>(concentrations.size()) != species_.size()) {
    throw core::InvalidValueError(fmt::format("expected {} species concentrations, got {}", species_.size(),
                                              concentrations.size()));
  }

  core::SymbolValues values;
  hydraulics.bind(values);
  for (std::size_t i = 0; i < species_.size(); ++i) {
    values[species_[i]] = concentrations(static_cast<Eigen::Index>(i));
  }
  for (const auto& variable : model_->variables(model::VariableType::Constant)) {
    const auto& constant = std::get<model::Constant>(variable);
    values[constant.name()] = constant.get_value();
  }
  for (const auto& variable : model_->variables(model::VariableType::Parameter)) {
    const auto& parameter = std::get<model::Parameter>(variable);
    if (site && location_ == model::LocationType::Pipe) {
      values[parameter.name()] = parameter.get_value(*site, std::nullopt);
    } else if (site) {
      values[parameter.name()] = parameter.get_value(std::nullopt, *site);
    } else {
      values[parameter.name()] = parameter.global_value();
    }
  }
  return values;
}

auto ReactionSystemEvaluator::rhs(const core::SpeciesVector& concentrations, const HydraulicState& hydraulics,
                                  std::optional<std::string_view> site) const
    -> std::expected<core::SpeciesVector, core::ExpressionCompileError> {
  core::SymbolValues values = bind(concentrations, hydraulics, site);

  for (const auto& term : terms_) {
    double value = 0.0;
    MSX_TRY_ASSIGN(value, term.expression->evaluate(values));
    values[term.name] = value;
  }

  core::SpeciesVector result = core::SpeciesVector::Zero(static_cast<Eigen::Index>(species_.size()));
  for (std::size_t i = 0; i < reactions_.size(); ++i) {
    if (!reactions_[i]) {
      continue;
    }
    double value = 0.0;
    MSX_TRY_ASSIGN(value, reactions_[i]->expression->evaluate(values));
    result(static_cast<Eigen::Index>(i)) = value;
  }
  return result;
}

// Chain rule through the terms: d(item)/dc = sum over symbols s of d(item)/ds * ds/dc
auto ReactionSystemEvaluator::gradient(const CompiledItem& item, const core::SymbolValues& values,
                                       const std::unordered_map<std::string, core::SpeciesVector>& term_gradients)
    const -> std::expected<core::SpeciesVector, core::ExpressionCompileError> {
  core::SpeciesVector result = core::SpeciesVector::Zero(static_cast<Eigen::Index>(species_.size()));
  for (const auto& partial : item.partials) {
    double slope = 0.0;
    MSX_TRY_ASSIGN(slope, partial.expression->evaluate(values));
    if (auto it = species_index_.find(partial.symbol); it != species_index_.end()) {
      result(static_cast<Eigen::Index>(it->second)) += slope;
    } else if (auto term = term_gradients.find(partial.symbol); term != term_gradients.end()) {
      result += slope * term->second;
    }
  }
  return result;
}

auto ReactionSystemEvaluator::jacobian(const core::SpeciesVector& concentrations, const HydraulicState& hydraulics,
                                       std::optional<std::string_view> site) const
    -> std::expected<core::SpeciesJacobian, core::ExpressionCompileError> {
  if (!has_jacobian_) {
    return std::unexpected(core::ExpressionCompileError("the Jacobian requires the symbolic expression backend"));
  }

  core::SymbolValues values = bind(concentrations, hydraulics, site);
  std::unordered_map<std::string, core::SpeciesVector> term_gradients;

  for (const auto& term : terms_) {
    double value = 0.0;
    MSX_TRY_ASSIGN(value, term.expression->evaluate(values));
    core::SpeciesVector grad;
    MSX_TRY_ASSIGN(grad, gradient(term, values, term_gradients));
    values[term.name] = value;
    term_gradients.emplace(term.name, std::move(grad));
  }

  const auto n = static_cast<Eigen::Index>(species_.size());
  core::SpeciesJacobian result = core::SpeciesJacobian::Zero(n, n);
  for (std::size_t i = 0; i < reactions_.size(); ++i) {
    if (!reactions_[i]) {
      continue;
    }
    core::SpeciesVector row;
    MSX_TRY_ASSIGN(row, gradient(*reactions_[i], values, term_gradients));
    result.row(static_cast<Eigen::Index>(i)) = row.transpose();
  }
  return result;
}

} // namespace msx::expression
