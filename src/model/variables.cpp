#include "msx/model/variables.hpp"
#include "msx/core/exceptions.hpp"
#include "msx/expression/builtin_functions.hpp"

#include <cmath>
#include <fmt/format.h>
#include <type_traits>

namespace msx::model {

namespace {

void require_finite(std::string_view what, double value) {
  if (!std::isfinite(value)) {
    throw core::InvalidValueError(fmt::format("{} must be a finite number, got {}", what, value));
  }
}

} // namespace

VariableBase::VariableBase(std::string name, Note note) : name_(std::move(name)), note_(std::move(note)) {
  expression::validate_user_name(name_);
}

// ---------------------------------------------------------------------------
// Species
// ---------------------------------------------------------------------------

Species::Species(std::string name, SpeciesType species_type, std::string units, std::optional<double> atol,
                 std::optional<double> rtol, Note note, std::optional<double> diffusivity)
    : VariableBase(std::move(name), std::move(note)), species_type_(species_type), units_(std::move(units)) {
  set_tolerances(atol, rtol);
  set_diffusivity(diffusivity);
}

void Species::set_diffusivity(std::optional<double> diffusivity) {
  if (diffusivity) {
    require_finite("diffusivity", *diffusivity);
    if (*diffusivity < 0.0) {
      throw core::InvalidValueError(fmt::format("diffusivity of '{}' must not be negative", name()));
    }
  }
  diffusivity_ = diffusivity;
}

auto Species::get_tolerances() const -> std::optional<std::pair<double, double>> {
  if (atol_ && rtol_) {
    return std::make_pair(*atol_, *rtol_);
  }
  return std::nullopt;
}

void Species::set_tolerances(std::optional<double> atol, std::optional<double> rtol) {
  if (!atol && !rtol) {
    clear_tolerances();
    return;
  }
  if (!atol || !rtol) {
    throw core::InvalidTypeError(
        fmt::format("atol and rtol of species '{}' must both be given or both be omitted", name()));
  }
  if (!(*atol > 0.0) || !(*rtol > 0.0) || !std::isfinite(*atol) || !std::isfinite(*rtol)) {
    throw core::InvalidValueError(
        fmt::format("tolerances of species '{}' must be positive, got atol={} rtol={}", name(), *atol, *rtol));
  }
  atol_ = atol;
  rtol_ = rtol;
}

void Species::clear_tolerances() noexcept {
  atol_.reset();
  rtol_.reset();
}

// ---------------------------------------------------------------------------
// Coefficients
// ---------------------------------------------------------------------------

Constant::Constant(std::string name, double global_value, std::string units, Note note)
    : VariableBase(std::move(name), std::move(note)), global_value_(0.0), units_(std::move(units)) {
  set_global_value(global_value);
}

void Constant::set_global_value(double value) {
  require_finite(fmt::format("value of constant '{}'", name()), value);
  global_value_ = value;
}

Parameter::Parameter(std::string name, double global_value, std::string units, core::SiteValues pipe_values,
                     core::SiteValues tank_values, Note note)
    : VariableBase(std::move(name), std::move(note)), global_value_(0.0), units_(std::move(units)) {
  set_global_value(global_value);
  set_pipe_values(std::move(pipe_values));
  set_tank_values(std::move(tank_values));
}

void Parameter::set_global_value(double value) {
  require_finite(fmt::format("value of parameter '{}'", name()), value);
  global_value_ = value;
}

void Parameter::set_pipe_value(std::string pipe, double value) {
  require_finite(fmt::format("value of parameter '{}' at pipe '{}'", name(), pipe), value);
  pipe_values_[std::move(pipe)] = value;
}

void Parameter::set_tank_value(std::string tank, double value) {
  require_finite(fmt::format("value of parameter '{}' at tank '{}'", name(), tank), value);
  tank_values_[std::move(tank)] = value;
}

void Parameter::set_pipe_values(core::SiteValues values) {
  for (const auto& [pipe, value] : values) {
    require_finite(fmt::format("value of parameter '{}' at pipe '{}'", name(), pipe), value);
  }
  pipe_values_ = std::move(values);
}

void Parameter::set_tank_values(core::SiteValues values) {
  for (const auto& [tank, value] : values) {
    require_finite(fmt::format("value of parameter '{}' at tank '{}'", name(), tank), value);
  }
  tank_values_ = std::move(values);
}

auto Parameter::get_value(std::optional<std::string_view> pipe, std::optional<std::string_view> tank) const
    -> double {
  if (pipe && tank) {
    throw core::InvalidTypeError(
        fmt::format("value of parameter '{}' requested for both pipe '{}' and tank '{}'", name(), *pipe, *tank));
  }
  if (pipe) {
    if (auto it = pipe_values_.find(std::string(*pipe)); it != pipe_values_.end()) {
      return it->second;
    }
  } else if (tank) {
    if (auto it = tank_values_.find(std::string(*tank)); it != tank_values_.end()) {
      return it->second;
    }
  }
  return global_value_;
}

// ---------------------------------------------------------------------------
// Terms
// ---------------------------------------------------------------------------

OtherTerm::OtherTerm(std::string name, std::string expression, Note note)
    : VariableBase(std::move(name), std::move(note)), expression_(std::move(expression)) {}

// ---------------------------------------------------------------------------
// Variant helpers
// ---------------------------------------------------------------------------

auto variable_type(const Variable& variable) -> VariableType {
  return std::visit([](const auto& v) { return std::decay_t<decltype(v)>::var_type; }, variable);
}

auto variable_name(const Variable& variable) -> const std::string& {
  return std::visit([](const auto& v) -> const std::string& { return v.name(); }, variable);
}

auto variable_note(const Variable& variable) -> const Note& {
  return std::visit([](const auto& v) -> const Note& { return v.note(); }, variable);
}

} // namespace msx::model
