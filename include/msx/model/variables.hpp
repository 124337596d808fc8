#pragma once
#include "../core/containers.hpp"
#include "model_types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace msx::model {

class ReactionModel;

/**
 * @brief Fields shared by every variable kind
 *
 * The owning model is recorded as a non-owning pointer once the variable is
 * added to it. It is never part of equality.
 */
class VariableBase {
private:
  std::string name_;
  Note note_;
  const ReactionModel* model_ = nullptr;

  friend class ReactionModel;

protected:
  // Validates the name against the reserved words
  VariableBase(std::string name, Note note);

  struct Unchecked {};
  VariableBase(Unchecked, std::string name, Note note) : name_(std::move(name)), note_(std::move(note)) {}

public:
  [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
  [[nodiscard]] auto note() const noexcept -> const Note& { return note_; }
  void set_note(Note note) { note_ = std::move(note); }

  // Model this variable belongs to, nullptr while detached
  [[nodiscard]] auto model() const noexcept -> const ReactionModel* { return model_; }
};

class Species : public VariableBase {
private:
  SpeciesType species_type_;
  std::string units_;
  std::optional<double> atol_;
  std::optional<double> rtol_;
  std::optional<double> diffusivity_;

public:
  static constexpr VariableType var_type = VariableType::Species;

  /**
   * @throws core::InvalidNameError for reserved names
   * @throws core::InvalidTypeError if only one of atol/rtol is given
   * @throws core::InvalidValueError if a tolerance is not strictly positive
   */
  Species(std::string name, SpeciesType species_type, std::string units, std::optional<double> atol = std::nullopt,
          std::optional<double> rtol = std::nullopt, Note note = {},
          std::optional<double> diffusivity = std::nullopt);

  [[nodiscard]] auto species_type() const noexcept -> SpeciesType { return species_type_; }
  void set_species_type(SpeciesType type) noexcept { species_type_ = type; }
  [[nodiscard]] auto is_bulk() const noexcept -> bool { return species_type_ == SpeciesType::Bulk; }
  [[nodiscard]] auto is_wall() const noexcept -> bool { return species_type_ == SpeciesType::Wall; }

  [[nodiscard]] auto units() const noexcept -> const std::string& { return units_; }
  void set_units(std::string units) { units_ = std::move(units); }

  [[nodiscard]] auto diffusivity() const noexcept -> std::optional<double> { return diffusivity_; }
  void set_diffusivity(std::optional<double> diffusivity);

  // (atol, rtol) when species specific tolerances are set
  [[nodiscard]] auto get_tolerances() const -> std::optional<std::pair<double, double>>;

  // Both empty clears the tolerances; otherwise both must be given and > 0
  void set_tolerances(std::optional<double> atol, std::optional<double> rtol);
  void clear_tolerances() noexcept;

  [[nodiscard]] friend auto operator==(const Species& a, const Species& b) -> bool {
    return a.name() == b.name() && a.species_type_ == b.species_type_ && a.units_ == b.units_ &&
           a.atol_ == b.atol_ && a.rtol_ == b.rtol_ && a.diffusivity_ == b.diffusivity_;
  }
};

class Constant : public VariableBase {
private:
  double global_value_;
  std::string units_;

public:
  static constexpr VariableType var_type = VariableType::Constant;

  Constant(std::string name, double global_value, std::string units = {}, Note note = {});

  [[nodiscard]] auto global_value() const noexcept -> double { return global_value_; }
  void set_global_value(double value);
  [[nodiscard]] auto get_value() const noexcept -> double { return global_value_; }

  [[nodiscard]] auto units() const noexcept -> const std::string& { return units_; }
  void set_units(std::string units) { units_ = std::move(units); }

  [[nodiscard]] friend auto operator==(const Constant& a, const Constant& b) -> bool {
    return a.name() == b.name() && a.global_value_ == b.global_value_ && a.units_ == b.units_;
  }
};

class Parameter : public VariableBase {
private:
  double global_value_;
  std::string units_;
  core::SiteValues pipe_values_;
  core::SiteValues tank_values_;

public:
  static constexpr VariableType var_type = VariableType::Parameter;

  Parameter(std::string name, double global_value, std::string units = {}, core::SiteValues pipe_values = {},
            core::SiteValues tank_values = {}, Note note = {});

  [[nodiscard]] auto global_value() const noexcept -> double { return global_value_; }
  void set_global_value(double value);

  [[nodiscard]] auto units() const noexcept -> const std::string& { return units_; }
  void set_units(std::string units) { units_ = std::move(units); }

  [[nodiscard]] auto pipe_values() const noexcept -> const core::SiteValues& { return pipe_values_; }
  [[nodiscard]] auto tank_values() const noexcept -> const core::SiteValues& { return tank_values_; }

  // Override values must be finite, like the global value
  void set_pipe_value(std::string pipe, double value);
  void set_tank_value(std::string tank, double value);
  void set_pipe_values(core::SiteValues values);
  void set_tank_values(core::SiteValues values);

  /**
   * @brief Value at a pipe or a tank, falling back to the global value
   * @throws core::InvalidTypeError if both a pipe and a tank are given
   */
  [[nodiscard]] auto get_value(std::optional<std::string_view> pipe = std::nullopt,
                               std::optional<std::string_view> tank = std::nullopt) const -> double;

  [[nodiscard]] friend auto operator==(const Parameter& a, const Parameter& b) -> bool {
    return a.name() == b.name() && a.global_value_ == b.global_value_ && a.units_ == b.units_ &&
           a.pipe_values_ == b.pipe_values_ && a.tank_values_ == b.tank_values_;
  }
};

// Named sub-expression usable inside reactions and other terms
class OtherTerm : public VariableBase {
private:
  std::string expression_;

public:
  static constexpr VariableType var_type = VariableType::Term;

  OtherTerm(std::string name, std::string expression, Note note = {});

  [[nodiscard]] auto expression() const noexcept -> const std::string& { return expression_; }
  void set_expression(std::string expression) { expression_ = std::move(expression); }

  [[nodiscard]] friend auto operator==(const OtherTerm& a, const OtherTerm& b) -> bool {
    return a.name() == b.name() && a.expression_ == b.expression_;
  }
};

// Hydraulic variables and function names pre-registered by every model
class InternalVariable : public VariableBase {
private:
  std::string units_;

public:
  static constexpr VariableType var_type = VariableType::Reserved;

  InternalVariable(std::string name, std::string units = {}, Note note = {})
      : VariableBase(Unchecked{}, std::move(name), std::move(note)), units_(std::move(units)) {}

  [[nodiscard]] auto units() const noexcept -> const std::string& { return units_; }

  [[nodiscard]] friend auto operator==(const InternalVariable& a, const InternalVariable& b) -> bool {
    return a.name() == b.name() && a.units_ == b.units_;
  }
};

using Variable = std::variant<Species, Constant, Parameter, OtherTerm, InternalVariable>;

[[nodiscard]] auto variable_type(const Variable& variable) -> VariableType;
[[nodiscard]] auto variable_name(const Variable& variable) -> const std::string&;
[[nodiscard]] auto variable_note(const Variable& variable) -> const Note&;

} // namespace msx::model
