#pragma once
#include "model_types.hpp"
#include <string>

namespace msx::model {

class ReactionModel;

/**
 * @brief Dynamics of one species at one location
 *
 * Rate, equilibrium and formula reactions carry the same data and differ
 * only in how the expression is interpreted:
 *  - Rate: d(species)/dt = expression
 *  - Equil: 0 = expression
 *  - Formula: species = expression
 */
class Reaction {
private:
  std::string species_;
  LocationType location_;
  DynamicsType dynamics_;
  std::string expression_;
  Note note_;
  const ReactionModel* model_ = nullptr;

  friend class ReactionModel;

public:
  Reaction(std::string species, LocationType location, DynamicsType dynamics, std::string expression,
           Note note = {});

  [[nodiscard]] auto species() const noexcept -> const std::string& { return species_; }
  [[nodiscard]] auto location() const noexcept -> LocationType { return location_; }
  [[nodiscard]] auto dynamics() const noexcept -> DynamicsType { return dynamics_; }

  [[nodiscard]] auto expression() const noexcept -> const std::string& { return expression_; }
  void set_expression(std::string expression) { expression_ = std::move(expression); }

  [[nodiscard]] auto note() const noexcept -> const Note& { return note_; }
  void set_note(Note note) { note_ = std::move(note); }

  [[nodiscard]] auto model() const noexcept -> const ReactionModel* { return model_; }

  [[nodiscard]] friend auto operator==(const Reaction& a, const Reaction& b) -> bool {
    return a.species_ == b.species_ && a.location_ == b.location_ && a.dynamics_ == b.dynamics_ &&
           a.expression_ == b.expression_;
  }
};

} // namespace msx::model
