#include "msx/model/reactions.hpp"
#include "msx/core/exceptions.hpp"

#include <fmt/format.h>

namespace msx::model {

Reaction::Reaction(std::string species, LocationType location, DynamicsType dynamics, std::string expression,
                   Note note)
    : species_(std::move(species)), location_(location), dynamics_(dynamics), expression_(std::move(expression)),
      note_(std::move(note)) {
  if (species_.empty()) {
    throw core::InvalidValueError("a reaction needs a species name");
  }
  if (expression_.empty()) {
    throw core::InvalidValueError(fmt::format("the {} reaction of '{}' has an empty expression",
                                              core::enum_key(location_), species_));
  }
}

} // namespace msx::model
