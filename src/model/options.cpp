#include "msx/model/options.hpp"
#include "msx/core/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>

namespace msx::model {

namespace {

auto checked_tolerance(std::string_view what, double value) -> double {
  if (!std::isfinite(value)) {
    throw core::InvalidValueError(fmt::format("{} must be a finite number, got {}", what, value));
  }
  return value;
}

auto checked_int(std::string_view what, long long value, long long min_value) -> int {
  if (value < min_value || value > std::numeric_limits<int>::max()) {
    throw core::InvalidValueError(fmt::format("{} must be an integer >= {}, got {}", what, min_value, value));
  }
  return static_cast<int>(value);
}

} // namespace

void Options::set_timestep(long long seconds) noexcept {
  const long long clamped = std::clamp<long long>(seconds, constants::options::min_timestep,
                                                  std::numeric_limits<int>::max());
  timestep_ = static_cast<int>(clamped);
}

void Options::set_atol(double atol) { atol_ = checked_tolerance("atol", atol); }

void Options::set_rtol(double rtol) { rtol_ = checked_tolerance("rtol", rtol); }

void Options::set_segments(long long segments) { segments_ = checked_int("segments", segments, 1); }

void Options::set_peclet(long long peclet) { peclet_ = checked_int("peclet", peclet, 0); }

} // namespace msx::model
