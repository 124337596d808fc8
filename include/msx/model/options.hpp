#pragma once
#include "../core/constants.hpp"
#include "model_types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace msx::model {

// Either every element of a kind, or an explicit list of names
struct ElementSelection {
  bool all = false;
  std::vector<std::string> names;

  [[nodiscard]] static auto everything() -> ElementSelection { return ElementSelection{true, {}}; }
  [[nodiscard]] auto empty() const noexcept -> bool { return !all && names.empty(); }

  [[nodiscard]] friend auto operator==(const ElementSelection&, const ElementSelection&) -> bool = default;
};

struct ReportOptions {
  std::optional<int> pagesize;
  std::optional<std::string> report_filename;
  std::map<std::string, bool> species;
  std::map<std::string, int> species_precision;
  ElementSelection nodes;
  ElementSelection links;

  [[nodiscard]] friend auto operator==(const ReportOptions&, const ReportOptions&) -> bool = default;
};

/**
 * @brief Solver configuration of a reaction model
 *
 * Setters coerce and validate their input; invalid values throw
 * core::InvalidValueError and leave the option unchanged.
 */
class Options {
private:
  int timestep_ = constants::options::default_timestep;
  AreaUnits area_units_ = AreaUnits::M2;
  RateUnits rate_units_ = RateUnits::Min;
  SolverType solver_ = SolverType::Rk5;
  CouplingType coupling_ = CouplingType::None;
  double atol_ = constants::options::default_atol;
  double rtol_ = constants::options::default_rtol;
  CompilerType compiler_ = CompilerType::None;
  int segments_ = constants::options::default_segments;
  int peclet_ = constants::options::default_peclet;
  ReportOptions report_;

public:
  Options() = default;

  [[nodiscard]] auto timestep() const noexcept -> int { return timestep_; }
  // Values below one second are raised to one second
  void set_timestep(long long seconds) noexcept;

  [[nodiscard]] auto area_units() const noexcept -> AreaUnits { return area_units_; }
  void set_area_units(AreaUnits units) noexcept { area_units_ = units; }

  [[nodiscard]] auto rate_units() const noexcept -> RateUnits { return rate_units_; }
  void set_rate_units(RateUnits units) noexcept { rate_units_ = units; }

  [[nodiscard]] auto solver() const noexcept -> SolverType { return solver_; }
  void set_solver(SolverType solver) noexcept { solver_ = solver; }

  [[nodiscard]] auto coupling() const noexcept -> CouplingType { return coupling_; }
  void set_coupling(CouplingType coupling) noexcept { coupling_ = coupling; }

  [[nodiscard]] auto atol() const noexcept -> double { return atol_; }
  void set_atol(double atol);

  [[nodiscard]] auto rtol() const noexcept -> double { return rtol_; }
  void set_rtol(double rtol);

  [[nodiscard]] auto compiler() const noexcept -> CompilerType { return compiler_; }
  void set_compiler(CompilerType compiler) noexcept { compiler_ = compiler; }

  [[nodiscard]] auto segments() const noexcept -> int { return segments_; }
  void set_segments(long long segments);

  [[nodiscard]] auto peclet() const noexcept -> int { return peclet_; }
  void set_peclet(long long peclet);

  [[nodiscard]] auto report() noexcept -> ReportOptions& { return report_; }
  [[nodiscard]] auto report() const noexcept -> const ReportOptions& { return report_; }

  [[nodiscard]] friend auto operator==(const Options&, const Options&) -> bool = default;
};

} // namespace msx::model
