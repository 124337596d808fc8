#pragma once
#include "../core/containers.hpp"
#include "model_types.hpp"
#include <map>
#include <string>

namespace msx::model {

// Initial concentration of one species, with node and link overrides
struct InitialQuality {
  double global_value = 0.0;
  core::SiteValues node_values;
  core::SiteValues link_values;

  [[nodiscard]] friend auto operator==(const InitialQuality&, const InitialQuality&) -> bool = default;
};

// External injection of one species at one node
struct Source {
  SourceType source_type = SourceType::Concen;
  double strength = 0.0;
  std::string pattern;

  [[nodiscard]] friend auto operator==(const Source&, const Source&) -> bool = default;
};

/**
 * @brief Per-network side tables keyed by species name
 *
 * Every species owns one entry in each table from the moment it is added to
 * a model until it is removed.
 */
struct NetworkData {
  std::map<std::string, InitialQuality> initial_quality;
  std::map<std::string, std::map<std::string, Source>> sources; // species -> node -> source

  [[nodiscard]] friend auto operator==(const NetworkData&, const NetworkData&) -> bool = default;
};

} // namespace msx::model
