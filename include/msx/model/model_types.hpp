#pragma once
#include "../core/constants.hpp"
#include "../core/enum_resolver.hpp"
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace msx::model {

enum class VariableType { Species = 3, Term = 4, Parameter = 5, Constant = 6, Reserved = 9 };

enum class SpeciesType { Bulk = 1, Wall = 2 };

enum class LocationType { Pipe = 1, Tank = 2 };

enum class DynamicsType { Equil = 1, Rate = 2, Formula = 3 };

// Toolkit-level option enums, spelled as the toolkit spells them (MSX_ prefix optional)
enum class SolverType { Eul = 0, Rk5 = 1, Ros2 = 2 };

enum class CouplingType { None = 0, Full = 1 };

enum class AreaUnits { Ft2 = 0, M2 = 1, Cm2 = 2 };

enum class RateUnits { Sec = 0, Min = 1, Hr = 2, Day = 3 };

enum class CompilerType { None = 0, Vc = 1, Gc = 2 };

enum class SourceType { Concen = 0, Mass = 1, Setpoint = 2, Flowpaced = 3 };

/**
 * @brief Free text attached to a variable or reaction
 *
 * Either a plain string (`post` only) or a comment block whose `pre` lines
 * precede the item in an input file and whose `post` text trails it.
 */
struct Note {
  std::vector<std::string> pre;
  std::string post;

  Note() = default;
  Note(std::string text) : post(std::move(text)) {}
  Note(const char* text) : post(text) {}
  Note(std::vector<std::string> pre_lines, std::string post_text)
      : pre(std::move(pre_lines)), post(std::move(post_text)) {}

  [[nodiscard]] auto empty() const noexcept -> bool { return pre.empty() && post.empty(); }
  [[nodiscard]] auto is_block() const noexcept -> bool { return !pre.empty(); }

  [[nodiscard]] friend auto operator==(const Note&, const Note&) -> bool = default;
};

} // namespace msx::model

namespace msx::core {

template <>
struct EnumTraits<model::VariableType> {
  using E = model::VariableType;
  static constexpr std::string_view type_name = "VariableType";
  static constexpr std::string_view prefix = {};
  static constexpr bool abbrev = true;
  static constexpr std::array<EnumEntry<E>, 14> entries{{
      {"SPECIES", E::Species},     {"TERM", E::Term},       {"PARAMETER", E::Parameter},
      {"CONSTANT", E::Constant},   {"RESERVED", E::Reserved}, {"S", E::Species},
      {"SPEC", E::Species},        {"T", E::Term},          {"P", E::Parameter},
      {"PARAM", E::Parameter},     {"C", E::Constant},      {"CONST", E::Constant},
      {"R", E::Reserved},          {"RES", E::Reserved},
  }};
};

template <>
struct EnumTraits<model::SpeciesType> {
  using E = model::SpeciesType;
  static constexpr std::string_view type_name = "SpeciesType";
  static constexpr std::string_view prefix = {};
  static constexpr bool abbrev = true;
  static constexpr std::array<EnumEntry<E>, 4> entries{{
      {"BULK", E::Bulk}, {"WALL", E::Wall}, {"B", E::Bulk}, {"W", E::Wall},
  }};
};

template <>
struct EnumTraits<model::LocationType> {
  using E = model::LocationType;
  static constexpr std::string_view type_name = "LocationType";
  static constexpr std::string_view prefix = {};
  static constexpr bool abbrev = true;
  static constexpr std::array<EnumEntry<E>, 4> entries{{
      {"PIPE", E::Pipe}, {"TANK", E::Tank}, {"P", E::Pipe}, {"T", E::Tank},
  }};
};

template <>
struct EnumTraits<model::DynamicsType> {
  using E = model::DynamicsType;
  static constexpr std::string_view type_name = "DynamicsType";
  static constexpr std::string_view prefix = {};
  static constexpr bool abbrev = true;
  static constexpr std::array<EnumEntry<E>, 6> entries{{
      {"EQUIL", E::Equil}, {"RATE", E::Rate}, {"FORMULA", E::Formula},
      {"E", E::Equil},     {"R", E::Rate},    {"F", E::Formula},
  }};
};

template <>
struct EnumTraits<model::SolverType> {
  using E = model::SolverType;
  static constexpr std::string_view type_name = "SolverType";
  static constexpr std::string_view prefix = constants::options::toolkit_prefix;
  static constexpr bool abbrev = false;
  static constexpr std::array<EnumEntry<E>, 3> entries{{
      {"EUL", E::Eul}, {"RK5", E::Rk5}, {"ROS2", E::Ros2},
  }};
};

template <>
struct EnumTraits<model::CouplingType> {
  using E = model::CouplingType;
  static constexpr std::string_view type_name = "CouplingType";
  static constexpr std::string_view prefix = constants::options::toolkit_prefix;
  static constexpr bool abbrev = false;
  static constexpr std::array<EnumEntry<E>, 4> entries{{
      {"NONE", E::None}, {"FULL", E::Full}, {"NO_COUPLING", E::None}, {"FULL_COUPLING", E::Full},
  }};
};

template <>
struct EnumTraits<model::AreaUnits> {
  using E = model::AreaUnits;
  static constexpr std::string_view type_name = "AreaUnits";
  static constexpr std::string_view prefix = constants::options::toolkit_prefix;
  static constexpr bool abbrev = false;
  static constexpr std::array<EnumEntry<E>, 3> entries{{
      {"FT2", E::Ft2}, {"M2", E::M2}, {"CM2", E::Cm2},
  }};
};

template <>
struct EnumTraits<model::RateUnits> {
  using E = model::RateUnits;
  static constexpr std::string_view type_name = "RateUnits";
  static constexpr std::string_view prefix = constants::options::toolkit_prefix;
  static constexpr bool abbrev = false;
  static constexpr std::array<EnumEntry<E>, 8> entries{{
      {"SEC", E::Sec},     {"MIN", E::Min},     {"HR", E::Hr},     {"DAY", E::Day},
      {"SECONDS", E::Sec}, {"MINUTES", E::Min}, {"HOURS", E::Hr}, {"DAYS", E::Day},
  }};
};

template <>
struct EnumTraits<model::CompilerType> {
  using E = model::CompilerType;
  static constexpr std::string_view type_name = "CompilerType";
  static constexpr std::string_view prefix = constants::options::toolkit_prefix;
  static constexpr bool abbrev = false;
  static constexpr std::array<EnumEntry<E>, 4> entries{{
      {"NONE", E::None}, {"VC", E::Vc}, {"GC", E::Gc}, {"NO_COMPILER", E::None},
  }};
};

template <>
struct EnumTraits<model::SourceType> {
  using E = model::SourceType;
  static constexpr std::string_view type_name = "SourceType";
  static constexpr std::string_view prefix = constants::options::toolkit_prefix;
  static constexpr bool abbrev = false;
  static constexpr std::array<EnumEntry<E>, 4> entries{{
      {"CONCEN", E::Concen}, {"MASS", E::Mass}, {"SETPOINT", E::Setpoint}, {"FLOWPACED", E::Flowpaced},
  }};
};

} // namespace msx::core
