#include <catch2/catch.hpp>

#include "msx/core/enum_resolver.hpp"
#include "msx/model/model_types.hpp"

#include <array>
#include <string>

namespace {
enum class Fruit { Apple = 1, Banana = 2, Cherry = 7 };
}

namespace msx::core {
template <>
struct EnumTraits<Fruit> {
  using E = Fruit;
  static constexpr std::string_view type_name = "Fruit";
  static constexpr std::string_view prefix = "FRUIT_";
  static constexpr bool abbrev = true;
  static constexpr std::array<EnumEntry<E>, 4> entries{{
      {"APPLE", E::Apple}, {"BANANA", E::Banana}, {"CHERRY", E::Cherry}, {"GREEN_APPLE", E::Apple},
  }};
};
} // namespace msx::core

using msx::core::get_enum;

TEST_CASE("Enum names are normalized before lookup", "[EnumResolver]") {
  CHECK(msx::core::normalize_enum_name("  green-apple ") == "GREEN_APPLE");
  CHECK(msx::core::normalize_enum_name("fruit banana", "FRUIT_") == "BANANA");
  CHECK(msx::core::normalize_enum_name("MSX_RK5", "MSX_") == "RK5");
}

TEST_CASE("Enums resolve from members, integers and text", "[EnumResolver]") {
  SECTION("Member passes through") {
    CHECK(get_enum<Fruit>(Fruit::Cherry) == Fruit::Cherry);
  }

  SECTION("Integer by underlying value") {
    CHECK(get_enum<Fruit>(2) == Fruit::Banana);
    CHECK(get_enum<Fruit>(7) == Fruit::Cherry);
    CHECK_THROWS_AS(get_enum<Fruit>(3), msx::core::InvalidValueError);
  }

  SECTION("Text, case insensitive, with aliases and prefix") {
    CHECK(get_enum<Fruit>("banana") == Fruit::Banana);
    CHECK(get_enum<Fruit>("Green Apple") == Fruit::Apple);
    CHECK(get_enum<Fruit>(std::string("fruit_cherry")) == Fruit::Cherry);
  }

  SECTION("First character fallback") {
    CHECK(get_enum<Fruit>("c") == Fruit::Cherry);
    CHECK(get_enum<Fruit>("bogus") == Fruit::Banana);
    CHECK_THROWS_AS(get_enum<Fruit>("zucchini"), msx::core::InvalidValueError);
    CHECK_THROWS_AS(get_enum<Fruit>(""), msx::core::InvalidValueError);
  }
}

TEST_CASE("Canonical names", "[EnumResolver]") {
  CHECK(msx::core::enum_name(Fruit::Apple) == "APPLE");
  CHECK(msx::core::enum_key(Fruit::Cherry) == "cherry");
}

TEST_CASE("Model enums accept their documented spellings", "[EnumResolver]") {
  using namespace msx::model;

  CHECK(get_enum<VariableType>("param") == VariableType::Parameter);
  CHECK(get_enum<VariableType>("CONST") == VariableType::Constant);
  CHECK(get_enum<VariableType>(3) == VariableType::Species);
  CHECK(get_enum<SpeciesType>("wall") == SpeciesType::Wall);
  CHECK(get_enum<SpeciesType>("b") == SpeciesType::Bulk);
  CHECK(get_enum<LocationType>("Tanks") == LocationType::Tank);
  CHECK(get_enum<DynamicsType>("equilibrium") == DynamicsType::Equil);
  CHECK(get_enum<DynamicsType>(3) == DynamicsType::Formula);

  SECTION("Toolkit option enums strip the MSX_ prefix and do not abbreviate") {
    CHECK(get_enum<SolverType>("MSX_ROS2") == SolverType::Ros2);
    CHECK(get_enum<CouplingType>("full_coupling") == CouplingType::Full);
    CHECK(get_enum<RateUnits>("hours") == RateUnits::Hr);
    CHECK(get_enum<AreaUnits>("cm2") == AreaUnits::Cm2);
    CHECK_THROWS_AS(get_enum<SolverType>("R"), msx::core::InvalidValueError);
  }
}
