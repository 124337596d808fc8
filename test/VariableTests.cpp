#include <catch2/catch.hpp>

#include "msx/core/exceptions.hpp"
#include "msx/model/variables.hpp"

#include <cmath>
#include <limits>

using namespace msx::model;
using msx::core::InvalidNameError;
using msx::core::InvalidTypeError;
using msx::core::InvalidValueError;

TEST_CASE("Species tolerances come in pairs", "[Variables]") {
  Species species("Cl2", SpeciesType::Bulk, "mg");
  CHECK(species.is_bulk());
  CHECK_FALSE(species.is_wall());
  CHECK_FALSE(species.get_tolerances().has_value());

  SECTION("Both given") {
    species.set_tolerances(0.01, 0.001);
    REQUIRE(species.get_tolerances().has_value());
    CHECK(species.get_tolerances()->first == 0.01);
    CHECK(species.get_tolerances()->second == 0.001);

    species.clear_tolerances();
    CHECK_FALSE(species.get_tolerances().has_value());
  }

  SECTION("Only one given") {
    CHECK_THROWS_AS(species.set_tolerances(0.01, std::nullopt), InvalidTypeError);
    CHECK_THROWS_AS(Species("X", SpeciesType::Wall, "mg", std::nullopt, 0.1), InvalidTypeError);
  }

  SECTION("Not strictly positive") {
    CHECK_THROWS_AS(species.set_tolerances(0.0, 0.1), InvalidValueError);
    CHECK_THROWS_AS(species.set_tolerances(0.1, -1.0), InvalidValueError);
    CHECK_THROWS_AS(species.set_tolerances(std::numeric_limits<double>::quiet_NaN(), 0.1), InvalidValueError);
    CHECK_FALSE(species.get_tolerances().has_value());
  }
}

TEST_CASE("Reserved names are rejected by every variable kind", "[Variables]") {
  for (const char* name : {"D", "Kc", "Q", "U", "Re", "Us", "Ff", "Av", "Len", "Mul", "Add", "Pow", "Integer",
                           "Float"}) {
    CAPTURE(name);
    CHECK_THROWS_AS(Constant(name, 1.0), InvalidNameError);
  }

  SECTION("Function names in any case") {
    CHECK_THROWS_AS(Species("log", SpeciesType::Bulk, "mg"), InvalidNameError);
    CHECK_THROWS_AS(Parameter("EXP", 1.0), InvalidNameError);
    CHECK_THROWS_AS(OtherTerm("Sqrt", "1"), InvalidNameError);
    CHECK_THROWS_AS(OtherTerm("sQrT", "1"), InvalidNameError);
  }

  SECTION("Empty or blank names") {
    CHECK_THROWS_AS(Constant("", 1.0), InvalidNameError);
    CHECK_THROWS_AS(Constant("a b", 1.0), InvalidNameError);
  }

  SECTION("Reserved names are case sensitive otherwise") {
    CHECK_NOTHROW(Constant("d", 1.0));
    CHECK_NOTHROW(Constant("LEN", 1.0));
    CHECK_NOTHROW(Constant("mul", 1.0));
  }
}

TEST_CASE("Parameters fall back to their global value", "[Variables]") {
  Parameter k("k", 0.5, "1/day", {{"P1", 1.5}}, {{"T1", 2.5}});

  CHECK(k.get_value() == 0.5);
  CHECK(k.get_value("P1") == 1.5);
  CHECK(k.get_value("P2") == 0.5);
  CHECK(k.get_value(std::nullopt, "T1") == 2.5);
  CHECK(k.get_value(std::nullopt, "P1") == 0.5);
  CHECK_THROWS_AS(k.get_value("P1", "T1"), InvalidTypeError);

  k.set_pipe_value("P2", 3.0);
  CHECK(k.get_value("P2") == 3.0);
  k.set_tank_values({{"T2", 4.0}});
  CHECK(k.get_value(std::nullopt, "T2") == 4.0);
  CHECK(k.get_value(std::nullopt, "T1") == 0.5);
}

TEST_CASE("Coefficient values must be finite", "[Variables]") {
  CHECK_THROWS_AS(Constant("k", std::numeric_limits<double>::infinity()), InvalidValueError);
  CHECK_THROWS_AS(Parameter("k", std::nan("")), InvalidValueError);

  Constant c("k", 2.0);
  CHECK(c.get_value() == 2.0);
  CHECK_THROWS_AS(c.set_global_value(std::numeric_limits<double>::infinity()), InvalidValueError);
  CHECK(c.get_value() == 2.0);

  SECTION("Pipe and tank overrides") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    CHECK_THROWS_AS(Parameter("p", 1.0, "", {{"P1", nan}}), InvalidValueError);
    CHECK_THROWS_AS(Parameter("p", 1.0, "", {}, {{"T1", -inf}}), InvalidValueError);

    Parameter p("p", 1.0, "", {{"P1", 2.0}});
    CHECK_THROWS_AS(p.set_pipe_value("P1", inf), InvalidValueError);
    CHECK_THROWS_AS(p.set_tank_value("T1", nan), InvalidValueError);
    CHECK_THROWS_AS(p.set_pipe_values({{"P3", nan}}), InvalidValueError);
    CHECK(p.get_value("P1") == 2.0);
    CHECK(p.tank_values().empty());
  }
}

TEST_CASE("Variable equality ignores notes", "[Variables]") {
  CHECK(Constant("k", 1.0, "mg", "first") == Constant("k", 1.0, "mg", Note({"c1"}, "second")));
  CHECK_FALSE(Constant("k", 1.0, "mg") == Constant("k", 2.0, "mg"));
  CHECK(OtherTerm("t", "a*b") == OtherTerm("t", "a*b", "note"));

  Variable v = Species("A", SpeciesType::Wall, "ug");
  CHECK(variable_type(v) == VariableType::Species);
  CHECK(variable_name(v) == "A");
  CHECK(variable_note(v).empty());
}
