#include <catch2/catch.hpp>

#include "msx/core/exceptions.hpp"
#include "msx/expression/builtin_functions.hpp"
#include "msx/model/reaction_model.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace msx::model;
using namespace msx::core;

namespace {

auto names_of(const VariableRange& range) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& variable : range) {
    names.push_back(variable_name(variable));
  }
  return names;
}

} // namespace

TEST_CASE("A new model holds only the reserved names", "[ReactionModel]") {
  ReactionModel model;

  CHECK(model.variable_names().empty());
  CHECK(model.variables().empty());
  CHECK(model.reactions().empty());

  const auto reserved = names_of(model.variables(VariableType::Reserved));
  CHECK(reserved.size() == 9 + msx::expression::function_spellings().size());
  CHECK(std::find(reserved.begin(), reserved.end(), "Len") != reserved.end());
  CHECK(std::find(reserved.begin(), reserved.end(), "LOG10") != reserved.end());

  for (const auto& variable : model.variables(VariableType::Reserved)) {
    CHECK(variable_type(variable) == VariableType::Reserved);
  }
  CHECK(std::get<InternalVariable>(model.get_variable("log")).note() == Note("MSX function"));
}

TEST_CASE("Variable names are unique across kinds", "[ReactionModel]") {
  ReactionModel model;
  model.add_bulk_species("A", "mg");
  model.add_constant("k", 0.5);

  CHECK_THROWS_AS(model.add_constant("A", 1.0), NameCollisionError);
  CHECK_THROWS_AS(model.add_other_term("k", "A*2"), NameCollisionError);
  CHECK_THROWS_AS(model.add_bulk_species("Q", "mg"), InvalidNameError);
  CHECK_THROWS_AS(model.add_parameter("Step", 1.0), InvalidNameError);

  // Failed additions leave the model unchanged
  CHECK(model.variable_names() == std::vector<std::string>{"A", "k"});
  CHECK(std::holds_alternative<Constant>(model.get_variable("k")));
}

TEST_CASE("Variables are grouped by kind in insertion order", "[ReactionModel]") {
  ReactionModel model;
  model.add_constant("k1", 1.0);
  model.add_bulk_species("B", "mg");
  model.add_other_term("T", "k1*B");
  model.add_wall_species("W", "mg/m2");
  model.add_parameter("p", 2.0);
  model.add_bulk_species("A", "mg");

  CHECK(model.species_names() == std::vector<std::string>{"B", "W", "A"});
  CHECK(model.constant_names() == std::vector<std::string>{"k1"});
  CHECK(model.parameter_names() == std::vector<std::string>{"p"});
  CHECK(model.term_names() == std::vector<std::string>{"T"});
  CHECK(model.variable_names() == std::vector<std::string>{"B", "W", "A", "k1", "p", "T"});

  CHECK(names_of(model.variables(VariableType::Species)) == model.species_names());

  SECTION("Typed access") {
    CHECK(model.get_species("W").is_wall());
    CHECK(model.get_constant("k1").get_value() == 1.0);
    CHECK(model.get_term("T").expression() == "k1*B");
    CHECK_THROWS_AS(model.get_species("k1"), InvalidTypeError);
    CHECK_THROWS_AS(model.get_variable("nope"), UnknownReferenceError);
    CHECK_FALSE(model.has_variable("nope"));
  }

  SECTION("Variables record their owner") {
    CHECK(model.get_species("A").model() == &model);
    CHECK(Species("X", SpeciesType::Bulk, "mg").model() == nullptr);
  }

  SECTION("Ranges reflect later changes") {
    const auto species = model.variables(VariableType::Species);
    model.add_bulk_species("C", "mg");
    CHECK(names_of(species) == std::vector<std::string>{"B", "W", "A", "C"});
  }
}

TEST_CASE("Generic variable creation", "[ReactionModel]") {
  ReactionModel model;

  VariableSpec spec;
  spec.units = "mg";
  spec.species_type = SpeciesType::Wall;
  model.add_variable(VariableType::Species, "S", spec);
  CHECK(model.get_species("S").is_wall());

  spec.global_value = 4.0;
  spec.pipe_values = {{"P1", 5.0}};
  model.add_variable(VariableType::Parameter, "p", spec);
  CHECK(model.get_parameter("p").get_value("P1") == 5.0);

  CHECK_THROWS_AS(model.add_variable(VariableType::Reserved, "r", spec), InvalidTypeError);
  CHECK_THROWS_AS(model.add_variable(InternalVariable("r")), InvalidTypeError);
  CHECK_FALSE(model.has_variable("r"));

  SECTION("Coefficients") {
    model.add_coefficient(VariableType::Constant, "c", 1.0);
    CHECK(std::holds_alternative<Constant>(model.get_variable("c")));
    CHECK_THROWS_AS(model.add_coefficient(VariableType::Species, "x", 1.0), InvalidValueError);
    CHECK_THROWS_AS(model.add_coefficient(VariableType::Constant, "y", 1.0, "", {{"P1", 2.0}}), InvalidTypeError);
  }
}

TEST_CASE("Reactions reference species", "[ReactionModel]") {
  ReactionModel model;
  model.add_bulk_species("A", "mg");
  model.add_constant("k", 0.1);

  model.add_pipe_reaction("A", DynamicsType::Rate, "-k*A");

  SECTION("Missing or non-species targets") {
    CHECK_THROWS_AS(model.add_pipe_reaction("B", DynamicsType::Rate, "1"), UnknownReferenceError);
    CHECK_THROWS_AS(model.add_pipe_reaction("k", DynamicsType::Rate, "1"), UnknownReferenceError);
  }

  SECTION("One reaction per species and location") {
    CHECK_THROWS_AS(model.add_pipe_reaction("A", DynamicsType::Formula, "2"), DuplicateReactionError);
    CHECK(model.get_reaction("A", LocationType::Pipe)->expression() == "-k*A");

    model.add_tank_reaction("A", DynamicsType::Equil, "A - 1");
    CHECK(model.reactions().size() == 2);
    CHECK(model.reactions(LocationType::Tank).size() == 1);
  }

  SECTION("Lookup of an absent reaction") {
    CHECK(model.get_reaction("A", LocationType::Tank) == nullptr);
  }

  SECTION("Removal by location, by name or everywhere") {
    model.add_tank_reaction("A", DynamicsType::Rate, "0");

    model.remove_reaction("A", LocationType::Tank);
    CHECK(model.get_reaction("A", LocationType::Tank) == nullptr);
    CHECK(model.get_reaction("A", LocationType::Pipe) != nullptr);

    CHECK_NOTHROW(model.remove_reaction("A", LocationType::Tank));

    model.add_tank_reaction("A", DynamicsType::Rate, "0");
    model.remove_reaction("A", "all");
    CHECK(model.reactions().empty());

    CHECK_THROWS_AS(model.remove_reaction("A", "river"), InvalidValueError);
  }

  SECTION("Removing a species keeps its reactions") {
    model.remove_variable("A");
    CHECK_FALSE(model.has_variable("A"));
    CHECK(model.get_reaction("A", LocationType::Pipe) != nullptr);
  }
}

TEST_CASE("Removing variables", "[ReactionModel]") {
  ReactionModel model;
  model.add_bulk_species("A", "mg");
  model.add_constant("k", 1.0);

  REQUIRE(model.network_data().initial_quality.contains("A"));
  REQUIRE(model.network_data().sources.contains("A"));

  model.remove_variable("A");
  CHECK_FALSE(model.network_data().initial_quality.contains("A"));
  CHECK_FALSE(model.network_data().sources.contains("A"));

  CHECK_THROWS_AS(model.remove_variable("A"), UnknownReferenceError);
  CHECK_THROWS_AS(model.remove_variable("Len"), InvalidNameError);
  CHECK(model.has_variable("Len"));

  // The name is free again, for any kind
  model.add_constant("A", 3.0);
  CHECK(model.constant_names() == std::vector<std::string>{"k", "A"});
}

TEST_CASE("The revision counter tracks structural changes", "[ReactionModel]") {
  ReactionModel model;
  CHECK(model.revision() == 0);

  model.add_bulk_species("A", "mg");
  const auto after_species = model.revision();
  CHECK(after_species > 0);

  model.add_pipe_reaction("A", DynamicsType::Rate, "-A");
  CHECK(model.revision() > after_species);

  const auto before_failure = model.revision();
  CHECK_THROWS(model.add_constant("A", 1.0));
  CHECK(model.revision() == before_failure);

  model.remove_reaction("A", LocationType::Tank);
  CHECK(model.revision() == before_failure);
}
