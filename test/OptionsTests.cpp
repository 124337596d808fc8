#include <catch2/catch.hpp>

#include "msx/io/yaml_parser.hpp"
#include "msx/model/options.hpp"

#include <limits>
#include <yaml-cpp/yaml.h>

using namespace msx::model;

TEST_CASE("Default options", "[Options]") {
  const Options options;
  CHECK(options.timestep() == 360);
  CHECK(options.area_units() == AreaUnits::M2);
  CHECK(options.rate_units() == RateUnits::Min);
  CHECK(options.solver() == SolverType::Rk5);
  CHECK(options.coupling() == CouplingType::None);
  CHECK(options.atol() == 1.0e-4);
  CHECK(options.rtol() == 1.0e-4);
  CHECK(options.compiler() == CompilerType::None);
  CHECK(options.segments() == 5000);
  CHECK(options.peclet() == 1000);
  CHECK(options.report() == ReportOptions{});
}

TEST_CASE("Option setters validate their input", "[Options]") {
  Options options;

  SECTION("The time step never drops below one second") {
    options.set_timestep(0);
    CHECK(options.timestep() == 1);
    options.set_timestep(-30);
    CHECK(options.timestep() == 1);
    options.set_timestep(60);
    CHECK(options.timestep() == 60);
  }

  SECTION("Segments and Peclet number") {
    CHECK_THROWS_AS(options.set_segments(0), msx::core::InvalidValueError);
    CHECK_THROWS_AS(options.set_peclet(-1), msx::core::InvalidValueError);
    options.set_peclet(0);
    CHECK(options.peclet() == 0);
    CHECK(options.segments() == 5000);
  }

  SECTION("Tolerances must be finite") {
    CHECK_THROWS_AS(options.set_atol(std::numeric_limits<double>::quiet_NaN()), msx::core::InvalidValueError);
    CHECK_THROWS_AS(options.set_rtol(std::numeric_limits<double>::infinity()), msx::core::InvalidValueError);
    options.set_atol(1.0e-8);
    CHECK(options.atol() == 1.0e-8);
  }
}

TEST_CASE("Options are read from YAML", "[Options][YamlParser]") {
  const msx::io::YamlParser parser;

  SECTION("Toolkit spellings") {
    const auto node = YAML::Load(R"(
timestep: 300.9
area_units: FT2
rate_units: hours
solver: MSX_ROS2
coupling: full
atol: 1.0e-6
rtol: 1.0e-3
compiler: gc
segments: 100
peclet: 10
report:
  pagesize: 60
  species: {AS3: true, AS5: false}
  species_precision: {AS3: 4}
  nodes: all
  links: [P1, P2]
)");
    auto options = parser.parse_options(node);
    REQUIRE(options.has_value());
    CHECK(options->timestep() == 300);
    CHECK(options->area_units() == AreaUnits::Ft2);
    CHECK(options->rate_units() == RateUnits::Hr);
    CHECK(options->solver() == SolverType::Ros2);
    CHECK(options->coupling() == CouplingType::Full);
    CHECK(options->atol() == 1.0e-6);
    CHECK(options->rtol() == 1.0e-3);
    CHECK(options->compiler() == CompilerType::Gc);
    CHECK(options->segments() == 100);
    CHECK(options->peclet() == 10);

    const auto& report = options->report();
    CHECK(report.pagesize == 60);
    CHECK(report.species.at("AS3"));
    CHECK_FALSE(report.species.at("AS5"));
    CHECK(report.species_precision.at("AS3") == 4);
    CHECK(report.nodes.all);
    CHECK(report.links.names == std::vector<std::string>{"P1", "P2"});
  }

  SECTION("Integer codes and missing keys") {
    auto options = parser.parse_options(YAML::Load("{solver: 0, rate_units: 3}"));
    REQUIRE(options.has_value());
    CHECK(options->solver() == SolverType::Eul);
    CHECK(options->rate_units() == RateUnits::Day);
    CHECK(options->timestep() == 360);

    auto empty = parser.parse_options(YAML::Node());
    REQUIRE(empty.has_value());
    CHECK(empty.value() == Options{});
  }

  SECTION("Invalid values") {
    for (const char* text : {"{solver: R}", "{solver: 7}", "{segments: 0}", "{peclet: -5}", "{atol: .nan}",
                             "{timestep: soon}", "[1, 2]"}) {
      CAPTURE(text);
      CHECK_FALSE(parser.parse_options(YAML::Load(text)).has_value());
    }
  }

  SECTION("Malformed report values") {
    for (const char* text : {"{report: {species: [1, 2]}}", "{report: {species: {A: maybe}}}",
                             "{report: {species_precision: {A: many}}}", "{report: {nodes: {N1: yes}}}",
                             "{report: {links: [[P1], P2]}}"}) {
      CAPTURE(text);
      auto options = parser.parse_options(YAML::Load(text));
      REQUIRE_FALSE(options.has_value());
      CHECK_THAT(options.error().message(), Catch::Contains("report"));
    }
  }

  SECTION("Malformed notes") {
    CHECK_FALSE(msx::io::YamlParser::parse_note(YAML::Load("{pre: {a: 1}}")).has_value());
    CHECK_FALSE(msx::io::YamlParser::parse_note(YAML::Load("{post: [a, b]}")).has_value());
    CHECK_FALSE(msx::io::YamlParser::parse_note(YAML::Load("[a, b]")).has_value());
  }

  SECTION("Errors name the offending field") {
    auto options = parser.parse_options(YAML::Load("{coupling: partial}"));
    REQUIRE_FALSE(options.has_value());
    CHECK_THAT(options.error().message(), Catch::Contains("coupling"));
  }
}
