#include <catch2/catch.hpp>

#include "msx/core/containers.hpp"
#include "msx/expression/builtin_functions.hpp"
#include "msx/expression/expression_compiler.hpp"
#include "msx/expression/numeric_backend.hpp"
#include "msx/expression/parser.hpp"
#include "msx/expression/symbolic_backend.hpp"
#include "msx/model/reaction_model.hpp"

#include <cmath>
#include <memory>
#include <string>

using namespace msx::expression;
using msx::core::SymbolValues;

namespace {

auto value_of(const ExpressionBackend& backend, const std::string& text, const SymbolValues& values = {}) -> double {
  auto compiled = backend.compile(text);
  if (!compiled) {
    FAIL(compiled.error().message());
  }
  auto result = compiled.value()->evaluate(values);
  if (!result) {
    FAIL(result.error().message());
  }
  return result.value();
}

auto derivative_of(const std::string& text, const std::string& symbol, const SymbolValues& values) -> double {
  SymbolicBackend backend;
  auto compiled = backend.compile(text);
  REQUIRE(compiled.has_value());
  auto derivative = compiled.value()->derivative(symbol);
  REQUIRE(derivative.has_value());
  auto result = derivative.value()->evaluate(values);
  REQUIRE(result.has_value());
  return result.value();
}

} // namespace

TEST_CASE("Operator precedence and associativity", "[Expression]") {
  SymbolicBackend symbolic;
  NumericBackend numeric;

  for (const ExpressionBackend* backend : {static_cast<const ExpressionBackend*>(&symbolic),
                                           static_cast<const ExpressionBackend*>(&numeric)}) {
    CAPTURE(std::string(backend_name(backend->kind())));
    CHECK(value_of(*backend, "1 + 2*3") == Approx(7.0));
    CHECK(value_of(*backend, "(1 + 2)*3") == Approx(9.0));
    CHECK(value_of(*backend, "2^3^2") == Approx(512.0));
    CHECK(value_of(*backend, "2**3") == Approx(8.0));
    CHECK(value_of(*backend, "-2^2") == Approx(-4.0));
    CHECK(value_of(*backend, "2^-1") == Approx(0.5));
    CHECK(value_of(*backend, "8/4/2") == Approx(1.0));
    CHECK(value_of(*backend, "10 - 4 - 3") == Approx(3.0));
    CHECK(value_of(*backend, "1.5e2 + .5") == Approx(150.5));
    CHECK(value_of(*backend, "-k*A*B^2", {{"k", 0.5}, {"A", 2.0}, {"B", 3.0}}) == Approx(-9.0));
  }
}

TEST_CASE("Built-in functions", "[Expression]") {
  NumericBackend backend;

  CHECK(value_of(backend, "step(0)") == 0.0);
  CHECK(value_of(backend, "step(-2)") == 0.0);
  CHECK(value_of(backend, "step(1e-9)") == 1.0);
  CHECK(value_of(backend, "sgn(0)") == 0.0);
  CHECK(value_of(backend, "sgn(-3)") == -1.0);
  CHECK(value_of(backend, "abs(-3)") == 3.0);
  CHECK(value_of(backend, "log10(1000)") == Approx(3.0));
  CHECK(value_of(backend, "log(exp(2))") == Approx(2.0));
  CHECK(value_of(backend, "cot(0.7)") == Approx(1.0 / std::tan(0.7)));
  CHECK(value_of(backend, "acot(2)") == Approx(std::atan(0.5)));
  CHECK(value_of(backend, "coth(0.3)") == Approx(1.0 / std::tanh(0.3)));

  SECTION("Lower, upper and capitalized spellings") {
    CHECK(value_of(backend, "EXP(0) + Exp(0) + exp(0)") == Approx(3.0));
    CHECK(find_function("Log10") != nullptr);
    CHECK(find_function("lOG") == nullptr);
  }
}

TEST_CASE("Malformed expressions are rejected", "[Expression]") {
  SymbolicBackend backend;

  for (const char* text : {"", "   ", "2 A", "2(A)", "k(A)", "(A", "A)", "A +", "log", "log(A, B)", "A $ B",
                           "sin()", "eXp(1)", "3 4"}) {
    CAPTURE(text);
    auto compiled = backend.compile(text);
    CHECK_FALSE(compiled.has_value());
  }

  SECTION("Errors name the column") {
    auto compiled = parse("A + 2 B");
    REQUIRE_FALSE(compiled.has_value());
    CHECK_THAT(compiled.error().message(), Catch::Contains("implicit multiplication"));
    CHECK_THAT(compiled.error().message(), Catch::Contains("column 7"));
    CHECK(compiled.error().expression() == "A + 2 B");
  }
}

TEST_CASE("Symbolic expressions", "[Expression]") {
  SymbolicBackend backend;

  SECTION("Free symbols in order of first appearance") {
    auto compiled = backend.compile("k*A + B/A - sqrt(C)");
    REQUIRE(compiled.has_value());
    CHECK(compiled.value()->free_symbols() == std::vector<std::string>{"k", "A", "B", "C"});
  }

  SECTION("Derivatives") {
    const SymbolValues values{{"k", 0.5}, {"A", 2.0}, {"B", 3.0}, {"x", 4.0}};
    CHECK(derivative_of("-k*A*B^2", "B", values) == Approx(-6.0));
    CHECK(derivative_of("-k*A*B^2", "A", values) == Approx(-4.5));
    CHECK(derivative_of("-k*A*B^2", "x", values) == Approx(0.0));
    CHECK(derivative_of("sqrt(x)", "x", values) == Approx(0.25));
    CHECK(derivative_of("exp(2*x)", "x", values) == Approx(2.0 * std::exp(8.0)));
    CHECK(derivative_of("x^x", "x", values) == Approx(std::pow(4.0, 4.0) * (std::log(4.0) + 1.0)));
    CHECK(derivative_of("A/x", "x", values) == Approx(-2.0 / 16.0));
    CHECK(derivative_of("log10(x)", "x", values) == Approx(1.0 / (4.0 * std::log(10.0))));
  }

  SECTION("Simplification folds constants and identities") {
    auto parsed = parse("0*A + 1*B + (2 + 3)");
    REQUIRE(parsed.has_value());
    CHECK(symbolic::to_string(symbolic::simplify(parsed.value())) == "B + 5");
  }

  SECTION("Printing keeps the meaning") {
    for (const char* text : {"-(A + B)*C", "A - (B - C)", "A/(B*C)", "(A^B)^C", "A^-B", "-A^2", "exp(-A)/2"}) {
      CAPTURE(text);
      auto parsed = parse(text);
      REQUIRE(parsed.has_value());
      const std::string printed = symbolic::to_string(parsed.value());
      const SymbolValues values{{"A", 1.3}, {"B", 0.7}, {"C", 2.1}};
      CHECK(value_of(backend, printed, values) == Approx(value_of(backend, text, values)));
    }
  }

  SECTION("Substitution") {
    auto parsed = parse("k*A");
    REQUIRE(parsed.has_value());
    SymbolicExpression expression("k*A", parsed.value());
    auto replacement = parse("B + 1");
    REQUIRE(replacement.has_value());
    const auto substituted = expression.substitute({{"A", replacement.value()}});
    CHECK(substituted.free_symbols() == std::vector<std::string>{"k", "B"});
    auto result = substituted.evaluate({{"k", 2.0}, {"B", 3.0}});
    REQUIRE(result.has_value());
    CHECK(result.value() == Approx(8.0));
  }

  SECTION("Unbound symbols fail at evaluation") {
    auto compiled = backend.compile("A + 1");
    REQUIRE(compiled.has_value());
    CHECK_FALSE(compiled.value()->evaluate({}).has_value());
  }
}

TEST_CASE("The numeric backend evaluates but does not differentiate", "[Expression]") {
  NumericBackend backend;
  CHECK_FALSE(backend.supports_derivatives());

  auto compiled = backend.compile("k*A^2");
  REQUIRE(compiled.has_value());
  CHECK(compiled.value()->free_symbols() == std::vector<std::string>{"k", "A"});

  auto derivative = compiled.value()->derivative("A");
  REQUIRE_FALSE(derivative.has_value());
  CHECK_THAT(derivative.error().message(), Catch::Contains("symbolic backend"));

  CHECK_FALSE(compiled.value()->evaluate({{"k", 1.0}}).has_value());
}

TEST_CASE("Backend selection", "[Expression]") {
  CHECK(parse_backend_kind("symbolic").value() == BackendKind::Symbolic);
  CHECK(parse_backend_kind("NUMERIC").value() == BackendKind::Numeric);
  CHECK_FALSE(parse_backend_kind("jit").has_value());
  CHECK(create_backend(BackendKind::Symbolic)->supports_derivatives());
}

TEST_CASE("Expressions compile against the model symbol table", "[ExpressionCompiler]") {
  msx::model::ReactionModel model;
  model.add_bulk_species("A", "mg");
  model.add_constant("k", 0.1);
  model.add_other_term("rate", "k*A*U");

  SymbolicBackend backend;
  ExpressionCompiler compiler(model, backend);

  SECTION("Known symbols") {
    CHECK(compiler.is_known_symbol("A"));
    CHECK(compiler.is_known_symbol("rate"));
    CHECK(compiler.is_known_symbol("Re"));
    CHECK_FALSE(compiler.is_known_symbol("log"));
    CHECK_FALSE(compiler.is_known_symbol("Z"));
  }

  SECTION("Unresolved symbols") {
    auto compiled = compiler.compile("-k*Z");
    REQUIRE_FALSE(compiled.has_value());
    CHECK_THAT(compiled.error().message(), Catch::Contains("'Z'"));
  }

  SECTION("Reaction errors name the reaction") {
    const auto& reaction = model.add_pipe_reaction("A", msx::model::DynamicsType::Rate, "-k*Z");
    auto compiled = compiler.compile_reaction(reaction);
    REQUIRE_FALSE(compiled.has_value());
    CHECK_THAT(compiled.error().message(), Catch::Contains("pipe reaction of 'A'"));
    CHECK_FALSE(compiler.compile_all().has_value());
  }

  SECTION("Compiled reactions are cached until the model changes") {
    const auto& reaction = model.add_pipe_reaction("A", msx::model::DynamicsType::Rate, "-rate");
    auto first = compiler.compile_reaction(reaction);
    auto second = compiler.compile_reaction(reaction);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first.value() == second.value());

    model.add_constant("k2", 1.0);
    auto third = compiler.compile_reaction(reaction);
    REQUIRE(third.has_value());
    CHECK(third.value() != first.value());

    compiler.clear_cache();
    auto fourth = compiler.compile_reaction(reaction);
    REQUIRE(fourth.has_value());
    CHECK(fourth.value() != third.value());
  }

  SECTION("Removing a variable invalidates expressions that use it") {
    const auto& reaction = model.add_pipe_reaction("A", msx::model::DynamicsType::Rate, "-k*A");
    REQUIRE(compiler.compile_reaction(reaction).has_value());
    model.remove_variable("k");
    CHECK_FALSE(compiler.compile_reaction(reaction).has_value());
  }
}

TEST_CASE("Terms are ordered by dependency", "[ExpressionCompiler]") {
  msx::model::ReactionModel model;
  model.add_bulk_species("A", "mg");
  model.add_other_term("t3", "t2 + t1");
  model.add_other_term("t1", "A*2");
  model.add_other_term("t2", "t1^2");

  SymbolicBackend backend;
  ExpressionCompiler compiler(model, backend);

  auto order = compiler.term_order();
  REQUIRE(order.has_value());
  CHECK(order.value() == std::vector<std::string>{"t1", "t2", "t3"});

  SymbolValues values{{"A", 1.5}};
  REQUIRE(compiler.evaluate_terms(values).has_value());
  CHECK(values.at("t1") == Approx(3.0));
  CHECK(values.at("t3") == Approx(12.0));

  SECTION("Cycles are reported") {
    model.add_other_term("u1", "u2 + 1");
    model.add_other_term("u2", "u1*A");
    auto cyclic = compiler.term_order();
    REQUIRE_FALSE(cyclic.has_value());
    CHECK_THAT(cyclic.error().message(), Catch::Contains("u1 -> u2 -> u1"));
  }
}
