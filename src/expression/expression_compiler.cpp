#include "msx/expression/expression_compiler.hpp"
#include "msx/core/expected_utils.hpp"
#include "msx/expression/builtin_functions.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <unordered_map>

namespace msx::expression {

auto ExpressionCompiler::is_known_symbol(std::string_view name) const -> bool {
  if (is_hydraulic_variable(name)) {
    return true;
  }
  if (!model_.has_variable(name)) {
    return false;
  }
  return model::variable_type(model_.get_variable(name)) != model::VariableType::Reserved;
}

auto ExpressionCompiler::compile(std::string_view expression) const
    -> std::expected<CompiledPtr, core::ExpressionCompileError> {
  std::unique_ptr<CompiledExpression> compiled;
  MSX_TRY_ASSIGN(compiled, backend_.compile(expression));

  for (const auto& symbol : compiled->free_symbols()) {
    if (!is_known_symbol(symbol)) {
      return std::unexpected(
          core::ExpressionCompileError(fmt::format("unresolved symbol '{}'", symbol), std::string(expression)));
    }
  }
  return CompiledPtr(std::move(compiled));
}

auto ExpressionCompiler::cached(CacheEntry& entry, std::string_view expression) const
    -> std::expected<CompiledPtr, core::ExpressionCompileError> {
  if (entry.compiled && entry.revision == model_.revision() && entry.expression == expression) {
    return entry.compiled;
  }
  CompiledPtr compiled;
  MSX_TRY_ASSIGN(compiled, compile(expression));
  entry = CacheEntry{model_.revision(), std::string(expression), compiled};
  return compiled;
}

auto ExpressionCompiler::compile_reaction(const model::Reaction& reaction) const
    -> std::expected<CompiledPtr, core::ExpressionCompileError> {
  auto& entry = reaction_cache_[{reaction.location(), reaction.species()}];
  auto result = cached(entry, reaction.expression());
  if (!result) {
    return std::unexpected(core::expected_utils::with_context(
        result.error(),
        fmt::format("{} reaction of '{}'", core::enum_key(reaction.location()), reaction.species())));
  }
  return result;
}

auto ExpressionCompiler::compile_term(const model::OtherTerm& term) const
    -> std::expected<CompiledPtr, core::ExpressionCompileError> {
  auto result = cached(term_cache_[term.name()], term.expression());
  if (!result) {
    return std::unexpected(core::expected_utils::with_context(result.error(), fmt::format("term '{}'", term.name())));
  }
  return result;
}

auto ExpressionCompiler::term_order() const -> std::expected<std::vector<std::string>, core::ExpressionCompileError> {
  enum class Mark { Unvisited, Visiting, Done };

  const auto names = model_.term_names();
  std::unordered_map<std::string, Mark> marks;
  std::unordered_map<std::string, std::vector<std::string>> depends_on;

  for (const auto& name : names) {
    marks[name] = Mark::Unvisited;
    const auto& term = std::get<model::OtherTerm>(model_.get_variable(name));
    CompiledPtr compiled;
    MSX_TRY_ASSIGN(compiled, compile_term(term));
    auto& deps = depends_on[name];
    for (const auto& symbol : compiled->free_symbols()) {
      if (std::ranges::find(names, symbol) != names.end()) {
        deps.push_back(symbol);
      }
    }
  }

  std::vector<std::string> order;
  std::vector<std::string> path;

  // Depth-first, emitting a term once all of its dependencies are emitted
  auto visit = [&](auto& self, const std::string& name) -> std::expected<void, core::ExpressionCompileError> {
    Mark& mark = marks[name];
    if (mark == Mark::Done) {
      return {};
    }
    if (mark == Mark::Visiting) {
      std::string cycle;
      auto start = std::ranges::find(path, name);
      for (auto it = start; it != path.end(); ++it) {
        cycle += *it + " -> ";
      }
      cycle += name;
      return std::unexpected(core::ExpressionCompileError(fmt::format("cyclic term definitions: {}", cycle)));
    }
    mark = Mark::Visiting;
    path.push_back(name);
    for (const auto& dep : depends_on[name]) {
      MSX_TRY_VOID(self(self, dep));
    }
    path.pop_back();
    marks[name] = Mark::Done;
    order.push_back(name);
    return {};
  };

  for (const auto& name : names) {
    MSX_TRY_VOID(visit(visit, name));
  }
  return order;
}

auto ExpressionCompiler::compile_all() const -> std::expected<void, core::ExpressionCompileError> {
  std::vector<std::string> order;
  MSX_TRY_ASSIGN(order, term_order());
  for (const auto& reaction : model_.reactions()) {
    CompiledPtr compiled;
    MSX_TRY_ASSIGN(compiled, compile_reaction(reaction));
  }
  return {};
}

auto ExpressionCompiler::evaluate_terms(core::SymbolValues& values) const
    -> std::expected<void, core::ExpressionCompileError> {
  std::vector<std::string> order;
  MSX_TRY_ASSIGN(order, term_order());
  for (const auto& name : order) {
    const auto& term = std::get<model::OtherTerm>(model_.get_variable(name));
    CompiledPtr compiled;
    MSX_TRY_ASSIGN(compiled, compile_term(term));
    double value = 0.0;
    MSX_TRY_ASSIGN(value, compiled->evaluate(values));
    values[name] = value;
  }
  return {};
}

void ExpressionCompiler::clear_cache() const {
  reaction_cache_.clear();
  term_cache_.clear();
}

} // namespace msx::expression
