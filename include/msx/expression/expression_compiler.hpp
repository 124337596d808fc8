#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../model/reaction_model.hpp"
#include "expression_backend.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace msx::expression {

using CompiledPtr = std::shared_ptr<const CompiledExpression>;

/**
 * @brief Compiles the expressions of a model against its symbol table
 *
 * A symbol resolves when it names a species, constant, parameter or term of
 * the model, or a hydraulic variable. Compiled reactions and terms are cached;
 * an entry is reused only while both the model revision and the expression
 * text are unchanged. The model and the backend must outlive the compiler.
 */
class ExpressionCompiler {
private:
  struct CacheEntry {
    std::uint64_t revision = 0;
    std::string expression;
    CompiledPtr compiled;
  };

  const model::ReactionModel& model_;
  const ExpressionBackend& backend_;

  mutable std::map<std::pair<model::LocationType, std::string>, CacheEntry> reaction_cache_;
  mutable std::map<std::string, CacheEntry> term_cache_;

  [[nodiscard]] auto cached(CacheEntry& entry, std::string_view expression) const
      -> std::expected<CompiledPtr, core::ExpressionCompileError>;

public:
  ExpressionCompiler(const model::ReactionModel& model, const ExpressionBackend& backend)
      : model_(model), backend_(backend) {}

  [[nodiscard]] auto backend() const noexcept -> const ExpressionBackend& { return backend_; }
  [[nodiscard]] auto reaction_model() const noexcept -> const model::ReactionModel& { return model_; }

  [[nodiscard]] auto is_known_symbol(std::string_view name) const -> bool;

  // Parses, compiles and resolves every free symbol. Not cached.
  [[nodiscard]] auto compile(std::string_view expression) const
      -> std::expected<CompiledPtr, core::ExpressionCompileError>;

  [[nodiscard]] auto compile_reaction(const model::Reaction& reaction) const
      -> std::expected<CompiledPtr, core::ExpressionCompileError>;

  [[nodiscard]] auto compile_term(const model::OtherTerm& term) const
      -> std::expected<CompiledPtr, core::ExpressionCompileError>;

  // Terms ordered so that every term comes after the terms it reads. Fails on cycles.
  [[nodiscard]] auto term_order() const -> std::expected<std::vector<std::string>, core::ExpressionCompileError>;

  // Compiles every term and every reaction of the model
  [[nodiscard]] auto compile_all() const -> std::expected<void, core::ExpressionCompileError>;

  // Evaluates all terms in dependency order, adding their values to `values`
  [[nodiscard]] auto evaluate_terms(core::SymbolValues& values) const
      -> std::expected<void, core::ExpressionCompileError>;

  // Drops every cached compilation
  void clear_cache() const;
};

} // namespace msx::expression
