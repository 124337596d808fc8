#include "msx/expression/numeric_backend.hpp"
#include "msx/core/expected_utils.hpp"
#include "msx/expression/parser.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <iterator>

namespace msx::expression {

NumericExpression::NumericExpression(std::string source, const NodePtr& root) : source_(std::move(source)) {
  emit(root, 1);
}

void NumericExpression::emit(const NodePtr& node, std::size_t depth) {
  max_depth_ = std::max(max_depth_, depth);

  switch (node->kind) {
  case NodeKind::Number:
    program_.push_back(Instruction{OpCode::PushConstant, node->value});
    return;

  case NodeKind::Symbol: {
    auto it = std::ranges::find(symbols_, node->name);
    if (it == symbols_.end()) {
      symbols_.push_back(node->name);
      it = std::prev(symbols_.end());
    }
    Instruction instruction{OpCode::PushSymbol};
    instruction.symbol = static_cast<std::size_t>(std::distance(symbols_.begin(), it));
    program_.push_back(instruction);
    return;
  }

  case NodeKind::Negate:
    emit(node->left, depth);
    program_.push_back(Instruction{OpCode::Negate});
    return;

  case NodeKind::Call: {
    emit(node->left, depth);
    Instruction instruction{OpCode::Call};
    instruction.function = node->function->evaluate;
    program_.push_back(instruction);
    return;
  }

  case NodeKind::Add:
  case NodeKind::Subtract:
  case NodeKind::Multiply:
  case NodeKind::Divide:
  case NodeKind::Power:
    break;
  }

  emit(node->left, depth);
  emit(node->right, depth + 1);

  OpCode op = OpCode::Add;
  switch (node->kind) {
  case NodeKind::Subtract:
    op = OpCode::Subtract;
    break;
  case NodeKind::Multiply:
    op = OpCode::Multiply;
    break;
  case NodeKind::Divide:
    op = OpCode::Divide;
    break;
  case NodeKind::Power:
    op = OpCode::Power;
    break;
  default:
    break;
  }
  program_.push_back(Instruction{op});
}

auto NumericExpression::evaluate(const core::SymbolValues& values) const
    -> std::expected<double, core::ExpressionCompileError> {
  std::vector<double> bound(symbols_.size());
  for (std::size_t i = 0; i < symbols_.size(); ++i) {
    auto it = values.find(symbols_[i]);
    if (it == values.end()) {
      return std::unexpected(core::ExpressionCompileError(
          fmt::format("no value bound to symbol '{}'", symbols_[i]), source_));
    }
    bound[i] = it->second;
  }

  std::vector<double> stack;
  stack.reserve(max_depth_);

  for (const auto& instruction : program_) {
    switch (instruction.op) {
    case OpCode::PushConstant:
      stack.push_back(instruction.constant);
      break;
    case OpCode::PushSymbol:
      stack.push_back(bound[instruction.symbol]);
      break;
    case OpCode::Negate:
      stack.back() = -stack.back();
      break;
    case OpCode::Call:
      stack.back() = instruction.function(stack.back());
      break;
    default: {
      const double right = stack.back();
      stack.pop_back();
      double& left = stack.back();
      switch (instruction.op) {
      case OpCode::Add:
        left += right;
        break;
      case OpCode::Subtract:
        left -= right;
        break;
      case OpCode::Multiply:
        left *= right;
        break;
      case OpCode::Divide:
        left /= right;
        break;
      case OpCode::Power:
        left = std::pow(left, right);
        break;
      default:
        break;
      }
      break;
    }
    }
  }
  return stack.back();
}

auto NumericExpression::derivative(std::string_view symbol) const
    -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> {
  return std::unexpected(core::ExpressionCompileError(
      fmt::format("derivative with respect to '{}' requires the symbolic backend", symbol), source_));
}

auto NumericBackend::compile(std::string_view expression) const
    -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> {
  NodePtr root;
  MSX_TRY_ASSIGN(root, parse(expression));
  return std::make_unique<NumericExpression>(std::string(expression), root);
}

} // namespace msx::expression
