#include "msx/expression/symbolic_backend.hpp"
#include "msx/core/expected_utils.hpp"
#include "msx/expression/parser.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numbers>

namespace msx::expression {

namespace symbolic {

namespace {

auto num(double value) -> NodePtr { return make_number(value); }
auto neg(NodePtr a) -> NodePtr { return make_unary(NodeKind::Negate, std::move(a)); }
auto add(NodePtr a, NodePtr b) -> NodePtr { return make_binary(NodeKind::Add, std::move(a), std::move(b)); }
auto sub(NodePtr a, NodePtr b) -> NodePtr { return make_binary(NodeKind::Subtract, std::move(a), std::move(b)); }
auto mul(NodePtr a, NodePtr b) -> NodePtr { return make_binary(NodeKind::Multiply, std::move(a), std::move(b)); }
auto quot(NodePtr a, NodePtr b) -> NodePtr { return make_binary(NodeKind::Divide, std::move(a), std::move(b)); }
auto raise(NodePtr a, NodePtr b) -> NodePtr { return make_binary(NodeKind::Power, std::move(a), std::move(b)); }

auto call(std::string_view name, NodePtr argument) -> NodePtr {
  return make_call(*find_function(name), std::string(name), std::move(argument));
}

auto apply(NodeKind kind, double a, double b) -> double {
  switch (kind) {
  case NodeKind::Add:
    return a + b;
  case NodeKind::Subtract:
    return a - b;
  case NodeKind::Multiply:
    return a * b;
  case NodeKind::Divide:
    return a / b;
  case NodeKind::Power:
    return std::pow(a, b);
  default:
    return 0.0;
  }
}

void collect(const NodePtr& node, std::vector<std::string>& out) {
  if (!node) {
    return;
  }
  if (node->kind == NodeKind::Symbol) {
    if (std::ranges::find(out, node->name) == out.end()) {
      out.push_back(node->name);
    }
    return;
  }
  collect(node->left, out);
  collect(node->right, out);
}

// Derivative of f(u) with respect to u
auto outer_derivative(const Node& node) -> NodePtr {
  const NodePtr& u = node.left;
  const std::string_view f = node.function->name;

  if (f == "abs") {
    return call("sgn", u);
  }
  if (f == "sgn" || f == "step") {
    return num(0.0);
  }
  if (f == "sqrt") {
    return quot(num(1.0), mul(num(2.0), call("sqrt", u)));
  }
  if (f == "log") {
    return quot(num(1.0), u);
  }
  if (f == "log10") {
    return quot(num(1.0), mul(u, num(std::numbers::ln10)));
  }
  if (f == "exp") {
    return call("exp", u);
  }
  if (f == "sin") {
    return call("cos", u);
  }
  if (f == "cos") {
    return neg(call("sin", u));
  }
  if (f == "tan") {
    return add(num(1.0), raise(call("tan", u), num(2.0)));
  }
  if (f == "cot") {
    return neg(add(num(1.0), raise(call("cot", u), num(2.0))));
  }
  if (f == "asin") {
    return quot(num(1.0), call("sqrt", sub(num(1.0), raise(u, num(2.0)))));
  }
  if (f == "acos") {
    return neg(quot(num(1.0), call("sqrt", sub(num(1.0), raise(u, num(2.0))))));
  }
  if (f == "atan") {
    return quot(num(1.0), add(num(1.0), raise(u, num(2.0))));
  }
  if (f == "acot") {
    return neg(quot(num(1.0), add(num(1.0), raise(u, num(2.0)))));
  }
  if (f == "sinh") {
    return call("cosh", u);
  }
  if (f == "cosh") {
    return call("sinh", u);
  }
  if (f == "tanh") {
    return sub(num(1.0), raise(call("tanh", u), num(2.0)));
  }
  // coth
  return sub(num(1.0), raise(call("coth", u), num(2.0)));
}

auto differentiate_raw(const NodePtr& node, std::string_view symbol) -> NodePtr {
  switch (node->kind) {
  case NodeKind::Number:
    return num(0.0);
  case NodeKind::Symbol:
    return num(node->name == symbol ? 1.0 : 0.0);
  case NodeKind::Negate:
    return neg(differentiate_raw(node->left, symbol));
  case NodeKind::Add:
    return add(differentiate_raw(node->left, symbol), differentiate_raw(node->right, symbol));
  case NodeKind::Subtract:
    return sub(differentiate_raw(node->left, symbol), differentiate_raw(node->right, symbol));
  case NodeKind::Multiply:
    return add(mul(differentiate_raw(node->left, symbol), node->right),
               mul(node->left, differentiate_raw(node->right, symbol)));
  case NodeKind::Divide:
    return quot(sub(mul(differentiate_raw(node->left, symbol), node->right),
                   mul(node->left, differentiate_raw(node->right, symbol))),
               raise(node->right, num(2.0)));
  case NodeKind::Power: {
    const NodePtr& u = node->left;
    const NodePtr& v = node->right;
    const NodePtr dv = simplify(differentiate_raw(v, symbol));
    const NodePtr du = differentiate_raw(u, symbol);
    if (is_number(dv, 0.0)) {
      // d(u^n) = n*u^(n-1)*du
      return mul(mul(v, raise(u, sub(v, num(1.0)))), du);
    }
    // d(u^v) = u^v * (dv*log(u) + v*du/u)
    return mul(node, add(mul(dv, call("log", u)), quot(mul(v, du), u)));
  }
  case NodeKind::Call:
    return mul(outer_derivative(*node), differentiate_raw(node->left, symbol));
  }
  return num(0.0);
}

auto precedence(const Node& node) -> int {
  switch (node.kind) {
  case NodeKind::Add:
  case NodeKind::Subtract:
    return 1;
  case NodeKind::Multiply:
  case NodeKind::Divide:
    return 2;
  case NodeKind::Negate:
    return 3;
  case NodeKind::Power:
    return 4;
  case NodeKind::Number:
    return node.value < 0.0 ? 3 : 5;
  default:
    return 5;
  }
}

auto wrap(const NodePtr& node, bool parenthesize) -> std::string {
  std::string text = to_string(node);
  return parenthesize ? fmt::format("({})", text) : text;
}

} // namespace

auto evaluate(const NodePtr& node, const core::SymbolValues& values)
    -> std::expected<double, core::ExpressionCompileError> {
  switch (node->kind) {
  case NodeKind::Number:
    return node->value;

  case NodeKind::Symbol: {
    auto it = values.find(node->name);
    if (it == values.end()) {
      return std::unexpected(
          core::ExpressionCompileError(fmt::format("no value bound to symbol '{}'", node->name)));
    }
    return it->second;
  }

  case NodeKind::Negate: {
    double operand = 0.0;
    MSX_TRY_ASSIGN(operand, evaluate(node->left, values));
    return -operand;
  }

  case NodeKind::Call: {
    double argument = 0.0;
    MSX_TRY_ASSIGN(argument, evaluate(node->left, values));
    return node->function->evaluate(argument);
  }

  default: {
    double left = 0.0;
    double right = 0.0;
    MSX_TRY_ASSIGN(left, evaluate(node->left, values));
    MSX_TRY_ASSIGN(right, evaluate(node->right, values));
    return apply(node->kind, left, right);
  }
  }
}

auto collect_symbols(const NodePtr& node) -> std::vector<std::string> {
  std::vector<std::string> symbols;
  collect(node, symbols);
  return symbols;
}

auto substitute(const NodePtr& node, const std::unordered_map<std::string, NodePtr>& replacements) -> NodePtr {
  switch (node->kind) {
  case NodeKind::Number:
    return node;
  case NodeKind::Symbol: {
    auto it = replacements.find(node->name);
    return it == replacements.end() ? node : it->second;
  }
  case NodeKind::Negate:
    return make_unary(NodeKind::Negate, substitute(node->left, replacements));
  case NodeKind::Call:
    return make_call(*node->function, node->name, substitute(node->left, replacements));
  default:
    return make_binary(node->kind, substitute(node->left, replacements), substitute(node->right, replacements));
  }
}

auto simplify(const NodePtr& node) -> NodePtr {
  switch (node->kind) {
  case NodeKind::Number:
  case NodeKind::Symbol:
    return node;

  case NodeKind::Negate: {
    NodePtr operand = simplify(node->left);
    if (operand->kind == NodeKind::Number) {
      return num(-operand->value);
    }
    if (operand->kind == NodeKind::Negate) {
      return operand->left;
    }
    return neg(std::move(operand));
  }

  case NodeKind::Call: {
    NodePtr argument = simplify(node->left);
    if (argument->kind == NodeKind::Number) {
      const double value = node->function->evaluate(argument->value);
      if (std::isfinite(value)) {
        return num(value);
      }
    }
    return make_call(*node->function, node->name, std::move(argument));
  }

  default:
    break;
  }

  NodePtr a = simplify(node->left);
  NodePtr b = simplify(node->right);

  if (a->kind == NodeKind::Number && b->kind == NodeKind::Number) {
    const double value = apply(node->kind, a->value, b->value);
    if (std::isfinite(value)) {
      return num(value);
    }
  }

  switch (node->kind) {
  case NodeKind::Add:
    if (is_number(a, 0.0)) {
      return b;
    }
    if (is_number(b, 0.0)) {
      return a;
    }
    break;
  case NodeKind::Subtract:
    if (is_number(b, 0.0)) {
      return a;
    }
    if (is_number(a, 0.0)) {
      return simplify(neg(b));
    }
    break;
  case NodeKind::Multiply:
    if (is_number(a, 0.0) || is_number(b, 0.0)) {
      return num(0.0);
    }
    if (is_number(a, 1.0)) {
      return b;
    }
    if (is_number(b, 1.0)) {
      return a;
    }
    if (is_number(a, -1.0)) {
      return simplify(neg(b));
    }
    if (is_number(b, -1.0)) {
      return simplify(neg(a));
    }
    break;
  case NodeKind::Divide:
    if (is_number(b, 1.0)) {
      return a;
    }
    if (is_number(a, 0.0) && !is_number(b, 0.0)) {
      return num(0.0);
    }
    break;
  case NodeKind::Power:
    if (is_number(b, 1.0)) {
      return a;
    }
    if (is_number(b, 0.0) || is_number(a, 1.0)) {
      return num(1.0);
    }
    break;
  default:
    break;
  }
  return make_binary(node->kind, std::move(a), std::move(b));
}

auto differentiate(const NodePtr& node, std::string_view symbol) -> NodePtr {
  return simplify(differentiate_raw(node, symbol));
}

auto to_string(const NodePtr& node) -> std::string {
  switch (node->kind) {
  case NodeKind::Number:
    return fmt::format("{}", node->value);
  case NodeKind::Symbol:
    return node->name;
  case NodeKind::Negate:
    return fmt::format("-{}", wrap(node->left, precedence(*node->left) < 4));
  case NodeKind::Call:
    return fmt::format("{}({})", node->name, to_string(node->left));
  default:
    break;
  }

  const int own = precedence(*node);
  const int left = precedence(*node->left);
  const int right = precedence(*node->right);

  std::string_view op;
  bool left_parens = left < own;
  bool right_parens = right < own;
  switch (node->kind) {
  case NodeKind::Add:
    op = " + ";
    break;
  case NodeKind::Subtract:
    op = " - ";
    right_parens = right <= own;
    break;
  case NodeKind::Multiply:
    op = "*";
    break;
  case NodeKind::Divide:
    op = "/";
    right_parens = right <= own;
    break;
  case NodeKind::Power:
    op = "^";
    left_parens = left <= own;
    right_parens = right < 3;
    break;
  default:
    break;
  }
  return fmt::format("{}{}{}", wrap(node->left, left_parens), op, wrap(node->right, right_parens));
}

} // namespace symbolic

SymbolicExpression::SymbolicExpression(std::string source, NodePtr root)
    : source_(std::move(source)), root_(std::move(root)), symbols_(symbolic::collect_symbols(root_)) {}

auto SymbolicExpression::evaluate(const core::SymbolValues& values) const
    -> std::expected<double, core::ExpressionCompileError> {
  auto result = symbolic::evaluate(root_, values);
  if (!result) {
    return std::unexpected(core::expected_utils::with_context(result.error(), fmt::format("evaluating '{}'", source_)));
  }
  return result;
}

auto SymbolicExpression::derivative(std::string_view symbol) const
    -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> {
  NodePtr root = symbolic::differentiate(root_, symbol);
  std::string text = symbolic::to_string(root);
  return std::make_unique<SymbolicExpression>(std::move(text), std::move(root));
}

auto SymbolicExpression::substitute(const std::unordered_map<std::string, NodePtr>& replacements) const
    -> SymbolicExpression {
  NodePtr root = symbolic::substitute(root_, replacements);
  std::string text = symbolic::to_string(root);
  return SymbolicExpression(std::move(text), std::move(root));
}

auto SymbolicExpression::simplified() const -> SymbolicExpression {
  NodePtr root = symbolic::simplify(root_);
  std::string text = symbolic::to_string(root);
  return SymbolicExpression(std::move(text), std::move(root));
}

auto SymbolicBackend::compile(std::string_view expression) const
    -> std::expected<std::unique_ptr<CompiledExpression>, core::ExpressionCompileError> {
  NodePtr root;
  MSX_TRY_ASSIGN(root, parse(expression));
  return std::make_unique<SymbolicExpression>(std::string(expression), std::move(root));
}

} // namespace msx::expression
