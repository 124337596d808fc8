#include "msx/expression/ast.hpp"

namespace msx::expression {

auto make_number(double value) -> NodePtr {
  auto node = std::make_shared<Node>();
  node->kind = NodeKind::Number;
  node->value = value;
  return node;
}

auto make_symbol(std::string name) -> NodePtr {
  auto node = std::make_shared<Node>();
  node->kind = NodeKind::Symbol;
  node->name = std::move(name);
  return node;
}

auto make_unary(NodeKind kind, NodePtr operand) -> NodePtr {
  auto node = std::make_shared<Node>();
  node->kind = kind;
  node->left = std::move(operand);
  return node;
}

auto make_binary(NodeKind kind, NodePtr left, NodePtr right) -> NodePtr {
  auto node = std::make_shared<Node>();
  node->kind = kind;
  node->left = std::move(left);
  node->right = std::move(right);
  return node;
}

auto make_call(const BuiltinFunction& function, std::string spelling, NodePtr argument) -> NodePtr {
  auto node = std::make_shared<Node>();
  node->kind = NodeKind::Call;
  node->function = &function;
  node->name = std::move(spelling);
  node->left = std::move(argument);
  return node;
}

auto is_number(const NodePtr& node, double value) -> bool {
  return node && node->kind == NodeKind::Number && node->value == value;
}

} // namespace msx::expression
