#pragma once
#include "builtin_functions.hpp"
#include <memory>
#include <string>

namespace msx::expression {

enum class NodeKind { Number, Symbol, Negate, Add, Subtract, Multiply, Divide, Power, Call };

struct Node;

// Trees are immutable once built, so subtrees can be shared freely
using NodePtr = std::shared_ptr<const Node>;

struct Node {
  NodeKind kind = NodeKind::Number;
  double value = 0.0;                         // Number
  std::string name;                           // Symbol, or the spelling of a Call
  const BuiltinFunction* function = nullptr;  // Call
  NodePtr left;                               // operand of unary nodes and calls
  NodePtr right;
};

[[nodiscard]] auto make_number(double value) -> NodePtr;
[[nodiscard]] auto make_symbol(std::string name) -> NodePtr;
[[nodiscard]] auto make_unary(NodeKind kind, NodePtr operand) -> NodePtr;
[[nodiscard]] auto make_binary(NodeKind kind, NodePtr left, NodePtr right) -> NodePtr;
[[nodiscard]] auto make_call(const BuiltinFunction& function, std::string spelling, NodePtr argument) -> NodePtr;

[[nodiscard]] auto is_number(const NodePtr& node, double value) -> bool;

} // namespace msx::expression
