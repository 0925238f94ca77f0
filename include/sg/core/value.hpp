#pragma once
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "sg/core/graph.hpp"

namespace sg {

class Operand;

// Handle to one scalar node. Copies share the node; the owning Graph lives as
// long as the longest-lived handle (or the thread's current-graph slot).
class Value {
public:
  Value() = default;                                            // empty handle
  explicit Value(double value, std::string label = {});         // leaf on current_graph()
  Value(std::shared_ptr<Graph> graph, NodeId id);               // wrap existing node

  static Value leaf(const std::shared_ptr<Graph>& graph, double value, std::string label = {});

  bool defined() const { return static_cast<bool>(g_); }
  bool valid() const { return g_ && g_->contains(id_, serial_); }   // defined and not rewound

  double value() const;
  double grad() const;
  const std::string& label() const;
  Op op() const;
  double exponent() const;
  std::vector<Value> operands() const;
  bool is_leaf() const;

  NodeId id() const { return id_; }
  const std::shared_ptr<Graph>& graph() const { return g_; }
  bool same_node(const Value& other) const;

  Value& set_label(std::string label);
  void set_value(double value);     // leaves only
  void zero_grad();                 // this node only

  Value relu() const;
  Value pow(const Operand& exponent) const;

  // Reverse-mode pass from this node; returns the evaluation order
  // (operands before consumers).
  std::vector<Value> backward() const;

private:
  const Node& node_() const;
  Node& node_();

  std::shared_ptr<Graph> g_;
  NodeId id_ = 0;
  std::uint64_t serial_ = 0;
};

// Either a node or a bare number. Every op takes Operands so a literal works
// on either side; the literal becomes a leaf on the other operand's graph.
class Operand {
public:
  Operand(const Value& v) : node_(v), is_node_(true) {}

  template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
  Operand(T x) : literal_(static_cast<double>(x)) {}

  bool is_node() const { return is_node_; }
  const Value& node() const { return node_; }
  double literal() const { return literal_; }

private:
  Value node_;
  double literal_ = 0.0;
  bool is_node_ = false;
};

// "+", "*", "**<p>", "ReLU", or "" for a leaf.
std::string op_symbol(const Value& v);

std::ostream& operator<<(std::ostream& os, const Value& v);

} // namespace sg
