#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sg {

// Index of a node inside its Graph. Assigned at construction, never reused
// while the node is alive.
using NodeId = std::uint32_t;

// Which local derivative rule applies to a node.
enum class Op : std::uint8_t { None, Add, Mul, Pow, ReLU };

const char* to_string(Op op);

struct Node {
  double value = 0.0;                    // forward result
  double grad  = 0.0;                    // d(root)/d(this), accumulated
  Op op = Op::None;
  std::uint8_t arity = 0;                // 0 (leaf), 1 or 2
  std::array<NodeId, 2> operands{{0, 0}};
  double exponent = 0.0;                 // Op::Pow only
  std::uint64_t serial = 0;              // distinguishes reuse of an index after rewind()
  std::string label;
};

// Arena owning every node of a computation. Nodes are appended only, and an
// operand always has a smaller index than its consumer, so the graph is a DAG
// by construction.
class Graph {
public:
  Graph();
  Graph(const Graph&)            = delete;
  Graph& operator=(const Graph&) = delete;

  // ---- construction (forward pass) ----
  NodeId leaf(double value, std::string label = {});
  NodeId add(NodeId a, NodeId b);
  NodeId mul(NodeId a, NodeId b);
  NodeId pow(NodeId a, double exponent);
  NodeId relu(NodeId a);

  // ---- access ----
  const Node& node(NodeId id) const;
  Node& node(NodeId id);
  bool contains(NodeId id, std::uint64_t serial) const;
  std::size_t size() const { return nodes_.size(); }
  std::uint64_t id() const { return id_; }

  // ---- arena reuse ----
  // mark() remembers the current size; rewind(m) drops every node appended
  // after it. Handles to dropped nodes become stale.
  std::size_t mark() const { return nodes_.size(); }
  void rewind(std::size_t mark);
  void clear() { rewind(0); }

  // Sets every gradient in the arena to 0.
  void zero_grad();

  // ---- reverse mode ----
  // Post-order DFS from root: every node appears once, after its operands.
  std::vector<NodeId> topo_order(NodeId root) const;

  // Seeds root.grad = 1, runs every local rule in reverse topological order
  // and returns the order. Other gradients are not reset here.
  std::vector<NodeId> backward(NodeId root);

private:
  NodeId push_(Node n);
  void check_operand_(NodeId id) const;
  void propagate_(const Node& n);

  std::vector<Node> nodes_;
  std::uint64_t id_;
  std::uint64_t next_serial_ = 1;
};

// ---- thread-local current graph ----
// Leaves built without an explicit graph land here. Created on first use.
std::shared_ptr<Graph> current_graph();
void set_current_graph(std::shared_ptr<Graph> g);

// Makes a fresh (or the given) graph current for the lifetime of the scope.
class GraphScope {
public:
  GraphScope();
  explicit GraphScope(std::shared_ptr<Graph> g);
  ~GraphScope();
  GraphScope(const GraphScope&)            = delete;
  GraphScope& operator=(const GraphScope&) = delete;

  const std::shared_ptr<Graph>& graph() const { return graph_; }

private:
  std::shared_ptr<Graph> previous_;
  std::shared_ptr<Graph> graph_;
};

} // namespace sg
