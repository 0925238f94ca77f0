#include "sg/core/graph.hpp"
#include "sg/core/config.hpp"
#include "sg/core/trace.hpp"
#include <atomic>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {

std::uint64_t next_graph_id() {
  static std::atomic<std::uint64_t> counter{1};
  return counter.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<sg::Graph>& current_slot() {
  static thread_local std::shared_ptr<sg::Graph> g;
  return g;
}

} // anon

namespace sg {

const char* to_string(Op op) {
  switch (op) {
    case Op::None: return "";
    case Op::Add:  return "+";
    case Op::Mul:  return "*";
    case Op::Pow:  return "**";
    case Op::ReLU: return "ReLU";
  }
  return "?";
}

Graph::Graph() : id_(next_graph_id()) {}

NodeId Graph::push_(Node n) {
  if (nodes_.size() >= std::numeric_limits<NodeId>::max())
    throw std::length_error("sg::Graph: node index space exhausted");
  n.serial = next_serial_++;
  nodes_.push_back(std::move(n));
  return static_cast<NodeId>(nodes_.size() - 1);
}

void Graph::check_operand_(NodeId id) const {
  if (id >= nodes_.size()) throw std::out_of_range("sg::Graph: operand index out of range");
}

NodeId Graph::leaf(double value, std::string label) {
  if (config::check_finite_enabled() && !std::isfinite(value))
    throw std::domain_error("sg::Graph::leaf: non-finite value with SG_CHECK_FINITE on");
  Node n;
  n.value = value;
  n.label = std::move(label);
  return push_(std::move(n));
}

NodeId Graph::add(NodeId a, NodeId b) {
  check_operand_(a); check_operand_(b);
  Node n;
  n.value = nodes_[a].value + nodes_[b].value;
  n.op = Op::Add;
  n.arity = 2;
  n.operands = {{a, b}};
  return push_(std::move(n));
}

NodeId Graph::mul(NodeId a, NodeId b) {
  check_operand_(a); check_operand_(b);
  Node n;
  n.value = nodes_[a].value * nodes_[b].value;
  n.op = Op::Mul;
  n.arity = 2;
  n.operands = {{a, b}};
  return push_(std::move(n));
}

NodeId Graph::pow(NodeId a, double exponent) {
  check_operand_(a);
  Node n;
  n.value = std::pow(nodes_[a].value, exponent);
  n.op = Op::Pow;
  n.arity = 1;
  n.operands = {{a, a}};
  n.exponent = exponent;
  return push_(std::move(n));
}

NodeId Graph::relu(NodeId a) {
  check_operand_(a);
  Node n;
  const double x = nodes_[a].value;
  n.value = x > 0.0 ? x : 0.0;
  n.op = Op::ReLU;
  n.arity = 1;
  n.operands = {{a, a}};
  return push_(std::move(n));
}

const Node& Graph::node(NodeId id) const { return nodes_.at(id); }
Node& Graph::node(NodeId id) { return nodes_.at(id); }

bool Graph::contains(NodeId id, std::uint64_t serial) const {
  return id < nodes_.size() && nodes_[id].serial == serial;
}

void Graph::rewind(std::size_t mark) {
  if (mark > nodes_.size()) throw std::out_of_range("sg::Graph::rewind: mark beyond current size");
  SG_TRACE_SCOPE(timer, "graph.rewind");
  timer.items = nodes_.size() - mark;
  nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(mark), nodes_.end());
}

void Graph::zero_grad() {
  for (auto& n : nodes_) n.grad = 0.0;
}

std::vector<NodeId> Graph::topo_order(NodeId root) const {
  if (root >= nodes_.size()) throw std::out_of_range("sg::Graph::topo_order: root out of range");

  // Operands always precede their consumer, so every reachable index is <= root.
  std::vector<bool> seen(static_cast<std::size_t>(root) + 1, false);
  std::vector<NodeId> order;

  // Explicit stack of (node, next operand slot) instead of recursion; chains
  // built by long sums would otherwise exhaust the call stack.
  std::vector<std::pair<NodeId, std::uint8_t>> stack;
  stack.emplace_back(root, 0);
  seen[root] = true;

  while (!stack.empty()) {
    const NodeId id = stack.back().first;
    const std::uint8_t slot = stack.back().second;
    const Node& n = nodes_[id];
    if (slot < n.arity) {
      ++stack.back().second;
      const NodeId child = n.operands[slot];
      if (!seen[child]) {
        seen[child] = true;
        stack.emplace_back(child, 0);
      }
      continue;
    }
    order.push_back(id);
    stack.pop_back();
  }
  return order;
}

void Graph::propagate_(const Node& n) {
  const double g = n.grad;
  switch (n.op) {
    case Op::None:
      break;
    case Op::Add:
      nodes_[n.operands[0]].grad += g;
      nodes_[n.operands[1]].grad += g;
      break;
    case Op::Mul: {
      const double a = nodes_[n.operands[0]].value;
      const double b = nodes_[n.operands[1]].value;
      nodes_[n.operands[0]].grad += b * g;
      nodes_[n.operands[1]].grad += a * g;
      break;
    }
    case Op::Pow: {
      Node& a = nodes_[n.operands[0]];
      a.grad += n.exponent * std::pow(a.value, n.exponent - 1.0) * g;
      break;
    }
    case Op::ReLU: {
      // strict: the gradient at exactly 0 is 0
      Node& a = nodes_[n.operands[0]];
      a.grad += (a.value > 0.0 ? 1.0 : 0.0) * g;
      break;
    }
  }
}

std::vector<NodeId> Graph::backward(NodeId root) {
  SG_TRACE_SCOPE(timer, "graph.backward");
  auto order = topo_order(root);
  timer.items = order.size();

  nodes_[root].grad = 1.0;
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    propagate_(nodes_[*it]);
  }
  return order;
}

std::shared_ptr<Graph> current_graph() {
  auto& g = current_slot();
  if (!g) g = std::make_shared<Graph>();
  return g;
}

void set_current_graph(std::shared_ptr<Graph> g) {
  if (!g) throw std::invalid_argument("sg::set_current_graph: null graph");
  current_slot() = std::move(g);
}

GraphScope::GraphScope() : GraphScope(std::make_shared<Graph>()) {}

GraphScope::GraphScope(std::shared_ptr<Graph> g)
  : previous_(current_graph()), graph_(std::move(g)) {
  set_current_graph(graph_);
}

GraphScope::~GraphScope() { current_slot() = std::move(previous_); }

} // namespace sg
