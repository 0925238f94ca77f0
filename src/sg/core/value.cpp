#include "sg/core/value.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/elementwise.hpp"
#include <cstdlib>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace sg {

Value::Value(double value, std::string label)
  : Value(leaf(current_graph(), value, std::move(label))) {}

Value::Value(std::shared_ptr<Graph> graph, NodeId id) : g_(std::move(graph)), id_(id) {
  if (!g_) throw std::invalid_argument("sg::Value: null graph");
  serial_ = g_->node(id_).serial;
}

Value Value::leaf(const std::shared_ptr<Graph>& graph, double value, std::string label) {
  if (!graph) throw std::invalid_argument("sg::Value::leaf: null graph");
  return Value(graph, graph->leaf(value, std::move(label)));
}

const Node& Value::node_() const {
  if (!g_) throw std::logic_error("sg::Value: empty handle");
  if (!g_->contains(id_, serial_)) throw std::out_of_range("sg::Value: stale handle (node was rewound)");
  return g_->node(id_);
}

Node& Value::node_() {
  if (!g_) throw std::logic_error("sg::Value: empty handle");
  if (!g_->contains(id_, serial_)) throw std::out_of_range("sg::Value: stale handle (node was rewound)");
  return g_->node(id_);
}

double Value::value() const { return node_().value; }
double Value::grad() const { return node_().grad; }
const std::string& Value::label() const { return node_().label; }
Op Value::op() const { return node_().op; }
double Value::exponent() const { return node_().exponent; }
bool Value::is_leaf() const { return node_().arity == 0; }

std::vector<Value> Value::operands() const {
  const Node& n = node_();
  std::vector<Value> out;
  out.reserve(n.arity);
  for (std::uint8_t i = 0; i < n.arity; ++i) out.emplace_back(g_, n.operands[i]);
  return out;
}

bool Value::same_node(const Value& other) const {
  return g_ == other.g_ && id_ == other.id_ && serial_ == other.serial_;
}

Value& Value::set_label(std::string label) {
  node_().label = std::move(label);
  return *this;
}

void Value::set_value(double value) {
  Node& n = node_();
  if (n.arity != 0) throw std::logic_error("sg::Value::set_value: only leaf values can be reassigned");
  n.value = value;
}

void Value::zero_grad() { node_().grad = 0.0; }

Value Value::relu() const { return sg::relu(*this); }

Value Value::pow(const Operand& exponent) const { return sg::pow(*this, exponent); }

std::vector<Value> Value::backward() const {
  node_();
  auto order = g_->backward(id_);
  std::vector<Value> out;
  out.reserve(order.size());
  for (NodeId id : order) out.emplace_back(g_, id);
  return out;
}

std::string op_symbol(const Value& v) {
  if (v.op() != Op::Pow) return to_string(v.op());
  // shortest precision that reads back as the same double
  const double p = v.exponent();
  std::string digits;
  for (int prec = 1; prec <= 17; ++prec) {
    std::ostringstream oss;
    oss << std::setprecision(prec) << p;
    digits = oss.str();
    if (std::strtod(digits.c_str(), nullptr) == p) break;
  }
  return "**" + digits;
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
  if (!v.valid()) return os << (v.defined() ? "Value(<stale>)" : "Value(<empty>)");
  return os << "Value(data=" << v.value() << ", grad=" << v.grad()
            << ", label='" << v.label() << "', op='" << op_symbol(v) << "')";
}

} // namespace sg
