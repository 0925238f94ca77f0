#include "sg/ops/elementwise.hpp"
#include "sg/ops/checks.hpp"
#include "sg/core/errors.hpp"

namespace sg {
namespace detail {

void check_handle(const char* op, const Value& v) {
  if (!v.defined()) throw InvalidOperand(op, "empty Value");
  if (!v.valid()) throw InvalidOperand(op, "stale Value");
}

void check_pair(const char* op, const Operand& a, const Operand& b) {
  if (a.is_node()) check_handle(op, a.node());
  if (b.is_node()) check_handle(op, b.node());
  if (a.is_node() && b.is_node() && a.node().graph() != b.node().graph())
    throw InvalidOperand(op, "Value from another graph");
}

} // namespace detail

namespace {

struct Resolved {
  std::shared_ptr<Graph> g;
  NodeId a, b;
};

// Puts both operands on one graph. A literal becomes a leaf on the graph of
// the node it is combined with (the current graph if both are literals).
Resolved resolve(const char* op, const Operand& a, const Operand& b) {
  detail::check_pair(op, a, b);

  std::shared_ptr<Graph> g = a.is_node() ? a.node().graph()
                           : b.is_node() ? b.node().graph()
                           : current_graph();
  const NodeId ia = a.is_node() ? a.node().id() : g->leaf(a.literal());
  const NodeId ib = b.is_node() ? b.node().id() : g->leaf(b.literal());
  return {std::move(g), ia, ib};
}

} // anon

Value add(const Operand& a, const Operand& b) {
  auto r = resolve("add", a, b);
  const NodeId out = r.g->add(r.a, r.b);
  return Value(std::move(r.g), out);
}

Value mul(const Operand& a, const Operand& b) {
  auto r = resolve("mul", a, b);
  const NodeId out = r.g->mul(r.a, r.b);
  return Value(std::move(r.g), out);
}

Value neg(const Operand& x) {
  if (x.is_node()) detail::check_handle("neg", x.node());
  return mul(x, -1.0);
}

Value sub(const Operand& a, const Operand& b) {
  // both sides are checked before neg() appends anything
  detail::check_pair("sub", a, b);
  // a literal subtrahend is negated numerically, a node one through neg()
  if (!b.is_node()) return add(a, -b.literal());
  return add(a, neg(b));
}

Value div(const Operand& a, const Operand& b) {
  detail::check_pair("div", a, b);
  if (b.is_node()) return mul(a, pow(b.node(), -1.0));
  // a literal divisor becomes a leaf and goes through pow() like a node, so
  // x / 0 is a derived inf rather than a non-finite leaf
  auto g = a.is_node() ? a.node().graph() : current_graph();
  return mul(a, pow(Value::leaf(g, b.literal()), -1.0));
}

Value pow(const Value& base, const Operand& exponent) {
  detail::check_handle("pow", base);
  if (exponent.is_node()) throw InvalidExponent("pow", "Value");
  auto g = base.graph();
  const NodeId out = g->pow(base.id(), exponent.literal());
  return Value(std::move(g), out);
}

} // namespace sg
