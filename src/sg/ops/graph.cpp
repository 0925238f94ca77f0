#include "sg/ops/graph.hpp"
#include "sg/ops/checks.hpp"

namespace sg {

Value detach(const Value& x) {
  detail::check_handle("detach", x);
  return Value::leaf(x.graph(), x.value(), x.label());
}

std::vector<Value> topo_order(const Value& root) {
  detail::check_handle("topo_order", root);
  const auto& g = root.graph();
  std::vector<Value> out;
  for (NodeId id : g->topo_order(root.id())) out.emplace_back(g, id);
  return out;
}

void zero_grad_subgraph(const Value& root) {
  detail::check_handle("zero_grad_subgraph", root);
  const auto& g = root.graph();
  for (NodeId id : g->topo_order(root.id())) g->node(id).grad = 0.0;
}

} // namespace sg
