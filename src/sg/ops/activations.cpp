#include "sg/ops/activations.hpp"
#include "sg/ops/checks.hpp"

namespace sg {

Value relu(const Value& x) {
  detail::check_handle("relu", x);
  auto g = x.graph();
  const NodeId out = g->relu(x.id());
  return Value(std::move(g), out);
}

} // namespace sg
