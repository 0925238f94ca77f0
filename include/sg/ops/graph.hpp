#pragma once
#include <vector>
#include "sg/core/value.hpp"

namespace sg {

// New leaf with x's current value on x's graph; no gradient flows back to x.
Value detach(const Value& x);

// Nodes reachable from root, operands before consumers. Does not touch
// gradients.
std::vector<Value> topo_order(const Value& root);

// Sets the gradient of every node reachable from root to 0.
void zero_grad_subgraph(const Value& root);

} // namespace sg
