#pragma once
#include <iosfwd>
#include <string>
#include "sg/core/value.hpp"

namespace sg::viz {

struct DotOptions {
  std::string rankdir = "LR";   // Graphviz rank direction: LR, RL, TB or BT
  int precision = 4;            // digits after the point for data/grad
};

// Graphviz DOT text for the graph reachable from root. One record node per
// value ("label | data | grad"), one op node per non-leaf feeding its result,
// one edge per distinct (operand, consumer) pair into the consumer's op node.
std::string to_dot(const Value& root, const DotOptions& opts = {});
void write_dot(std::ostream& os, const Value& root, const DotOptions& opts = {});

} // namespace sg::viz
