// ============================
// File: include/sg/nn/optim/sgd.hpp
// ============================
#pragma once
#include <cstdint>
#include <map>
#include <utility>
#include "sg/core/value.hpp"
#include "sg/nn/module.hpp"

namespace sg::nn {

// Plain SGD over a module's leaf parameters:
//   v = momentum * v + (g + weight_decay * w);  w -= lr * v
// step() zeroes each gradient after applying it.
struct SGD {
  double lr{0.05};
  double momentum{0.0};
  double weight_decay{0.0};

  // velocity per parameter (by graph + node identity)
  std::map<std::pair<const Graph*, NodeId>, double> velocity;

  explicit SGD(double lr=0.05, double momentum=0.0, double weight_decay=0.0)
    : lr(lr), momentum(momentum), weight_decay(weight_decay) {}

  void step(Module& m);
};

} // namespace sg::nn
