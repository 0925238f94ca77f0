// ============================
// File: include/sg/nn/layers/neuron.hpp
// ============================
#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "sg/nn/module.hpp"

namespace sg::nn {

// act = b + sum_i w_i * x_i, passed through relu when nonlin.
// Weights start U(-1, 1), bias at 0.
class Neuron : public Module {
public:
  explicit Neuron(std::size_t nin, bool nonlin = true, unsigned long long seed = 0xC0FFEE);

  using Module::forward;
  std::vector<Value> forward(const std::vector<Value>& x) override;
  Value activate(const std::vector<Value>& x);

  std::string describe() const override;

  std::size_t in_features() const { return w_.size(); }
  bool nonlin() const { return nonlin_; }
  const std::vector<Value>& weights() const { return w_; }
  const Value& bias() const { return b_; }

private:
  std::vector<Value> w_;
  Value b_;
  bool nonlin_ = true;
};

} // namespace sg::nn
