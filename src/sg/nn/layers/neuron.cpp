// ============================
// File: src/sg/nn/layers/neuron.cpp
// ============================
#include "sg/nn/layers/neuron.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/elementwise.hpp"
#include <stdexcept>

namespace sg::nn {

Neuron::Neuron(std::size_t nin, bool nonlin, unsigned long long seed) : nonlin_(nonlin) {
  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> dist(-1.0, 1.0);
  w_.reserve(nin);
  for (std::size_t i = 0; i < nin; ++i) {
    w_.push_back(Value::leaf(graph(), dist(rng)));
    register_parameter("w" + std::to_string(i), w_.back());
  }
  b_ = Value::leaf(graph(), 0.0);
  register_parameter("b", b_);
}

Value Neuron::activate(const std::vector<Value>& x) {
  if (x.size() != w_.size())
    throw std::invalid_argument("sg::nn::Neuron: expected " + std::to_string(w_.size()) +
                                " inputs, got " + std::to_string(x.size()));
  Value act = b_;
  for (std::size_t i = 0; i < w_.size(); ++i) act = act + w_[i] * x[i];
  return nonlin_ ? relu(act) : act;
}

std::vector<Value> Neuron::forward(const std::vector<Value>& x) {
  return { activate(x) };
}

std::string Neuron::describe() const {
  return std::string(nonlin_ ? "ReLU" : "Linear") + " Neuron(" + std::to_string(w_.size()) + ")";
}

} // namespace sg::nn
