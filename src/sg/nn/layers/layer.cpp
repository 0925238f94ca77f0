// ============================
// File: src/sg/nn/layers/layer.cpp
// ============================
#include "sg/nn/layers/layer.hpp"

namespace sg::nn {

Layer::Layer(std::size_t nin, std::size_t nout, bool nonlin, unsigned long long seed) : nin_(nin) {
  neurons_.reserve(nout);
  for (std::size_t i = 0; i < nout; ++i) {
    auto n = std::make_shared<Neuron>(nin, nonlin, seed + 7919ull * i);
    register_module("neuron" + std::to_string(i), n);
    neurons_.push_back(std::move(n));
  }
}

std::vector<Value> Layer::forward(const std::vector<Value>& x) {
  std::vector<Value> out;
  out.reserve(neurons_.size());
  for (auto& n : neurons_) out.push_back(n->activate(x));
  return out;
}

std::string Layer::describe() const {
  std::string s = "Layer of [";
  for (std::size_t i = 0; i < neurons_.size(); ++i) {
    if (i) s += ", ";
    s += neurons_[i]->describe();
  }
  return s + "]";
}

} // namespace sg::nn
