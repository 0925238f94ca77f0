// ============================
// File: src/sg/nn/mlp.cpp
// ============================
#include "sg/nn/mlp.hpp"
#include <stdexcept>

namespace sg::nn {

MLP::MLP(std::size_t nin, const std::vector<std::size_t>& nouts, unsigned long long seed) {
  if (nouts.empty()) throw std::invalid_argument("sg::nn::MLP: need at least one layer");
  std::size_t in = nin;
  for (std::size_t i = 0; i < nouts.size(); ++i) {
    const bool nonlin = (i + 1 != nouts.size());
    auto layer = std::make_shared<Layer>(in, nouts[i], nonlin, seed + 104729ull * (i + 1));
    register_module("layer" + std::to_string(i), layer);
    layers_.push_back(std::move(layer));
    in = nouts[i];
  }
}

std::vector<Value> MLP::forward(const std::vector<Value>& x) {
  std::vector<Value> h = x;
  for (auto& layer : layers_) h = layer->forward(h);
  return h;
}

std::string MLP::describe() const {
  std::string s = "MLP of [";
  for (std::size_t i = 0; i < layers_.size(); ++i) {
    if (i) s += ", ";
    s += layers_[i]->describe();
  }
  return s + "]";
}

} // namespace sg::nn
