// ============================
// File: include/sg/nn/layers/layer.hpp
// ============================
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sg/nn/module.hpp"
#include "sg/nn/layers/neuron.hpp"

namespace sg::nn {

// nout independent neurons over the same nin inputs.
class Layer : public Module {
public:
  Layer(std::size_t nin, std::size_t nout, bool nonlin = true, unsigned long long seed = 0xC0FFEE);

  using Module::forward;
  std::vector<Value> forward(const std::vector<Value>& x) override;
  std::string describe() const override;

  std::size_t in_features() const { return nin_; }
  std::size_t out_features() const { return neurons_.size(); }
  const std::vector<std::shared_ptr<Neuron>>& neurons() const { return neurons_; }

private:
  std::size_t nin_ = 0;
  std::vector<std::shared_ptr<Neuron>> neurons_;
};

} // namespace sg::nn
