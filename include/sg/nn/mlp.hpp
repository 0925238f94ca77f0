// ============================
// File: include/sg/nn/mlp.hpp
// ============================
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sg/nn/module.hpp"
#include "sg/nn/layers/layer.hpp"

namespace sg::nn {

// Stack of layers nin -> nouts[0] -> ... -> nouts.back(). Every layer but the
// last applies relu.
class MLP : public Module {
public:
  MLP(std::size_t nin, const std::vector<std::size_t>& nouts, unsigned long long seed = 0xC0FFEE);

  using Module::forward;
  std::vector<Value> forward(const std::vector<Value>& x) override;
  std::string describe() const override;

  std::size_t size() const { return layers_.size(); }
  const std::shared_ptr<Layer>& operator[](std::size_t i) const { return layers_.at(i); }

private:
  std::vector<std::shared_ptr<Layer>> layers_;
};

} // namespace sg::nn
