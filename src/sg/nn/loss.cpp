#include "sg/nn/loss.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/elementwise.hpp"
#include <stdexcept>
#include <string>

namespace sg::nn {
namespace {

void check_sizes(const char* name, std::size_t n, std::size_t m) {
  if (n == 0) throw std::invalid_argument(std::string("sg::nn::") + name + ": empty input");
  if (n != m)
    throw std::invalid_argument(std::string("sg::nn::") + name + ": size mismatch (" +
                                std::to_string(n) + " vs " + std::to_string(m) + ")");
}

} // anon

Value mse_loss(const std::vector<Value>& pred, const std::vector<double>& target) {
  check_sizes("mse_loss", pred.size(), target.size());
  Value total = pow(pred[0] - target[0], 2.0);
  for (std::size_t i = 1; i < pred.size(); ++i) total = total + pow(pred[i] - target[i], 2.0);
  return total / static_cast<double>(pred.size());
}

Value hinge_loss(const std::vector<Value>& scores, const std::vector<double>& labels) {
  check_sizes("hinge_loss", scores.size(), labels.size());
  Value total = relu(1.0 - labels[0] * scores[0]);
  for (std::size_t i = 1; i < scores.size(); ++i) total = total + relu(1.0 - labels[i] * scores[i]);
  return total / static_cast<double>(scores.size());
}

} // namespace sg::nn
