#pragma once
#include <vector>
#include "sg/core/value.hpp"

namespace sg::nn {

// mean_i (pred_i - target_i)^2
Value mse_loss(const std::vector<Value>& pred, const std::vector<double>& target);

// mean_i relu(1 - y_i * score_i), labels in {-1, +1}
Value hinge_loss(const std::vector<Value>& scores, const std::vector<double>& labels);

} // namespace sg::nn
