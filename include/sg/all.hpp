#pragma once
// Umbrella header to simplify includes from bindings and examples.

// Core
#include "sg/core/config.hpp"
#include "sg/core/errors.hpp"
#include "sg/core/graph.hpp"
#include "sg/core/value.hpp"

// Ops
#include "sg/ops/activations.hpp"
#include "sg/ops/elementwise.hpp"
#include "sg/ops/graph.hpp"

// NN
#include "sg/nn/module.hpp"
#include "sg/nn/layers/neuron.hpp"
#include "sg/nn/layers/layer.hpp"
#include "sg/nn/mlp.hpp"
#include "sg/nn/loss.hpp"
#include "sg/nn/optim/sgd.hpp"

// Visualization
#include "sg/viz/dot.hpp"

// End of umbrella
