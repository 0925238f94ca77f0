#include "sg/nn/optim/sgd.hpp"
#include "sg/core/trace.hpp"

namespace sg::nn {

void SGD::step(Module& m) {
  SG_TRACE_SCOPE(timer, "sgd.step");
  auto params = m.parameters();
  timer.items = params.size();

  const double lr_ = lr;
  const double mu  = momentum;
  const double wd  = weight_decay;

  for (Value& p : params) {
    const double w = p.value();
    double g = p.grad();
    if (wd != 0.0) g += wd * w;
    double& v = velocity[{p.graph().get(), p.id()}];
    v = mu * v + g;
    p.set_value(w - lr_ * v);
    p.zero_grad();
  }
}

} // namespace sg::nn
