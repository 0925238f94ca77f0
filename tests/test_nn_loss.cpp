// ============================
// File: tests/test_nn_loss.cpp
// ============================
#include "test_framework.hpp"
#include "sg/core/value.hpp"
#include "sg/nn/loss.hpp"
#include <vector>

using sg::GraphScope;
using sg::Value;
using sg::nn::hinge_loss;
using sg::nn::mse_loss;

TEST("nn/loss/mse_value_and_grad") {
    GraphScope scope;
    Value p0(1.0), p1(3.0);
    Value L = mse_loss({p0, p1}, {0.0, 1.0});
    ASSERT_NEAR(L.value(), (1.0 + 4.0) / 2.0, 1e-15);
    L.backward();
    // dL/dp_i = 2 (p_i - t_i) / n
    ASSERT_NEAR(p0.grad(), 1.0, 1e-15);
    ASSERT_NEAR(p1.grad(), 2.0, 1e-15);
}

TEST("nn/loss/mse_perfect_fit_is_zero") {
    GraphScope scope;
    Value p(0.75);
    Value L = mse_loss({p}, {0.75});
    ASSERT_NEAR(L.value(), 0.0, 0.0);
    L.backward();
    ASSERT_NEAR(p.grad(), 0.0, 0.0);
}

TEST("nn/loss/hinge_value_and_grad") {
    GraphScope scope;
    Value s0(0.5), s1(-2.0), s2(-2.0);
    // margins: 1 - 0.5 = 0.5, 1 + 2 = 3, 1 - 2 = -1 (clamped)
    Value L = hinge_loss({s0, s1, s2}, {1.0, 1.0, -1.0});
    ASSERT_NEAR(L.value(), (0.5 + 3.0 + 0.0) / 3.0, 1e-15);
    L.backward();
    ASSERT_NEAR(s0.grad(), -1.0 / 3.0, 1e-15);
    ASSERT_NEAR(s1.grad(), -1.0 / 3.0, 1e-15);
    ASSERT_NEAR(s2.grad(), 0.0, 0.0);
}

TEST("nn/loss/hinge_margin_boundary_has_zero_grad") {
    GraphScope scope;
    Value s(1.0);
    Value L = hinge_loss({s}, {1.0});
    ASSERT_NEAR(L.value(), 0.0, 0.0);
    L.backward();
    ASSERT_NEAR(s.grad(), 0.0, 0.0);
}

TEST("nn/loss/size_errors") {
    GraphScope scope;
    Value p(1.0);
    ASSERT_THROWS_AS(mse_loss({}, {}), std::invalid_argument);
    ASSERT_THROWS_AS(mse_loss({p}, {1.0, 2.0}), std::invalid_argument);
    auto msg = ASSERT_THROWS_AS(hinge_loss({p, p}, {1.0}), std::invalid_argument);
    ASSERT_TRUE(msg.find("size mismatch") != std::string::npos);
}
