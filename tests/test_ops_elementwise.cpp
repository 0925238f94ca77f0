#include "test_framework.hpp"
#include <cmath>
#include <limits>

#include "sg/core/config.hpp"
#include "sg/core/errors.hpp"
#include "sg/core/value.hpp"
#include "sg/ops/elementwise.hpp"

using sg::GraphScope;
using sg::Value;

TEST("ops/literal_on_either_side_of_add_and_mul") {
    GraphScope scope;
    Value a(2.0);
    Value l = 3.0 + a;
    Value r = a + 3.0;
    Value ml = 4 * a;
    Value mr = a * 4;
    ASSERT_NEAR(l.value(), 5.0, 0.0);
    ASSERT_NEAR(r.value(), 5.0, 0.0);
    ASSERT_NEAR(ml.value(), 8.0, 0.0);
    ASSERT_NEAR(mr.value(), 8.0, 0.0);

    // the literal is wrapped into a leaf operand on the same graph
    auto ops = l.operands();
    ASSERT_EQ(ops.size(), 2u);
    ASSERT_TRUE(ops[0].is_leaf());
    ASSERT_NEAR(ops[0].value(), 3.0, 0.0);
    ASSERT_TRUE(ops[1].same_node(a));
    ASSERT_TRUE(ops[0].graph() == a.graph());

    ml.backward();
    ASSERT_NEAR(a.grad(), 4.0, 0.0);
}

TEST("ops/negate_is_multiply_by_minus_one") {
    GraphScope scope;
    Value a(2.5);
    Value n = -a;
    ASSERT_TRUE(n.op() == sg::Op::Mul);
    ASSERT_NEAR(n.operands()[1].value(), -1.0, 0.0);
    n.backward();
    ASSERT_NEAR(n.value(), -2.5, 0.0);
    ASSERT_NEAR(a.grad(), -1.0, 0.0);
}

TEST("ops/subtract_node_node") {
    GraphScope scope;
    Value a(5.0), b(3.0);
    Value d = a - b;
    ASSERT_TRUE(d.op() == sg::Op::Add);
    d.backward();
    ASSERT_NEAR(d.value(), 2.0, 0.0);
    ASSERT_NEAR(a.grad(), 1.0, 0.0);
    ASSERT_NEAR(b.grad(), -1.0, 0.0);
}

TEST("ops/subtract_reversed_literal") {
    // 10 - a must be 10 + (-a), not a - 10
    GraphScope scope;
    Value a(4.0);
    Value d = 10.0 - a;
    d.backward();
    ASSERT_NEAR(d.value(), 6.0, 0.0);
    ASSERT_NEAR(a.grad(), -1.0, 0.0);

    Value b(4.0);
    Value e = b - 10.0;
    e.backward();
    ASSERT_NEAR(e.value(), -6.0, 0.0);
    ASSERT_NEAR(b.grad(), 1.0, 0.0);
}

TEST("ops/divide_matches_manual_expansion") {
    GraphScope scope;
    Value a(3.0), b(-1.5);
    Value q = a / b;
    q.backward();

    Value a2(3.0), b2(-1.5);
    Value manual = a2 * sg::pow(b2, -1);
    manual.backward();

    ASSERT_NEAR(q.value(), 3.0 / -1.5, 1e-15);
    ASSERT_NEAR(q.value(), manual.value(), 0.0);
    ASSERT_NEAR(a.grad(), a2.grad(), 0.0);
    ASSERT_NEAR(b.grad(), b2.grad(), 0.0);
    ASSERT_NEAR(a.grad(), 1.0 / -1.5, 1e-15);
    ASSERT_NEAR(b.grad(), -3.0 / (1.5 * 1.5), 1e-15);
}

TEST("ops/subtract_matches_manual_expansion") {
    GraphScope scope;
    Value a(0.25), b(7.0);
    Value d = a - b;
    d.backward();

    Value a2(0.25), b2(7.0);
    Value manual = a2 + b2 * -1.0;
    manual.backward();

    ASSERT_NEAR(d.value(), manual.value(), 0.0);
    ASSERT_NEAR(a.grad(), a2.grad(), 0.0);
    ASSERT_NEAR(b.grad(), b2.grad(), 0.0);
}

TEST("ops/divide_reversed_literal") {
    // 3 / a = 3 * a^-1
    GraphScope scope;
    Value a(2.0);
    Value q = 3.0 / a;
    q.backward();
    ASSERT_NEAR(q.value(), 1.5, 1e-15);
    ASSERT_NEAR(a.grad(), -3.0 / 4.0, 1e-15);

    Value b(2.0);
    Value r = b / 4.0;
    r.backward();
    ASSERT_NEAR(r.value(), 0.5, 0.0);
    ASSERT_NEAR(b.grad(), 0.25, 0.0);
}

TEST("ops/divide_by_zero_gives_infinity") {
    GraphScope scope;
    Value a(1.0), z(0.0);
    Value q = a / z;
    ASSERT_TRUE(std::isinf(q.value()));
    Value lit = a / 0.0;
    ASSERT_TRUE(std::isinf(lit.value()));
}

TEST("ops/both_literals_land_on_current_graph") {
    GraphScope scope;
    Value s = sg::add(1.5, 2);
    ASSERT_NEAR(s.value(), 3.5, 0.0);
    ASSERT_TRUE(s.graph() == scope.graph());
    ASSERT_EQ(scope.graph()->size(), 3u);
}

TEST("ops/pow_rejects_node_exponent") {
    GraphScope scope;
    Value a(2.0), e(3.0);
    auto msg = ASSERT_THROWS_AS(sg::pow(a, e), sg::InvalidExponent);
    ASSERT_TRUE(msg.find("pow") != std::string::npos);
    try {
        (void)a.pow(e);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidExponent& ex) {
        ASSERT_EQ(ex.op(), std::string("pow"));
        ASSERT_EQ(ex.exponent_type(), std::string("Value"));
    }
}

TEST("ops/empty_handle_is_invalid_operand") {
    GraphScope scope;
    Value a(1.0);
    Value empty;
    ASSERT_THROWS_AS(a + empty, sg::InvalidOperand);
    ASSERT_THROWS_AS(empty * 2.0, sg::InvalidOperand);
    ASSERT_THROWS_AS(-empty, sg::InvalidOperand);
    ASSERT_THROWS_AS(sg::pow(empty, 2), sg::InvalidOperand);
    try {
        (void)sg::sub(a, empty);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidOperand& ex) {
        ASSERT_EQ(ex.op(), std::string("sub"));
        ASSERT_EQ(ex.operand_type(), std::string("empty Value"));
    }
}

TEST("ops/operands_from_different_graphs_are_rejected") {
    Value a, b;
    {
        GraphScope s1;
        a = Value(1.0);
    }
    {
        GraphScope s2;
        b = Value(2.0);
    }
    ASSERT_TRUE(a.graph() != b.graph());
    try {
        (void)(a * b);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidOperand& ex) {
        ASSERT_EQ(ex.op(), std::string("mul"));
        ASSERT_EQ(ex.operand_type(), std::string("Value from another graph"));
    }
}

TEST("ops/invalid_operand_is_an_invalid_argument") {
    GraphScope scope;
    Value empty;
    ASSERT_THROWS_AS(empty + 1.0, std::invalid_argument);
}

TEST("ops/sub_and_div_check_left_operand_first") {
    GraphScope scope;
    auto g = scope.graph();
    Value b(2.0);
    Value empty;
    const auto before = g->size();
    try {
        (void)(empty - b);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidOperand& ex) {
        ASSERT_EQ(ex.op(), std::string("sub"));
        ASSERT_EQ(ex.operand_type(), std::string("empty Value"));
    }
    ASSERT_EQ(g->size(), before);
    try {
        (void)sg::div(empty, b);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidOperand& ex) {
        ASSERT_EQ(ex.op(), std::string("div"));
    }
    ASSERT_EQ(g->size(), before);
}

TEST("ops/sub_and_div_reject_stale_left_operand_without_new_nodes") {
    GraphScope scope;
    auto g = scope.graph();
    Value b(2.0);
    const auto m = g->mark();
    Value gone = b * 3.0;
    g->rewind(m);
    try {
        (void)(gone / b);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidOperand& ex) {
        ASSERT_EQ(ex.op(), std::string("div"));
        ASSERT_EQ(ex.operand_type(), std::string("stale Value"));
    }
    ASSERT_EQ(g->size(), m);
}

TEST("ops/cross_graph_sub_and_div_name_the_op") {
    Value a, b;
    {
        GraphScope s1;
        a = Value(1.0);
    }
    {
        GraphScope s2;
        b = Value(2.0);
    }
    const auto a_size = a.graph()->size();
    const auto b_size = b.graph()->size();
    try {
        (void)(a - b);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidOperand& ex) {
        ASSERT_EQ(ex.op(), std::string("sub"));
        ASSERT_EQ(ex.operand_type(), std::string("Value from another graph"));
    }
    try {
        (void)(a / b);
        ASSERT_TRUE(false);
    } catch (const sg::InvalidOperand& ex) {
        ASSERT_EQ(ex.op(), std::string("div"));
    }
    ASSERT_EQ(a.graph()->size(), a_size);
    ASSERT_EQ(b.graph()->size(), b_size);
}

TEST("ops/divide_by_literal_goes_through_pow") {
    GraphScope scope;
    Value a(3.0);
    Value q = a / 4.0;
    auto ops = q.operands();
    ASSERT_TRUE(q.op() == sg::Op::Mul);
    ASSERT_TRUE(ops[1].op() == sg::Op::Pow);
    ASSERT_NEAR(ops[1].exponent(), -1.0, 0.0);
    ASSERT_NEAR(ops[1].operands()[0].value(), 4.0, 0.0);
    q.backward();
    ASSERT_NEAR(q.value(), 0.75, 0.0);
    ASSERT_NEAR(a.grad(), 0.25, 0.0);
}

TEST("ops/divide_by_literal_zero_with_check_finite_on") {
    sg::config::ScopedConfig restore;
    sg::config::set_check_finite(true);
    GraphScope scope;
    Value a(1.0), zero(0.0);
    Value lit = a / 0.0;
    Value node = a / zero;
    ASSERT_TRUE(std::isinf(lit.value()));
    ASSERT_TRUE(std::isinf(node.value()));
    Value rev = 2.0 / zero;
    ASSERT_TRUE(std::isinf(rev.value()));
}
