// examples/expression_demo.cpp: single expression, backward pass, DOT dump
// - Builds z = x*y + relu(x) and prints every node with its gradient
// - Writes the graph to expression.dot (or argv[1]) for `dot -Tsvg`

#include <fstream>
#include <iostream>
#include <string>
#include "sg/core/value.hpp"
#include "sg/ops/activations.hpp"
#include "sg/ops/elementwise.hpp"
#include "sg/ops/graph.hpp"
#include "sg/viz/dot.hpp"

int main(int argc, char** argv) {
    const std::string out_path = argc > 1 ? argv[1] : "expression.dot";

    sg::GraphScope scope;
    sg::Value x(-2.0, "x");
    sg::Value y(3.0, "y");
    sg::Value xy = x * y;
    xy.set_label("x*y");
    sg::Value rx = sg::relu(x);
    rx.set_label("relu(x)");
    sg::Value z = xy + rx;
    z.set_label("z");

    const auto order = z.backward();
    std::cout << "evaluation order (" << order.size() << " nodes):\n";
    for (const auto& v : order) std::cout << "  " << v << "\n";

    std::cout << "dz/dx = " << x.grad() << "  (expected 3)\n";
    std::cout << "dz/dy = " << y.grad() << "  (expected -2)\n";

    std::ofstream f(out_path);
    if (!f) {
        std::cerr << "Failed to open " << out_path << "\n";
        return 1;
    }
    sg::viz::write_dot(f, z);
    std::cout << "wrote " << out_path << "\n";
    return 0;
}
