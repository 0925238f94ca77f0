// examples/train_mlp.cpp: tiny binary classifier with MLP + SGD
// - Four hand-written points, targets in {-1, +1}
// - Per-step loss printed every 10 steps; final predictions at the end
// - Graph arena is rewound after each step so memory stays flat
// Set SG_TRACE=1 to see per-phase timings on stderr.

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <vector>
#include "sg/core/value.hpp"
#include "sg/nn/loss.hpp"
#include "sg/nn/mlp.hpp"
#include "sg/nn/optim/sgd.hpp"

int main(int argc, char** argv) {
    const int steps = argc > 1 ? std::atoi(argv[1]) : 100;

    sg::GraphScope scope;
    auto g = scope.graph();

    sg::nn::MLP model(3, {4, 4, 1});
    sg::nn::SGD opt(/*lr=*/0.05, /*momentum=*/0.9);
    std::cout << model.describe() << "\n"
              << "parameters: " << model.num_parameters() << "\n";

    const std::vector<std::vector<double>> xs = {
        {2.0, 3.0, -1.0}, {3.0, -1.0, 0.5}, {0.5, 1.0, 1.0}, {1.0, 1.0, -1.0}};
    const std::vector<double> ys = {1.0, -1.0, -1.0, 1.0};

    // Everything after this mark is per-step scratch.
    const auto params_end = g->mark();

    std::cout << std::fixed << std::setprecision(6);
    for (int step = 0; step < steps; ++step) {
        std::vector<sg::Value> preds;
        preds.reserve(xs.size());
        for (const auto& x : xs) preds.push_back(model(x)[0]);
        sg::Value loss = sg::nn::mse_loss(preds, ys);

        loss.backward();
        opt.step(model);

        if (step % 10 == 0 || step + 1 == steps)
            std::cout << "step " << std::setw(4) << step << "  loss " << loss.value()
                      << "  nodes " << g->size() << "\n";
        g->rewind(params_end);
    }

    std::cout << "predictions:\n";
    for (std::size_t i = 0; i < xs.size(); ++i) {
        const double p = model(xs[i])[0].value();
        std::cout << "  target " << std::setw(5) << ys[i] << "  pred " << p << "\n";
    }
    g->rewind(params_end);
    return 0;
}
