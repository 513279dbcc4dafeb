#include "activations.h"
#include "layers.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

bool nearly_equal(float a, float b, float eps = 1e-6f) {
    return std::abs(a - b) <= eps;
}

int main() {
    {
        ReLU relu;
        std::vector<float> values = {-1.0f, 0.0f, 0.5f, 2.0f, -3.0f};
        const std::vector<float> pre = values;
        relu.apply_inplace(values);

        const std::vector<float> expected_out = {0.0f, 0.0f, 0.5f, 2.0f, 0.0f};
        for (std::size_t i = 0; i < values.size(); ++i) {
            assert(nearly_equal(values[i], expected_out[i]));
        }

        const std::vector<float> grad_out = {1.0f, 1.0f, 2.0f, 3.0f, 4.0f};
        auto grad_in = relu.backward(pre, grad_out);
        const std::vector<float> expected_grad_in = {0.0f, 0.0f, 2.0f, 3.0f, 0.0f};
        for (std::size_t i = 0; i < grad_in.size(); ++i) {
            assert(nearly_equal(grad_in[i], expected_grad_in[i]));
        }
        assert(relu.name() == "relu");
        std::cout << "ReLU activation test: OK\n";
    }

    {
        // Fused into Dense: identity weights expose the activation directly.
        Dense dense(3, 3, std::make_shared<ReLU>());
        auto& w = dense.weights();
        std::fill(w.begin(), w.end(), 0.0f);
        w[0] = w[4] = w[8] = 1.0f;
        const std::vector<float> input = {-2.0f, 0.0f, 3.0f};
        auto out = dense.forward(input, 1);
        assert(nearly_equal(out[0], 0.0f));
        assert(nearly_equal(out[1], 0.0f));
        assert(nearly_equal(out[2], 3.0f));

        auto grad_in = dense.backward({1.0f, 1.0f, 1.0f});
        assert(nearly_equal(grad_in[0], 0.0f));
        assert(nearly_equal(grad_in[1], 0.0f));
        assert(nearly_equal(grad_in[2], 1.0f));
        std::cout << "ReLU fused into Dense: OK\n";
    }

    {
        bool threw = false;
        try {
            make_activation("tanh", -1.0f);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(make_activation("relu", -1.0f)->name() == "relu");
        std::cout << "Activation factory: OK\n";
    }

    std::cout << "All ReLU sanity tests passed.\n";
    return 0;
}
