#include "layers.h"
#include "optimizer.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

bool nearly_equal(float a, float b, float eps = 1e-6f) {
    return std::abs(a - b) <= eps;
}

int main() {
    {
        // First bias-corrected step moves each weight by ~lr against the
        // sign of its gradient, whatever the gradient scale.
        Adam adam(0.001f);
        std::vector<float> w = {1.0f, -2.0f, 0.5f};
        std::vector<float> g = {0.5f, -3.0f, 1e-3f};
        adam.step({{&w, &g}});
        assert(adam.iterations() == 1);
        assert(nearly_equal(w[0], 0.999f, 1e-6f));
        assert(nearly_equal(w[1], -1.999f, 1e-6f));
        assert(nearly_equal(w[2], 0.499f, 1e-5f));

        // Zero gradient leaves the weight in place.
        std::vector<float> w0 = {4.0f};
        std::vector<float> g0 = {0.0f};
        Adam fresh;
        fresh.step({{&w0, &g0}});
        assert(w0[0] == 4.0f);
        std::cout << "Adam first step: OK\n";
    }

    {
        // Minimize sum (w - 3)^2.
        Adam adam(0.1f);
        std::vector<float> w = {0.0f, 6.0f};
        std::vector<float> g(2, 0.0f);
        auto loss = [&]() {
            return (w[0] - 3.0f) * (w[0] - 3.0f) + (w[1] - 3.0f) * (w[1] - 3.0f);
        };
        const float loss1 = loss();
        for (int it = 0; it < 500; ++it) {
            g[0] = 2.0f * (w[0] - 3.0f);
            g[1] = 2.0f * (w[1] - 3.0f);
            adam.step({{&w, &g}});
        }
        const float loss2 = loss();
        std::cout << "Loss before: " << loss1 << ", after 500 steps: " << loss2 << "\n";
        assert(loss2 < 0.01f * loss1);
        std::cout << "Adam quadratic: OK\n";
    }

    {
        // Moment buffers are bound to the first parameter list.
        Adam adam;
        std::vector<float> a = {1.0f}, ga = {1.0f};
        std::vector<float> b = {1.0f}, gb = {1.0f};
        adam.step({{&a, &ga}});
        bool threw = false;
        try {
            adam.step({{&a, &ga}, {&b, &gb}});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            Adam bad(0.0f);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Adam validation: OK\n";
    }

    std::cout << "All Adam sanity tests passed.\n";
    return 0;
}
