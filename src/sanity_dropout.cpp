#include "layers.h"

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
        // Inference mode is identity in both directions.
        Dropout drop(0.5f, 3);
        drop.set_training(false);
        const std::vector<float> input = {1.0f, -2.0f, 3.0f, 0.25f};
        auto out = drop.forward(input);
        assert(out == input);
        auto grad = drop.backward({1.0f, 2.0f, 3.0f, 4.0f});
        assert(nearly_equal(grad[3], 4.0f));
        std::cout << "Dropout inference identity: OK\n";
    }

    {
        // Training mode: each value is either dropped or scaled by 1/(1-rate),
        // and backward uses the same mask.
        Dropout drop(0.5f, 5);
        const std::size_t n = 4000;
        std::vector<float> input(n, 1.0f);
        auto out = drop.forward(input);
        auto grad = drop.backward(std::vector<float>(n, 3.0f));

        std::size_t kept = 0;
        for (std::size_t i = 0; i < n; ++i) {
            assert(out[i] == 0.0f || nearly_equal(out[i], 2.0f));
            if (out[i] != 0.0f) {
                ++kept;
                assert(nearly_equal(grad[i], 6.0f));
            } else {
                assert(grad[i] == 0.0f);
            }
        }
        const double kept_frac = static_cast<double>(kept) / n;
        assert(kept_frac > 0.45 && kept_frac < 0.55);
        std::cout << "Dropout training mask (kept " << kept_frac << "): OK\n";
    }

    {
        // rate 0 never drops.
        Dropout drop(0.0f, 1);
        const std::vector<float> input = {1.0f, 2.0f};
        assert(drop.forward(input) == input);
        std::cout << "Dropout rate 0: OK\n";
    }

    {
        bool threw = false;
        try {
            Dropout bad(1.0f);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            Dropout bad(-0.1f);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Dropout rate validation: OK\n";
    }

    std::cout << "All Dropout sanity tests passed.\n";
    return 0;
}
