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
    Softmax softmax;
    CategoricalCrossEntropy cce;

    {
        // Rows sum to 1, ordering preserved, huge logits do not overflow.
        const std::vector<float> logits = {1.0f, 2.0f, 3.0f,  //
                                           1000.0f, 1000.0f, -1000.0f};
        auto probs = softmax.forward(logits, 2, 3);
        for (std::size_t n = 0; n < 2; ++n) {
            float sum = 0.0f;
            for (std::size_t c = 0; c < 3; ++c) {
                const float p = probs[n * 3 + c];
                assert(std::isfinite(p) && p >= 0.0f && p <= 1.0f);
                sum += p;
            }
            assert(nearly_equal(sum, 1.0f, 1e-6f));
        }
        assert(probs[0] < probs[1] && probs[1] < probs[2]);
        assert(nearly_equal(probs[3], 0.5f));
        assert(nearly_equal(probs[5], 0.0f));
        std::cout << "Softmax forward test: OK\n";
    }

    {
        // CE value: -log(p_true) averaged over rows.
        const std::vector<float> probs = {0.7f, 0.2f, 0.1f,  //
                                          0.25f, 0.25f, 0.5f};
        const std::vector<float> target = {1, 0, 0,  //
                                           0, 0, 1};
        const float loss = cce.forward(probs, target, 2);
        const float expected = -(std::log(0.7f) + std::log(0.5f)) / 2.0f;
        assert(nearly_equal(loss, expected, 1e-6f));

        auto grad = cce.backward(probs, target, 2);
        assert(nearly_equal(grad[0], -1.0f / 0.7f / 2.0f, 1e-5f));
        assert(grad[1] == 0.0f);
        assert(nearly_equal(grad[5], -1.0f, 1e-5f));

        // Zero probability is clipped, not infinite.
        const float clipped = cce.forward({0.0f, 1.0f}, {1.0f, 0.0f}, 1);
        assert(std::isfinite(clipped));
        assert(nearly_equal(clipped, -std::log(CategoricalCrossEntropy::kEpsilon), 1e-3f));
        std::cout << "Cross-entropy test: OK\n";
    }

    {
        // Softmax + CE chain gives (p - y) / N on the logits.
        const std::vector<float> logits = {0.5f, -1.0f, 2.0f, 0.0f};
        const std::vector<float> target = {0, 0, 1, 0};
        auto probs = softmax.forward(logits, 1, 4);
        auto grad_probs = cce.backward(probs, target, 1);
        auto grad_logits = softmax.backward(grad_probs);
        for (std::size_t c = 0; c < 4; ++c) {
            assert(nearly_equal(grad_logits[c], probs[c] - target[c], 1e-5f));
        }
        std::cout << "Softmax + CE gradient test: OK\n";
    }

    {
        bool threw = false;
        try {
            cce.forward({0.5f, 0.5f}, {1.0f}, 1);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Cross-entropy size mismatch test: OK\n";
    }

    std::cout << "All Softmax / cross-entropy sanity tests passed.\n";
    return 0;
}
