#include "activations.h"
#include "layers.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

// Helper to compare floats with tolerance.
bool nearly_equal(float a, float b, float eps = 1e-5f) {
    return std::abs(a - b) <= eps;
}

// sum(out * probe) in double.
double probe_loss(const std::vector<float>& out, const std::vector<float>& probe) {
    double acc = 0.0;
    for (std::size_t i = 0; i < out.size(); ++i) {
        acc += static_cast<double>(out[i]) * probe[i];
    }
    return acc;
}

int main() {
    {
        // Test 1: identity-like kernel (center=1, others=0) without padding
        // crops the 1-pixel border.
        Conv2D conv(1, 1, nullptr);
        auto& w = conv.weights();
        std::fill(w.begin(), w.end(), 0.0f);
        w[4] = 1.0f;  // center of 3x3
        conv.bias()[0] = 0.0f;

        const std::vector<float> input = {
            1, 2, 3, 4,  //
            5, 6, 7, 8,  //
            9, 1, 2, 3,  //
            4, 5, 6, 7   //
        };
        auto out = conv.forward(input, /*batch=*/1, /*H=*/4, /*W=*/4);
        const std::vector<float> expected = {6, 7, 1, 2};
        assert(out.size() == expected.size());
        for (std::size_t i = 0; i < expected.size(); ++i) {
            if (!nearly_equal(out[i], expected[i])) {
                std::cerr << "Identity conv mismatch at " << i << ": got "
                          << out[i] << " expected " << expected[i] << "\n";
                return 1;
            }
        }
        std::cout << "Conv identity test: OK\n";
    }

    {
        // Test 2: all-ones kernel, bias=0.5, input all-ones. Every output sees
        // a full 3x3 window.
        Conv2D conv(1, 1, nullptr);
        auto& w = conv.weights();
        std::fill(w.begin(), w.end(), 1.0f);
        conv.bias()[0] = 0.5f;

        std::vector<float> input(5 * 4, 1.0f);
        auto out = conv.forward(input, 1, 5, 4);
        assert(out.size() == 3 * 2);
        for (float v : out) {
            assert(nearly_equal(v, 9.5f));
        }
        std::cout << "Conv all-ones test: OK\n";
    }

    {
        // Test 3: FTSwish clamps negative responses to its threshold and
        // passes no gradient back through them.
        Conv2D conv(2, 3, std::make_shared<FTSwish>(-1.0f));
        std::fill(conv.weights().begin(), conv.weights().end(), -1.0f);
        std::vector<float> input(2 * 2 * 3 * 3, 1.0f);
        auto out = conv.forward(input, /*batch=*/2, 3, 3);
        assert(out.size() == 2 * 3);
        for (float v : out) {
            assert(v == -1.0f);
        }
        conv.zero_grad();
        auto grad_in = conv.backward(std::vector<float>(out.size(), 1.0f), 2, 3, 3);
        assert(grad_in.size() == input.size());
        for (float g : grad_in) assert(g == 0.0f);
        for (float g : conv.grad_weights()) assert(g == 0.0f);
        for (float g : conv.grad_bias()) assert(g == 0.0f);
        std::cout << "Conv FTSwish flat region: OK\n";
    }

    {
        // Test 4: analytic gradients match central differences on the smooth
        // (positive) side of FTSwish.
        std::mt19937 rng(7);
        std::uniform_real_distribution<float> pos(0.1f, 1.0f);
        std::uniform_real_distribution<float> wdist(0.05f, 0.5f);
        std::uniform_real_distribution<float> pdist(-1.0f, 1.0f);

        const std::size_t batch = 1, in_c = 2, out_c = 2, H = 5, W = 5;
        Conv2D conv(in_c, out_c, std::make_shared<FTSwish>());
        for (auto& v : conv.weights()) v = wdist(rng);
        for (auto& v : conv.bias()) v = wdist(rng);

        std::vector<float> input(batch * in_c * H * W);
        for (auto& v : input) v = pos(rng);

        auto out = conv.forward(input, batch, H, W);
        std::vector<float> probe(out.size());
        for (auto& v : probe) v = pdist(rng);

        conv.zero_grad();
        const auto grad_in = conv.backward(probe, batch, H, W);
        const std::vector<float> grad_w = conv.grad_weights();
        const std::vector<float> grad_b = conv.grad_bias();

        const float h = 1e-2f;
        auto check = [&](float& slot, float analytic, const char* what) {
            const float saved = slot;
            slot = saved + h;
            const double up = probe_loss(conv.forward(input, batch, H, W), probe);
            slot = saved - h;
            const double down = probe_loss(conv.forward(input, batch, H, W), probe);
            slot = saved;
            const double numeric = (up - down) / (2.0 * h);
            const double tol = 5e-3 + 1e-2 * std::abs(numeric);
            if (std::abs(numeric - analytic) > tol) {
                std::cerr << what << " gradient mismatch: analytic " << analytic
                          << " numeric " << numeric << "\n";
                assert(false);
            }
        };

        for (std::size_t i = 0; i < input.size(); i += 3) {
            check(input[i], grad_in[i], "input");
        }
        for (std::size_t i = 0; i < grad_w.size(); ++i) {
            check(conv.weights()[i], grad_w[i], "weight");
        }
        for (std::size_t i = 0; i < grad_b.size(); ++i) {
            check(conv.bias()[i], grad_b[i], "bias");
        }
        std::cout << "Conv gradient check: OK\n";
    }

    {
        // Backward before forward is an error.
        Conv2D conv(1, 1, nullptr);
        bool threw = false;
        try {
            conv.backward(std::vector<float>(4, 1.0f), 1, 4, 4);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Conv missing cache test: OK\n";
    }

    {
        // A zero upstream gradient does not mask a non-finite weight.
        Conv2D conv(1, 1, nullptr);
        std::fill(conv.weights().begin(), conv.weights().end(), 1.0f);
        conv.weights()[4] = std::numeric_limits<float>::infinity();
        conv.forward(std::vector<float>(9, 1.0f), 1, 3, 3);
        conv.zero_grad();
        const auto grad_in = conv.backward({0.0f}, 1, 3, 3);
        assert(std::isnan(grad_in[4]));
        assert(grad_in[0] == 0.0f);
        assert(conv.grad_weights()[4] == 0.0f);
        std::cout << "Conv non-finite weight test: OK\n";
    }

    std::cout << "All Conv2D sanity tests passed.\n";
    return 0;
}
