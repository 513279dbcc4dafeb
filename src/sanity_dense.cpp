#include "activations.h"
#include "layers.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

bool nearly_equal(float a, float b, float eps = 1e-5f) {
    return std::abs(a - b) <= eps;
}

int main() {
    {
        // y = xW + b with W laid out [in, out].
        Dense dense(2, 3, nullptr);
        dense.weights() = {1, 2, 3,   //
                           4, 5, 6};  //
        dense.bias() = {0.5f, 0.0f, -0.5f};
        const std::vector<float> input = {1, 1,   //
                                          2, -1};  //
        auto out = dense.forward(input, 2);
        const std::vector<float> expected = {5.5f, 7, 8.5f, -1.5f, -1, -0.5f};
        assert(out.size() == expected.size());
        for (std::size_t i = 0; i < out.size(); ++i) {
            assert(nearly_equal(out[i], expected[i]));
        }

        dense.zero_grad();
        auto grad_in = dense.backward(std::vector<float>(6, 1.0f));
        // grad_in[n, i] = sum_o W[i, o]
        const std::vector<float> expected_grad_in = {6, 15, 6, 15};
        for (std::size_t i = 0; i < grad_in.size(); ++i) {
            assert(nearly_equal(grad_in[i], expected_grad_in[i]));
        }
        // grad_W[i, o] = sum_n x[n, i]
        const std::vector<float> expected_grad_w = {3, 3, 3, 0, 0, 0};
        for (std::size_t i = 0; i < expected_grad_w.size(); ++i) {
            assert(nearly_equal(dense.grad_weights()[i], expected_grad_w[i]));
        }
        for (float g : dense.grad_bias()) {
            assert(nearly_equal(g, 2.0f));
        }
        std::cout << "Dense linear test: OK\n";
    }

    {
        // FTSwish head: gradient matches central differences. Biases of +-1.5
        // with small weights keep every pre-activation away from the kink, so
        // both the flat and the smooth branch are exercised.
        std::mt19937 rng(11);
        std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
        std::uniform_real_distribution<float> small(-0.2f, 0.2f);

        const std::size_t batch = 3, in = 4, out_f = 6;
        Dense dense(in, out_f, std::make_shared<FTSwish>());
        for (auto& v : dense.weights()) v = small(rng);
        for (std::size_t o = 0; o < out_f; ++o) {
            dense.bias()[o] = (o % 2 == 0) ? 1.5f : -1.5f;
        }
        std::vector<float> input(batch * in);
        for (auto& v : input) v = dist(rng);
        std::vector<float> probe(batch * out_f);
        for (auto& v : probe) v = dist(rng);

        auto out = dense.forward(input, batch);
        for (std::size_t n = 0; n < batch; ++n) {
            for (std::size_t o = 0; o < out_f; ++o) {
                const float v = out[n * out_f + o];
                if (o % 2 == 0) {
                    assert(v > -1.0f);
                } else {
                    assert(v == -1.0f);
                }
            }
        }

        auto loss_at = [&]() {
            const auto y = dense.forward(input, batch);
            double acc = 0.0;
            for (std::size_t i = 0; i < y.size(); ++i) acc += static_cast<double>(y[i]) * probe[i];
            return acc;
        };

        dense.forward(input, batch);
        dense.zero_grad();
        const auto grad_in = dense.backward(probe);
        const std::vector<float> grad_w = dense.grad_weights();

        const float h = 1e-2f;
        for (std::size_t i = 0; i < input.size(); ++i) {
            const float saved = input[i];
            input[i] = saved + h;
            const double up = loss_at();
            input[i] = saved - h;
            const double down = loss_at();
            input[i] = saved;
            const double numeric = (up - down) / (2.0 * h);
            assert(std::abs(numeric - grad_in[i]) < 2e-3 + 1e-2 * std::abs(numeric));
        }
        for (std::size_t i = 0; i < grad_w.size(); ++i) {
            float& slot = dense.weights()[i];
            const float saved = slot;
            slot = saved + h;
            const double up = loss_at();
            slot = saved - h;
            const double down = loss_at();
            slot = saved;
            const double numeric = (up - down) / (2.0 * h);
            assert(std::abs(numeric - grad_w[i]) < 2e-3 + 1e-2 * std::abs(numeric));
            if (i % out_f % 2 == 1) {
                assert(grad_w[i] == 0.0f);
            }
        }
        std::cout << "Dense FTSwish gradient check: OK\n";
    }

    {
        Dense dense(3, 2, nullptr);
        bool threw = false;
        try {
            dense.forward(std::vector<float>(5, 0.0f), 2);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "Dense shape mismatch test: OK\n";
    }

    {
        // A zero input does not mask a non-finite weight.
        Dense dense(2, 1, nullptr);
        dense.weights() = {std::numeric_limits<float>::infinity(), 1.0f};
        const auto out = dense.forward({0.0f, 1.0f}, 1);
        assert(std::isnan(out[0]));
        std::cout << "Dense non-finite weight test: OK\n";
    }

    std::cout << "All Dense sanity tests passed.\n";
    return 0;
}
