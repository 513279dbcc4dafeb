#include "layers.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

bool nearly_equal(float a, float b, float eps = 1e-6f) {
    return std::abs(a - b) <= eps;
}

int main() {
    MaxPool2x2 pool;

    {
        // Forward test: simple 1x1x2x2
        std::vector<float> input = {1.0f, 2.0f, 3.0f, 4.0f};
        auto out = pool.forward(input, 1, 1, 2, 2);
        assert(out.size() == 1);
        assert(nearly_equal(out[0], 4.0f));

        std::vector<float> grad_out = {1.0f};
        auto grad_in = pool.backward(grad_out);
        // Only the max position (last element) should receive grad.
        std::vector<float> expected_grad_in = {0.0f, 0.0f, 0.0f, 1.0f};
        for (std::size_t i = 0; i < grad_in.size(); ++i) {
            assert(nearly_equal(grad_in[i], expected_grad_in[i]));
        }
        std::cout << "MaxPool 2x2 simple test: OK\n";
    }

    {
        // Odd extents drop the last row/column (13x13 -> 6x6 in the network).
        // Input 1x1x3x5:
        // 1 9 2 3 7
        // 4 5 8 6 9
        // 9 9 9 9 9
        std::vector<float> input = {
            1, 9, 2, 3, 7,  //
            4, 5, 8, 6, 9,  //
            9, 9, 9, 9, 9   //
        };
        auto out = pool.forward(input, 1, 1, 3, 5);
        const std::vector<float> expected_out = {9, 8};
        assert(out.size() == expected_out.size());
        for (std::size_t i = 0; i < out.size(); ++i) {
            assert(nearly_equal(out[i], expected_out[i]));
        }

        auto grad_in = pool.backward({2.0f, 3.0f});
        const std::vector<float> expected_grad_in = {
            0, 2, 0, 0, 0,  //
            0, 0, 3, 0, 0,  //
            0, 0, 0, 0, 0   //
        };
        assert(grad_in.size() == input.size());
        for (std::size_t i = 0; i < grad_in.size(); ++i) {
            assert(nearly_equal(grad_in[i], expected_grad_in[i]));
        }
        std::cout << "MaxPool odd-size test: OK\n";
    }

    {
        // Forward/Backward test on 2x1x4x4 with distinct values, flat
        // FTSwish-style ties in the second sample: first max wins.
        std::vector<float> input = {
            1, 2, 3, 4,  //
            5, 6, 7, 8,  //
            9, 1, 2, 3,  //
            4, 5, 6, 7,  //
            -1, -1, -1, -1,  //
            -1, -1, -1, -1,  //
            -1, -1, -1, -1,  //
            -1, -1, -1, -1   //
        };
        auto out = pool.forward(input, 2, 1, 4, 4);
        const std::vector<float> expected_out = {6, 8, 9, 7, -1, -1, -1, -1};
        for (std::size_t i = 0; i < out.size(); ++i) {
            assert(nearly_equal(out[i], expected_out[i]));
        }

        std::vector<float> grad_out(out.size(), 1.0f);
        auto grad_in = pool.backward(grad_out);
        const std::vector<float> expected_grad_in = {
            0, 0, 0, 0,  //
            0, 1, 0, 1,  //
            1, 0, 0, 0,  //
            0, 0, 0, 1,  //
            1, 0, 1, 0,  //
            0, 0, 0, 0,  //
            1, 0, 1, 0,  //
            0, 0, 0, 0   //
        };
        for (std::size_t i = 0; i < grad_in.size(); ++i) {
            assert(nearly_equal(grad_in[i], expected_grad_in[i]));
        }
        std::cout << "MaxPool 4x4 test: OK\n";
    }

    std::cout << "All MaxPool2x2 sanity tests passed.\n";
    return 0;
}
