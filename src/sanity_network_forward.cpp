#include "activations.h"
#include "convnet.h"
#include "dataset.h"
#include "layers.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

bool nearly_equal(float a, float b, float eps = 1e-5f) {
    return std::abs(a - b) <= eps;
}

void check_probabilities(const std::vector<float>& probs, std::size_t batch,
                         std::size_t classes) {
    assert(probs.size() == batch * classes);
    for (std::size_t n = 0; n < batch; ++n) {
        double sum = 0.0;
        for (std::size_t c = 0; c < classes; ++c) {
            const float p = probs[n * classes + c];
            assert(p >= 0.0f && p <= 1.0f);
            sum += p;
        }
        assert(std::abs(sum - 1.0) <= 1e-5);
    }
}

int main() {
    const std::size_t batch = 4;
    const std::size_t classes = 10;

    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> pixel(0.0f, 1.0f);
    std::vector<float> images(batch * ConvNet::kImageSize);
    for (auto& v : images) v = pixel(rng);
    const auto targets = to_categorical({0, 3, 7, 9}, classes);
    assert(targets.size() == batch * classes);

    {
        // Architecture: 32 -> 30 -> 15 -> 13 -> 6, 128 * 6 * 6 flattened.
        ConvNet net(std::make_shared<FTSwish>(), classes,
                    DataFormat::kChannelsFirst, 42);
        assert(net.flattened_size() == 128 * 6 * 6);
        assert(net.conv1().weights().size() == 64 * 3 * 3 * 3);
        assert(net.conv2().weights().size() == 128 * 64 * 3 * 3);
        assert(net.dense1().weights().size() == 4608 * 512);
        assert(net.dense2().weights().size() == 512 * 256);
        assert(net.dense3().weights().size() == 256 * classes);
        assert(net.activation().name() == "ftswish");

        // He init: zero bias, weights within the 2-sigma truncation.
        for (float b : net.conv2().bias()) assert(b == 0.0f);
        const float bound = 2.0f * std::sqrt(2.0f / (64 * 9)) / 0.87962566f;
        for (float w : net.conv2().weights()) assert(std::abs(w) <= bound * 1.0001f);
        std::cout << "ConvNet architecture: OK\n";
    }

    {
        // One forward pass over 4 synthetic images in inference mode.
        ConvNet net(std::make_shared<FTSwish>(), classes,
                    DataFormat::kChannelsFirst, 42);
        net.set_training(false);
        const auto probs = net.forward(images, batch);
        check_probabilities(probs, batch, classes);

        // Dropout is off: a second pass is identical.
        const auto again = net.forward(images, batch);
        for (std::size_t i = 0; i < probs.size(); ++i) {
            assert(probs[i] == again[i]);
        }
        std::cout << "ConvNet inference forward: OK\n";
    }

    {
        // Training mode still yields a distribution per row, and backward
        // returns an input-shaped gradient.
        ConvNet net(std::make_shared<FTSwish>(), classes,
                    DataFormat::kChannelsFirst, 42);
        net.set_training(true);
        const auto probs = net.forward(images, batch);
        check_probabilities(probs, batch, classes);

        CategoricalCrossEntropy cce;
        const float loss = cce.forward(probs, targets, batch);
        assert(std::isfinite(loss) && loss > 0.0f);
        net.zero_grad();
        const auto grad_in = net.backward(cce.backward(probs, targets, batch));
        assert(grad_in.size() == images.size());

        bool any_grad = false;
        for (const auto& p : net.parameters()) {
            for (float g : *p.grad) {
                assert(std::isfinite(g));
                if (g != 0.0f) any_grad = true;
            }
        }
        assert(any_grad);
        assert(net.parameters().size() == 10);
        std::cout << "ConvNet training forward/backward: OK\n";
    }

    {
        // Channel-last input gives the same answer as its channel-first twin.
        ConvNet first(std::make_shared<FTSwish>(), classes,
                      DataFormat::kChannelsFirst, 9);
        ConvNet last(std::make_shared<FTSwish>(), classes,
                     DataFormat::kChannelsLast, 9);
        first.set_training(false);
        last.set_training(false);

        std::vector<float> hwc(images.size());
        for (std::size_t n = 0; n < batch; ++n) {
            for (std::size_t c = 0; c < 3; ++c) {
                for (std::size_t p = 0; p < 32 * 32; ++p) {
                    hwc[n * ConvNet::kImageSize + p * 3 + c] =
                        images[n * ConvNet::kImageSize + c * 32 * 32 + p];
                }
            }
        }
        const auto a = first.forward(images, batch);
        const auto b = last.forward(hwc, batch);
        for (std::size_t i = 0; i < a.size(); ++i) {
            assert(nearly_equal(a[i], b[i], 1e-6f));
        }
        std::cout << "ConvNet channels-last input: OK\n";
    }

    {
        // Two thresholds coexist in one process.
        ConvNet shallow(std::make_shared<FTSwish>(-0.25f), classes,
                        DataFormat::kChannelsFirst, 42);
        ConvNet deep(std::make_shared<FTSwish>(-1.0f), classes,
                     DataFormat::kChannelsFirst, 42);
        shallow.set_training(false);
        deep.set_training(false);
        const auto a = shallow.forward(images, batch);
        const auto b = deep.forward(images, batch);
        check_probabilities(a, batch, classes);
        check_probabilities(b, batch, classes);
        bool differs = false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) differs = true;
        }
        assert(differs);
        std::cout << "ConvNet independent thresholds: OK\n";
    }

    {
        // Wrong input size is rejected on the first forward pass.
        ConvNet net(std::make_shared<FTSwish>(), classes,
                    DataFormat::kChannelsFirst, 42);
        bool threw = false;
        try {
            net.forward(std::vector<float>(batch * 3 * 28 * 28, 0.0f), batch);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            ConvNet bad(nullptr, classes);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        std::cout << "ConvNet input validation: OK\n";
    }

    std::cout << "All ConvNet forward sanity tests passed.\n";
    return 0;
}
