#pragma once

#include <cstddef>
#include <memory>
#include <random>
#include <vector>

#include "activations.h"
#include "layers.h"

// CIFAR-10 classifier: two conv/pool/dropout blocks, then three dense layers.
// Every hidden layer uses the activation given at construction; the head is
// linear + softmax.
class ConvNet {
public:
    static constexpr std::size_t kChannels = 3;
    static constexpr std::size_t kHeight = 32;
    static constexpr std::size_t kWidth = 32;
    static constexpr std::size_t kImageSize = kChannels * kHeight * kWidth;
    static constexpr float kDropoutRate = 0.5f;

    ConvNet(std::shared_ptr<const Activation> activation,
            std::size_t num_classes = 10,
            DataFormat format = DataFormat::kChannelsFirst,
            unsigned int seed = std::random_device{}());

    // Reinitialize kernels with He-normal (fan_in, truncated at 2 stddev)
    // and bias=0.
    void init_weights(unsigned int seed);

    // Forward pass. input holds `batch` images in the layout chosen at
    // construction. Returns reference to internal N x num_classes
    // probabilities.
    const std::vector<float>& forward(const std::vector<float>& input,
                                      std::size_t batch);

    // Backward given grad w.r.t. the probabilities. Accumulates gradients
    // into all trainable layers and returns grad_input (channel-first).
    std::vector<float> backward(const std::vector<float>& grad_output);

    void zero_grad();
    std::vector<Parameter> parameters();

    // Dropout is active only in training mode.
    void set_training(bool training);
    bool training() const { return training_; }

    std::size_t num_classes() const { return num_classes_; }
    DataFormat data_format() const { return format_; }
    const Activation& activation() const { return *activation_; }
    std::size_t flattened_size() const { return flat_size_; }

    Conv2D& conv1() { return conv1_; }
    Conv2D& conv2() { return conv2_; }
    Dense& dense1() { return dense1_; }
    Dense& dense2() { return dense2_; }
    Dense& dense3() { return dense3_; }
    const Conv2D& conv1() const { return conv1_; }
    const Conv2D& conv2() const { return conv2_; }
    const Dense& dense1() const { return dense1_; }
    const Dense& dense2() const { return dense2_; }
    const Dense& dense3() const { return dense3_; }

private:
    std::shared_ptr<const Activation> activation_;
    std::size_t num_classes_;
    DataFormat format_;
    bool training_ = true;

    // Spatial extents after each stage.
    std::size_t conv1_h_, conv1_w_;  // 30 x 30
    std::size_t pool1_h_, pool1_w_;  // 15 x 15
    std::size_t conv2_h_, conv2_w_;  // 13 x 13
    std::size_t pool2_h_, pool2_w_;  // 6 x 6
    std::size_t flat_size_;          // 128 * 6 * 6

    Conv2D conv1_;  // 3 -> 64
    MaxPool2x2 pool1_;
    Dropout drop1_;

    Conv2D conv2_;  // 64 -> 128
    MaxPool2x2 pool2_;
    Dropout drop2_;

    Dense dense1_;  // flat -> 512
    Dense dense2_;  // 512 -> 256
    Dense dense3_;  // 256 -> num_classes, linear
    Softmax softmax_;

    std::vector<float> probs_;
    std::size_t cached_batch_ = 0;
};
