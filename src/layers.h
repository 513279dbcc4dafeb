#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "activations.h"

// Memory layout of image batches. Layers compute channel-first (N, C, H, W).
enum class DataFormat { kChannelsFirst, kChannelsLast };

// Trainable buffer and its gradient, handed to the optimizer.
struct Parameter {
    std::vector<float>* value;
    std::vector<float>* grad;
};

// N x H x W x C -> N x C x H x W.
std::vector<float> to_channels_first(const std::vector<float>& input,
                                     std::size_t batch, std::size_t channels,
                                     std::size_t height, std::size_t width);

// 3x3 convolution, stride 1, no padding, channel-first (N, C, H, W), with a
// fused activation (null activation = linear).
class Conv2D {
public:
    Conv2D(std::size_t in_channels, std::size_t out_channels,
           std::shared_ptr<const Activation> activation);

    // input shape: N x in_channels x H x W
    // output shape: N x out_channels x (H - 2) x (W - 2)
    std::vector<float> forward(const std::vector<float>& input,
                               std::size_t batch,
                               std::size_t height,
                               std::size_t width);

    // grad_output has the output shape. Height/width are the input extents
    // given to forward. Accumulates grad_weight/grad_bias, returns grad_input.
    std::vector<float> backward(const std::vector<float>& grad_output,
                                std::size_t batch,
                                std::size_t height,
                                std::size_t width);

    void zero_grad();
    std::vector<Parameter> parameters();

    std::size_t in_channels() const { return in_channels_; }
    std::size_t out_channels() const { return out_channels_; }
    std::size_t fan_in() const { return in_channels_ * 3 * 3; }

    std::vector<float>& weights() { return weights_; }
    std::vector<float>& bias() { return bias_; }
    const std::vector<float>& weights() const { return weights_; }
    const std::vector<float>& bias() const { return bias_; }
    const std::vector<float>& grad_weights() const { return grad_weights_; }
    const std::vector<float>& grad_bias() const { return grad_bias_; }

private:
    std::size_t in_channels_;
    std::size_t out_channels_;
    std::shared_ptr<const Activation> activation_;
    std::vector<float> weights_;      // [out_c, in_c, 3, 3]
    std::vector<float> bias_;         // [out_c]
    std::vector<float> grad_weights_; // same shape as weights
    std::vector<float> grad_bias_;    // [out_c]

    // Cache for backward.
    std::vector<float> input_cache_;
    std::vector<float> pre_activation_;
    std::size_t cached_batch_ = 0;
    std::size_t cached_h_ = 0;
    std::size_t cached_w_ = 0;
};

// MaxPooling 2x2 stride 2 (channel-first). Odd trailing rows/cols are dropped.
class MaxPool2x2 {
public:
    // input: N x C x H x W, output: N x C x (H/2) x (W/2)
    std::vector<float> forward(const std::vector<float>& input,
                               std::size_t batch,
                               std::size_t channels,
                               std::size_t height,
                               std::size_t width);

    // grad_output: same shape as forward output. Returns grad_input shape of input.
    std::vector<float> backward(const std::vector<float>& grad_output);

private:
    std::vector<std::size_t> max_indices_;  // position in input for each output
    std::size_t cached_batch_ = 0;
    std::size_t cached_channels_ = 0;
    std::size_t cached_in_h_ = 0;
    std::size_t cached_in_w_ = 0;
};

// Inverted dropout. Drops `rate` of the activations while training and scales
// the rest by 1 / (1 - rate); identity otherwise.
class Dropout {
public:
    explicit Dropout(float rate, unsigned int seed = std::random_device{}());

    std::vector<float> forward(const std::vector<float>& input);
    std::vector<float> backward(const std::vector<float>& grad_output);

    void set_training(bool training) { training_ = training; }
    bool training() const { return training_; }
    float rate() const { return rate_; }

private:
    float rate_;
    bool training_ = true;
    std::mt19937 rng_;
    std::vector<uint8_t> mask_;  // 1 if kept
    bool cached_training_ = false;
    std::size_t cached_size_ = 0;
};

// Fully connected y = xW + b over N x in, with fused activation
// (null activation = linear).
class Dense {
public:
    Dense(std::size_t in_features, std::size_t out_features,
          std::shared_ptr<const Activation> activation);

    // input: N x in, output: N x out
    std::vector<float> forward(const std::vector<float>& input, std::size_t batch);
    std::vector<float> backward(const std::vector<float>& grad_output);

    void zero_grad();
    std::vector<Parameter> parameters();

    std::size_t in_features() const { return in_features_; }
    std::size_t out_features() const { return out_features_; }

    std::vector<float>& weights() { return weights_; }
    std::vector<float>& bias() { return bias_; }
    const std::vector<float>& weights() const { return weights_; }
    const std::vector<float>& bias() const { return bias_; }
    const std::vector<float>& grad_weights() const { return grad_weights_; }
    const std::vector<float>& grad_bias() const { return grad_bias_; }

private:
    std::size_t in_features_;
    std::size_t out_features_;
    std::shared_ptr<const Activation> activation_;
    std::vector<float> weights_;      // [in, out]
    std::vector<float> bias_;         // [out]
    std::vector<float> grad_weights_;
    std::vector<float> grad_bias_;

    std::vector<float> input_cache_;
    std::vector<float> pre_activation_;
    std::size_t cached_batch_ = 0;
};

// Row-wise softmax over N x classes.
class Softmax {
public:
    std::vector<float> forward(const std::vector<float>& input,
                               std::size_t batch, std::size_t classes);

    // Jacobian-vector product: dx = y * (g - sum(g * y)) per row.
    std::vector<float> backward(const std::vector<float>& grad_output) const;

private:
    std::vector<float> output_cache_;
    std::size_t cached_batch_ = 0;
    std::size_t cached_classes_ = 0;
};

// Categorical cross-entropy on probabilities, mean over the batch.
class CategoricalCrossEntropy {
public:
    static constexpr float kEpsilon = 1e-7f;

    // Returns -mean_n sum_c target * log(clip(prob)).
    float forward(const std::vector<float>& probs,
                  const std::vector<float>& target,
                  std::size_t batch) const;

    // Returns grad w.r.t probs: -target / clip(prob) / N.
    std::vector<float> backward(const std::vector<float>& probs,
                                const std::vector<float>& target,
                                std::size_t batch) const;
};
