#include "convnet.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace {
constexpr std::size_t kConv1Filters = 64;
constexpr std::size_t kConv2Filters = 128;
constexpr std::size_t kDense1Units = 512;
constexpr std::size_t kDense2Units = 256;

// stddev of a unit normal truncated to [-2, 2].
constexpr float kTruncatedNormalStd = 0.87962566103423978f;

inline float he_std(std::size_t fan_in) {
    return std::sqrt(2.0f / static_cast<float>(fan_in));
}

void he_normal(std::vector<float>& weights, std::size_t fan_in,
               std::mt19937& rng) {
    const float stddev = he_std(fan_in) / kTruncatedNormalStd;
    std::normal_distribution<float> dist(0.0f, stddev);
    for (auto& v : weights) {
        float sample = dist(rng);
        while (std::fabs(sample) > 2.0f * stddev) {
            sample = dist(rng);
        }
        v = sample;
    }
}
}  // namespace

ConvNet::ConvNet(std::shared_ptr<const Activation> activation,
                 std::size_t num_classes, DataFormat format, unsigned int seed)
    : activation_(std::move(activation)),
      num_classes_(num_classes),
      format_(format),
      conv1_h_(kHeight - 2),
      conv1_w_(kWidth - 2),
      pool1_h_(conv1_h_ / 2),
      pool1_w_(conv1_w_ / 2),
      conv2_h_(pool1_h_ - 2),
      conv2_w_(pool1_w_ - 2),
      pool2_h_(conv2_h_ / 2),
      pool2_w_(conv2_w_ / 2),
      flat_size_(kConv2Filters * pool2_h_ * pool2_w_),
      conv1_(kChannels, kConv1Filters, activation_),
      drop1_(kDropoutRate, seed + 1),
      conv2_(kConv1Filters, kConv2Filters, activation_),
      drop2_(kDropoutRate, seed + 2),
      dense1_(flat_size_, kDense1Units, activation_),
      dense2_(kDense1Units, kDense2Units, activation_),
      dense3_(kDense2Units, num_classes, nullptr) {
    if (!activation_) {
        throw std::invalid_argument("ConvNet requires an activation");
    }
    if (num_classes_ < 2) {
        throw std::invalid_argument("ConvNet requires at least 2 classes");
    }
    init_weights(seed);
}

void ConvNet::init_weights(unsigned int seed) {
    std::mt19937 rng(seed);
    he_normal(conv1_.weights(), conv1_.fan_in(), rng);
    he_normal(conv2_.weights(), conv2_.fan_in(), rng);
    he_normal(dense1_.weights(), dense1_.in_features(), rng);
    he_normal(dense2_.weights(), dense2_.in_features(), rng);
    he_normal(dense3_.weights(), dense3_.in_features(), rng);
    for (auto* b : {&conv1_.bias(), &conv2_.bias(), &dense1_.bias(),
                    &dense2_.bias(), &dense3_.bias()}) {
        std::fill(b->begin(), b->end(), 0.0f);
    }
}

const std::vector<float>& ConvNet::forward(const std::vector<float>& input,
                                           std::size_t batch) {
    if (batch == 0) {
        throw std::runtime_error("ConvNet forward on empty batch");
    }
    if (input.size() != batch * kImageSize) {
        throw std::runtime_error("ConvNet input size mismatch: expected " +
                                 std::to_string(batch * kImageSize) + " values, got " +
                                 std::to_string(input.size()));
    }
    cached_batch_ = batch;

    const std::vector<float> nchw =
        format_ == DataFormat::kChannelsLast
            ? to_channels_first(input, batch, kChannels, kHeight, kWidth)
            : input;

    auto act = conv1_.forward(nchw, batch, kHeight, kWidth);                 // N x 64 x 30 x 30
    act = pool1_.forward(act, batch, kConv1Filters, conv1_h_, conv1_w_);      // N x 64 x 15 x 15
    act = drop1_.forward(act);
    act = conv2_.forward(act, batch, pool1_h_, pool1_w_);                     // N x 128 x 13 x 13
    act = pool2_.forward(act, batch, kConv2Filters, conv2_h_, conv2_w_);      // N x 128 x 6 x 6
    act = drop2_.forward(act);
    // Flatten is a no-op on the contiguous buffer: N x 4608.
    act = dense1_.forward(act, batch);                                        // N x 512
    act = dense2_.forward(act, batch);                                        // N x 256
    act = dense3_.forward(act, batch);                                        // N x classes
    probs_ = softmax_.forward(act, batch, num_classes_);
    return probs_;
}

std::vector<float> ConvNet::backward(const std::vector<float>& grad_output) {
    if (probs_.empty()) {
        throw std::runtime_error("Backward called before forward");
    }
    if (grad_output.size() != cached_batch_ * num_classes_) {
        throw std::runtime_error("grad_output size mismatch in backward");
    }

    auto grad = softmax_.backward(grad_output);
    grad = dense3_.backward(grad);
    grad = dense2_.backward(grad);
    grad = dense1_.backward(grad);
    grad = drop2_.backward(grad);
    grad = pool2_.backward(grad);
    grad = conv2_.backward(grad, cached_batch_, pool1_h_, pool1_w_);
    grad = drop1_.backward(grad);
    grad = pool1_.backward(grad);
    return conv1_.backward(grad, cached_batch_, kHeight, kWidth);
}

void ConvNet::zero_grad() {
    conv1_.zero_grad();
    conv2_.zero_grad();
    dense1_.zero_grad();
    dense2_.zero_grad();
    dense3_.zero_grad();
}

std::vector<Parameter> ConvNet::parameters() {
    std::vector<Parameter> params;
    for (auto&& layer_params : {conv1_.parameters(), conv2_.parameters(),
                                dense1_.parameters(), dense2_.parameters(),
                                dense3_.parameters()}) {
        params.insert(params.end(), layer_params.begin(), layer_params.end());
    }
    return params;
}

void ConvNet::set_training(bool training) {
    training_ = training;
    drop1_.set_training(training);
    drop2_.set_training(training);
}
