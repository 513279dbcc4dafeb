#include "layers.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>

namespace {
inline std::size_t idx4(std::size_t n, std::size_t c, std::size_t h,
                        std::size_t w, std::size_t C, std::size_t H,
                        std::size_t W) {
    return ((n * C + c) * H + h) * W + w;
}

inline std::size_t weight_idx(std::size_t oc, std::size_t ic, std::size_t kh,
                              std::size_t kw, std::size_t in_c) {
    return ((oc * in_c + ic) * 3 + kh) * 3 + kw;
}
}  // namespace

std::vector<float> to_channels_first(const std::vector<float>& input,
                                     std::size_t batch, std::size_t channels,
                                     std::size_t height, std::size_t width) {
    if (input.size() != batch * channels * height * width) {
        throw std::runtime_error("to_channels_first input size mismatch");
    }
    std::vector<float> output(input.size());
    for (std::size_t n = 0; n < batch; ++n) {
        for (std::size_t h = 0; h < height; ++h) {
            for (std::size_t w = 0; w < width; ++w) {
                for (std::size_t c = 0; c < channels; ++c) {
                    const std::size_t src =
                        ((n * height + h) * width + w) * channels + c;
                    output[idx4(n, c, h, w, channels, height, width)] = input[src];
                }
            }
        }
    }
    return output;
}

Conv2D::Conv2D(std::size_t in_channels, std::size_t out_channels,
               std::shared_ptr<const Activation> activation)
    : in_channels_(in_channels),
      out_channels_(out_channels),
      activation_(std::move(activation)),
      weights_(out_channels * in_channels * 3 * 3, 0.0f),
      bias_(out_channels, 0.0f),
      grad_weights_(out_channels * in_channels * 3 * 3, 0.0f),
      grad_bias_(out_channels, 0.0f) {}

std::vector<float> Conv2D::forward(const std::vector<float>& input,
                                   std::size_t batch, std::size_t height,
                                   std::size_t width) {
    if (height < 3 || width < 3) {
        throw std::runtime_error("Conv2D expects height and width >= 3");
    }
    if (input.size() != batch * in_channels_ * height * width) {
        throw std::runtime_error("Conv2D forward input size mismatch");
    }
    const std::size_t out_h = height - 2;
    const std::size_t out_w = width - 2;
    std::vector<float> output(batch * out_channels_ * out_h * out_w, 0.0f);

    input_cache_ = input;
    cached_batch_ = batch;
    cached_h_ = height;
    cached_w_ = width;

    for (std::size_t n = 0; n < batch; ++n) {
        for (std::size_t oc = 0; oc < out_channels_; ++oc) {
            for (std::size_t h = 0; h < out_h; ++h) {
                for (std::size_t w = 0; w < out_w; ++w) {
                    float acc = bias_[oc];
                    for (std::size_t ic = 0; ic < in_channels_; ++ic) {
                        for (std::size_t kh = 0; kh < 3; ++kh) {
                            for (std::size_t kw = 0; kw < 3; ++kw) {
                                const std::size_t in_idx =
                                    idx4(n, ic, h + kh, w + kw, in_channels_,
                                         height, width);
                                acc += input[in_idx] *
                                       weights_[weight_idx(oc, ic, kh, kw, in_channels_)];
                            }
                        }
                    }
                    output[idx4(n, oc, h, w, out_channels_, out_h, out_w)] = acc;
                }
            }
        }
    }

    pre_activation_ = output;
    if (activation_) {
        activation_->apply_inplace(output);
    }
    return output;
}

std::vector<float> Conv2D::backward(const std::vector<float>& grad_output,
                                    std::size_t batch, std::size_t height,
                                    std::size_t width) {
    if (input_cache_.empty()) {
        throw std::runtime_error("Conv2D backward called without forward cache");
    }
    if (batch != cached_batch_ || height != cached_h_ || width != cached_w_) {
        throw std::runtime_error("Conv2D backward shape mismatch with cache");
    }
    const std::size_t out_h = height - 2;
    const std::size_t out_w = width - 2;
    if (grad_output.size() != batch * out_channels_ * out_h * out_w) {
        throw std::runtime_error("Conv2D backward grad_output size mismatch");
    }

    const std::vector<float> grad_pre =
        activation_ ? activation_->backward(pre_activation_, grad_output)
                    : grad_output;

    std::vector<float> grad_input(batch * in_channels_ * height * width, 0.0f);

    // Grad bias: sum over N, H, W.
    for (std::size_t n = 0; n < batch; ++n) {
        for (std::size_t oc = 0; oc < out_channels_; ++oc) {
            float acc = 0.0f;
            for (std::size_t h = 0; h < out_h; ++h) {
                for (std::size_t w = 0; w < out_w; ++w) {
                    acc += grad_pre[idx4(n, oc, h, w, out_channels_, out_h, out_w)];
                }
            }
            grad_bias_[oc] += acc;
        }
    }

    // Grad weights and grad input.
    for (std::size_t n = 0; n < batch; ++n) {
        for (std::size_t oc = 0; oc < out_channels_; ++oc) {
            for (std::size_t h = 0; h < out_h; ++h) {
                for (std::size_t w = 0; w < out_w; ++w) {
                    const float go =
                        grad_pre[idx4(n, oc, h, w, out_channels_, out_h, out_w)];
                    for (std::size_t ic = 0; ic < in_channels_; ++ic) {
                        for (std::size_t kh = 0; kh < 3; ++kh) {
                            for (std::size_t kw = 0; kw < 3; ++kw) {
                                const std::size_t in_idx =
                                    idx4(n, ic, h + kh, w + kw, in_channels_,
                                         height, width);
                                const std::size_t w_idx =
                                    weight_idx(oc, ic, kh, kw, in_channels_);
                                grad_weights_[w_idx] += input_cache_[in_idx] * go;
                                grad_input[in_idx] += weights_[w_idx] * go;
                            }
                        }
                    }
                }
            }
        }
    }

    return grad_input;
}

void Conv2D::zero_grad() {
    std::fill(grad_weights_.begin(), grad_weights_.end(), 0.0f);
    std::fill(grad_bias_.begin(), grad_bias_.end(), 0.0f);
}

std::vector<Parameter> Conv2D::parameters() {
    return {{&weights_, &grad_weights_}, {&bias_, &grad_bias_}};
}

std::vector<float> MaxPool2x2::forward(const std::vector<float>& input,
                                       std::size_t batch,
                                       std::size_t channels,
                                       std::size_t height,
                                       std::size_t width) {
    if (height < 2 || width < 2) {
        throw std::runtime_error("MaxPool2x2 expects height and width >= 2");
    }
    if (input.size() != batch * channels * height * width) {
        throw std::runtime_error("MaxPool2x2 forward input size mismatch");
    }
    const std::size_t out_h = height / 2;
    const std::size_t out_w = width / 2;
    std::vector<float> output(batch * channels * out_h * out_w, 0.0f);
    max_indices_.resize(output.size());

    cached_batch_ = batch;
    cached_channels_ = channels;
    cached_in_h_ = height;
    cached_in_w_ = width;

    for (std::size_t n = 0; n < batch; ++n) {
        for (std::size_t c = 0; c < channels; ++c) {
            for (std::size_t oh = 0; oh < out_h; ++oh) {
                for (std::size_t ow = 0; ow < out_w; ++ow) {
                    const std::size_t h0 = oh * 2;
                    const std::size_t w0 = ow * 2;
                    float max_val = -std::numeric_limits<float>::infinity();
                    std::size_t max_idx = idx4(n, c, h0, w0, channels, height, width);
                    for (std::size_t kh = 0; kh < 2; ++kh) {
                        for (std::size_t kw = 0; kw < 2; ++kw) {
                            const std::size_t in_idx =
                                idx4(n, c, h0 + kh, w0 + kw, channels, height, width);
                            if (input[in_idx] > max_val) {
                                max_val = input[in_idx];
                                max_idx = in_idx;
                            }
                        }
                    }
                    const std::size_t out_idx =
                        idx4(n, c, oh, ow, channels, out_h, out_w);
                    // All-NaN window: forward the NaN.
                    output[out_idx] = input[max_idx];
                    max_indices_[out_idx] = max_idx;
                }
            }
        }
    }
    return output;
}

std::vector<float> MaxPool2x2::backward(
    const std::vector<float>& grad_output) {
    if (max_indices_.empty()) {
        throw std::runtime_error("MaxPool2x2 backward called without forward cache");
    }
    if (grad_output.size() != max_indices_.size()) {
        throw std::runtime_error("MaxPool2x2 backward grad_output size mismatch");
    }

    std::vector<float> grad_input(cached_batch_ * cached_channels_ * cached_in_h_ *
                                      cached_in_w_,
                                  0.0f);
    for (std::size_t i = 0; i < grad_output.size(); ++i) {
        grad_input[max_indices_[i]] += grad_output[i];
    }
    return grad_input;
}

Dropout::Dropout(float rate, unsigned int seed) : rate_(rate), rng_(seed) {
    if (!(rate >= 0.0f && rate < 1.0f)) {
        throw std::invalid_argument("Dropout rate must be in [0, 1)");
    }
}

std::vector<float> Dropout::forward(const std::vector<float>& input) {
    cached_training_ = training_;
    cached_size_ = input.size();
    if (!training_ || rate_ == 0.0f) {
        cached_training_ = false;
        return input;
    }

    std::bernoulli_distribution keep(1.0f - rate_);
    const float scale = 1.0f / (1.0f - rate_);
    mask_.resize(input.size());
    std::vector<float> output(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        mask_[i] = keep(rng_) ? 1 : 0;
        output[i] = mask_[i] ? input[i] * scale : 0.0f;
    }
    return output;
}

std::vector<float> Dropout::backward(const std::vector<float>& grad_output) {
    if (grad_output.size() != cached_size_) {
        throw std::runtime_error("Dropout backward called without forward cache");
    }
    if (!cached_training_) {
        return grad_output;
    }
    const float scale = 1.0f / (1.0f - rate_);
    std::vector<float> grad_input(grad_output.size());
    for (std::size_t i = 0; i < grad_output.size(); ++i) {
        grad_input[i] = mask_[i] ? grad_output[i] * scale : 0.0f;
    }
    return grad_input;
}

Dense::Dense(std::size_t in_features, std::size_t out_features,
             std::shared_ptr<const Activation> activation)
    : in_features_(in_features),
      out_features_(out_features),
      activation_(std::move(activation)),
      weights_(in_features * out_features, 0.0f),
      bias_(out_features, 0.0f),
      grad_weights_(in_features * out_features, 0.0f),
      grad_bias_(out_features, 0.0f) {}

std::vector<float> Dense::forward(const std::vector<float>& input,
                                  std::size_t batch) {
    if (input.size() != batch * in_features_) {
        throw std::runtime_error("Dense forward input size mismatch");
    }
    input_cache_ = input;
    cached_batch_ = batch;

    std::vector<float> output(batch * out_features_);
    for (std::size_t n = 0; n < batch; ++n) {
        float* out_row = output.data() + n * out_features_;
        std::copy(bias_.begin(), bias_.end(), out_row);
        const float* in_row = input.data() + n * in_features_;
        for (std::size_t i = 0; i < in_features_; ++i) {
            const float x = in_row[i];
            const float* w_row = weights_.data() + i * out_features_;
            for (std::size_t o = 0; o < out_features_; ++o) {
                out_row[o] += x * w_row[o];
            }
        }
    }

    pre_activation_ = output;
    if (activation_) {
        activation_->apply_inplace(output);
    }
    return output;
}

std::vector<float> Dense::backward(const std::vector<float>& grad_output) {
    if (input_cache_.empty()) {
        throw std::runtime_error("Dense backward called without forward cache");
    }
    if (grad_output.size() != cached_batch_ * out_features_) {
        throw std::runtime_error("Dense backward grad_output size mismatch");
    }

    const std::vector<float> grad_pre =
        activation_ ? activation_->backward(pre_activation_, grad_output)
                    : grad_output;

    std::vector<float> grad_input(cached_batch_ * in_features_, 0.0f);
    for (std::size_t n = 0; n < cached_batch_; ++n) {
        const float* g_row = grad_pre.data() + n * out_features_;
        const float* in_row = input_cache_.data() + n * in_features_;
        float* gi_row = grad_input.data() + n * in_features_;
        for (std::size_t o = 0; o < out_features_; ++o) {
            grad_bias_[o] += g_row[o];
        }
        for (std::size_t i = 0; i < in_features_; ++i) {
            const float x = in_row[i];
            const float* w_row = weights_.data() + i * out_features_;
            float* gw_row = grad_weights_.data() + i * out_features_;
            float acc = 0.0f;
            for (std::size_t o = 0; o < out_features_; ++o) {
                gw_row[o] += x * g_row[o];
                acc += w_row[o] * g_row[o];
            }
            gi_row[i] = acc;
        }
    }
    return grad_input;
}

void Dense::zero_grad() {
    std::fill(grad_weights_.begin(), grad_weights_.end(), 0.0f);
    std::fill(grad_bias_.begin(), grad_bias_.end(), 0.0f);
}

std::vector<Parameter> Dense::parameters() {
    return {{&weights_, &grad_weights_}, {&bias_, &grad_bias_}};
}

std::vector<float> Softmax::forward(const std::vector<float>& input,
                                    std::size_t batch, std::size_t classes) {
    if (classes == 0 || input.size() != batch * classes) {
        throw std::runtime_error("Softmax forward input size mismatch");
    }
    std::vector<float> output(input.size());
    for (std::size_t n = 0; n < batch; ++n) {
        const float* in_row = input.data() + n * classes;
        float* out_row = output.data() + n * classes;
        const float max_val = *std::max_element(in_row, in_row + classes);
        float sum = 0.0f;
        for (std::size_t c = 0; c < classes; ++c) {
            out_row[c] = std::exp(in_row[c] - max_val);
            sum += out_row[c];
        }
        for (std::size_t c = 0; c < classes; ++c) {
            out_row[c] /= sum;
        }
    }
    output_cache_ = output;
    cached_batch_ = batch;
    cached_classes_ = classes;
    return output;
}

std::vector<float> Softmax::backward(const std::vector<float>& grad_output) const {
    if (output_cache_.empty()) {
        throw std::runtime_error("Softmax backward called without forward cache");
    }
    if (grad_output.size() != output_cache_.size()) {
        throw std::runtime_error("Softmax backward grad_output size mismatch");
    }
    std::vector<float> grad_input(grad_output.size());
    for (std::size_t n = 0; n < cached_batch_; ++n) {
        const std::size_t off = n * cached_classes_;
        float dot = 0.0f;
        for (std::size_t c = 0; c < cached_classes_; ++c) {
            dot += grad_output[off + c] * output_cache_[off + c];
        }
        for (std::size_t c = 0; c < cached_classes_; ++c) {
            grad_input[off + c] = output_cache_[off + c] * (grad_output[off + c] - dot);
        }
    }
    return grad_input;
}

float CategoricalCrossEntropy::forward(const std::vector<float>& probs,
                                       const std::vector<float>& target,
                                       std::size_t batch) const {
    if (probs.size() != target.size()) {
        throw std::runtime_error("CategoricalCrossEntropy forward size mismatch");
    }
    if (batch == 0) {
        throw std::runtime_error("CategoricalCrossEntropy forward on empty batch");
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < probs.size(); ++i) {
        if (target[i] == 0.0f) continue;
        const float p = std::min(std::max(probs[i], kEpsilon), 1.0f - kEpsilon);
        sum -= static_cast<double>(target[i]) * std::log(p);
    }
    return static_cast<float>(sum / static_cast<double>(batch));
}

std::vector<float> CategoricalCrossEntropy::backward(
    const std::vector<float>& probs, const std::vector<float>& target,
    std::size_t batch) const {
    if (probs.size() != target.size()) {
        throw std::runtime_error("CategoricalCrossEntropy backward size mismatch");
    }
    if (batch == 0) {
        throw std::runtime_error("CategoricalCrossEntropy backward on empty batch");
    }
    std::vector<float> grad(probs.size());
    const float scale = 1.0f / static_cast<float>(batch);
    for (std::size_t i = 0; i < probs.size(); ++i) {
        const float p = std::min(std::max(probs[i], kEpsilon), 1.0f - kEpsilon);
        grad[i] = -target[i] / p * scale;
    }
    return grad;
}
