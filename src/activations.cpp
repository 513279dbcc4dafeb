#include "activations.h"

#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace {
// max() that returns NaN when either operand is NaN.
inline float nan_max(float a, float b) {
    return (a > b || std::isnan(a)) ? a : b;
}

inline float sigmoid_impl(float x) {
    const float z = std::exp(-std::fabs(x));
    return x >= 0.0f ? 1.0f / (1.0f + z) : z / (1.0f + z);
}

inline float ftswish_value(float x, float t) {
    const float r = nan_max(x, 0.0f);
    const float s = sigmoid_impl(x);
    return nan_max(t, r * s + t);
}

inline float ftswish_grad(float x) {
    if (std::isnan(x)) {
        return x;
    }
    const float s = sigmoid_impl(x);
    // x * s * (1 - s) is inf * 0 at +inf; the limit of the slope there is 1.
    const float d = std::isinf(x) ? 1.0f : s + x * s * (1.0f - s);
    return x > 0.0f ? d : 0.0f;
}

void check_sizes(const std::vector<float>& pre_activation,
                 const std::vector<float>& grad_output, const char* who) {
    if (pre_activation.size() != grad_output.size()) {
        throw std::runtime_error(std::string(who) +
                                 " backward size mismatch with pre-activation");
    }
}
}  // namespace

float stable_sigmoid(float x) { return sigmoid_impl(x); }

FTSwish::FTSwish(float threshold) : threshold_(threshold) {}

float FTSwish::apply(float x) const { return ftswish_value(x, threshold_); }

float FTSwish::derivative(float x) const { return ftswish_grad(x); }

std::string FTSwish::name() const { return "ftswish"; }

void FTSwish::apply_inplace(std::vector<float>& values) const {
    const float t = threshold_;
    float* v = values.data();
    const std::size_t n = values.size();
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = ftswish_value(v[i], t);
    }
}

std::vector<float> FTSwish::backward(const std::vector<float>& pre_activation,
                                     const std::vector<float>& grad_output) const {
    check_sizes(pre_activation, grad_output, "FTSwish");
    std::vector<float> grad_input(grad_output.size());
    for (std::size_t i = 0; i < grad_output.size(); ++i) {
        grad_input[i] = grad_output[i] * ftswish_grad(pre_activation[i]);
    }
    return grad_input;
}

float ReLU::apply(float x) const { return nan_max(x, 0.0f); }

float ReLU::derivative(float x) const { return x > 0.0f ? 1.0f : 0.0f; }

std::string ReLU::name() const { return "relu"; }

void ReLU::apply_inplace(std::vector<float>& values) const {
    for (auto& v : values) {
        v = nan_max(v, 0.0f);
    }
}

std::vector<float> ReLU::backward(const std::vector<float>& pre_activation,
                                  const std::vector<float>& grad_output) const {
    check_sizes(pre_activation, grad_output, "ReLU");
    std::vector<float> grad_input(grad_output.size());
    for (std::size_t i = 0; i < grad_output.size(); ++i) {
        grad_input[i] = pre_activation[i] > 0.0f ? grad_output[i] : 0.0f;
    }
    return grad_input;
}

std::shared_ptr<const Activation> make_activation(const std::string& name,
                                                  float threshold) {
    if (name == "ftswish") {
        return std::make_shared<FTSwish>(threshold);
    }
    if (name == "relu") {
        return std::make_shared<ReLU>();
    }
    throw std::invalid_argument("Unknown activation: " + name);
}
