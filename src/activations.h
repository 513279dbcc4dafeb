#pragma once

#include <memory>
#include <string>
#include <vector>

// Elementwise activation fused into Conv2D / Dense. Implementations are pure
// and hold no state besides their constructor parameters.
class Activation {
public:
    virtual ~Activation() = default;

    // y = f(x) for a single pre-activation value.
    virtual float apply(float x) const = 0;

    // dy/dx at pre-activation x.
    virtual float derivative(float x) const = 0;

    virtual std::string name() const = 0;

    // Forward over a whole buffer.
    virtual void apply_inplace(std::vector<float>& values) const = 0;

    // grad_input[i] = grad_output[i] * f'(pre_activation[i]).
    virtual std::vector<float> backward(
        const std::vector<float>& pre_activation,
        const std::vector<float>& grad_output) const = 0;
};

// Flatten-T Swish: y = max(t, relu(x) * sigmoid(x) + t).
// Flat at t for x <= 0, shifted Swish for x > 0. NaN propagates through both
// the value and the derivative.
class FTSwish : public Activation {
public:
    static constexpr float kDefaultThreshold = -1.0f;

    explicit FTSwish(float threshold = kDefaultThreshold);

    float apply(float x) const override;
    float derivative(float x) const override;
    std::string name() const override;
    void apply_inplace(std::vector<float>& values) const override;
    std::vector<float> backward(const std::vector<float>& pre_activation,
                                const std::vector<float>& grad_output) const override;

    float threshold() const { return threshold_; }

private:
    const float threshold_;
};

// Baseline y = max(0, x).
class ReLU : public Activation {
public:
    float apply(float x) const override;
    float derivative(float x) const override;
    std::string name() const override;
    void apply_inplace(std::vector<float>& values) const override;
    std::vector<float> backward(const std::vector<float>& pre_activation,
                                const std::vector<float>& grad_output) const override;
};

// Sigmoid without overflow for large |x|.
float stable_sigmoid(float x);

// Builds an activation by name ("ftswish" or "relu"). Throws
// std::invalid_argument for anything else.
std::shared_ptr<const Activation> make_activation(const std::string& name,
                                                  float threshold);
