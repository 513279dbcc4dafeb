#pragma once

#include <cstddef>
#include <vector>

#include "layers.h"

// Adam with bias correction folded into the step size:
//   lr_t = lr * sqrt(1 - beta2^t) / (1 - beta1^t)
//   p   -= lr_t * m / (sqrt(v) + epsilon)
// Moment buffers are created on the first step and tied to the parameter
// list given then.
class Adam {
public:
    explicit Adam(float lr = 0.001f, float beta1 = 0.9f, float beta2 = 0.999f,
                  float epsilon = 1e-7f);

    void step(const std::vector<Parameter>& params);

    std::size_t iterations() const { return t_; }
    float lr() const { return lr_; }

private:
    float lr_;
    float beta1_;
    float beta2_;
    float epsilon_;
    std::size_t t_ = 0;
    std::vector<std::vector<float>> m_;
    std::vector<std::vector<float>> v_;
};
