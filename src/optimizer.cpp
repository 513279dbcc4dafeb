#include "optimizer.h"

#include <cmath>
#include <stdexcept>

Adam::Adam(float lr, float beta1, float beta2, float epsilon)
    : lr_(lr), beta1_(beta1), beta2_(beta2), epsilon_(epsilon) {
    if (lr <= 0.0f) {
        throw std::invalid_argument("Adam learning rate must be positive");
    }
    if (beta1 < 0.0f || beta1 >= 1.0f || beta2 < 0.0f || beta2 >= 1.0f) {
        throw std::invalid_argument("Adam betas must be in [0, 1)");
    }
}

void Adam::step(const std::vector<Parameter>& params) {
    if (m_.empty()) {
        m_.resize(params.size());
        v_.resize(params.size());
        for (std::size_t i = 0; i < params.size(); ++i) {
            m_[i].assign(params[i].value->size(), 0.0f);
            v_[i].assign(params[i].value->size(), 0.0f);
        }
    }
    if (params.size() != m_.size()) {
        throw std::runtime_error("Adam step parameter count changed between steps");
    }

    ++t_;
    const double t = static_cast<double>(t_);
    const float lr_t = static_cast<float>(
        lr_ * std::sqrt(1.0 - std::pow(static_cast<double>(beta2_), t)) /
        (1.0 - std::pow(static_cast<double>(beta1_), t)));

    for (std::size_t i = 0; i < params.size(); ++i) {
        auto& value = *params[i].value;
        const auto& grad = *params[i].grad;
        auto& m = m_[i];
        auto& v = v_[i];
        if (value.size() != m.size() || grad.size() != m.size()) {
            throw std::runtime_error("Adam step parameter size mismatch");
        }
        for (std::size_t j = 0; j < value.size(); ++j) {
            const float g = grad[j];
            m[j] = beta1_ * m[j] + (1.0f - beta1_) * g;
            v[j] = beta2_ * v[j] + (1.0f - beta2_) * g * g;
            value[j] -= lr_t * m[j] / (std::sqrt(v[j]) + epsilon_);
        }
    }
}
