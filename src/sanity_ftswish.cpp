#include "activations.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

bool nearly_equal(float a, float b, float eps = 1e-6f) {
    return std::abs(a - b) <= eps;
}

// Central difference in double precision around the float function.
double numeric_grad(const Activation& act, double x, double h = 1e-3) {
    const double up = act.apply(static_cast<float>(x + h));
    const double down = act.apply(static_cast<float>(x - h));
    return (up - down) / (2.0 * h);
}

double closed_form_grad(double x) {
    const double s = 1.0 / (1.0 + std::exp(-x));
    return s + x * s * (1.0 - s);
}

int main() {
    const FTSwish ftswish;
    const float t = FTSwish::kDefaultThreshold;
    assert(ftswish.threshold() == -1.0f);

    {
        // Flat at t on the whole non-positive domain.
        for (float x : {-1000.0f, -50.0f, -5.0f, -1.0f, -1e-6f, -1e-30f, -0.0f, 0.0f}) {
            assert(ftswish.apply(x) == t);
        }
        assert(ftswish.apply(-std::numeric_limits<float>::max()) == t);
        assert(ftswish.apply(-std::numeric_limits<float>::infinity()) == t);
        std::cout << "FTSwish flat region: OK\n";
    }

    {
        // Floor holds everywhere.
        for (float x : {-1000.0f, -3.0f, 0.0f, 1e-7f, 0.5f, 3.0f, 1000.0f}) {
            assert(ftswish.apply(x) >= t);
        }
        assert(ftswish.apply(0.0f) == t);
        // Tiny positive inputs sit just above the floor.
        assert(ftswish.apply(1e-30f) >= t);
        std::cout << "FTSwish floor: OK\n";
    }

    {
        // Positive side is Swish shifted by t.
        assert(nearly_equal(ftswish.apply(50.0f), 50.0f + t, 1e-4f));
        assert(nearly_equal(ftswish.apply(1000.0f), 1000.0f + t, 1e-3f));
        const float x = 2.0f;
        const float swish = x / (1.0f + std::exp(-x));
        assert(nearly_equal(ftswish.apply(x), swish + t, 1e-6f));
        assert(ftswish.apply(std::numeric_limits<float>::infinity()) ==
               std::numeric_limits<float>::infinity());
        std::cout << "FTSwish positive side: OK\n";
    }

    {
        // NaN in, NaN out.
        const float nan = std::numeric_limits<float>::quiet_NaN();
        assert(std::isnan(ftswish.apply(nan)));
        std::vector<float> buf = {nan, -2.0f, 2.0f};
        ftswish.apply_inplace(buf);
        assert(std::isnan(buf[0]));
        assert(buf[1] == t);
        assert(nearly_equal(buf[2], ftswish.apply(2.0f)));

        // The slope at NaN is NaN, so backward does not zero it out.
        assert(std::isnan(ftswish.derivative(nan)));
        const auto grad_in = ftswish.backward({nan, -2.0f, 2.0f}, {1.0f, 1.0f, 1.0f});
        assert(std::isnan(grad_in[0]));
        assert(grad_in[1] == 0.0f);
        assert(std::isfinite(grad_in[2]));
        std::cout << "FTSwish NaN propagation: OK\n";
    }

    {
        // Gradients: numeric vs closed form.
        const double g_neg = numeric_grad(ftswish, -5.0);
        assert(std::abs(g_neg) < 1e-3);
        assert(ftswish.derivative(-5.0f) == 0.0f);

        const double g_pos = numeric_grad(ftswish, 5.0);
        const double expected = closed_form_grad(5.0);
        assert(std::abs(g_pos - expected) < 1e-3);
        assert(std::abs(ftswish.derivative(5.0f) - expected) < 1e-5);

        for (double x : {0.1, 0.5, 1.0, 2.5, 8.0}) {
            assert(std::abs(ftswish.derivative(static_cast<float>(x)) -
                            closed_form_grad(x)) < 1e-5);
            assert(std::abs(numeric_grad(ftswish, x, 1e-2) - closed_form_grad(x)) < 1e-2);
        }

        // Kink at 0 belongs to the flat branch; right limit is sigmoid(0).
        assert(ftswish.derivative(0.0f) == 0.0f);
        assert(nearly_equal(ftswish.derivative(1e-6f), 0.5f, 1e-5f));
        assert(nearly_equal(ftswish.derivative(std::numeric_limits<float>::infinity()), 1.0f));
        assert(ftswish.derivative(-std::numeric_limits<float>::infinity()) == 0.0f);
        std::cout << "FTSwish gradient: OK\n";
    }

    {
        // Buffer backward multiplies by the derivative.
        const std::vector<float> pre = {-3.0f, 0.0f, 1.0f, 4.0f};
        const std::vector<float> grad_out = {2.0f, 2.0f, 2.0f, 0.5f};
        const auto grad_in = ftswish.backward(pre, grad_out);
        assert(grad_in.size() == pre.size());
        assert(grad_in[0] == 0.0f);
        assert(grad_in[1] == 0.0f);
        assert(nearly_equal(grad_in[2], 2.0f * ftswish.derivative(1.0f)));
        assert(nearly_equal(grad_in[3], 0.5f * ftswish.derivative(4.0f)));

        bool threw = false;
        try {
            ftswish.backward(pre, {1.0f});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        std::cout << "FTSwish buffer backward: OK\n";
    }

    {
        // Independent thresholds in one process.
        const FTSwish shallow(-0.2f);
        const FTSwish deep(-3.0f);
        assert(shallow.apply(-10.0f) == -0.2f);
        assert(deep.apply(-10.0f) == -3.0f);
        assert(ftswish.apply(-10.0f) == -1.0f);
        assert(nearly_equal(deep.apply(50.0f), 47.0f, 1e-4f));
        assert(shallow.derivative(3.0f) == deep.derivative(3.0f));

        const auto made = make_activation("ftswish", -0.5f);
        assert(made->name() == "ftswish");
        assert(made->apply(-1.0f) == -0.5f);
        std::cout << "FTSwish custom thresholds: OK\n";
    }

    {
        // Stable sigmoid does not overflow.
        assert(stable_sigmoid(-1000.0f) == 0.0f);
        assert(stable_sigmoid(1000.0f) == 1.0f);
        assert(nearly_equal(stable_sigmoid(0.0f), 0.5f));
        assert(nearly_equal(stable_sigmoid(-2.0f), 1.0f / (1.0f + std::exp(2.0f))));
        std::cout << "Stable sigmoid: OK\n";
    }

    std::cout << "All FTSwish sanity tests passed.\n";
    return 0;
}
