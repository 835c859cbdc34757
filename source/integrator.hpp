#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <concepts>
#include <variant>

#include "types.hpp"

namespace ctrlkit {

// One step of an explicit method applied to x_dot = f(t, x)
struct IntegrationResult {
    ColVec x;
    double error;  // zero for methods without an embedded estimate
};

template <typename T>
concept FixedStepIntegrator = T::is_fixed_step;

template <typename T>
concept AdaptiveStepIntegrator = T::is_adaptive_step;

template <typename T>
concept ODEIntegrator = requires(const T& integrator, ColVec (*f)(double, const ColVec&), const ColVec& x, double t, double h) {
    { integrator.evolve(f, x, t, h) } -> std::same_as<IntegrationResult>;
};

struct ForwardEuler {
    static constexpr bool is_fixed_step    = true;
    static constexpr bool is_adaptive_step = false;

    template <typename F>
    IntegrationResult evolve(F&& f, const ColVec& x, double t, double h) const {
        return {x + h * f(t, x), 0.0};
    }
};

// Explicit trapezoid
struct Heun {
    static constexpr bool is_fixed_step    = true;
    static constexpr bool is_adaptive_step = false;

    template <typename F>
    IntegrationResult evolve(F&& f, const ColVec& x, double t, double h) const {
        const ColVec k1 = f(t, x);
        const ColVec k2 = f(t + h, x + h * k1);
        return {x + 0.5 * h * (k1 + k2), 0.0};
    }
};

struct RK4 {
    static constexpr bool is_fixed_step    = true;
    static constexpr bool is_adaptive_step = false;

    template <typename F>
    IntegrationResult evolve(F&& f, const ColVec& x, double t, double h) const {
        const double half = 0.5 * h;
        const ColVec k1   = f(t, x);
        const ColVec k2   = f(t + half, x + half * k1);
        const ColVec k3   = f(t + half, x + half * k2);
        const ColVec k4   = f(t + h, x + h * k3);
        return {x + (h / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4), 0.0};
    }
};

/**
 * @brief Runge-Kutta-Fehlberg 4(5).
 *
 * Advances with the fifth order weights. The error is max_i |x5_i - x4_i| / max(1, |x_i|), mixing
 * absolute and relative measures. Usable by FixedStepSolver, which ignores the estimate.
 */
struct RK45 {
    static constexpr bool is_fixed_step    = true;
    static constexpr bool is_adaptive_step = true;

    template <typename F>
    IntegrationResult evolve(F&& f, const ColVec& x, double t, double h) const {
        static constexpr int                   stages = 6;
        static constexpr std::array<double, 6> c      = {0.0, 1.0 / 4.0, 3.0 / 8.0, 12.0 / 13.0, 1.0, 1.0 / 2.0};
        static constexpr double                a[stages][stages - 1] = {
            {},
            {1.0 / 4.0},
            {3.0 / 32.0, 9.0 / 32.0},
            {1932.0 / 2197.0, -7200.0 / 2197.0, 7296.0 / 2197.0},
            {439.0 / 216.0, -8.0, 3680.0 / 513.0, -845.0 / 4104.0},
            {-8.0 / 27.0, 2.0, -3544.0 / 2565.0, 1859.0 / 4104.0, -11.0 / 40.0},
        };
        static constexpr std::array<double, 6> b5 = {16.0 / 135.0, 0.0, 6656.0 / 12825.0, 28561.0 / 56430.0, -9.0 / 50.0, 2.0 / 55.0};
        // b5 - b4
        static constexpr std::array<double, 6> e = {1.0 / 360.0, 0.0, -128.0 / 4275.0, -2197.0 / 75240.0, 1.0 / 50.0, 2.0 / 55.0};

        std::array<ColVec, stages> k;
        ColVec                     x5 = x;
        ColVec                     dx = ColVec::Zero(x.size());
        for (int s = 0; s < stages; ++s) {
            ColVec xs = x;
            for (int j = 0; j < s; ++j) {
                xs += (h * a[s][j]) * k[j];
            }
            k[s] = f(t + c[s] * h, xs);
            x5 += (h * b5[s]) * k[s];
            dx += (h * e[s]) * k[s];
        }

        double error = 0.0;
        for (Eigen::Index i = 0; i < x.size(); ++i) {
            error = std::max(error, std::abs(dx(i)) / std::max(1.0, std::abs(x(i))));
        }
        return {x5, error};
    }
};

// Runtime selection of a method for FixedStepSolver
using Integrator = std::variant<ForwardEuler, Heun, RK4, RK45>;

}  // namespace ctrlkit
