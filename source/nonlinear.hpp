#pragma once

#include <algorithm>
#include <cmath>
#include <functional>

#include "ss.hpp"
#include "types.hpp"

namespace ctrlkit {

/**
 * @brief Central-difference Jacobian of func at x.
 *
 * The perturbation of component j is eps * max(1, |x_j|).
 *
 * @return Matrix  m x n Jacobian, m = func(x).size(), n = x.size()
 */
template <typename Func>
Matrix numericalJacobian(Func&& func, const ColVec& x, double eps = 1e-6) {
    const ColVec       f0 = func(x);
    const Eigen::Index n  = x.size();
    const Eigen::Index m  = f0.size();

    Matrix J(m, n);
    for (Eigen::Index j = 0; j < n; ++j) {
        const double h = eps * std::max(1.0, std::abs(x(j)));

        ColVec x_plus  = x;
        ColVec x_minus = x;
        x_plus(j) += h;
        x_minus(j) -= h;
        J.col(j) = (func(x_plus) - func(x_minus)) / (2.0 * h);
    }
    return J;
}

// x_dot = f(x, u), y = h(x, u)
class NonlinearSystem {
   public:
    using VectorField = std::function<ColVec(const ColVec& x, const ColVec& u)>;

    // @throws std::invalid_argument if f or h is empty
    NonlinearSystem(VectorField f, VectorField h, size_t nx, size_t nu, size_t ny);

    // A = df/dx, B = df/du, C = dh/dx, D = dh/du at (x0, u0)
    StateSpace linearize(const ColVec& x0, const ColVec& u0) const;

    ColVec derivative(const ColVec& x, const ColVec& u) const { return f_(x, u); }
    ColVec output(const ColVec& x, const ColVec& u) const { return h_(x, u); }

    size_t states() const { return nx_; }
    size_t inputs() const { return nu_; }
    size_t outputs() const { return ny_; }

   private:
    VectorField f_;
    VectorField h_;
    size_t      nx_, nu_, ny_;
};

}  // namespace ctrlkit
