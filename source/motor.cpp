#include "motor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "polynomial.hpp"

namespace ctrlkit {

void validate(const DcMotorParams& p) {
    if (!(p.J > 0.0)) throw std::invalid_argument("DcMotorParams: inertia J must be positive");
    if (!(p.R > 0.0)) throw std::invalid_argument("DcMotorParams: resistance R must be positive");
    if (!(p.L > 0.0)) throw std::invalid_argument("DcMotorParams: inductance L must be positive");
    if (!(p.K > 0.0)) throw std::invalid_argument("DcMotorParams: motor constant K must be positive");
    if (!(p.b >= 0.0)) throw std::invalid_argument("DcMotorParams: friction b must be non-negative");
}

TransferFunction speedTf(const DcMotorParams& p) {
    validate(p);
    const Poly den = polyadd(conv({p.J, p.b}, {p.L, p.R}), {p.K * p.K});
    return TransferFunction{{p.K}, den};
}

TransferFunction positionTf(const DcMotorParams& p) {
    const auto speed = speedTf(p);
    return TransferFunction{speed.num, conv(speed.den, {1.0, 0.0})};
}

StateSpace speedSs(const DcMotorParams& p) {
    validate(p);
    // J w' = -b w + K i,  L i' = -K w - R i + V
    Matrix A{{-p.b / p.J, p.K / p.J},
             {-p.K / p.L, -p.R / p.L}};
    Matrix B{{0.0}, {1.0 / p.L}};
    Matrix C{{1.0, 0.0}};
    Matrix D = Matrix::Zero(1, 1);
    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D)};
}

StateSpace positionSs(const DcMotorParams& p) {
    validate(p);
    Matrix A{{0.0, 1.0, 0.0},
             {0.0, -p.b / p.J, p.K / p.J},
             {0.0, -p.K / p.L, -p.R / p.L}};
    Matrix B{{0.0}, {0.0}, {1.0 / p.L}};
    Matrix C{{1.0, 0.0, 0.0}};
    Matrix D = Matrix::Zero(1, 1);
    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D)};
}

NonlinearSystem nonlinearModel(const DcMotorParams& p, double coulomb, double vmax, MotorOutput output) {
    validate(p);
    if (!(coulomb >= 0.0)) {
        throw std::invalid_argument("nonlinearModel: Coulomb friction must be non-negative");
    }
    if (!(vmax > 0.0)) {
        throw std::invalid_argument("nonlinearModel: voltage limit must be positive");
    }

    constexpr double omega_smooth = 1e-3;  // [rad/s]

    auto f = [p, coulomb, vmax](const ColVec& x, const ColVec& u) -> ColVec {
        const double omega = x(1);
        const double i     = x(2);
        const double v     = std::clamp(u(0), -vmax, vmax);

        const double friction = p.b * omega + coulomb * std::tanh(omega / omega_smooth);

        ColVec dx(3);
        dx(0) = omega;
        dx(1) = (p.K * i - friction) / p.J;
        dx(2) = (v - p.K * omega - p.R * i) / p.L;
        return dx;
    };

    const Eigen::Index measured = (output == MotorOutput::Speed) ? 1 : 0;
    auto               h        = [measured](const ColVec& x, const ColVec&) -> ColVec {
        ColVec y(1);
        y(0) = x(measured);
        return y;
    };

    return NonlinearSystem{f, h, 3, 1, 1};
}

}  // namespace ctrlkit
