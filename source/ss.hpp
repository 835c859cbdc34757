#pragma once

#include "LTI.hpp"
#include "types.hpp"

namespace ctrlkit {

/**
 * @brief x_dot = A x + B u, y = C x + D u, or the difference-equation form when Ts is set.
 *
 * The motor models order their states [omega, i] or [theta, omega, i].
 */
class StateSpace : public LTI {
   public:
    Matrix A = {}, B = {}, C = {}, D = {};

    StateSpace() = default;

    // @throws std::invalid_argument on inconsistent shapes or a non-positive Ts
    StateSpace(Matrix A, Matrix B, Matrix C, Matrix D, std::optional<double> Ts = std::nullopt);
    StateSpace(const TransferFunction& tf);

    StateSpace       toStateSpace() const override { return *this; }
    TransferFunction toTransferFunction(int output = 0, int input = 0) const;

    std::vector<Pole> poles() const override;
    std::vector<Zero> zeros() const override;

    size_t states() const { return static_cast<size_t>(A.rows()); }
    size_t inputs() const { return static_cast<size_t>(B.cols()); }
    size_t outputs() const { return static_cast<size_t>(C.rows()); }

    ColVec output(const ColVec& x, const ColVec& u) const { return C * x + D * u; }

    // x[k+1] for discrete models
    ColVec advance(const ColVec& x, const ColVec& u) const { return A * x + B * u; }

    bool operator==(const StateSpace& other) const {
        return Ts == other.Ts && A.isApprox(other.A) && B.isApprox(other.B) && C.isApprox(other.C) && D.isApprox(other.D);
    }
};

}  // namespace ctrlkit
