#include "nonlinear.hpp"

#include <stdexcept>
#include <utility>

#include "ss.hpp"
#include "types.hpp"

namespace ctrlkit {

NonlinearSystem::NonlinearSystem(VectorField f, VectorField h, size_t nx, size_t nu, size_t ny)
    : f_(std::move(f)), h_(std::move(h)), nx_(nx), nu_(nu), ny_(ny) {
    if (!f_ || !h_) {
        throw std::invalid_argument("NonlinearSystem: dynamics and measurement functions must be set");
    }
}

StateSpace NonlinearSystem::linearize(const ColVec& x0, const ColVec& u0) const {
    if (static_cast<size_t>(x0.size()) != nx_ || static_cast<size_t>(u0.size()) != nu_) {
        throw std::invalid_argument("NonlinearSystem::linearize: operating point has the wrong dimension");
    }

    Matrix A = numericalJacobian([&](const ColVec& x) { return f_(x, u0); }, x0);
    Matrix B = numericalJacobian([&](const ColVec& u) { return f_(x0, u); }, u0);
    Matrix C = numericalJacobian([&](const ColVec& x) { return h_(x, u0); }, x0);
    Matrix D = numericalJacobian([&](const ColVec& u) { return h_(x0, u); }, u0);

    return StateSpace(std::move(A), std::move(B), std::move(C), std::move(D));
}

}  // namespace ctrlkit
