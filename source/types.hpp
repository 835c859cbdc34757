#pragma once

#include <complex>
#include <initializer_list>
#include <vector>

#include "Eigen/Dense"

namespace ctrlkit {

using Matrix = Eigen::MatrixXd;

// Roots of the denominator and numerator of a transfer function
using Pole = std::complex<double>;
using Zero = std::complex<double>;

// Polynomial coefficients, highest power first
using Poly = std::vector<double>;

// Dynamic column vector that can also be written as ColVec{{1.0, 2.0}}
struct ColVec : public Eigen::VectorXd {
    using Eigen::VectorXd::VectorXd;

    ColVec(std::initializer_list<double> values)
        : Eigen::VectorXd(Eigen::Map<const Eigen::VectorXd>(values.begin(), static_cast<Eigen::Index>(values.size()))) {}
};

}  // namespace ctrlkit

// Lets Eigen expressions treat ColVec as the VectorXd it derives from
namespace Eigen::internal {
template <>
struct traits<ctrlkit::ColVec> : traits<VectorXd> {};
}  // namespace Eigen::internal
