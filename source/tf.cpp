#include "tf.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "control.hpp"
#include "polynomial.hpp"
#include "ss.hpp"

namespace ctrlkit {

namespace {
    constexpr double kZeroCoefficient = 1e-15;

    // Reorders poles so that entry b is the pole nearest to previous[b]
    std::vector<Pole> followBranches(const std::vector<Pole>& previous, std::vector<Pole> current) {
        if (previous.size() != current.size()) {
            return current;
        }
        std::vector<Pole> ordered;
        ordered.reserve(current.size());
        for (const Pole& p : previous) {
            auto nearest = current.begin();
            for (auto it = current.begin(); it != current.end(); ++it) {
                if (std::abs(*it - p) < std::abs(*nearest - p)) {
                    nearest = it;
                }
            }
            ordered.push_back(*nearest);
            current.erase(nearest);
        }
        return ordered;
    }
}  // namespace

TransferFunction::TransferFunction(Poly num_, Poly den_, std::optional<double> Ts_)
    : num(std::move(num_)), den(std::move(den_)) {
    if (den.empty() || std::abs(den.front()) < kZeroCoefficient) {
        throw std::invalid_argument("TransferFunction: denominator needs a nonzero leading coefficient");
    }
    if (num.empty()) {
        throw std::invalid_argument("TransferFunction: numerator is empty");
    }
    if (num.size() > 1 && std::abs(num.front()) < kZeroCoefficient) {
        throw std::invalid_argument("TransferFunction: numerator needs a nonzero leading coefficient");
    }
    if (Ts_.has_value() && !(*Ts_ > 0.0)) {
        throw std::invalid_argument("TransferFunction: sampling time must be positive");
    }
    Ts = Ts_;
}

TransferFunction::TransferFunction(const StateSpace& ss) : TransferFunction(ss.toTransferFunction()) {}

/*
 * With den monic and the numerator padded to b_0 s^n + ... + b_n:
 *   A = companion matrix with last row -a_n ... -a_1,  B = e_n,
 *   D = b_0,  C_i = b_(n-i) - b_0 a_(n-i)
 */
StateSpace TransferFunction::toStateSpace() const {
    if (num.size() > den.size()) {
        throw std::invalid_argument("TransferFunction: improper transfer function has no state-space realization");
    }
    const Eigen::Index n = static_cast<Eigen::Index>(order());

    const Poly a = polyscale(den, 1.0 / den.front());
    Poly       b(den.size(), 0.0);
    std::transform(num.begin(), num.end(), b.end() - static_cast<std::ptrdiff_t>(num.size()),
                   [&](double c) { return c / den.front(); });

    Matrix A = Matrix::Zero(n, n);
    Matrix B = Matrix::Zero(n, 1);
    Matrix C(1, n);
    Matrix D = Matrix::Constant(1, 1, b[0]);

    if (n > 0) {
        A.topRightCorner(n - 1, n - 1).setIdentity();
        B(n - 1, 0) = 1.0;
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        A(n - 1, i) = -a[n - i];
        C(0, i)     = b[n - i] - b[0] * a[n - i];
    }
    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D), Ts};
}

std::vector<Pole> TransferFunction::poles() const { return roots(den); }

std::vector<Zero> TransferFunction::zeros() const { return num.size() > 1 ? roots(num) : std::vector<Zero>{}; }

std::complex<double> TransferFunction::evaluate(std::complex<double> s) const { return polyval(num, s) / polyval(den, s); }

// Evaluated on s = j w, or z = exp(j w Ts) for discrete models
FrequencyResponse TransferFunction::freqresp(const std::vector<double>& frequencies) const {
    FrequencyResponse response;
    response.freq = frequencies;
    response.response.reserve(frequencies.size());

    for (double f : frequencies) {
        const std::complex<double> jw(0.0, 2.0 * std::numbers::pi * f);
        response.response.push_back(evaluate(Ts.has_value() ? std::exp(jw * *Ts) : jw));
    }
    return response;
}

// Roots of den + k num on a uniform gain grid, with branches kept continuous in k
RootLocusResponse TransferFunction::rlocus(double kMin, double kMax, size_t numPoints) const {
    if (numPoints < 2) {
        throw std::invalid_argument("rlocus: numPoints must be at least 2");
    }

    RootLocusResponse response;
    response.gains.reserve(numPoints);

    std::vector<Pole> previous;
    for (size_t i = 0; i < numPoints; ++i) {
        const double k = kMin + (kMax - kMin) * static_cast<double>(i) / static_cast<double>(numPoints - 1);
        std::vector<Pole> current = followBranches(previous, roots(polyadd(den, polyscale(num, k))));

        if (response.branches.empty()) {
            response.branches.resize(current.size());
        }
        for (size_t b = 0; b < std::min(current.size(), response.branches.size()); ++b) {
            response.branches[b].push_back(current[b]);
        }
        response.gains.push_back(k);
        previous = std::move(current);
    }
    return response;
}

}  // namespace ctrlkit
