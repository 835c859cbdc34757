#include "polynomial.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ctrlkit {

Poly conv(const Poly& a, const Poly& b) {
    if (a.empty() || b.empty()) {
        return {};
    }

    Poly result(a.size() + b.size() - 1, 0.0);
    for (size_t i = 0; i < a.size(); ++i) {
        for (size_t j = 0; j < b.size(); ++j) {
            result[i + j] += a[i] * b[j];
        }
    }
    return result;
}

Poly polyadd(const Poly& a, const Poly& b) {
    const size_t n = std::max(a.size(), b.size());
    Poly         result(n, 0.0);

    // Right-align so that constant terms line up
    for (size_t i = 0; i < a.size(); ++i) {
        result[n - a.size() + i] += a[i];
    }
    for (size_t i = 0; i < b.size(); ++i) {
        result[n - b.size() + i] += b[i];
    }
    return result;
}

Poly polyscale(const Poly& a, double k) {
    Poly result = a;
    for (auto& c : result) c *= k;
    return result;
}

Poly trimLeadingZeros(Poly p, double tol) {
    while (p.size() > 1 && std::abs(p.front()) < tol) {
        p.erase(p.begin());
    }
    return p;
}

double polyval(const Poly& p, double x) {
    double value = 0.0;
    for (double c : p) {
        value = value * x + c;
    }
    return value;
}

std::complex<double> polyval(const Poly& p, std::complex<double> x) {
    std::complex<double> value = 0.0;
    for (double c : p) {
        value = value * x + c;
    }
    return value;
}

Poly poly(const std::vector<std::complex<double>>& roots) {
    if (roots.empty()) {
        return {1.0};
    }

    Eigen::VectorXcd coeffs = Eigen::VectorXcd::Ones(1);

    for (const auto& root : roots) {
        Eigen::VectorXcd new_coeffs = Eigen::VectorXcd::Zero(coeffs.size() + 1);
        new_coeffs.head(coeffs.size()) += coeffs;
        new_coeffs.tail(coeffs.size()) -= coeffs * root;
        coeffs = new_coeffs;
    }

    // Imaginary parts cancel for conjugate-symmetric root sets
    Poly result(coeffs.size());
    for (Eigen::Index i = 0; i < coeffs.size(); ++i) {
        result[i] = coeffs(i).real();
    }
    return result;
}

std::vector<std::complex<double>> roots(const Poly& p) {
    const Poly trimmed = trimLeadingZeros(p, 1e-15);
    const int  n       = static_cast<int>(trimmed.size()) - 1;

    if (n <= 0) {
        return {};
    }
    if (std::abs(trimmed[0]) < 1e-15) {
        throw std::invalid_argument("roots: polynomial is identically zero");
    }

    // Companion matrix:
    // [ -a1/a0  -a2/a0  ...  -an/a0 ]
    // [   1       0     ...    0    ]
    // [  ...                        ]
    // [   0      ...     1     0    ]
    Matrix companion = Matrix::Zero(n, n);
    for (int i = 0; i < n; ++i) {
        companion(0, i) = -trimmed[i + 1] / trimmed[0];
    }
    for (int i = 1; i < n; ++i) {
        companion(i, i - 1) = 1.0;
    }

    const Eigen::VectorXcd eigenvalues = companion.eigenvalues();
    return std::vector<std::complex<double>>(eigenvalues.data(), eigenvalues.data() + eigenvalues.size());
}

std::vector<double> filter(const std::vector<double>& b, const std::vector<double>& a, const std::vector<double>& x) {
    if (a.empty() || std::abs(a[0]) < 1e-15) {
        throw std::invalid_argument("filter: leading denominator coefficient must be nonzero");
    }
    if (b.empty()) {
        return std::vector<double>(x.size(), 0.0);
    }

    const double a0 = a[0];
    const size_t n  = std::max(a.size(), b.size());

    std::vector<double> bn(n, 0.0), an(n, 0.0);
    for (size_t i = 0; i < b.size(); ++i) bn[i] = b[i] / a0;
    for (size_t i = 0; i < a.size(); ++i) an[i] = a[i] / a0;

    // Direct form II transposed
    std::vector<double> z(n, 0.0);
    std::vector<double> y(x.size(), 0.0);
    for (size_t k = 0; k < x.size(); ++k) {
        const double yk = bn[0] * x[k] + z[0];
        for (size_t i = 1; i < n; ++i) {
            z[i - 1] = bn[i] * x[k] + z[i] - an[i] * yk;
        }
        y[k] = yk;
    }
    return y;
}

Poly stabilizeDiscrete(const Poly& a) {
    if (a.empty() || std::abs(a[0]) < 1e-15) {
        throw std::invalid_argument("stabilizeDiscrete: leading coefficient must be nonzero");
    }

    auto r = roots(a);
    for (auto& root : r) {
        if (std::abs(root) > 1.0) {
            root = 1.0 / std::conj(root);
        }
    }

    Poly result = poly(r);
    result.resize(a.size(), 0.0);
    return result;
}

bool isStableDiscrete(const Poly& a, double margin) {
    for (const auto& root : roots(a)) {
        if (std::abs(root) >= 1.0 - margin) {
            return false;
        }
    }
    return true;
}

}  // namespace ctrlkit
