#pragma once

#include <complex>
#include <vector>

#include "types.hpp"

namespace ctrlkit {

// All polynomials are stored highest power first: {a0, a1, ..., an} = a0*s^n + ... + an

// Polynomial product
Poly conv(const Poly& a, const Poly& b);

// Polynomial sum, aligned at the constant term
Poly polyadd(const Poly& a, const Poly& b);

// Multiply every coefficient by k
Poly polyscale(const Poly& a, double k);

// Drop leading coefficients with magnitude below tol, keeping at least one
Poly trimLeadingZeros(Poly p, double tol = 1e-12);

double               polyval(const Poly& p, double x);
std::complex<double> polyval(const Poly& p, std::complex<double> x);

// Monic polynomial with the given roots. Complex roots must come in conjugate pairs.
Poly poly(const std::vector<std::complex<double>>& roots);

// Roots via eigenvalues of the companion matrix
std::vector<std::complex<double>> roots(const Poly& p);

/**
 * @brief Apply the rational filter b(q^-1)/a(q^-1) to x with zero initial conditions.
 *
 * Coefficients are in increasing powers of the delay operator: a[0] y[k] + a[1] y[k-1] + ... =
 * b[0] x[k] + b[1] x[k-1] + ...
 *
 * @throws std::invalid_argument if a is empty or a[0] == 0
 */
std::vector<double> filter(const std::vector<double>& b, const std::vector<double>& a, const std::vector<double>& x);

// Reflect roots outside the unit circle to 1/conj(r). Returns a monic polynomial in q^-1.
Poly stabilizeDiscrete(const Poly& a);

bool isStableDiscrete(const Poly& a, double margin = 0.0);

}  // namespace ctrlkit
