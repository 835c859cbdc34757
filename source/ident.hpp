#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include "LTI.hpp"
#include "iddata.hpp"
#include "ss.hpp"
#include "tf.hpp"
#include "types.hpp"

namespace ctrlkit {

/**
 * @brief Discrete SISO polynomial model A(q) y(t) = B(q)/F(q) u(t - nk) + e(t).
 *
 * Coefficients are in increasing powers of q^-1: A = {1, a1, ..., a_na}, B = {b0, ..., b_{nb-1}},
 * F = {1, f1, ..., f_nf}. ARX models have F = 1, output-error models have A = 1.
 */
class IdPoly : public LTI {
   public:
    Poly   A  = {1.0};
    Poly   B  = {0.0};
    Poly   F  = {1.0};
    size_t nk = 1;

    // Fit statistics, filled in by the estimators
    double      noiseVariance = 0.0;
    double      lossFunction  = 0.0;  // Mean squared one-step prediction error on the estimation data
    double      fitPercent    = 0.0;  // NRMSE fit on the estimation data
    size_t      iterations    = 0;
    std::string termination;

    IdPoly(Poly A, Poly B, Poly F, size_t nk, double Ts);

    size_t na() const { return A.size() - 1; }
    size_t nb() const { return B.size(); }
    size_t nf() const { return F.size() - 1; }

    // Input-output dynamics B / (A F) as a transfer function in z
    TransferFunction toTransferFunction() const;
    StateSpace       toStateSpace() const override;

    // Noise-free response to u with zero initial conditions
    std::vector<double> simulate(const std::vector<double>& u) const;
};

// Horizon value that turns prediction into pure simulation
inline constexpr size_t kSimulationHorizon = std::numeric_limits<size_t>::max();

/**
 * @brief Least-squares ARX estimate A(q) y = B(q) u(t - nk) + e.
 *
 * @throws std::invalid_argument if nb == 0 or the data has too few samples for the orders
 * @throws std::runtime_error if the regression matrix is rank deficient
 */
IdPoly arx(const IdData& data, size_t na, size_t nb, size_t nk = 1);

struct OeOptions {
    size_t maxFunctionEvaluations = 400;
    double functionTolerance      = 1e-10;  // Relative reduction of the sum of squares
    double stepTolerance          = 1e-10;  // Relative change of the parameters
    bool   enforceStability       = true;   // Reflect unstable roots of the final F and refit B

    // Initial polynomials; both empty means start from ARX with the same orders
    Poly initialB = {};
    Poly initialF = {};
};

/**
 * @brief Prediction-error estimate of the output-error model y = B(q)/F(q) u(t - nk) + e.
 *
 * Minimizes the simulation error with Levenberg-Marquardt using the analytic Jacobian obtained by
 * filtering the regressors through 1/F. Trial parameters with an unstable F are rejected.
 *
 * @throws std::invalid_argument for nb == 0, malformed initial polynomials or too little data
 */
IdPoly oe(const IdData& data, size_t nb, size_t nf, size_t nk = 1, const OeOptions& options = {});

struct N4sidOptions {
    size_t horizon = 0;  // Block rows of the past/future Hankel matrices; 0 picks max(2 * order, 10)
};

/**
 * @brief Subspace estimate (PO-MOESP) of a discrete state-space model of the given order.
 *
 * The extended observability matrix comes from the SVD of the past-instrumented projection in the
 * LQ factorization of the block-Hankel data. A and C follow from shift invariance, B and D (with
 * the initial state) from linear least squares on the output.
 *
 * @throws std::invalid_argument if order == 0, horizon <= order or the data is too short
 */
StateSpace n4sid(const IdData& data, size_t order, const N4sidOptions& options = {});

// Noise-free simulated output
std::vector<double> simulateModel(const IdPoly& model, const std::vector<double>& u);
std::vector<double> simulateModel(const StateSpace& model, const std::vector<double>& u);

/**
 * @brief k-step-ahead prediction of the measured output.
 *
 * The prediction at t uses measured outputs up to t - horizon. Samples before the start of the
 * record are taken as zero. horizon >= data.size() (or kSimulationHorizon) is pure simulation.
 *
 * @throws std::invalid_argument if horizon == 0
 */
std::vector<double> predict(const IdPoly& model, const IdData& data, size_t horizon = 1);

// One-step prediction errors y - yhat
std::vector<double> resid(const IdPoly& model, const IdData& data);

// 100 (1 - ||y - yhat|| / ||y - mean(y)||)
double nrmseFit(const std::vector<double>& y, const std::vector<double>& yhat);

double compare(const IdPoly& model, const IdData& data, size_t horizon = kSimulationHorizon);
double compare(const StateSpace& model, const IdData& data);

// Mean squared error of predicting every output sample by the output mean
double meanBaselineError(const IdData& data);

}  // namespace ctrlkit
