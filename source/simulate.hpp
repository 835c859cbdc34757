#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "integrator.hpp"
#include "nonlinear.hpp"
#include "types.hpp"

namespace ctrlkit {

class LTI;

struct SimulationResult {
    std::vector<double> time;
    Matrix              output;  // One row per time sample, one column per output
    Matrix              state;   // One row per time sample, one column per state

    // Column j of output as a plain sequence
    std::vector<double> outputSeries(Eigen::Index j = 0) const {
        std::vector<double> y(static_cast<size_t>(output.rows()));
        for (Eigen::Index k = 0; k < output.rows(); ++k) y[static_cast<size_t>(k)] = output(k, j);
        return y;
    }
};

/**
 * @brief Response of an LTI model to a sampled input.
 *
 * Continuous models are discretized with ZOH over each sample interval, which is exact for a
 * piecewise-constant input. Discrete models iterate x[k+1] = A x[k] + B u[k] and require the
 * spacing of t to equal Ts.
 *
 * @param sys  Model
 * @param u    Input, one row per time sample and one column per model input
 * @param t    Strictly increasing sample times, t.size() == u.rows()
 * @param x0   Initial state (zero when empty)
 *
 * @throws std::invalid_argument on dimension mismatch, non-increasing t, or Ts mismatch
 */
SimulationResult lsim(const LTI& sys, const Matrix& u, const std::vector<double>& t, const ColVec& x0 = ColVec());

// Single-input convenience overload
SimulationResult lsim(const LTI& sys, const std::vector<double>& u, const std::vector<double>& t, const ColVec& x0 = ColVec());

// Input as a function of time for nonlinear simulation
using InputFcn = std::function<ColVec(double t)>;

// Zero-order hold of the samples u[k] taken at t[k]. Before t[0] the first sample is held.
InputFcn holdInput(std::vector<double> t, std::vector<double> u);

/**
 * @brief Integrate a NonlinearSystem with the adaptive RK45 solver.
 *
 * @param tEval  Times to record; every accepted step when empty
 * @param maxStep  Upper bound on the step, keep it below the input sample time for held inputs
 *
 * @throws std::runtime_error if the solver fails
 */
SimulationResult simulate(const NonlinearSystem&           sys,
                          const InputFcn&                  input,
                          const ColVec&                    x0,
                          const std::pair<double, double>& tSpan,
                          const std::vector<double>&       tEval   = {},
                          double                           tol     = 1e-6,
                          double                           maxStep = 0.01);

// Same with a fixed step and a runtime-selected integrator
SimulationResult simulateFixedStep(const NonlinearSystem&           sys,
                                   const InputFcn&                  input,
                                   const ColVec&                    x0,
                                   const std::pair<double, double>& tSpan,
                                   double                           h,
                                   Integrator                       method = RK4{},
                                   const std::vector<double>&       tEval  = {});

}  // namespace ctrlkit
