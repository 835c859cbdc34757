#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "integrator.hpp"
#include "types.hpp"
#include "unsupported/Eigen/MatrixFunctions"  // IWYU pragma: keep

namespace ctrlkit {

// Trajectory produced by one of the solvers below. Failures are reported through success/message.
struct SolveResult {
    std::vector<double> t;
    std::vector<ColVec> x;

    bool        success = true;
    std::string message;
    size_t      nfev = 0;  // integrator steps, rejected ones included

    SolveResult& fail(std::string why) {
        success = false;
        message = std::move(why);
        return *this;
    }
};

namespace detail {

    constexpr double kTimeMatchTol = 1e-9;

    // Writes either every accepted step, or only the entries of tEval, into a SolveResult
    class TrajectoryRecorder {
       public:
        TrajectoryRecorder(SolveResult& out, const std::vector<double>& tEval, double t0) : out_(out), tEval_(tEval) {
            while (next_ < tEval_.size() && tEval_[next_] < t0 - kTimeMatchTol) {
                ++next_;
            }
            if (!tEval_.empty()) {
                out_.t.reserve(tEval_.size() - next_);
                out_.x.reserve(tEval_.size() - next_);
            }
        }

        // Shortens a step from t so that it ends on the next requested time
        double limitStep(double t, double h) const {
            if (next_ < tEval_.size() && tEval_[next_] - t <= h) {
                return tEval_[next_] - t;
            }
            return h;
        }

        void record(double t, const ColVec& x) {
            if (tEval_.empty()) {
                out_.t.push_back(t);
                out_.x.push_back(x);
                return;
            }
            while (next_ < tEval_.size() && std::abs(t - tEval_[next_]) < kTimeMatchTol) {
                out_.t.push_back(tEval_[next_++]);
                out_.x.push_back(x);
            }
        }

       private:
        SolveResult&               out_;
        const std::vector<double>& tEval_;
        size_t                     next_ = 0;
    };

}  // namespace detail

/**
 * @brief Fixed-step ODE solver.
 *
 * Without tEval every step is recorded. With tEval, steps are shortened to land on each requested
 * time and only those times are recorded.
 */
template <typename IntegratorType>
    requires FixedStepIntegrator<IntegratorType>
class FixedStepSolver {
   public:
    explicit FixedStepSolver(double stepSize = 0.01) : h_(stepSize) {}

    template <typename F>
    SolveResult solve(F&&                              f,
                      const ColVec&                    x0,
                      const std::pair<double, double>& tSpan,
                      const std::vector<double>&       tEval = {}) const
        requires ODEIntegrator<IntegratorType> && std::invocable<F, double, const ColVec&>
    {
        SolveResult result;
        if (!(h_ > 0.0)) {
            result.fail("Step size must be positive");
            return result;
        }

        const auto [t0, tf] = tSpan;
        double t            = t0;
        ColVec x            = x0;

        detail::TrajectoryRecorder recorder(result, tEval, t0);
        recorder.record(t, x);

        while (t < tf - 1e-12) {
            const double step = recorder.limitStep(t, std::min(h_, tf - t));

            x = integrator_.evolve(f, x, t, step).x;
            t += step;
            ++result.nfev;

            if (!x.allFinite()) {
                result.fail("State became non-finite");
                return result;
            }
            recorder.record(t, x);
        }
        return result;
    }

   private:
    IntegratorType integrator_;
    double         h_;
};

/**
 * @brief Adaptive-step ODE solver driven by an embedded error estimate.
 *
 * A step is accepted when the error estimate is within tol, or when it is already at the minimum
 * step size. Recording follows the same rules as FixedStepSolver.
 */
template <typename IntegratorType>
    requires AdaptiveStepIntegrator<IntegratorType>
class AdaptiveStepSolver {
   public:
    explicit AdaptiveStepSolver(double initialStep = 0.01,
                                double tol         = 1e-6,
                                double minStep     = 1e-8,
                                double maxStep     = 1.0,
                                size_t maxNfev     = 1000000)
        : h0_(initialStep), tol_(tol), hMin_(minStep), hMax_(maxStep), maxNfev_(maxNfev) {}

    template <typename F>
    SolveResult solve(F&&                              f,
                      const ColVec&                    x0,
                      const std::pair<double, double>& tSpan,
                      const std::vector<double>&       tEval = {}) const
        requires ODEIntegrator<IntegratorType> && std::invocable<F, double, const ColVec&>
    {
        constexpr double safety         = 0.9;
        constexpr double minScale       = 0.2;
        constexpr double maxScale       = 5.0;
        constexpr size_t maxRejections  = 100;
        size_t           rejectionCount = 0;

        SolveResult result;
        const auto [t0, tf] = tSpan;
        double t            = t0;
        ColVec x            = x0;
        double h            = std::clamp(h0_, hMin_, hMax_);

        detail::TrajectoryRecorder recorder(result, tEval, t0);
        recorder.record(t, x);

        while (t < tf - 1e-12) {
            if (result.nfev >= maxNfev_) {
                result.fail("Maximum number of function evaluations exceeded. System may be too stiff.");
                return result;
            }

            const double wanted    = std::min(h, tf - t);
            const double step      = recorder.limitStep(t, wanted);
            const bool   shortened = step < wanted;

            const IntegrationResult trial = integrator_.evolve(f, x, t, step);
            ++result.nfev;

            const double scale =
                trial.error > 0.0 ? std::clamp(safety * std::pow(tol_ / trial.error, 0.2), minScale, maxScale) : maxScale;

            if (!(trial.error <= tol_) && step > hMin_) {
                h = std::clamp(step * scale, hMin_, hMax_);
                if (++rejectionCount >= maxRejections) {
                    result.fail("Too many consecutive step rejections. System may be too stiff or ill-conditioned.");
                    return result;
                }
                continue;
            }

            t += step;
            x = trial.x;
            if (!x.allFinite()) {
                result.fail("State became non-finite");
                return result;
            }
            recorder.record(t, x);

            rejectionCount = 0;
            // A step cut short to land on a requested time says nothing about the next one
            if (!shortened) {
                h = std::clamp(step * scale, hMin_, hMax_);
            }
        }
        return result;
    }

   private:
    IntegratorType integrator_;
    double         h0_;
    double         tol_;
    double         hMin_;
    double         hMax_;
    size_t         maxNfev_;
};

/**
 * @brief Exact solution of x_dot = A x + B u for constant u.
 *
 * Uses exp([[A B]; [0 0]] dt) = [[Phi Gamma]; [0 I]], so A may be singular.
 */
class ExactSolver {
   public:
    SolveResult solve(const Matrix&                    A,
                      const Matrix&                    B,
                      const ColVec&                    x0,
                      const ColVec&                    u,
                      const std::pair<double, double>& tSpan,
                      const std::vector<double>&       tEval) const {
        SolveResult result;
        const auto [t0, tf] = tSpan;

        if (tEval.empty()) {
            result.t.push_back(tf);
            result.x.push_back(stateAt(A, B, x0, u, tf - t0));
            return result;
        }
        for (double t : tEval) {
            if (t >= t0 && t <= tf) {
                result.t.push_back(t);
                result.x.push_back(stateAt(A, B, x0, u, t - t0));
            }
        }
        return result;
    }

    static ColVec stateAt(const Matrix& A, const Matrix& B, const ColVec& x0, const ColVec& u, double dt) {
        const Eigen::Index n = A.rows();
        const Eigen::Index m = B.cols();

        Matrix M                = Matrix::Zero(n + m, n + m);
        M.topLeftCorner(n, n)   = A * dt;
        M.topRightCorner(n, m)  = B * dt;
        const Matrix E          = M.exp();
        return E.topLeftCorner(n, n) * x0 + E.topRightCorner(n, m) * u;
    }
};

// Exact solution sampled on a uniform grid, with intervals bisected until linear interpolation
// matches the trajectory to within tol. With tEval it evaluates at those points only.
class AdaptiveExactSolver {
   public:
    explicit AdaptiveExactSolver(double tol = 1e-4, size_t maxDepth = 12) : tol_(tol), maxDepth_(maxDepth) {}

    SolveResult solve(const Matrix&                    A,
                      const Matrix&                    B,
                      const ColVec&                    x0,
                      const ColVec&                    u,
                      const std::pair<double, double>& tSpan,
                      const std::vector<double>&       tEval = {}) const {
        if (!tEval.empty()) {
            return ExactSolver{}.solve(A, B, x0, u, tSpan, tEval);
        }

        constexpr int gridIntervals = 64;

        const auto [t0, tf] = tSpan;
        const Sampler sampler{A, B, x0, u, t0};

        SolveResult result;
        result.t.reserve(4 * gridIntervals);
        result.x.reserve(4 * gridIntervals);

        double tl = t0;
        ColVec xl = sampler(t0);
        result.t.push_back(tl);
        result.x.push_back(xl);
        for (int i = 1; i <= gridIntervals; ++i) {
            const double tr = t0 + (tf - t0) * static_cast<double>(i) / gridIntervals;
            ColVec       xr = sampler(tr);
            if (xr.size() > 0) {
                refine(sampler, tl, xl, tr, xr, 0, result);
            }
            result.t.push_back(tr);
            result.x.push_back(xr);
            tl = tr;
            xl = std::move(xr);
        }
        return result;
    }

   private:
    struct Sampler {
        const Matrix& A;
        const Matrix& B;
        const ColVec& x0;
        const ColVec& u;
        double        t0;

        ColVec operator()(double t) const { return ExactSolver::stateAt(A, B, x0, u, t - t0); }
    };

    // Appends the interior points of (tl, tr) in increasing time
    void refine(const Sampler& sampler, double tl, const ColVec& xl, double tr, const ColVec& xr, size_t depth,
                SolveResult& out) const {
        const double tm = 0.5 * (tl + tr);
        if (depth >= maxDepth_ || tm <= tl || tm >= tr) return;

        const ColVec xm = sampler(tm);
        if ((xm - 0.5 * (xl + xr)).cwiseAbs().maxCoeff() <= tol_) return;

        refine(sampler, tl, xl, tm, xm, depth + 1, out);
        out.t.push_back(tm);
        out.x.push_back(xm);
        refine(sampler, tm, xm, tr, xr, depth + 1, out);
    }

    double tol_;
    size_t maxDepth_;
};

}  // namespace ctrlkit
