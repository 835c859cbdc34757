#include "simulate.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <tuple>
#include <variant>

#include "control.hpp"
#include "solver.hpp"

namespace ctrlkit {

namespace {
    ColVec initialState(const StateSpace& sys, const ColVec& x0) {
        const auto n = static_cast<Eigen::Index>(sys.states());
        if (x0.size() == 0) {
            return ColVec::Zero(n);
        }
        if (x0.size() != n) {
            throw std::invalid_argument("lsim: x0 size does not match the number of states");
        }
        return x0;
    }

    SimulationResult collect(const NonlinearSystem& sys, const InputFcn& input, const SolveResult& sol) {
        if (!sol.success) {
            throw std::runtime_error("simulate: ODE solver failed: " + sol.message);
        }

        const auto nx = static_cast<Eigen::Index>(sys.states());
        const auto ny = static_cast<Eigen::Index>(sys.outputs());
        const auto N  = static_cast<Eigen::Index>(sol.t.size());

        SimulationResult result;
        result.time = sol.t;
        result.state.resize(N, nx);
        result.output.resize(N, ny);
        for (Eigen::Index k = 0; k < N; ++k) {
            const auto& x = sol.x[static_cast<size_t>(k)];
            result.state.row(k)  = x.transpose();
            result.output.row(k) = sys.output(x, input(sol.t[static_cast<size_t>(k)])).transpose();
        }
        return result;
    }

    void checkInitial(const NonlinearSystem& sys, const ColVec& x0) {
        if (static_cast<size_t>(x0.size()) != sys.states()) {
            throw std::invalid_argument("simulate: x0 size does not match the number of states");
        }
    }
}  // namespace

SimulationResult lsim(const LTI& model, const Matrix& u, const std::vector<double>& t, const ColVec& x0) {
    const StateSpace sys = model.toStateSpace();

    if (static_cast<size_t>(u.rows()) != t.size()) {
        throw std::invalid_argument("lsim: input must have one row per time sample");
    }
    if (static_cast<size_t>(u.cols()) != sys.inputs()) {
        throw std::invalid_argument("lsim: input must have one column per system input");
    }
    for (size_t k = 1; k < t.size(); ++k) {
        if (!(t[k] > t[k - 1])) {
            throw std::invalid_argument("lsim: time samples must be strictly increasing");
        }
    }

    const auto N = static_cast<Eigen::Index>(t.size());

    SimulationResult result;
    result.time = t;
    result.output.resize(N, static_cast<Eigen::Index>(sys.outputs()));
    result.state.resize(N, static_cast<Eigen::Index>(sys.states()));

    ColVec x = initialState(sys, x0);

    if (sys.isDiscrete()) {
        const double Ts = sys.Ts.value();
        for (size_t k = 1; k < t.size(); ++k) {
            if (std::abs((t[k] - t[k - 1]) - Ts) > 1e-6 * Ts) {
                throw std::invalid_argument("lsim: time spacing must equal the sample time of a discrete model");
            }
        }
        for (Eigen::Index k = 0; k < N; ++k) {
            const ColVec uk      = u.row(k).transpose();
            result.state.row(k)  = x.transpose();
            result.output.row(k) = sys.output(x, uk).transpose();
            x                    = sys.advance(x, uk);
        }
        return result;
    }

    // Continuous: exact ZOH propagation per interval, cached for uniform spacing
    double dtCached = -1.0;
    Matrix Ad, Bd;
    for (Eigen::Index k = 0; k < N; ++k) {
        const ColVec uk      = u.row(k).transpose();
        result.state.row(k)  = x.transpose();
        result.output.row(k) = sys.output(x, uk).transpose();

        if (k + 1 < N) {
            const double dt = t[static_cast<size_t>(k + 1)] - t[static_cast<size_t>(k)];
            if (std::abs(dt - dtCached) > 1e-12 * std::max(1.0, dt)) {
                std::tie(Ad, Bd) = c2d(sys.A, sys.B, dt, DiscretizationMethod::ZOH);
                dtCached         = dt;
            }
            x = Ad * x + Bd * uk;
        }
    }
    return result;
}

SimulationResult lsim(const LTI& sys, const std::vector<double>& u, const std::vector<double>& t, const ColVec& x0) {
    const Matrix U = Eigen::Map<const Eigen::VectorXd>(u.data(), static_cast<Eigen::Index>(u.size()));
    return lsim(sys, U, t, x0);
}

InputFcn holdInput(std::vector<double> t, std::vector<double> u) {
    if (t.empty() || t.size() != u.size()) {
        throw std::invalid_argument("holdInput: time and input must be non-empty and the same length");
    }
    return [t = std::move(t), u = std::move(u)](double time) -> ColVec {
        // Index of the last sample at or before time, tolerant to rounding in the solver's clock
        const auto   it = std::upper_bound(t.begin(), t.end(), time + 1e-9);
        const size_t k  = (it == t.begin()) ? 0 : static_cast<size_t>(std::distance(t.begin(), it)) - 1;
        return ColVec{u[k]};
    };
}

SimulationResult simulate(const NonlinearSystem&           sys,
                          const InputFcn&                  input,
                          const ColVec&                    x0,
                          const std::pair<double, double>& tSpan,
                          const std::vector<double>&       tEval,
                          double                           tol,
                          double                           maxStep) {
    checkInitial(sys, x0);

    const AdaptiveStepSolver<RK45> solver(std::min(1e-3, maxStep), tol, 1e-10, maxStep);

    auto f = [&](double t, const ColVec& x) -> ColVec { return sys.derivative(x, input(t)); };
    return collect(sys, input, solver.solve(f, x0, tSpan, tEval));
}

SimulationResult simulateFixedStep(const NonlinearSystem&           sys,
                                   const InputFcn&                  input,
                                   const ColVec&                    x0,
                                   const std::pair<double, double>& tSpan,
                                   double                           h,
                                   Integrator                       method,
                                   const std::vector<double>&       tEval) {
    checkInitial(sys, x0);

    auto f = [&](double t, const ColVec& x) -> ColVec { return sys.derivative(x, input(t)); };

    const SolveResult sol = std::visit(
        [&](const auto& integrator) {
            using I = std::decay_t<decltype(integrator)>;
            return FixedStepSolver<I>(h).solve(f, x0, tSpan, tEval);
        },
        method);

    return collect(sys, input, sol);
}

}  // namespace ctrlkit
