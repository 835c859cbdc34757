#include "ident.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "Eigen/Dense"
#include "fmt/format.h"
#include "log.hpp"
#include "polynomial.hpp"
#include "simulate.hpp"
#include "unsupported/Eigen/NonLinearOptimization"
#include "utility.hpp"

namespace ctrlkit {

namespace {
    // B(q) q^-nk as a plain q^-1 polynomial
    Poly delayed(const Poly& B, size_t nk) {
        Poly result(nk, 0.0);
        result.insert(result.end(), B.begin(), B.end());
        return result;
    }

    double sumSquares(const std::vector<double>& y, const std::vector<double>& yhat) {
        double s = 0.0;
        for (size_t k = 0; k < y.size(); ++k) {
            const double e = y[k] - yhat[k];
            s += e * e;
        }
        return s;
    }

    void requireSamples(const IdData& data, size_t params, size_t first, const char* who) {
        if (data.size() <= first + params) {
            throw std::invalid_argument(std::string(who) + ": " + std::to_string(data.size()) +
                                        " samples are not enough for " + std::to_string(params) + " parameters");
        }
    }

    // Least-squares B for fixed F in y = B/F u(t - nk)
    Poly refitNumerator(const IdData& data, const Poly& F, size_t nb, size_t nk) {
        const auto& y  = data.output();
        const auto  uf = filter({1.0}, F, data.input());
        const auto  N  = static_cast<Eigen::Index>(y.size());

        Matrix          Phi = Matrix::Zero(N, static_cast<Eigen::Index>(nb));
        Eigen::VectorXd Y   = Eigen::Map<const Eigen::VectorXd>(y.data(), N);
        for (Eigen::Index t = 0; t < N; ++t) {
            for (size_t k = 0; k < nb; ++k) {
                const auto idx = t - static_cast<Eigen::Index>(nk + k);
                if (idx >= 0) Phi(t, static_cast<Eigen::Index>(k)) = uf[static_cast<size_t>(idx)];
            }
        }
        const Eigen::VectorXd b = Phi.colPivHouseholderQr().solve(Y);
        return Poly(b.data(), b.data() + b.size());
    }

    // Residual functor for Eigen::LevenbergMarquardt, theta = [b0 .. b_{nb-1}, f1 .. f_nf]
    struct OutputErrorResidual {
        const std::vector<double>& y;
        const std::vector<double>& u;
        size_t                     nb, nf, nk;
        double                     penalty;  // Residual level reported for an unstable F

        int values() const { return static_cast<int>(y.size()); }
        int inputs() const { return static_cast<int>(nb + nf); }

        void unpack(const Eigen::VectorXd& theta, Poly& B, Poly& F) const {
            B.assign(theta.data(), theta.data() + nb);
            F.assign(nf + 1, 1.0);
            for (size_t k = 0; k < nf; ++k) F[k + 1] = theta(static_cast<Eigen::Index>(nb + k));
        }

        int operator()(const Eigen::VectorXd& theta, Eigen::VectorXd& fvec) const {
            Poly B, F;
            unpack(theta, B, F);
            if (!isStableDiscrete(F)) {
                fvec.setConstant(penalty);
                return 0;
            }

            const auto yhat = filter(delayed(B, nk), F, u);
            for (size_t t = 0; t < y.size(); ++t) {
                fvec(static_cast<Eigen::Index>(t)) = y[t] - yhat[t];
            }
            if (!fvec.allFinite()) {
                fvec.setConstant(penalty);
            }
            return 0;
        }

        int df(const Eigen::VectorXd& theta, Eigen::MatrixXd& fjac) const {
            Poly B, F;
            unpack(theta, B, F);

            // d(yhat)/d(b_k) = u_f(t - nk - k), d(yhat)/d(f_k) = -yhat_f(t - k), where x_f = x / F
            const auto uf    = filter({1.0}, F, u);
            const auto yhat  = filter(delayed(B, nk), F, u);
            const auto yhatf = filter({1.0}, F, yhat);

            fjac.setZero();
            for (size_t t = 0; t < y.size(); ++t) {
                const auto row = static_cast<Eigen::Index>(t);
                for (size_t k = 0; k < nb; ++k) {
                    if (t >= nk + k) fjac(row, static_cast<Eigen::Index>(k)) = -uf[t - nk - k];
                }
                for (size_t k = 1; k <= nf; ++k) {
                    if (t >= k) fjac(row, static_cast<Eigen::Index>(nb + k - 1)) = yhatf[t - k];
                }
            }
            return 0;
        }
    };

    const char* describe(Eigen::LevenbergMarquardtSpace::Status status) {
        using namespace Eigen::LevenbergMarquardtSpace;
        switch (status) {
            case ImproperInputParameters: return "improper input parameters";
            case RelativeReductionTooSmall: return "relative reduction of the loss below tolerance";
            case RelativeErrorTooSmall: return "relative parameter change below tolerance";
            case RelativeErrorAndReductionTooSmall: return "loss reduction and parameter change below tolerance";
            case CosinusTooSmall: return "residual orthogonal to the Jacobian";
            case TooManyFunctionEvaluation: return "maximum function evaluations reached";
            case FtolTooSmall: return "loss tolerance too small, no further reduction possible";
            case XtolTooSmall: return "step tolerance too small, no further improvement possible";
            case GtolTooSmall: return "gradient tolerance too small";
            case UserAsked: return "stopped by residual function";
            default: return "not started";
        }
    }

    void finishOutputError(IdPoly& model, const IdData& data) {
        const auto   yhat = model.simulate(data.input());
        const double N    = static_cast<double>(data.size());
        const double d    = static_cast<double>(model.nb() + model.nf());

        model.lossFunction  = sumSquares(data.output(), yhat) / N;
        model.noiseVariance = model.lossFunction * N / (N - d);
        model.fitPercent    = nrmseFit(data.output(), yhat);
    }
}  // namespace

IdPoly::IdPoly(Poly A_, Poly B_, Poly F_, size_t nk_, double Ts_)
    : A(std::move(A_)), B(std::move(B_)), F(std::move(F_)), nk(nk_) {
    if (A.empty() || std::abs(A[0]) < 1e-15) {
        throw std::invalid_argument("IdPoly: A must be non-empty with a nonzero leading coefficient");
    }
    if (F.empty() || std::abs(F[0]) < 1e-15) {
        throw std::invalid_argument("IdPoly: F must be non-empty with a nonzero leading coefficient");
    }
    if (B.empty()) {
        throw std::invalid_argument("IdPoly: B must be non-empty");
    }
    if (!(Ts_ > 0.0)) {
        throw std::invalid_argument("IdPoly: sampling time must be positive");
    }
    Ts = Ts_;
}

TransferFunction IdPoly::toTransferFunction() const {
    // Multiply numerator and denominator (both in q^-1) by z^d to get polynomials in z
    Poly         num = delayed(B, nk);
    Poly         den = conv(A, F);
    const size_t len = std::max(num.size(), den.size());
    num.resize(len, 0.0);
    den.resize(len, 0.0);
    return TransferFunction{trimLeadingZeros(num), den, Ts};
}

StateSpace IdPoly::toStateSpace() const {
    return toTransferFunction().toStateSpace();
}

std::vector<double> IdPoly::simulate(const std::vector<double>& u) const {
    return filter(delayed(B, nk), conv(A, F), u);
}

IdPoly arx(const IdData& data, size_t na, size_t nb, size_t nk) {
    if (nb == 0) {
        throw std::invalid_argument("arx: nb must be at least 1");
    }

    const size_t d     = na + nb;
    const size_t first = std::max(na, nb + nk - 1);
    requireSamples(data, d, first, "arx");

    const auto& y    = data.output();
    const auto& u    = data.input();
    const auto  rows = static_cast<Eigen::Index>(data.size() - first);

    // phi(t) = [-y(t-1) .. -y(t-na), u(t-nk) .. u(t-nk-nb+1)]
    Matrix          Phi(rows, static_cast<Eigen::Index>(d));
    Eigen::VectorXd Y(rows);
    for (Eigen::Index r = 0; r < rows; ++r) {
        const size_t t = first + static_cast<size_t>(r);
        for (size_t i = 0; i < na; ++i) Phi(r, static_cast<Eigen::Index>(i)) = -y[t - 1 - i];
        for (size_t j = 0; j < nb; ++j) Phi(r, static_cast<Eigen::Index>(na + j)) = u[t - nk - j];
        Y(r) = y[t];
    }

    const auto qr = Phi.colPivHouseholderQr();
    if (qr.rank() < static_cast<Eigen::Index>(d)) {
        throw std::runtime_error("arx: regression matrix is rank deficient (input not persistently exciting)");
    }
    const Eigen::VectorXd theta = qr.solve(Y);

    Poly A(na + 1, 1.0);
    for (size_t i = 0; i < na; ++i) A[i + 1] = theta(static_cast<Eigen::Index>(i));
    Poly B(theta.data() + na, theta.data() + d);

    IdPoly model{std::move(A), std::move(B), {1.0}, nk, data.sampleTime()};

    const double loss   = (Y - Phi * theta).squaredNorm() / static_cast<double>(rows);
    model.lossFunction  = loss;
    model.noiseVariance = loss * static_cast<double>(rows) / static_cast<double>(static_cast<size_t>(rows) - d);
    model.fitPercent    = compare(model, data, 1);
    model.iterations    = 0;
    model.termination   = "least squares";

    log::info("arx({}, {}, {}): loss {:.6g}, fit {:.2f}%", na, nb, nk, model.lossFunction, model.fitPercent);
    return model;
}

IdPoly oe(const IdData& data, size_t nb, size_t nf, size_t nk, const OeOptions& options) {
    if (nb == 0) {
        throw std::invalid_argument("oe: nb must be at least 1");
    }
    requireSamples(data, nb + nf, 0, "oe");

    if (nf == 0) {
        // Finite impulse response: linear in the parameters
        IdPoly model{{1.0}, refitNumerator(data, {1.0}, nb, nk), {1.0}, nk, data.sampleTime()};
        finishOutputError(model, data);
        model.termination = "least squares";
        log::info("oe({}, 0, {}): loss {:.6g}, fit {:.2f}%", nb, nk, model.lossFunction, model.fitPercent);
        return model;
    }

    Poly B0, F0;
    if (options.initialB.empty() && options.initialF.empty()) {
        const IdPoly initial = arx(data, nf, nb, nk);
        B0                   = initial.B;
        F0                   = initial.A;
    } else {
        if (options.initialB.size() != nb || options.initialF.size() != nf + 1) {
            throw std::invalid_argument("oe: initial polynomials must have nb and nf + 1 coefficients");
        }
        if (std::abs(options.initialF[0]) < 1e-15) {
            throw std::invalid_argument("oe: initial F must have a nonzero leading coefficient");
        }
        B0 = polyscale(options.initialB, 1.0 / options.initialF[0]);
        F0 = polyscale(options.initialF, 1.0 / options.initialF[0]);
    }
    if (!isStableDiscrete(F0)) {
        log::debug("oe: reflecting unstable roots of the initial F");
        F0 = stabilizeDiscrete(F0);
    }

    const auto& y = data.output();

    OutputErrorResidual residual{y, data.input(), nb, nf, nk, 1e3 * (std::sqrt(meanSquare(y)) + 1.0)};

    Eigen::VectorXd theta(static_cast<Eigen::Index>(nb + nf));
    for (size_t k = 0; k < nb; ++k) theta(static_cast<Eigen::Index>(k)) = B0[k];
    for (size_t k = 0; k < nf; ++k) theta(static_cast<Eigen::Index>(nb + k)) = F0[k + 1];

    Eigen::LevenbergMarquardt<OutputErrorResidual> lm(residual);
    lm.parameters.maxfev = static_cast<Eigen::Index>(options.maxFunctionEvaluations);
    lm.parameters.ftol   = options.functionTolerance;
    lm.parameters.xtol   = options.stepTolerance;

    const auto status = lm.minimize(theta);
    log::debug("oe: {} function and {} Jacobian evaluations, |e| = {:.6g}", lm.nfev, lm.njev, lm.fnorm);

    Poly B, F;
    residual.unpack(theta, B, F);

    std::string termination = describe(status);
    if (options.enforceStability && !isStableDiscrete(F)) {
        log::warn("oe: estimated F is unstable, reflecting its roots and refitting B");
        F = stabilizeDiscrete(F);
        B = refitNumerator(data, F, nb, nk);
        termination += " (F stabilized)";
    }

    IdPoly model{{1.0}, std::move(B), std::move(F), nk, data.sampleTime()};
    finishOutputError(model, data);
    model.iterations  = static_cast<size_t>(lm.iter);
    model.termination = std::move(termination);

    log::info("oe({}, {}, {}): loss {:.6g}, fit {:.2f}%, {} iterations, {}",
              nb, nf, nk, model.lossFunction, model.fitPercent, model.iterations, model.termination);
    return model;
}

StateSpace n4sid(const IdData& data, size_t order, const N4sidOptions& options) {
    if (order == 0) {
        throw std::invalid_argument("n4sid: order must be at least 1");
    }
    const size_t i = (options.horizon == 0) ? std::max<size_t>(2 * order, 10) : options.horizon;
    if (i <= order) {
        throw std::invalid_argument("n4sid: horizon must exceed the model order");
    }
    if (data.size() + 1 < 2 * i || data.size() + 1 - 2 * i < 4 * i) {
        throw std::invalid_argument("n4sid: " + std::to_string(data.size()) + " samples are too few for horizon " +
                                    std::to_string(i));
    }

    const auto& y  = data.output();
    const auto& u  = data.input();
    const auto  ii = static_cast<Eigen::Index>(i);
    const auto  j  = static_cast<Eigen::Index>(data.size() + 1 - 2 * i);

    // Rows: future inputs, past inputs, past outputs, future outputs
    Matrix H(4 * ii, j);
    for (Eigen::Index r = 0; r < ii; ++r) {
        for (Eigen::Index c = 0; c < j; ++c) {
            const auto p = static_cast<size_t>(r + c);
            H(r, c)          = u[i + p];
            H(ii + r, c)     = u[p];
            H(2 * ii + r, c) = y[p];
            H(3 * ii + r, c) = y[i + p];
        }
    }

    // LQ factorization through QR of the transpose
    const Eigen::HouseholderQR<Matrix> qr(H.transpose());
    const Matrix R = qr.matrixQR().topRows(4 * ii).triangularView<Eigen::Upper>();
    const Matrix L = R.transpose();

    // Future outputs projected on the past, with the future inputs removed
    const Matrix                L32 = L.block(3 * ii, ii, ii, 2 * ii);
    const Eigen::JacobiSVD<Matrix> svd(L32, Eigen::ComputeThinU);
    const Eigen::VectorXd&      sv = svd.singularValues();
    log::debug("n4sid: leading singular values {}", fmt::join(sv.data(), sv.data() + std::min<Eigen::Index>(sv.size(), 8), ", "));

    const auto   n     = static_cast<Eigen::Index>(order);
    const Matrix Gamma = svd.matrixU().leftCols(n) * sv.head(n).cwiseSqrt().asDiagonal();

    const Matrix C = Gamma.topRows(1);
    const Matrix A = Gamma.topRows(ii - 1).completeOrthogonalDecomposition().solve(Gamma.bottomRows(ii - 1));

    // y(t) = C A^t x0 + sum_k C A^(t-1-k) B u(k) + D u(t), linear in [x0, B, D]
    const auto N   = static_cast<Eigen::Index>(data.size());
    Matrix     Phi(N, 2 * n + 1);
    Eigen::RowVectorXd obs = C;
    Matrix     X   = Matrix::Zero(n, n);  // Column k is the state response to a unit B along axis k
    for (Eigen::Index t = 0; t < N; ++t) {
        const double ut           = u[static_cast<size_t>(t)];
        Phi.block(t, 0, 1, n)     = obs;
        Phi.block(t, n, 1, n)     = C * X;
        Phi(t, 2 * n)             = ut;
        obs                       = obs * A;
        X                         = A * X + ut * Matrix::Identity(n, n);
    }
    const Eigen::VectorXd Y     = Eigen::Map<const Eigen::VectorXd>(y.data(), N);
    const Eigen::VectorXd theta = Phi.colPivHouseholderQr().solve(Y);

    const Matrix B = theta.segment(n, n);
    Matrix       D(1, 1);
    D(0, 0) = theta(2 * n);

    StateSpace model{A, B, C, D, data.sampleTime()};

    log::info("n4sid(order {}, horizon {}): fit {:.2f}%", order, i, compare(model, data));
    return model;
}

std::vector<double> simulateModel(const IdPoly& model, const std::vector<double>& u) {
    return model.simulate(u);
}

std::vector<double> simulateModel(const StateSpace& model, const std::vector<double>& u) {
    if (!model.isDiscrete()) {
        throw std::invalid_argument("simulateModel: state-space model must be discrete");
    }
    if (u.empty()) {
        return {};
    }
    return lsim(model, u, sampleTimes(0.0, model.Ts.value(), u.size())).outputSeries();
}

std::vector<double> predict(const IdPoly& model, const IdData& data, size_t horizon) {
    if (horizon == 0) {
        throw std::invalid_argument("predict: horizon must be at least 1");
    }

    const auto& y = data.output();
    const auto  w = filter(delayed(model.B, model.nk), model.F, data.input());  // Deterministic part B/F u
    const auto  N = y.size();

    // A = 1 has no output feedback: every horizon is the simulation
    if (horizon >= N || model.na() == 0) {
        return model.simulate(data.input());
    }

    const auto& A  = model.A;
    const auto  na = model.na();
    const auto  a0 = A[0];

    // yhat(s) = (w(s) - sum_i a_i ytilde(s - i)) / a0, ytilde measured up to t - horizon and predicted after
    std::vector<double> yhat(N, 0.0);
    std::vector<double> window(horizon, 0.0);
    for (size_t t = 0; t < N; ++t) {
        const size_t origin = (t + 1 >= horizon) ? t + 1 - horizon : 0;  // First unmeasured sample

        for (size_t s = origin; s <= t; ++s) {
            double v = w[s];
            for (size_t i = 1; i <= na && i <= s; ++i) {
                v -= A[i] * ((s - i >= origin) ? window[s - i - origin] : y[s - i]);
            }
            window[s - origin] = v / a0;
        }
        yhat[t] = window[t - origin];
    }
    return yhat;
}

std::vector<double> resid(const IdPoly& model, const IdData& data) {
    const auto          yhat = predict(model, data, 1);
    const auto&         y    = data.output();
    std::vector<double> e(y.size());
    for (size_t k = 0; k < y.size(); ++k) e[k] = y[k] - yhat[k];
    return e;
}

double nrmseFit(const std::vector<double>& y, const std::vector<double>& yhat) {
    if (y.size() != yhat.size()) {
        throw std::invalid_argument("nrmseFit: sequences must have the same length");
    }
    const double ybar = mean(y);

    double err = 0.0, spread = 0.0;
    for (size_t k = 0; k < y.size(); ++k) {
        err += (y[k] - yhat[k]) * (y[k] - yhat[k]);
        spread += (y[k] - ybar) * (y[k] - ybar);
    }
    if (spread < 1e-300) {
        return (err < 1e-300) ? 100.0 : -std::numeric_limits<double>::infinity();
    }
    return 100.0 * (1.0 - std::sqrt(err) / std::sqrt(spread));
}

double compare(const IdPoly& model, const IdData& data, size_t horizon) {
    return nrmseFit(data.output(), predict(model, data, horizon));
}

double compare(const StateSpace& model, const IdData& data) {
    return nrmseFit(data.output(), simulateModel(model, data.input()));
}

double meanBaselineError(const IdData& data) {
    const auto&  y    = data.output();
    const double ybar = mean(y);

    double s = 0.0;
    for (double v : y) s += (v - ybar) * (v - ybar);
    return s / static_cast<double>(y.size());
}

}  // namespace ctrlkit
