#include "control.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <string>

#include "LTI.hpp"
#include "polynomial.hpp"
#include "ss.hpp"
#include "tf.hpp"
#include "types.hpp"
#include "unsupported/Eigen/MatrixFunctions"  // IWYU pragma: keep

// Free Function Interface
namespace ctrlkit {

namespace {
    // Shifts each sample by a multiple of 360 degrees to stay within 180 degrees of its predecessor
    void unwrapDegrees(std::vector<double>& phase) {
        for (size_t i = 1; i < phase.size(); ++i) {
            phase[i] += 360.0 * std::round((phase[i - 1] - phase[i]) / 360.0);
        }
    }

    void requireCompatible(const LTI& sys1, const LTI& sys2) {
        if (sys1.isDiscrete() != sys2.isDiscrete()) {
            throw std::runtime_error("Cannot combine continuous and discrete systems. Use discretize() or c2d() first.");
        }
        if (sys1.Ts != sys2.Ts) {
            throw std::runtime_error("Sampling times do not match for discrete systems.");
        }
    }

    // Continuous-time equivalent of a pole; discrete poles are mapped through s = ln(z)/Ts
    std::complex<double> continuousEquivalent(std::complex<double> p, const std::optional<double>& Ts) {
        if (!Ts.has_value()) {
            return p;
        }
        return std::log(p) / *Ts;
    }

    struct StepMetrics {
        double riseTime         = 0.0;
        double settlingTime     = 0.0;
        double overshoot        = 0.0;
        double steadyStateError = 0.0;
        double peak             = 0.0;
        double peakTime         = 0.0;
    };

    // Metrics of one unit-step output sampled at t. The last sample is taken as the final value.
    // Peak, overshoot and rise time are measured in the direction of the final value.
    StepMetrics stepMetrics(const std::vector<double>& t, const std::vector<double>& y) {
        StepMetrics  m;
        const double yFinal = y.back();
        const double sign   = yFinal < 0.0 ? -1.0 : 1.0;
        const auto   index  = [&](std::vector<double>::const_iterator it) { return static_cast<size_t>(it - y.begin()); };

        m.steadyStateError = 1.0 - yFinal;

        const auto peakIt =
            std::max_element(y.begin(), y.end(), [sign](double a, double b) { return sign * a < sign * b; });
        m.peak     = *peakIt;
        m.peakTime = t[index(peakIt)];
        if (std::abs(yFinal) > 1e-6) {
            m.overshoot = std::max(0.0, 100.0 * (m.peak - yFinal) / yFinal);
        }

        // 10% to 90% of the final value
        const auto firstPast = [&](double fraction) {
            return std::find_if(y.begin(), y.end(), [&](double v) { return sign * v >= fraction * std::abs(yFinal); });
        };
        const auto it10 = firstPast(0.1);
        const auto it90 = firstPast(0.9);
        if (it90 != y.end() && it90 > it10) {
            m.riseTime = t[index(it90)] - t[index(it10)];
        }

        // Sample after the last one outside the 2% band
        const double band    = 0.02 * std::abs(yFinal);
        const auto   outside = std::find_if(y.rbegin(), y.rend(), [&](double v) { return std::abs(v - yFinal) > band; });
        m.settlingTime       = t.front();
        if (outside != y.rend()) {
            const size_t last = static_cast<size_t>(y.rend() - outside) - 1;
            m.settlingTime    = t[std::min(last + 1, t.size() - 1)];
        }
        return m;
    }

    // [M1, 0; 0, M2]
    Matrix blockDiagonal(const Matrix& M1, const Matrix& M2) {
        Matrix out                                  = Matrix::Zero(M1.rows() + M2.rows(), M1.cols() + M2.cols());
        out.topLeftCorner(M1.rows(), M1.cols())     = M1;
        out.bottomRightCorner(M2.rows(), M2.cols()) = M2;
        return out;
    }

    // [top; bottom]
    Matrix stacked(const Matrix& top, const Matrix& bottom) {
        Matrix out(top.rows() + bottom.rows(), top.cols());
        out.topRows(top.rows())       = top;
        out.bottomRows(bottom.rows()) = bottom;
        return out;
    }

    // [left, right]
    Matrix sideBySide(const Matrix& left, const Matrix& right) {
        Matrix out(left.rows(), left.cols() + right.cols());
        out.leftCols(left.cols())   = left;
        out.rightCols(right.cols()) = right;
        return out;
    }

    // Zero-state response of a discrete system at tStart + k Ts for k = 0 .. floor((tEnd - tStart) / Ts)
    template <typename Response, typename InputAt>
    Response sampleDiscrete(const StateSpace& sys, double tStart, double tEnd, InputAt inputAt) {
        const double Ts        = *sys.Ts;
        const auto   numPoints = static_cast<size_t>((tEnd - tStart) / Ts) + 1;

        Response response;
        response.time = sampleTimes(tStart, Ts, numPoints);
        response.output.reserve(numPoints);

        ColVec x = ColVec::Zero(sys.A.rows());
        for (size_t k = 0; k < numPoints; ++k) {
            const ColVec u = inputAt(k);
            response.output.push_back(sys.output(x, u));
            x = sys.advance(x, u);
        }
        return response;
    }
}  // namespace

bool is_stable(const StateSpace& sys) {
    const auto ps = poles(sys);
    if (sys.Ts.has_value()) {
        return std::all_of(ps.begin(), ps.end(), [](const Pole& p) { return std::abs(p) < 1.0; });
    }
    return std::all_of(ps.begin(), ps.end(), [](const Pole& p) { return p.real() < 0.0; });
}

std::vector<Pole> poles(const StateSpace& sys) {
    if (sys.A.rows() == 0) {
        return {};
    }
    const Eigen::VectorXcd ev = sys.A.eigenvalues();
    return std::vector<Pole>(ev.begin(), ev.end());
}

std::vector<Zero> zeros(const StateSpace& sys) {
    // Transmission zeros of a SISO system are the roots of the transfer function numerator
    if (sys.B.cols() != 1 || sys.C.rows() != 1) {
        throw std::invalid_argument("zeros() only works for SISO systems");
    }

    auto tf_sys = sys.toTransferFunction();
    return tf_sys.zeros();
}

Matrix dcgain(const StateSpace& sys) {
    const int n = static_cast<int>(sys.A.rows());
    if (n == 0) {
        return sys.D;
    }

    // G(0) = D - C A^-1 B (continuous), G(1) = D + C (I - A)^-1 B (discrete)
    const Matrix M = sys.Ts.has_value() ? Matrix(Matrix::Identity(n, n) - sys.A) : Matrix(-sys.A);

    Eigen::FullPivLU<Matrix> lu(M);
    if (!lu.isInvertible()) {
        throw std::runtime_error("dcgain: system has a pole at DC, steady-state gain is infinite");
    }
    return sys.D + sys.C * lu.solve(sys.B);
}

MarginInfo margin(const StateSpace& sys) {
    // For discrete systems, adjust frequency range to avoid aliasing
    double fStart = 1e-3;
    double fEnd   = 1e4;

    if (sys.Ts.has_value()) {
        fEnd = 0.999 / (2.0 * (*sys.Ts));  // Just below Nyquist
    }

    const size_t numPoints = 2000;
    auto         bode_resp = bode(sys, fStart, fEnd, numPoints);
    const auto&  f         = bode_resp.freq;
    const auto&  mag       = bode_resp.magnitude;
    const auto&  phase     = bode_resp.phase;

    // Margins are infinite when the corresponding crossover does not exist
    MarginInfo info{
        .gainMargin     = std::numeric_limits<double>::infinity(),
        .phaseMargin    = std::numeric_limits<double>::infinity(),
        .gainCrossover  = std::numeric_limits<double>::quiet_NaN(),
        .phaseCrossover = std::numeric_limits<double>::quiet_NaN()};

    // Crossings are interpolated linearly in log-frequency
    auto interpolate = [&](size_t i, double alpha) {
        return std::pow(10.0, std::log10(f[i - 1]) + alpha * (std::log10(f[i]) - std::log10(f[i - 1])));
    };

    // Gain crossover: first point where |G| passes through 0 dB
    for (size_t i = 1; i < f.size(); ++i) {
        if ((mag[i - 1] >= 0.0) != (mag[i] >= 0.0)) {
            const double alpha = mag[i - 1] / (mag[i - 1] - mag[i]);
            info.gainCrossover = interpolate(i, alpha);
            info.phaseMargin   = 180.0 + phase[i - 1] + alpha * (phase[i] - phase[i - 1]);
            break;
        }
    }

    // Phase crossover: first point where the unwrapped phase passes through -180 degrees
    for (size_t i = 1; i < f.size(); ++i) {
        const double p0 = phase[i - 1] + 180.0;
        const double p1 = phase[i] + 180.0;
        if ((p0 >= 0.0) != (p1 >= 0.0)) {
            const double alpha  = p0 / (p0 - p1);
            info.phaseCrossover = interpolate(i, alpha);
            info.gainMargin     = -(mag[i - 1] + alpha * (mag[i] - mag[i - 1]));
            break;
        }
    }

    return info;
}

DampingInfo damp(const StateSpace& sys) {
    auto                poles_vec = poles(sys);
    std::vector<double> wns, zetas;
    for (auto p : poles_vec) {
        const auto   s     = continuousEquivalent(p, sys.Ts);
        const double abs_s = std::abs(s);
        if (abs_s > 1e-12 && std::isfinite(abs_s)) {
            wns.push_back(abs_s);
            zetas.push_back(-s.real() / abs_s);
        } else {
            wns.push_back(0.0);
            zetas.push_back(1.0);
        }
    }
    return {wns, zetas};
}

StepInfo stepinfo(const StateSpace& sys, double tEnd) {
    const auto resp = step(sys, 0.0, tEnd, ColVec::Ones(sys.B.cols()));

    StepInfo info;
    std::vector<double> y(resp.output.size());
    for (Eigen::Index j = 0; j < sys.C.rows(); ++j) {
        std::transform(resp.output.begin(), resp.output.end(), y.begin(), [j](const ColVec& v) { return v(j); });
        const auto m = stepMetrics(resp.time, y);
        info.riseTime.push_back(m.riseTime);
        info.settlingTime.push_back(m.settlingTime);
        info.overshoot.push_back(m.overshoot);
        info.steadyStateError.push_back(m.steadyStateError);
        info.peak.push_back(m.peak);
        info.peakTime.push_back(m.peakTime);
    }
    return info;
}

StepResponse step(const StateSpace& sys, double tStart, double tEnd, ColVec uStep) {
    if (uStep.size() != sys.B.cols()) {
        uStep = ColVec::Ones(sys.B.cols());
    }

    if (sys.Ts.has_value()) {
        return sampleDiscrete<StepResponse>(sys, tStart, tEnd, [&uStep](size_t) { return uStep; });
    }

    // Constant input, so the exact solver only needs to refine where the output bends
    const auto result = AdaptiveExactSolver{}.solve(sys.A, sys.B, ColVec::Zero(sys.A.rows()), uStep, {tStart, tEnd});

    StepResponse response;
    response.time = result.t;
    response.output.reserve(result.x.size());
    for (const auto& x : result.x) {
        response.output.push_back(sys.output(x, uStep));
    }
    return response;
}

ImpulseResponse impulse(const StateSpace& sys, double tStart, double tEnd) {
    if (sys.Ts.has_value()) {
        // Unit pulse on the first sample only
        const auto m = sys.B.cols();
        return sampleDiscrete<ImpulseResponse>(sys, tStart, tEnd, [m](size_t k) {
            return k == 0 ? ColVec(ColVec::Ones(m)) : ColVec(ColVec::Zero(m));
        });
    }

    // h(t) = C e^(A (t - tStart)) B on 1001 uniform samples. The D delta(t) term is omitted.
    constexpr size_t numPoints = 1001;
    const double     dt        = (tEnd - tStart) / static_cast<double>(numPoints - 1);
    const Matrix     Phi       = (sys.A * dt).exp();

    ImpulseResponse response;
    response.time = sampleTimes(tStart, dt, numPoints);
    response.output.reserve(numPoints);

    ColVec h = sys.B.col(0);
    for (size_t i = 0; i < numPoints; ++i) {
        response.output.push_back(sys.C * h);
        h = Phi * h;
    }
    return response;
}

BodeResponse bode(const StateSpace& sys, double fStart, double fEnd, size_t maxPoints) {
    auto freqs     = logspace(fStart, fEnd, maxPoints);
    auto freq_resp = freqresp(sys, freqs);

    // Convert to magnitude (dB) and phase (degrees)
    std::vector<double> mags, phases;
    mags.reserve(maxPoints);
    phases.reserve(maxPoints);

    for (const auto& H : freq_resp.response) {
        mags.push_back(mag2db(std::abs(H)));
        phases.push_back(rad2deg(std::arg(H)));
    }

    unwrapDegrees(phases);

    return BodeResponse{
        .freq      = std::move(freqs),
        .magnitude = std::move(mags),
        .phase     = std::move(phases)};
}

// First input to first output, evaluated at s = j*2*pi*f or z = exp(j*2*pi*f*Ts)
FrequencyResponse freqresp(const StateSpace& sys, const std::vector<double>& frequencies) {
    using Complex = std::complex<double>;

    const Eigen::Index        n = sys.A.rows();
    const Eigen::MatrixXcd    A = sys.A.cast<Complex>();
    const Eigen::VectorXcd    b = sys.B.col(0).cast<Complex>();
    const Eigen::RowVectorXcd c = sys.C.row(0).cast<Complex>();

    FrequencyResponse response;
    response.freq = frequencies;
    response.response.reserve(frequencies.size());

    for (double f : frequencies) {
        const double  omega = 2.0 * std::numbers::pi * f;
        const Complex s     = sys.Ts.has_value() ? std::polar(1.0, omega * *sys.Ts) : Complex(0.0, omega);

        Complex g = sys.D(0, 0);
        if (n > 0) {
            const Eigen::MatrixXcd M = s * Eigen::MatrixXcd::Identity(n, n) - A;
            const Eigen::VectorXcd x = M.colPivHouseholderQr().solve(b);
            g += (c * x).value();
        }
        response.response.push_back(g);
    }
    return response;
}

RootLocusResponse rlocus(const StateSpace& sys, double kMin, double kMax, size_t numPoints) {
    return sys.toTransferFunction().rlocus(kMin, kMax, numPoints);
}

RootLocusResponse rlocus(const TransferFunction& sys, double kMin, double kMax, size_t numPoints) {
    return sys.rlocus(kMin, kMax, numPoints);
}

/* Discretization */
StateSpace c2d(const StateSpace& sys, double Ts, DiscretizationMethod method, std::optional<double> prewarp) {
    if (!(Ts > 0.0)) {
        throw std::invalid_argument("c2d: sampling time must be positive");
    }
    if (sys.Ts.has_value()) {
        if (Ts != sys.Ts.value()) {
            throw std::runtime_error("Sampling times do not match for discrete systems.");
        }
        return sys;  // Already discrete with matching Ts
    }

    const int n = static_cast<int>(sys.A.rows());
    const int m = static_cast<int>(sys.B.cols());

    switch (method) {
        case DiscretizationMethod::FOH: {
            // exp([[A B 0]; [0 0 I/Ts]; [0 0 0]] Ts) = [[Phi G1 G2]; [0 I I]; [0 0 I]]
            Matrix M                  = Matrix::Zero(n + 2 * m, n + 2 * m);
            M.block(0, 0, n, n)       = sys.A * Ts;
            M.block(0, n, n, m)       = sys.B * Ts;
            M.block(n, n + m, m, m)   = Matrix::Identity(m, m);
            const Matrix E            = M.exp();
            const Matrix Phi          = E.block(0, 0, n, n);
            const Matrix G1           = E.block(0, n, n, m);
            const Matrix G2           = E.block(0, n + m, n, m);
            return StateSpace{
                Phi,                    // A
                G1 + Phi * G2 - G2,     // B
                sys.C,                  // C
                sys.D + sys.C * G2,     // D
                Ts                      // Ts
            };
        }
        case DiscretizationMethod::Tustin:  // Fallthrough
        case DiscretizationMethod::Bilinear: {
            // s = k (z - 1)/(z + 1), with k = 2/Ts or w/tan(w Ts/2) when prewarped
            double k = 2.0 / Ts;
            if (prewarp.has_value() && *prewarp > 0.0) {
                k = prewarp.value() / std::tan(prewarp.value() * Ts / 2.0);
            }
            const double a = 1.0 / k;

            const Matrix I = Matrix::Identity(n, n);
            const Matrix Q = (I - a * sys.A).inverse();
            return StateSpace{
                Q * (I + a * sys.A),             // A
                2.0 * a * Q * sys.B,             // B
                sys.C * Q,                       // C
                sys.D + a * sys.C * Q * sys.B,   // D
                Ts                               // Ts
            };
        }
        case DiscretizationMethod::ZOH:
        default: {
            // exp([[A B]; [0 0]] Ts) = [[Ad Bd]; [0 I]]
            Matrix M            = Matrix::Zero(n + m, n + m);
            M.block(0, 0, n, n) = sys.A * Ts;
            M.block(0, n, n, m) = sys.B * Ts;
            const Matrix E      = M.exp();
            return StateSpace{
                E.block(0, 0, n, n),  // A
                E.block(0, n, n, m),  // B
                sys.C,                // C
                sys.D,                // D
                Ts                    // Ts
            };
        }
    }
}

// Continuous to discrete conversion for matrices (A, B)
std::pair<Matrix, Matrix> c2d(const Matrix& A, const Matrix& B, double Ts, DiscretizationMethod method, std::optional<double> prewarp) {
    StateSpace sys{A, B, Matrix::Identity(A.rows(), A.rows()), Matrix::Zero(A.rows(), B.cols()), std::nullopt};
    StateSpace dsys = c2d(sys, Ts, method, prewarp);
    return {dsys.A, dsys.B};
}

StateSpace d2c(const StateSpace& sys) {
    if (!sys.Ts.has_value()) {
        throw std::invalid_argument("d2c: system is already continuous");
    }

    const int n = static_cast<int>(sys.A.rows());
    const int m = static_cast<int>(sys.B.cols());

    for (const auto& p : poles(sys)) {
        if (std::abs(p.imag()) < 1e-12 && p.real() <= 0.0) {
            throw std::runtime_error("d2c: pole on the negative real axis has no real continuous-time equivalent");
        }
    }

    Matrix M            = Matrix::Identity(n + m, n + m);
    M.block(0, 0, n, n) = sys.A;
    M.block(0, n, n, m) = sys.B;

    const Matrix L = Matrix(M.log()) / *sys.Ts;
    return StateSpace{L.block(0, 0, n, n), L.block(0, n, n, m), sys.C, sys.D, std::nullopt};
}

/* Series Connections */
StateSpace series(const StateSpace& sys1, const StateSpace& sys2) {
    requireCompatible(sys1, sys2);
    if (sys2.B.cols() != sys1.C.rows()) {
        throw std::invalid_argument("series: output count of the first system must match input count of the second");
    }

    // sys1 drives sys2, state [x1; x2]
    Matrix A = blockDiagonal(sys1.A, sys2.A);
    A.bottomLeftCorner(sys2.A.rows(), sys1.A.cols()) = sys2.B * sys1.C;

    return StateSpace{std::move(A),
                      stacked(sys1.B, sys2.B * sys1.D),
                      sideBySide(sys2.D * sys1.C, sys2.C),
                      sys2.D * sys1.D,
                      sys1.Ts};
}

TransferFunction series(const TransferFunction& sys1, const TransferFunction& sys2) {
    requireCompatible(sys1, sys2);
    return TransferFunction{trimLeadingZeros(conv(sys1.num, sys2.num)), conv(sys1.den, sys2.den), sys1.Ts};
}

StateSpace operator*(const StateSpace& sys1, const StateSpace& sys2) {
    return series(sys1, sys2);
}

TransferFunction operator*(const TransferFunction& sys1, const TransferFunction& sys2) {
    return series(sys1, sys2);
}

/* Parallel Connections */
StateSpace parallel(const StateSpace& sys1, const StateSpace& sys2) {
    requireCompatible(sys1, sys2);
    if (sys1.B.cols() != sys2.B.cols() || sys1.C.rows() != sys2.C.rows()) {
        throw std::invalid_argument("parallel: systems must have the same number of inputs and outputs");
    }

    // Shared input, summed outputs
    return StateSpace{blockDiagonal(sys1.A, sys2.A),
                      stacked(sys1.B, sys2.B),
                      sideBySide(sys1.C, sys2.C),
                      sys1.D + sys2.D,
                      sys1.Ts};
}

TransferFunction parallel(const TransferFunction& sys1, const TransferFunction& sys2) {
    requireCompatible(sys1, sys2);

    // n1/d1 + n2/d2 = (n1*d2 + n2*d1) / (d1*d2)
    Poly num = polyadd(conv(sys1.num, sys2.den), conv(sys2.num, sys1.den));
    return TransferFunction{trimLeadingZeros(std::move(num)), conv(sys1.den, sys2.den), sys1.Ts};
}

StateSpace operator+(const StateSpace& sys1, const StateSpace& sys2) {
    return parallel(sys1, sys2);
}

TransferFunction operator+(const TransferFunction& sys1, const TransferFunction& sys2) {
    return parallel(sys1, sys2);
}

StateSpace operator-(const StateSpace& sys1, const StateSpace& sys2) {
    StateSpace neg_sys2 = sys2;
    neg_sys2.C          = -neg_sys2.C;
    neg_sys2.D          = -neg_sys2.D;

    return parallel(sys1, neg_sys2);
}

TransferFunction operator-(const TransferFunction& sys1, const TransferFunction& sys2) {
    TransferFunction neg_sys2 = sys2;
    for (double& coeff : neg_sys2.num) {
        coeff = -coeff;
    }

    return parallel(sys1, neg_sys2);
}

/* Feedback Connections */
StateSpace feedback(const StateSpace& G, const StateSpace& H, int sign) {
    requireCompatible(G, H);

    if (H.B.cols() != G.C.rows() || H.C.rows() != G.B.cols()) {
        throw std::invalid_argument("feedback: sensor dimensions do not match the forward path");
    }

    // Closed loop G / (1 - sign*G*H); sign = -1 for negative feedback
    //
    // A_cl = [A_G + s*B_G*inv1*D_H*C_G,  s*B_G*inv1*C_H      ]
    //        [B_H*inv2*C_G,              A_H + s*B_H*inv2*D_G*C_H]
    // B_cl = [B_G*inv1; B_H*inv2*D_G]
    // C_cl = [inv2*C_G, s*inv2*D_G*C_H]
    // D_cl = inv2*D_G
    // with inv1 = (I - s*D_H*D_G)^-1 (m x m) and inv2 = (I - s*D_G*D_H)^-1 (p x p)

    const int nG = G.A.rows();
    const int nH = H.A.rows();
    const int m  = G.B.cols();
    const int p  = G.C.rows();

    const double s = static_cast<double>(sign);

    const Matrix E1 = Matrix::Identity(m, m) - s * H.D * G.D;
    const Matrix E2 = Matrix::Identity(p, p) - s * G.D * H.D;

    Eigen::FullPivLU<Matrix> lu1(E1);
    Eigen::FullPivLU<Matrix> lu2(E2);
    if (!lu1.isInvertible() || !lu2.isInvertible()) {
        throw std::runtime_error("feedback: algebraic loop is singular (I - sign*D_G*D_H not invertible)");
    }
    const Matrix inv1 = lu1.inverse();
    const Matrix inv2 = lu2.inverse();

    Matrix A_cl = Matrix::Zero(nG + nH, nG + nH);
    Matrix B_cl = Matrix::Zero(nG + nH, m);
    Matrix C_cl = Matrix::Zero(p, nG + nH);

    A_cl.block(0, 0, nG, nG)   = G.A + s * G.B * inv1 * H.D * G.C;
    A_cl.block(0, nG, nG, nH)  = s * G.B * inv1 * H.C;
    A_cl.block(nG, 0, nH, nG)  = H.B * inv2 * G.C;
    A_cl.block(nG, nG, nH, nH) = H.A + s * H.B * inv2 * G.D * H.C;

    B_cl.block(0, 0, nG, m)  = G.B * inv1;
    B_cl.block(nG, 0, nH, m) = H.B * inv2 * G.D;

    C_cl.block(0, 0, p, nG)  = inv2 * G.C;
    C_cl.block(0, nG, p, nH) = s * inv2 * G.D * H.C;

    Matrix D_cl = inv2 * G.D;

    return StateSpace{std::move(A_cl), std::move(B_cl), std::move(C_cl), std::move(D_cl), G.Ts};
}

TransferFunction feedback(const TransferFunction& G, const TransferFunction& H, int sign) {
    requireCompatible(G, H);

    // (nG/dG) / (1 - sign*nG*nH/(dG*dH)) = nG*dH / (dG*dH - sign*nG*nH)
    const Poly num = conv(G.num, H.den);
    const Poly den = trimLeadingZeros(polyadd(conv(G.den, H.den), polyscale(conv(G.num, H.num), -static_cast<double>(sign))));
    if (std::abs(den.front()) < 1e-15) {
        throw std::runtime_error("feedback: closed-loop denominator vanishes identically");
    }
    return TransferFunction{trimLeadingZeros(num), den, G.Ts};
}

StateSpace operator/(const StateSpace& forward, const StateSpace& sensor) { return feedback(forward, sensor, -1); }

TransferFunction operator/(const TransferFunction& forward, const TransferFunction& sensor) {
    return feedback(forward, sensor, -1);
}

Matrix ctrb(const StateSpace& sys) {
    return ctrlkit::ctrb(sys.A, sys.B);
}

Matrix obsv(const StateSpace& sys) {
    return ctrlkit::obsv(sys.C, sys.A);
}

namespace {
    // Cross term N defaults to zero
    Matrix crossWeight(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R, const Matrix& N, const char* who) {
        const auto n     = A.rows();
        const auto m     = B.cols();
        Matrix     cross = N.size() == 0 ? Matrix::Zero(n, m) : N;
        if (A.cols() != n || B.rows() != n || Q.rows() != n || Q.cols() != n || R.rows() != m || R.cols() != m ||
            cross.rows() != n || cross.cols() != m) {
            throw std::invalid_argument(std::string(who) + ": dimension mismatch");
        }
        return cross;
    }

    // True when every complex pole is paired with its own conjugate elsewhere in the set
    bool closedUnderConjugation(const std::vector<Pole>& poles) {
        constexpr double  tol = 1e-9;
        std::vector<bool> paired(poles.size(), false);
        for (size_t i = 0; i < poles.size(); ++i) {
            const double scale = std::max(1.0, std::abs(poles[i]));
            if (paired[i] || std::abs(poles[i].imag()) <= tol * scale) continue;
            bool found = false;
            for (size_t j = i + 1; j < poles.size() && !found; ++j) {
                if (!paired[j] && std::abs(poles[j] - std::conj(poles[i])) <= tol * scale) {
                    paired[i] = paired[j] = true;
                    found                 = true;
                }
            }
            if (!found) return false;
        }
        return true;
    }

    std::vector<Pole> eigenvalues(const Matrix& M) {
        const Eigen::VectorXcd e = Eigen::EigenSolver<Matrix>(M, false).eigenvalues();
        return {e.data(), e.data() + e.size()};
    }
}  // namespace

// The cross term is removed by the substitution A - B R^-1 N^T, Q - N R^-1 N^T before the Riccati solve
LQRResult lqr(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R, const Matrix& N) {
    const Matrix cross = crossWeight(A, B, Q, R, N, "lqr");
    const Matrix RinvNt = R.ldlt().solve(cross.transpose());
    const Matrix S      = care(A - B * RinvNt, B, Q - cross * RinvNt, R);
    const Matrix K      = R.ldlt().solve(B.transpose() * S + cross.transpose());
    return LQRResult{K, S, eigenvalues(A - B * K)};
}

LQRResult lqr(const StateSpace& sys, const Matrix& Q, const Matrix& R, const Matrix& N) {
    return sys.isDiscrete() ? dlqr(sys.A, sys.B, Q, R, N) : lqr(sys.A, sys.B, Q, R, N);
}

LQRResult dlqr(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R, const Matrix& N) {
    const Matrix cross  = crossWeight(A, B, Q, R, N, "dlqr");
    const Matrix RinvNt = R.ldlt().solve(cross.transpose());
    const Matrix S      = dare(A - B * RinvNt, B, Q - cross * RinvNt, R);
    const Matrix Bt     = B.transpose();
    const Matrix K      = (R + Bt * S * B).ldlt().solve(Bt * S * A + cross.transpose());
    return LQRResult{K, S, eigenvalues(A - B * K)};
}

Matrix place(const Matrix& A, const Matrix& B, const std::vector<Pole>& poles) {
    const int n = A.rows();
    const int m = B.cols();

    if (A.rows() != A.cols() || B.rows() != n) {
        throw std::invalid_argument("place: dimension mismatch");
    }

    if (poles.size() != static_cast<size_t>(n)) {
        throw std::invalid_argument("place: number of poles must equal system order");
    }

    if (!closedUnderConjugation(poles)) {
        throw std::invalid_argument("place: complex poles must come in conjugate pairs");
    }

    if (m != 1) {
        throw std::invalid_argument("place: only single-input systems are supported");
    }

    // Controllability via numerical rank of the controllability matrix
    Matrix                   P = ctrb(A, B);
    Eigen::FullPivLU<Matrix> lu(P);
    lu.setThreshold(1e-10);
    if (lu.rank() < n) {
        throw std::invalid_argument("place: system is not controllable");
    }

    // Desired characteristic polynomial s^n + a1 s^(n-1) + ... + an
    const Poly alpha = poly(poles);

    // phi(A) = A^n + a1 A^(n-1) + ... + an I by Horner's rule
    Matrix phi_A = Matrix::Zero(n, n);
    for (double a : alpha) {
        phi_A = phi_A * A + a * Matrix::Identity(n, n);
    }

    // Ackermann formula: K = [0 0 ... 0 1] * P^{-1} * phi(A)
    Matrix selector    = Matrix::Zero(1, n);
    selector(0, n - 1) = 1.0;

    return selector * lu.solve(phi_A);
}

Matrix acker(const Matrix& A, const Matrix& B, const std::vector<Pole>& poles) {
    return place(A, B, poles);
}

Matrix placeObserver(const Matrix& A, const Matrix& C, const std::vector<Pole>& poles) {
    if (C.rows() != 1) {
        throw std::invalid_argument("placeObserver: only single-output systems are supported");
    }
    // eig(A - L C) = eig(A^T - C^T L^T)
    return place(A.transpose(), C.transpose(), poles).transpose();
}

// Observer x_hat' = A x_hat + B u + L (y - C x_hat - D u) closed through u = -K x_hat. Input y, output u.
StateSpace reg(const StateSpace& sys, const Matrix& K, const Matrix& L) {
    if (K.rows() != sys.B.cols() || K.cols() != sys.A.rows() || L.rows() != sys.A.rows() || L.cols() != sys.C.rows()) {
        throw std::invalid_argument("reg: gain dimensions do not match the plant");
    }
    const Matrix A = sys.A - sys.B * K - L * (sys.C - sys.D * K);
    return StateSpace{A, L, -K, Matrix::Zero(K.rows(), L.cols()), sys.Ts};
}

namespace {
    // Damping of the least damped pole, in continuous-time terms. Real stable poles count as 1.
    double minimumDamping(const std::vector<Pole>& ps, const std::optional<double>& Ts) {
        double zeta = 1.0;
        for (const auto& p : ps) {
            const auto   s   = continuousEquivalent(p, Ts);
            const double mag = std::abs(s);
            if (mag > 1e-12) {
                zeta = std::min(zeta, -s.real() / mag);
            }
        }
        return zeta;
    }
}  // namespace

RootLocusGain rlocusGainForDamping(const TransferFunction& sys, double zeta, double kMax, size_t numPoints) {
    if (!(zeta > 0.0 && zeta < 1.0)) {
        throw std::invalid_argument("rlocusGainForDamping: damping ratio must be in (0, 1)");
    }
    if (numPoints < 2 || !(kMax > 0.0)) {
        throw std::invalid_argument("rlocusGainForDamping: need kMax > 0 and at least two points");
    }

    auto closedLoopPoles = [&](double k) { return roots(polyadd(sys.den, polyscale(sys.num, k))); };
    auto dampingAt       = [&](double k) { return minimumDamping(closedLoopPoles(k), sys.Ts); };

    double kPrev = 0.0;
    if (dampingAt(kPrev) <= zeta) {
        auto ps = closedLoopPoles(kPrev);
        return RootLocusGain{kPrev, minimumDamping(ps, sys.Ts), std::move(ps)};
    }

    const double kStep = kMax / static_cast<double>(numPoints - 1);
    for (size_t i = 1; i < numPoints; ++i) {
        const double k = static_cast<double>(i) * kStep;
        if (dampingAt(k) <= zeta) {
            // Bisection on [kPrev, k]
            double lo = kPrev, hi = k;
            for (int iter = 0; iter < 60; ++iter) {
                const double mid = 0.5 * (lo + hi);
                if (dampingAt(mid) <= zeta) {
                    hi = mid;
                } else {
                    lo = mid;
                }
            }
            auto ps = closedLoopPoles(hi);
            return RootLocusGain{hi, minimumDamping(ps, sys.Ts), std::move(ps)};
        }
        kPrev = k;
    }

    throw std::runtime_error("rlocusGainForDamping: requested damping ratio is not reached for gains up to kMax");
}

TransferFunction pid(double Kp, double Ki, double Kd, double Tf) {
    if (Tf < 0.0) {
        throw std::invalid_argument("pid: derivative filter time constant must be non-negative");
    }

    Poly num, den;
    if (Tf > 0.0) {
        // Kp + Ki/s + Kd s/(Tf s + 1) over the common denominator s (Tf s + 1)
        if (Ki != 0.0) {
            num = {Kp * Tf + Kd, Kp + Ki * Tf, Ki};
            den = {Tf, 1.0, 0.0};
        } else {
            num = {Kp * Tf + Kd, Kp};
            den = {Tf, 1.0};
        }
    } else {
        // Ideal derivative: improper when Kd != 0
        if (Ki != 0.0) {
            num = {Kd, Kp, Ki};
            den = {1.0, 0.0};
        } else {
            num = {Kd, Kp};
            den = {1.0};
        }
    }
    return TransferFunction{trimLeadingZeros(num), den};
}

TransferFunction leadLag(double zero, double pole, double k) {
    if (k == 0.0) {
        throw std::invalid_argument("leadLag: gain must be nonzero");
    }
    return TransferFunction{{k, -k * zero}, {1.0, -pole}};
}

StepResponse closedLoopStep(const TransferFunction& plant, const TransferFunction& controller, double tEnd) {
    const TransferFunction loop = series(controller, plant);
    const TransferFunction unity{{1.0}, {1.0}, loop.Ts};
    return feedback(loop, unity, -1).step(0.0, tEnd);
}

}  // namespace ctrlkit
