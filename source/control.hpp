#pragma once

#include <stdexcept>

#include "LTI.hpp"         // IWYU pragma: keep
#include "csv.hpp"         // IWYU pragma: keep
#include "format.hpp"      // IWYU pragma: keep
#include "iddata.hpp"      // IWYU pragma: keep
#include "ident.hpp"       // IWYU pragma: keep
#include "integrator.hpp"  // IWYU pragma: keep
#include "log.hpp"         // IWYU pragma: keep
#include "mathprog.hpp"    // IWYU pragma: keep
#include "motor.hpp"       // IWYU pragma: keep
#include "nonlinear.hpp"   // IWYU pragma: keep
#include "polynomial.hpp"  // IWYU pragma: keep
#include "signal.hpp"      // IWYU pragma: keep
#include "simulate.hpp"    // IWYU pragma: keep
#include "solver.hpp"      // IWYU pragma: keep
#include "ss.hpp"          // IWYU pragma: keep
#include "tf.hpp"          // IWYU pragma: keep
#include "types.hpp"       // IWYU pragma: keep
#include "utility.hpp"     // IWYU pragma: keep

namespace ctrlkit {

template <class T>
concept SSConvertible = requires(const T& t) { { t.toStateSpace() }; };

template <class T>
concept TFConvertible = requires(const T& t) { { t.toTransferFunction() }; };

template <SSConvertible T>
StateSpace ss(const T& sys) {
    return sys.toStateSpace();
}

template <TFConvertible T>
TransferFunction tf(const T& sys) {
    return sys.toTransferFunction();
}

// SISO channel from input `input` to output `output` of a MIMO model
inline TransferFunction tf(const StateSpace& sys, int output, int input) { return sys.toTransferFunction(output, input); }

inline TransferFunction tf(Poly num, Poly den, std::optional<double> Ts = std::nullopt) {
    return TransferFunction{std::move(num), std::move(den), Ts};
}

inline StateSpace tf2ss(Poly num, Poly den, std::optional<double> Ts = std::nullopt) {
    return TransferFunction{std::move(num), std::move(den), Ts}.toStateSpace();
}

inline TransferFunction ss2tf(Matrix A, Matrix B, Matrix C, Matrix D, std::optional<double> Ts = std::nullopt) {
    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D), Ts}.toTransferFunction();
}

/**
 * @brief Discrete-time equivalent of a continuous model.
 *
 * ZOH and FOH come from the exponential of an augmented block matrix, so a singular A (motor
 * position, pure integrators) needs no special handling. Bilinear/Tustin match the frequency
 * prewarp [rad/s] exactly when it is given.
 *
 * @throws std::invalid_argument if Ts <= 0
 * @throws std::runtime_error    if sys is discrete with a different sample time
 */
StateSpace c2d(const StateSpace& sys, double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt);

template <SSConvertible T>
StateSpace c2d(const T& sys, double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt) {
    return c2d(sys.toStateSpace(), Ts, method, prewarp);
}

// (Ad, Bd) for a bare (A, B) pair
std::pair<Matrix, Matrix> c2d(const Matrix& A, const Matrix& B, double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt);

/**
 * @brief Inverse of zero-order-hold discretization.
 *
 * Takes the principal matrix logarithm of [[Ad Bd]; [0 I]].
 *
 * @throws std::invalid_argument if sys is continuous
 * @throws std::runtime_error    if Ad has an eigenvalue on the closed negative real axis
 */
StateSpace d2c(const StateSpace& sys);

// Interconnections. a * b is the series connection that feeds the output of a into b, + and - sum
// the outputs of two models driven by the same input, and a / b closes a negative feedback loop
// with b in the return path. Mixing model types yields a StateSpace.
template <SSConvertible A, SSConvertible B>
StateSpace series(const A& a, const B& b) {
    return series(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace parallel(const A& a, const B& b) {
    return parallel(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace feedback(const A& a, const B& b, int sign = -1) {
    return feedback(a.toStateSpace(), b.toStateSpace(), sign);
}

// Unity feedback around a square model
template <SSConvertible A>
StateSpace feedback(const A& a, int sign = -1) {
    const StateSpace forward = a.toStateSpace();
    const auto       n       = forward.C.rows();
    if (forward.B.cols() != n) {
        throw std::invalid_argument("feedback(sys): unity feedback needs as many inputs as outputs");
    }
    const StateSpace sensor{Matrix::Zero(0, 0), Matrix::Zero(0, n), Matrix::Zero(n, 0), Matrix::Identity(n, n), forward.Ts};
    return feedback(forward, sensor, sign);
}

template <SSConvertible A, SSConvertible B>
StateSpace operator*(const A& a, const B& b) {
    return series(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace operator+(const A& a, const B& b) {
    return parallel(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace operator-(const A& a, const B& b) {
    StateSpace negated = b.toStateSpace();
    negated.C          = -negated.C;
    negated.D          = -negated.D;
    return parallel(a.toStateSpace(), negated);
}

template <SSConvertible A, SSConvertible B>
StateSpace operator/(const A& a, const B& b) {
    return feedback(a.toStateSpace(), b.toStateSpace(), -1);
}

// Same-type interconnections keep the representation
StateSpace       series(const StateSpace& first, const StateSpace& second);
StateSpace       parallel(const StateSpace& a, const StateSpace& b);
StateSpace       feedback(const StateSpace& forward, const StateSpace& sensor, int sign = -1);
TransferFunction series(const TransferFunction& first, const TransferFunction& second);
TransferFunction parallel(const TransferFunction& a, const TransferFunction& b);
TransferFunction feedback(const TransferFunction& forward, const TransferFunction& sensor, int sign = -1);

StateSpace operator*(const StateSpace& first, const StateSpace& second);
StateSpace operator+(const StateSpace& a, const StateSpace& b);
StateSpace operator-(const StateSpace& a, const StateSpace& b);
StateSpace operator/(const StateSpace& forward, const StateSpace& sensor);

TransferFunction operator*(const TransferFunction& first, const TransferFunction& second);
TransferFunction operator+(const TransferFunction& a, const TransferFunction& b);
TransferFunction operator-(const TransferFunction& a, const TransferFunction& b);
TransferFunction operator/(const TransferFunction& forward, const TransferFunction& sensor);

// Analysis of a StateSpace model; the LTI member functions forward here
bool is_stable(const StateSpace& sys);

std::vector<Pole> poles(const StateSpace& sys);
std::vector<Zero> zeros(const StateSpace& sys);

// Steady-state gain matrix. Throws std::runtime_error if the system has a pole at s=0 (z=1).
Matrix dcgain(const StateSpace& sys);

StepResponse    step(const StateSpace& sys, double tStart = 0.0, double tEnd = 10.0, ColVec uStep = ColVec::Ones(1));
ImpulseResponse impulse(const StateSpace& sys, double tStart = 0.0, double tEnd = 10.0);

BodeResponse      bode(const StateSpace& sys, double fStart = 0.1, double fEnd = 1.0e4, size_t maxPoints = 500);
RootLocusResponse rlocus(const StateSpace& sys, double kMin = 0.0, double kMax = 100.0, size_t numPoints = 500);
RootLocusResponse rlocus(const TransferFunction& sys, double kMin = 0.0, double kMax = 100.0, size_t numPoints = 500);

MarginInfo        margin(const StateSpace& sys);
FrequencyResponse freqresp(const StateSpace& sys, const std::vector<double>& frequencies);

DampingInfo damp(const StateSpace& sys);
StepInfo    stepinfo(const StateSpace& sys, double tEnd = 10.0);

// [B AB ... A^(n-1)B] and its dual
Matrix ctrb(const StateSpace& sys);
Matrix ctrb(const Matrix& A, const Matrix& B);
Matrix obsv(const StateSpace& sys);
Matrix obsv(const Matrix& C, const Matrix& A);

/**
 * @brief Lyapunov equations A X + X A^T + Q = 0 (lyap) and A X A^T - X + Q = 0 (dlyap).
 *
 * @throws std::runtime_error if the equation has no unique solution
 */
Matrix lyap(const Matrix& A, const Matrix& Q);
Matrix dlyap(const Matrix& A, const Matrix& Q);

/**
 * @brief Stabilizing solutions of the continuous and discrete algebraic Riccati equations.
 *
 * @throws std::invalid_argument on mismatched sizes, R not positive definite or Q indefinite
 * @throws std::runtime_error    if no stabilizing solution is found
 */
Matrix care(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R);
Matrix dare(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R);

struct LQRResult {
    Matrix            K;  // u = -K x
    Matrix            S;  // Riccati solution
    std::vector<Pole> P;  // eig(A - B K)
};

// Minimizes the integral (or sum, for dlqr) of x'Qx + u'Ru + 2x'Nu
LQRResult lqr(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R, const Matrix& N = {});
LQRResult lqr(const StateSpace& sys, const Matrix& Q, const Matrix& R, const Matrix& N = {});

LQRResult dlqr(const Matrix& A, const Matrix& B, const Matrix& Q, const Matrix& R, const Matrix& N = {});

/**
 * @brief Pole placement by Ackermann's formula, u = -K x.
 *
 * @throws std::invalid_argument if B has more than one column, if the number of poles differs
 *                               from the state dimension, or if (A, B) is not controllable
 */
Matrix place(const Matrix& A, const Matrix& B, const std::vector<Pole>& poles);
Matrix acker(const Matrix& A, const Matrix& B, const std::vector<Pole>& poles);

// Observer gain L such that eig(A - L*C) are the requested poles (placement on the dual pair)
Matrix placeObserver(const Matrix& A, const Matrix& C, const std::vector<Pole>& poles);

// Observer-based compensator from y to u = -K x_hat, with estimator gain L. Close the loop with
// feedback(plant, reg(plant, K, L), +1).
StateSpace reg(const StateSpace& sys, const Matrix& K, const Matrix& L);

struct RootLocusGain {
    double            gain;          // Feedback gain k
    double            dampingRatio;  // Damping ratio of the dominant pair at k
    std::vector<Pole> poles;         // Closed-loop poles at k
};

/**
 * @brief Smallest gain on the root locus whose dominant complex pair reaches a damping ratio.
 *
 * The dominant pair is the complex pair closest to the imaginary axis (continuous) or to the unit
 * circle (discrete). The locus is scanned on a uniform grid in [0, kMax] and refined by bisection.
 *
 * @throws std::invalid_argument if zeta is outside (0, 1)
 * @throws std::runtime_error    if no gain in [0, kMax] reaches zeta
 */
RootLocusGain rlocusGainForDamping(const TransferFunction& sys, double zeta, double kMax = 1000.0, size_t numPoints = 2000);

// Parallel-form PID with first-order derivative filter: Kp + Ki/s + Kd*s/(Tf*s + 1)
TransferFunction pid(double Kp, double Ki = 0.0, double Kd = 0.0, double Tf = 0.0);

// First-order compensator k*(s - zero)/(s - pole). Lead when |zero| < |pole|.
TransferFunction leadLag(double zero, double pole, double k = 1.0);

// Unity negative feedback step response of controller * plant
StepResponse closedLoopStep(const TransferFunction& plant, const TransferFunction& controller, double tEnd = 10.0);

}  // namespace ctrlkit
