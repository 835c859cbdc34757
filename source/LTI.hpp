#pragma once

#include <optional>
#include <vector>

#include "types.hpp"

namespace ctrlkit {

class StateSpace;
class TransferFunction;

// G(j 2 pi f) sampled at freq [Hz]
struct FrequencyResponse {
    std::vector<std::complex<double>> response;
    std::vector<double>               freq;
};

struct BodeResponse {
    std::vector<double> freq;       // [Hz]
    std::vector<double> magnitude;  // [dB]
    std::vector<double> phase;      // [deg], unwrapped
};

// Output samples y(t_k), one column vector per time point
struct TimeResponse {
    std::vector<double> time;
    std::vector<ColVec> output;
};
using StepResponse    = TimeResponse;
using ImpulseResponse = TimeResponse;

// Closed-loop pole trajectories under u = -k y; branches[b][i] is branch b at gains[i]
struct RootLocusResponse {
    std::vector<std::vector<std::complex<double>>> branches;
    std::vector<double>                            gains;
};

struct MarginInfo {
    double gainMargin;      // [dB], infinite when the phase never crosses -180 deg
    double phaseMargin;     // [deg], infinite when the gain never crosses 0 dB
    double gainCrossover;   // [Hz]
    double phaseCrossover;  // [Hz]
};

struct DampingInfo {
    std::vector<double> naturalFrequency;  // [rad/s]
    std::vector<double> dampingRatio;
};

// Step response characteristics, one entry per output channel
struct StepInfo {
    std::vector<double> riseTime;          // 10% to 90% of the final value
    std::vector<double> settlingTime;      // last exit from the 2% band
    std::vector<double> overshoot;         // [%]
    std::vector<double> steadyStateError;  // 1 - final value
    std::vector<double> peak;              // largest excursion toward the final value
    std::vector<double> peakTime;
};

enum class DiscretizationMethod {
    ZOH,
    FOH,
    Bilinear,
    Tustin,  // same as Bilinear; prewarping applies to both
};

/**
 * @brief Common interface of the linear time-invariant models.
 *
 * Every analysis defaults to converting the model with toStateSpace() and calling the matching free
 * function from control.hpp. A model is discrete exactly when Ts holds a sample time.
 */
class LTI {
   public:
    virtual ~LTI() = default;

    virtual StateSpace toStateSpace() const = 0;

    virtual std::vector<Pole> poles() const;
    virtual std::vector<Zero> zeros() const;
    virtual bool              is_stable() const;

    // G(0) for continuous models, G(1) for discrete ones
    virtual Matrix dcgain() const;

    virtual DampingInfo damp() const;
    virtual MarginInfo  margin() const;

    virtual FrequencyResponse freqresp(const std::vector<double>& frequencies) const;

    /**
     * @brief Magnitude and phase on a logarithmic frequency grid.
     *
     * @param fStart    First frequency [Hz]
     * @param fEnd      Last frequency [Hz]
     * @param maxPoints Number of grid points
     */
    virtual BodeResponse bode(double fStart = 0.1, double fEnd = 1.0e4, size_t maxPoints = 500) const;

    // Response to uStep applied at tStart, starting from rest
    virtual StepResponse    step(double tStart = 0.0, double tEnd = 10.0, ColVec uStep = ColVec::Ones(1)) const;
    virtual ImpulseResponse impulse(double tStart = 0.0, double tEnd = 10.0) const;
    virtual StepInfo        stepinfo(double tEnd = 10.0) const;

    virtual RootLocusResponse rlocus(double kMin = 0.0, double kMax = 100.0, size_t numPoints = 500) const;

    /**
     * @brief Discrete-time equivalent with sample time Ts.
     *
     * @param prewarp   Frequency [rad/s] matched exactly by the Bilinear/Tustin mapping
     */
    virtual StateSpace discretize(double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH,
                                  std::optional<double> prewarp = std::nullopt) const;

    bool isDiscrete() const { return Ts.has_value(); }
    bool isContinuous() const { return !Ts.has_value(); }

    std::optional<double> Ts = {};
};

}  // namespace ctrlkit
