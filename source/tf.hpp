#pragma once

#include "LTI.hpp"
#include "types.hpp"

namespace ctrlkit {

/**
 * @brief Rational SISO model num/den with coefficients in descending powers of s, or of z when Ts
 * is set.
 */
class TransferFunction : public LTI {
   public:
    Poly num = {0.0};
    Poly den = {1.0};

    TransferFunction() = default;

    // @throws std::invalid_argument for an empty or zero-leading polynomial, or a non-positive Ts
    TransferFunction(Poly num, Poly den, std::optional<double> Ts = std::nullopt);
    TransferFunction(const StateSpace& ss);

    // Controllable canonical realization
    StateSpace       toStateSpace() const override;
    TransferFunction toTransferFunction() const { return *this; }

    std::vector<Pole> poles() const override;
    std::vector<Zero> zeros() const override;

    FrequencyResponse freqresp(const std::vector<double>& frequencies) const override;
    RootLocusResponse rlocus(double kMin = 0.0, double kMax = 100.0, size_t numPoints = 500) const override;

    // G at a point of the s (or z) plane
    std::complex<double> evaluate(std::complex<double> s) const;

    size_t order() const { return den.size() - 1; }
};

}  // namespace ctrlkit
