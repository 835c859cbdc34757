#include "LTI.hpp"

#include <utility>

#include "control.hpp"
#include "ss.hpp"

namespace ctrlkit {

std::vector<Pole> LTI::poles() const { return ctrlkit::poles(toStateSpace()); }
std::vector<Zero> LTI::zeros() const { return ctrlkit::zeros(toStateSpace()); }
bool              LTI::is_stable() const { return ctrlkit::is_stable(toStateSpace()); }
Matrix            LTI::dcgain() const { return ctrlkit::dcgain(toStateSpace()); }

DampingInfo LTI::damp() const { return ctrlkit::damp(toStateSpace()); }
MarginInfo  LTI::margin() const { return ctrlkit::margin(toStateSpace()); }

FrequencyResponse LTI::freqresp(const std::vector<double>& frequencies) const {
    return ctrlkit::freqresp(toStateSpace(), frequencies);
}

BodeResponse LTI::bode(double fStart, double fEnd, size_t maxPoints) const {
    return ctrlkit::bode(toStateSpace(), fStart, fEnd, maxPoints);
}

StepResponse LTI::step(double tStart, double tEnd, ColVec uStep) const {
    return ctrlkit::step(toStateSpace(), tStart, tEnd, std::move(uStep));
}

ImpulseResponse LTI::impulse(double tStart, double tEnd) const { return ctrlkit::impulse(toStateSpace(), tStart, tEnd); }

StepInfo LTI::stepinfo(double tEnd) const { return ctrlkit::stepinfo(toStateSpace(), tEnd); }

RootLocusResponse LTI::rlocus(double kMin, double kMax, size_t numPoints) const {
    return ctrlkit::rlocus(toStateSpace(), kMin, kMax, numPoints);
}

StateSpace LTI::discretize(double Ts, DiscretizationMethod method, std::optional<double> prewarp) const {
    return ctrlkit::c2d(toStateSpace(), Ts, method, prewarp);
}

}  // namespace ctrlkit
