#pragma once

#include <cstddef>
#include <vector>

namespace ctrlkit {

/**
 * @brief Uniformly sampled single-input single-output experiment data.
 *
 * Sample k was taken at tStart + k*Ts. The output and input sequences always have the same,
 * non-zero length.
 */
class IdData {
   public:
    IdData(std::vector<double> y, std::vector<double> u, double Ts, double tStart = 0.0);

    const std::vector<double>& output() const { return y_; }
    const std::vector<double>& input() const { return u_; }

    double sampleTime() const { return Ts_; }
    double startTime() const { return tStart_; }
    size_t size() const { return y_.size(); }

    std::vector<double> time() const;

    // Samples [first, last); the start time moves with the first sample
    IdData segment(size_t first, size_t last) const;

    struct Split;
    // First round(fraction * size()) samples for identification, the rest for validation
    Split split(double fraction) const;

    struct Detrended;
    // Remove the sample means of output and input
    Detrended detrend() const;

    // Same input and timing with a replacement output sequence
    IdData withOutput(std::vector<double> y) const;

   private:
    std::vector<double> y_;
    std::vector<double> u_;
    double              Ts_;
    double              tStart_;
};

struct IdData::Split {
    IdData identification;
    IdData validation;
};

struct IdData::Detrended {
    IdData data;
    double outputMean;
    double inputMean;
};

}  // namespace ctrlkit
