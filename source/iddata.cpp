#include "iddata.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "utility.hpp"

namespace ctrlkit {

IdData::IdData(std::vector<double> y, std::vector<double> u, double Ts, double tStart)
    : y_(std::move(y)), u_(std::move(u)), Ts_(Ts), tStart_(tStart) {
    if (y_.empty()) {
        throw std::invalid_argument("IdData: data must contain at least one sample");
    }
    if (y_.size() != u_.size()) {
        throw std::invalid_argument("IdData: output has " + std::to_string(y_.size()) + " samples but input has " +
                                    std::to_string(u_.size()));
    }
    if (!(Ts_ > 0.0) || !std::isfinite(Ts_)) {
        throw std::invalid_argument("IdData: sampling time must be positive");
    }
}

std::vector<double> IdData::time() const {
    return sampleTimes(tStart_, Ts_, y_.size());
}

IdData IdData::segment(size_t first, size_t last) const {
    if (first >= last || last > y_.size()) {
        throw std::invalid_argument("IdData::segment: invalid range [" + std::to_string(first) + ", " +
                                    std::to_string(last) + ") for " + std::to_string(y_.size()) + " samples");
    }
    return IdData{std::vector<double>(y_.begin() + first, y_.begin() + last),
                  std::vector<double>(u_.begin() + first, u_.begin() + last),
                  Ts_,
                  tStart_ + static_cast<double>(first) * Ts_};
}

IdData::Split IdData::split(double fraction) const {
    if (!(fraction > 0.0 && fraction < 1.0)) {
        throw std::invalid_argument("IdData::split: fraction must be in (0, 1)");
    }
    const auto n = static_cast<size_t>(std::lround(fraction * static_cast<double>(y_.size())));
    if (n == 0 || n >= y_.size()) {
        throw std::invalid_argument("IdData::split: both parts must contain at least one sample");
    }
    return Split{segment(0, n), segment(n, y_.size())};
}

IdData::Detrended IdData::detrend() const {
    const double ym = mean(y_);
    const double um = mean(u_);

    std::vector<double> y = y_;
    std::vector<double> u = u_;
    for (auto& v : y) v -= ym;
    for (auto& v : u) v -= um;

    return Detrended{IdData{std::move(y), std::move(u), Ts_, tStart_}, ym, um};
}

IdData IdData::withOutput(std::vector<double> y) const {
    return IdData{std::move(y), u_, Ts_, tStart_};
}

}  // namespace ctrlkit
