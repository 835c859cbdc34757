#include "signal.hpp"

#include <cmath>
#include <numbers>
#include <random>
#include <stdexcept>

namespace ctrlkit {

std::vector<double> prbs(size_t n, double amplitude, uint16_t seed, size_t minHold) {
    if (minHold == 0) {
        throw std::invalid_argument("prbs: minHold must be at least 1");
    }

    uint16_t lfsr = (seed == 0) ? 0xACE1u : seed;

    std::vector<double> out;
    out.reserve(n);
    while (out.size() < n) {
        const uint16_t bit = ((lfsr >> 0) ^ (lfsr >> 2) ^ (lfsr >> 3) ^ (lfsr >> 5)) & 1u;
        lfsr               = static_cast<uint16_t>((lfsr >> 1) | (bit << 15));

        const double level = (lfsr & 1u) ? amplitude : -amplitude;
        for (size_t k = 0; k < minHold && out.size() < n; ++k) {
            out.push_back(level);
        }
    }
    return out;
}

std::vector<double> chirp(const std::vector<double>& t, double f0, double f1, double amplitude) {
    std::vector<double> out(t.size(), 0.0);
    if (t.empty()) {
        return out;
    }

    const double t0   = t.front();
    const double span = t.back() - t0;
    const double rate = (span > 0.0) ? (f1 - f0) / span : 0.0;

    for (size_t k = 0; k < t.size(); ++k) {
        const double tau = t[k] - t0;
        out[k]           = amplitude * std::sin(2.0 * std::numbers::pi * (f0 * tau + 0.5 * rate * tau * tau));
    }
    return out;
}

std::vector<double> stepSignal(const std::vector<double>& t, double tStep, double amplitude) {
    std::vector<double> out(t.size());
    for (size_t k = 0; k < t.size(); ++k) {
        out[k] = (t[k] >= tStep) ? amplitude : 0.0;
    }
    return out;
}

std::vector<double> whiteNoise(size_t n, double sigma, unsigned seed) {
    if (sigma < 0.0) {
        throw std::invalid_argument("whiteNoise: sigma must be non-negative");
    }

    std::vector<double> out(n, 0.0);
    if (sigma == 0.0) {
        return out;
    }

    std::mt19937                     gen(seed);
    std::normal_distribution<double> dist(0.0, sigma);
    for (auto& v : out) {
        v = dist(gen);
    }
    return out;
}

}  // namespace ctrlkit
