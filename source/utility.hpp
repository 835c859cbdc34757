#pragma once

#include <cmath>
#include <numbers>
#include <numeric>
#include <utility>
#include <vector>

namespace ctrlkit {

// num evenly spaced points from start to end inclusive
inline std::vector<double> linspace(double start, double end, size_t num) {
    std::vector<double> points(num, start);
    for (size_t i = 1; i < num; ++i) {
        points[i] = start + (end - start) * static_cast<double>(i) / static_cast<double>(num - 1);
    }
    return points;
}

inline std::vector<double> linspace(const std::pair<double, double>& span, size_t num) {
    return linspace(span.first, span.second, num);
}

// Geometric grid from start to end (both positive); the base only matters for rounding
inline std::vector<double> logspace(double start, double end, size_t num, double base = 10.0) {
    std::vector<double> points = linspace(std::log(start) / std::log(base), std::log(end) / std::log(base), num);
    for (double& p : points) {
        p = std::pow(base, p);
    }
    return points;
}

// t0, t0 + Ts, ..., t0 + (n - 1) Ts
inline std::vector<double> sampleTimes(double t0, double Ts, size_t n) {
    std::vector<double> t(n);
    for (size_t i = 0; i < n; ++i) {
        t[i] = t0 + static_cast<double>(i) * Ts;
    }
    return t;
}

inline double mag2db(double mag) { return 20.0 * std::log10(mag); }
inline double db2mag(double db) { return std::pow(10.0, db / 20.0); }

constexpr double rad2deg(double rad) { return rad * 180.0 / std::numbers::pi; }
constexpr double deg2rad(double deg) { return deg * std::numbers::pi / 180.0; }

// Zero for an empty sequence
inline double mean(const std::vector<double>& x) {
    return x.empty() ? 0.0 : std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
}

inline double meanSquare(const std::vector<double>& x) {
    return x.empty() ? 0.0 : std::inner_product(x.begin(), x.end(), x.begin(), 0.0) / static_cast<double>(x.size());
}

}  // namespace ctrlkit
