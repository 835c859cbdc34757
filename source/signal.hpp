#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ctrlkit {

/**
 * @brief Pseudo-random binary sequence from a 16-bit Fibonacci LFSR (taps 16, 14, 13, 11).
 *
 * Each register bit is held for minHold consecutive samples and mapped to +/-amplitude. A zero seed
 * would lock the register, so it is replaced by 0xACE1.
 *
 * @throws std::invalid_argument if minHold == 0
 */
std::vector<double> prbs(size_t n, double amplitude = 1.0, uint16_t seed = 0xACE1, size_t minHold = 1);

// Linear frequency sweep amplitude*sin(2 pi (f0 t + (f1 - f0) t^2 / (2 T))) over the span of t. Frequencies in Hz.
std::vector<double> chirp(const std::vector<double>& t, double f0, double f1, double amplitude = 1.0);

// amplitude for t >= tStep, zero before
std::vector<double> stepSignal(const std::vector<double>& t, double tStep = 0.0, double amplitude = 1.0);

// Zero-mean Gaussian samples, reproducible for a given seed
std::vector<double> whiteNoise(size_t n, double sigma, unsigned seed = 0);

}  // namespace ctrlkit
