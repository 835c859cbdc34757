#pragma once

#include <algorithm>
#include <cmath>
#include <string>

#include "fmt/core.h"
#include "iddata.hpp"
#include "ident.hpp"
#include "ss.hpp"
#include "tf.hpp"

namespace ctrlkit {

inline std::string formatMatrix(const char* name, const Matrix& M) {
    std::string result = fmt::format("{} = \n", name);
    for (Eigen::Index i = 0; i < M.rows(); ++i) {
        for (Eigen::Index j = 0; j < M.cols(); ++j) {
            result += fmt::format("{:>10.4f}", M(i, j));
        }
        result += "\n";
    }
    return result;
}

inline std::string formatStateSpaceMatrices(const StateSpace& sys) {
    return formatMatrix("A", sys.A) + "\n" + formatMatrix("B", sys.B) + "\n" + formatMatrix("C", sys.C) + "\n" +
           formatMatrix("D", sys.D);
}

/**
 * @brief Human-readable polynomial.
 *
 * With descending powers (s, z) p[0] multiplies var^(n-1); otherwise p[k] multiplies var^-k, as for
 * the q^-1 polynomials of IdPoly.
 */
inline std::string formatPolynomial(const Poly& p, const char* var, bool descending = true) {
    std::string result;
    const auto  n = p.size();
    for (size_t k = 0; k < n; ++k) {
        const double c = p[k];
        if (c == 0.0 && n > 1) continue;

        const long power = descending ? static_cast<long>(n - 1 - k) : -static_cast<long>(k);
        if (result.empty()) {
            result += fmt::format("{:.4g}", c);
        } else {
            result += fmt::format(" {} {:.4g}", c < 0.0 ? '-' : '+', std::abs(c));
        }
        if (power == 1) {
            result += fmt::format(" {}", var);
        } else if (power != 0) {
            result += fmt::format(" {}^{}", var, power);
        }
    }
    return result.empty() ? "0" : result;
}

}  // namespace ctrlkit

template <>
struct fmt::formatter<ctrlkit::StateSpace> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const ctrlkit::StateSpace& sys, fmt::format_context& ctx) const {
        auto out = fmt::format_to(ctx.out(), "{}", ctrlkit::formatStateSpaceMatrices(sys));
        if (sys.Ts) {
            out = fmt::format_to(out, "\nTs = {:g}\n", *sys.Ts);
        }
        return out;
    }
};

template <>
struct fmt::formatter<ctrlkit::TransferFunction> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const ctrlkit::TransferFunction& tf, fmt::format_context& ctx) const {
        const char* var = tf.Ts ? "z" : "s";
        const auto  num = ctrlkit::formatPolynomial(tf.num, var);
        const auto  den = ctrlkit::formatPolynomial(tf.den, var);
        const auto  bar = std::string(std::max(num.size(), den.size()), '-');

        auto out = fmt::format_to(ctx.out(), "  {}\n  {}\n  {}\n", num, bar, den);
        if (tf.Ts) {
            out = fmt::format_to(out, "Ts = {:g}\n", *tf.Ts);
        }
        return out;
    }
};

template <>
struct fmt::formatter<ctrlkit::IdPoly> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const ctrlkit::IdPoly& m, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "A(q) = {}\nB(q) = {}\nF(q) = {}\nnk = {}, Ts = {:g}\n"
                              "fit {:.2f}%, loss {:.6g}, noise variance {:.6g}, {} iterations ({})\n",
                              ctrlkit::formatPolynomial(m.A, "q", false),
                              ctrlkit::formatPolynomial(m.B, "q", false),
                              ctrlkit::formatPolynomial(m.F, "q", false),
                              m.nk,
                              m.Ts.value_or(0.0),
                              m.fitPercent,
                              m.lossFunction,
                              m.noiseVariance,
                              m.iterations,
                              m.termination);
    }
};

template <>
struct fmt::formatter<ctrlkit::IdData> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const ctrlkit::IdData& d, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "IdData: {} samples, Ts = {:g}, t = [{:g}, {:g}]", d.size(), d.sampleTime(),
                              d.startTime(), d.startTime() + static_cast<double>(d.size() - 1) * d.sampleTime());
    }
};
