#include <algorithm>
#include <cmath>

#include "control.hpp"
#include "doctest.h"

using namespace ctrlkit;

namespace {
    // y(t) = 0.8 y(t-1) + 0.5 u(t-1) + e(t)
    IdData arxData(size_t n, double sigma, unsigned seed = 1) {
        const auto u = prbs(n, 1.0, 0xACE1, 2);
        const auto e = whiteNoise(n, sigma, seed);

        std::vector<double> y(n, 0.0);
        for (size_t t = 0; t < n; ++t) {
            y[t] = e[t];
            if (t >= 1) y[t] += 0.8 * y[t - 1] + 0.5 * u[t - 1];
        }
        return IdData{y, u, 0.1};
    }

    // y(t) = (0.3 q^-1 + 0.2 q^-2) / (1 - 0.7 q^-1) u(t) + e(t)
    IdData oeData(size_t n, double sigma) {
        const auto u = prbs(n, 1.0, 0x1D2C, 3);
        auto       y = filter({0.0, 0.3, 0.2}, {1.0, -0.7}, u);
        const auto e = whiteNoise(n, sigma, 11);
        for (size_t t = 0; t < n; ++t) y[t] += e[t];
        return IdData{y, u, 0.1};
    }

    bool hasPole(const std::vector<Pole>& ps, double re, double tol) {
        return std::any_of(ps.begin(), ps.end(), [&](const Pole& p) { return std::abs(p - Pole{re, 0.0}) < tol; });
    }
}  // namespace

TEST_CASE("IdPoly Model") {
    SUBCASE("Transfer function in z") {
        IdPoly           model{{1.0, -0.8}, {0.5}, {1.0}, 1, 0.1};
        TransferFunction G = model.toTransferFunction();
        REQUIRE(G.num.size() == 1);
        REQUIRE(G.den.size() == 2);
        CHECK(G.num[0] == doctest::Approx(0.5));
        CHECK(G.den[1] == doctest::Approx(-0.8));
        CHECK(G.Ts.value() == doctest::Approx(0.1));
        CHECK(model.dcgain()(0, 0) == doctest::Approx(2.5));
        CHECK(model.is_stable());
    }

    SUBCASE("Extra delay adds poles at the origin") {
        IdPoly model{{1.0}, {1.0}, {1.0}, 3, 1.0};
        CHECK(model.toTransferFunction().den.size() == 4);
        CHECK(model.simulate({1.0, 2.0, 3.0, 4.0, 5.0}) == std::vector<double>{0.0, 0.0, 0.0, 1.0, 2.0});
    }

    SUBCASE("Orders") {
        IdPoly model{{1.0, 0.1, 0.2}, {1.0, 2.0, 3.0}, {1.0, 0.5}, 2, 1.0};
        CHECK(model.na() == 2);
        CHECK(model.nb() == 3);
        CHECK(model.nf() == 1);
    }

    SUBCASE("Invalid polynomials throw") {
        CHECK_THROWS_AS(IdPoly({0.0, 1.0}, {1.0}, {1.0}, 1, 1.0), std::invalid_argument);
        CHECK_THROWS_AS(IdPoly({1.0}, {}, {1.0}, 1, 1.0), std::invalid_argument);
        CHECK_THROWS_AS(IdPoly({1.0}, {1.0}, {}, 1, 1.0), std::invalid_argument);
        CHECK_THROWS_AS(IdPoly({1.0}, {1.0}, {1.0}, 1, 0.0), std::invalid_argument);
    }
}

TEST_CASE("ARX Estimation") {
    SUBCASE("Noise-free data recovers the system exactly") {
        const IdPoly model = arx(arxData(300, 0.0), 1, 1);
        CHECK(model.A[1] == doctest::Approx(-0.8).epsilon(1e-9));
        CHECK(model.B[0] == doctest::Approx(0.5).epsilon(1e-9));
        CHECK(model.lossFunction < 1e-20);
        CHECK(model.fitPercent == doctest::Approx(100.0).epsilon(1e-6));
        CHECK(model.termination == "least squares");
    }

    SUBCASE("Noisy data gives a consistent estimate") {
        const IdPoly model = arx(arxData(4000, 0.05), 1, 1);
        CHECK(std::abs(model.A[1] + 0.8) < 0.02);
        CHECK(std::abs(model.B[0] - 0.5) < 0.02);
        CHECK(model.noiseVariance == doctest::Approx(0.0025).epsilon(0.1));
        CHECK(model.noiseVariance > model.lossFunction);
    }

    SUBCASE("Validation residuals beat the mean predictor") {
        const auto   parts = arxData(2000, 0.05, 5).split(0.5);
        const IdPoly model = arx(parts.identification, 2, 2);

        const auto e = resid(model, parts.validation);
        CHECK(meanSquare(e) <= meanBaselineError(parts.validation));
        CHECK(compare(model, parts.validation, 1) > 80.0);
    }

    SUBCASE("Invalid requests throw") {
        CHECK_THROWS_AS(arx(arxData(100, 0.0), 1, 0), std::invalid_argument);
        CHECK_THROWS_AS(arx(arxData(3, 0.0), 2, 2), std::invalid_argument);

        IdData silent{std::vector<double>(50, 0.0), std::vector<double>(50, 0.0), 0.1};
        CHECK_THROWS_AS(arx(silent, 1, 1), std::runtime_error);
    }
}

TEST_CASE("Output-Error Estimation") {
    SUBCASE("Recovers the dynamics under measurement noise") {
        const IdPoly model = oe(oeData(1500, 0.02), 2, 1);
        REQUIRE(model.F.size() == 2);
        REQUIRE(model.B.size() == 2);
        CHECK(model.A == Poly{1.0});
        CHECK(std::abs(model.F[1] + 0.7) < 0.02);
        CHECK(std::abs(model.B[0] - 0.3) < 0.02);
        CHECK(std::abs(model.B[1] - 0.2) < 0.03);
        CHECK(model.fitPercent > 90.0);
        CHECK_FALSE(model.termination.empty());
        CHECK(isStableDiscrete(model.F));
    }

    SUBCASE("Validation residuals beat the mean predictor") {
        const auto   parts = oeData(2000, 0.05).split(0.5);
        const IdPoly model = oe(parts.identification, 2, 1);

        const auto e = resid(model, parts.validation);
        REQUIRE(e.size() == parts.validation.size());
        CHECK(meanSquare(e) <= meanBaselineError(parts.validation));
        CHECK(compare(model, parts.validation, 1) > 80.0);
    }

    SUBCASE("Explicit initial polynomials") {
        OeOptions options;
        options.initialB = {0.1, 0.1};
        options.initialF = {1.0, -0.5};
        const IdPoly model = oe(oeData(1500, 0.0), 2, 1, 1, options);
        CHECK(model.F[1] == doctest::Approx(-0.7).epsilon(1e-4));
        CHECK(model.B[0] == doctest::Approx(0.3).epsilon(1e-4));
    }

    SUBCASE("FIR model is solved directly") {
        const auto u = prbs(500, 1.0);
        const auto y = filter({0.0, 1.0, 0.5}, {1.0}, u);
        const IdPoly model = oe(IdData{y, u, 1.0}, 2, 0);
        CHECK(model.B[0] == doctest::Approx(1.0));
        CHECK(model.B[1] == doctest::Approx(0.5));
        CHECK(model.nf() == 0);
    }

    SUBCASE("Invalid requests throw") {
        const IdData data = oeData(200, 0.0);
        CHECK_THROWS_AS(oe(data, 0, 1), std::invalid_argument);

        OeOptions options;
        options.initialB = {0.1};
        options.initialF = {1.0, -0.5};
        CHECK_THROWS_AS(oe(data, 2, 1, 1, options), std::invalid_argument);
    }
}

TEST_CASE("Subspace Identification (n4sid)") {
    const StateSpace truth = c2d(speedSs(), 0.05);
    const auto       u     = prbs(800, 1.0, 0xBEEF, 2);
    const auto       y     = lsim(truth, u, sampleTimes(0.0, 0.05, u.size())).outputSeries();
    const IdData     data{y, u, 0.05};

    SUBCASE("Noise-free data recovers the poles") {
        const StateSpace model = n4sid(data, 2);
        CHECK(model.isDiscrete());
        CHECK(model.states() == 2);
        const auto p = model.poles();
        for (const auto& tp : truth.poles()) {
            CHECK(hasPole(p, tp.real(), 1e-4));
        }
        CHECK(compare(model, data) > 99.0);
    }

    SUBCASE("Noisy validation output beats the mean predictor") {
        auto       noisy = y;
        const auto e     = whiteNoise(noisy.size(), 0.002, 7);
        for (size_t t = 0; t < noisy.size(); ++t) noisy[t] += e[t];
        const auto parts = IdData{noisy, u, 0.05}.split(0.5);

        const StateSpace model = n4sid(parts.identification, 2);
        const auto       yhat  = simulateModel(model, parts.validation.input());
        REQUIRE(yhat.size() == parts.validation.size());

        std::vector<double> err(yhat.size());
        std::transform(yhat.begin(), yhat.end(), parts.validation.output().begin(), err.begin(),
                       [](double a, double b) { return b - a; });
        CHECK(meanSquare(err) <= meanBaselineError(parts.validation));
    }

    SUBCASE("Explicit horizon") {
        N4sidOptions options;
        options.horizon = 6;
        CHECK(compare(n4sid(data, 2, options), data) > 99.0);
    }

    SUBCASE("Invalid requests throw") {
        CHECK_THROWS_AS(n4sid(data, 0), std::invalid_argument);

        N4sidOptions options;
        options.horizon = 2;
        CHECK_THROWS_AS(n4sid(data, 2, options), std::invalid_argument);
        CHECK_THROWS_AS(n4sid(data.segment(0, 40), 2), std::invalid_argument);
    }
}

TEST_CASE("Prediction and Fit") {
    const IdData data  = arxData(200, 0.0);
    const IdPoly truth{{1.0, -0.8}, {0.5}, {1.0}, 1, 0.1};

    SUBCASE("Noise-free predictions reproduce the output at every horizon") {
        for (size_t horizon : {size_t{1}, size_t{5}, kSimulationHorizon}) {
            const auto yhat = predict(truth, data, horizon);
            REQUIRE(yhat.size() == data.size());
            for (size_t t = 0; t < yhat.size(); t += 17) {
                CHECK(yhat[t] == doctest::Approx(data.output()[t]));
            }
        }
        CHECK(compare(truth, data) == doctest::Approx(100.0));
    }

    SUBCASE("Prediction horizon matters for a wrong model") {
        const IdPoly wrong{{1.0, -0.5}, {0.5}, {1.0}, 1, 0.1};
        CHECK(compare(wrong, data, 1) > compare(wrong, data, 10));
    }

    SUBCASE("Simulation horizon equals the simulated model") {
        const IdPoly wrong{{1.0, -0.5}, {0.5}, {1.0}, 1, 0.1};
        const auto   sim = predict(wrong, data, kSimulationHorizon);
        CHECK(sim == simulateModel(wrong, data.input()));
    }

    SUBCASE("Residuals of the true model vanish") {
        const auto e = resid(truth, data);
        CHECK(meanSquare(e) < 1e-20);
    }

    SUBCASE("Zero horizon throws") {
        CHECK_THROWS_AS(predict(truth, data, 0), std::invalid_argument);
    }

    SUBCASE("NRMSE fit") {
        const std::vector<double> y = {1.0, 2.0, 3.0, 4.0};
        CHECK(nrmseFit(y, y) == doctest::Approx(100.0));
        CHECK(nrmseFit(y, std::vector<double>(4, 2.5)) == doctest::Approx(0.0));
        CHECK(nrmseFit(y, {1.0, 2.0, 3.0, 5.0}) == doctest::Approx(100.0 * (1.0 - 1.0 / std::sqrt(5.0))));
        CHECK_THROWS_AS(nrmseFit(y, {1.0}), std::invalid_argument);
    }

    SUBCASE("Continuous state-space models cannot be compared against samples") {
        CHECK_THROWS_AS(compare(speedSs(), data), std::invalid_argument);
    }

    SUBCASE("Mean baseline error is the output variance") {
        IdData flat{{1.0, 3.0, 1.0, 3.0}, {0.0, 0.0, 0.0, 0.0}, 1.0};
        CHECK(meanBaselineError(flat) == doctest::Approx(1.0));
    }
}
