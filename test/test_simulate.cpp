#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>

#include "control.hpp"
#include "doctest.h"

using namespace ctrlkit;

TEST_CASE("Linear Simulation (lsim)") {
    const TransferFunction G{{1.0}, {1.0, 1.0}};

    SUBCASE("Step response of a first-order lag is exact at the samples") {
        const auto t = sampleTimes(0.0, 0.1, 51);
        const auto r = lsim(G, std::vector<double>(t.size(), 1.0), t);
        REQUIRE(r.output.rows() == 51);
        for (size_t k = 0; k < t.size(); k += 10) {
            CHECK(r.output(static_cast<Eigen::Index>(k), 0) == doctest::Approx(1.0 - std::exp(-t[k])));
        }
    }

    SUBCASE("Non-uniform time grid") {
        const std::vector<double> t = {0.0, 0.05, 0.3, 0.31, 1.0, 2.5};
        const auto                r = lsim(G, std::vector<double>(t.size(), 2.0), t);
        for (size_t k = 0; k < t.size(); ++k) {
            CHECK(r.output(static_cast<Eigen::Index>(k), 0) == doctest::Approx(2.0 * (1.0 - std::exp(-t[k]))));
        }
    }

    SUBCASE("Free response from an initial state") {
        const auto t  = sampleTimes(0.0, 0.5, 5);
        const auto r  = lsim(G, std::vector<double>(t.size(), 0.0), t, ColVec{3.0});
        const auto ys = r.outputSeries();
        CHECK(ys.front() == doctest::Approx(3.0));
        CHECK(ys.back() == doctest::Approx(3.0 * std::exp(-2.0)));
        CHECK(r.state.cols() == 1);
    }

    SUBCASE("Discrete models iterate the difference equation") {
        Matrix     I = Matrix::Identity(1, 1);
        StateSpace sysd{Matrix::Constant(1, 1, 0.5), I, I, Matrix::Zero(1, 1), 1.0};
        const auto r = lsim(sysd, std::vector<double>(4, 1.0), {0.0, 1.0, 2.0, 3.0});
        CHECK(r.output(0, 0) == doctest::Approx(0.0));
        CHECK(r.output(1, 0) == doctest::Approx(1.0));
        CHECK(r.output(2, 0) == doctest::Approx(1.5));
        CHECK(r.output(3, 0) == doctest::Approx(1.75));
    }

    SUBCASE("Multi-input models take one column per input") {
        Matrix A(1, 1), B(1, 2), C(1, 1), D(1, 2);
        A << -1.0;
        B << 1.0, 2.0;
        C << 1.0;
        D << 0.0, 0.0;
        const StateSpace sys{A, B, C, D};
        const auto       t = sampleTimes(0.0, 1.0, 11);
        Matrix           U = Matrix::Zero(11, 2);
        U.col(1).setOnes();
        const auto r = lsim(sys, U, t);
        CHECK(r.output(10, 0) == doctest::Approx(2.0 * (1.0 - std::exp(-10.0))));
    }

    SUBCASE("Invalid arguments throw") {
        CHECK_THROWS_AS(lsim(G, std::vector<double>(3, 1.0), {0.0, 1.0}), std::invalid_argument);
        CHECK_THROWS_AS(lsim(G, std::vector<double>(3, 1.0), {0.0, 1.0, 1.0}), std::invalid_argument);
        CHECK_THROWS_AS(lsim(G, std::vector<double>(2, 1.0), {0.0, 1.0}, ColVec::Zero(2)), std::invalid_argument);

        const StateSpace Gd = c2d(G, 0.1);
        CHECK_THROWS_AS(lsim(Gd, std::vector<double>(3, 1.0), {0.0, 0.1, 0.3}), std::invalid_argument);
        CHECK_THROWS_AS(lsim(G, Matrix::Zero(2, 2), {0.0, 1.0}), std::invalid_argument);
    }
}

TEST_CASE("Held Inputs") {
    const auto u = holdInput({0.0, 1.0, 2.0}, {5.0, 6.0, 7.0});
    CHECK(u(-1.0)(0) == doctest::Approx(5.0));
    CHECK(u(0.5)(0) == doctest::Approx(5.0));
    CHECK(u(1.0)(0) == doctest::Approx(6.0));
    CHECK(u(1.0 - 1e-12)(0) == doctest::Approx(6.0));
    CHECK(u(10.0)(0) == doctest::Approx(7.0));

    CHECK_THROWS_AS(holdInput({}, {}), std::invalid_argument);
    CHECK_THROWS_AS(holdInput({0.0, 1.0}, {1.0}), std::invalid_argument);
}

TEST_CASE("Nonlinear Simulation") {
    const auto model = nonlinearModel();

    SUBCASE("Frictionless motor matches the linear speed model") {
        const auto t     = sampleTimes(0.0, 0.01, 201);
        const auto input = [](double) { return ColVec::Constant(1, 1.0); };

        const auto nl  = simulate(model, input, ColVec::Zero(3), {0.0, 2.0}, t);
        const auto lin = lsim(speedSs(), std::vector<double>(t.size(), 1.0), t);

        REQUIRE(nl.output.rows() == lin.output.rows());
        for (Eigen::Index k = 0; k < nl.output.rows(); k += 20) {
            CHECK(std::abs(nl.output(k, 0) - lin.output(k, 0)) < 1e-5);
        }
    }

    SUBCASE("One ZOH step agrees with continuous integration") {
        const StateSpace motor = positionSs();
        const double     Ts    = 0.05;
        const auto [Ad, Bd]    = c2d(motor.A, motor.B, Ts);

        ColVec x0(3);
        x0 << 0.3, -1.0, 0.5;
        const double u = 2.0;

        const ColVec x1 = Ad * x0 + Bd * ColVec::Constant(1, u);

        const auto nl = simulate(nonlinearModel(DcMotorParams{}, 0.0, std::numeric_limits<double>::infinity(), MotorOutput::Position),
                                 [u](double) { return ColVec::Constant(1, u); }, x0, {0.0, Ts}, {Ts}, 1e-10, 1e-3);
        REQUIRE(nl.state.rows() == 1);
        for (Eigen::Index i = 0; i < 3; ++i) {
            CHECK(nl.state(0, i) == doctest::Approx(x1(i)).epsilon(1e-7));
        }

        const ColVec exact = ExactSolver::stateAt(motor.A, motor.B, x0, ColVec::Constant(1, u), Ts);
        CHECK((exact - x1).norm() < 1e-10);
    }

    SUBCASE("Saturation limits the final speed") {
        const auto limited = nonlinearModel(DcMotorParams{}, 0.0, 1.0);
        const auto input   = [](double) { return ColVec::Constant(1, 10.0); };
        const auto r       = simulate(limited, input, ColVec::Zero(3), {0.0, 5.0}, {5.0});
        CHECK(r.output(0, 0) == doctest::Approx(0.01 / 0.1001).epsilon(1e-3));
    }

    SUBCASE("Coulomb friction holds the motor below the breakaway voltage") {
        // Stall torque K V / R = 0.001 N m is below Tc = 0.002 N m
        const auto sticky = nonlinearModel(DcMotorParams{}, 0.002);
        const auto input  = [](double) { return ColVec::Constant(1, 0.1); };
        const auto r      = simulate(sticky, input, ColVec::Zero(3), {0.0, 2.0}, {2.0});
        CHECK(std::abs(r.output(0, 0)) < 1e-3);
    }

    SUBCASE("Fixed-step integration converges with the method order") {
        const auto input = holdInput({0.0}, {1.0});
        const auto ref   = simulate(model, input, ColVec::Zero(3), {0.0, 1.0}, {1.0}, 1e-10, 1e-3);

        const auto euler = simulateFixedStep(model, input, ColVec::Zero(3), {0.0, 1.0}, 0.01, ForwardEuler{}, {1.0});
        const auto rk4   = simulateFixedStep(model, input, ColVec::Zero(3), {0.0, 1.0}, 0.01, RK4{}, {1.0});

        const double errEuler = std::abs(euler.output(0, 0) - ref.output(0, 0));
        const double errRk4   = std::abs(rk4.output(0, 0) - ref.output(0, 0));
        CHECK(errRk4 < errEuler);
        CHECK(errRk4 < 1e-6);
    }

    SUBCASE("Wrong initial state size throws") {
        const auto input = [](double) { return ColVec::Zero(1); };
        CHECK_THROWS_AS(simulate(model, input, ColVec::Zero(2), {0.0, 1.0}), std::invalid_argument);
        CHECK_THROWS_AS(simulateFixedStep(model, input, ColVec::Zero(2), {0.0, 1.0}, 0.01), std::invalid_argument);
    }
}

TEST_CASE("Excitation Signals") {
    SUBCASE("PRBS levels and hold") {
        const auto u = prbs(1000, 2.0, 0xACE1, 4);
        REQUIRE(u.size() == 1000);
        for (size_t k = 0; k < u.size(); ++k) {
            CHECK(std::abs(u[k]) == doctest::Approx(2.0));
            CHECK(u[k] == u[k - k % 4]);
        }
        const double mean = std::accumulate(u.begin(), u.end(), 0.0) / static_cast<double>(u.size());
        CHECK(std::abs(mean) < 0.4);
    }

    SUBCASE("PRBS is reproducible and seed dependent") {
        CHECK(prbs(200, 1.0, 0x1234) == prbs(200, 1.0, 0x1234));
        CHECK(prbs(200, 1.0, 0x1234) != prbs(200, 1.0, 0x4321));
        CHECK(prbs(200, 1.0, 0) == prbs(200, 1.0, 0xACE1));
        CHECK_THROWS_AS(prbs(10, 1.0, 0xACE1, 0), std::invalid_argument);
    }

    SUBCASE("Chirp with equal frequencies is a sine") {
        const auto t = sampleTimes(0.0, 0.01, 101);
        const auto u = chirp(t, 2.0, 2.0, 0.5);
        for (size_t k = 0; k < t.size(); k += 7) {
            CHECK(u[k] == doctest::Approx(0.5 * std::sin(2.0 * std::numbers::pi * 2.0 * t[k])));
        }
        CHECK(chirp({}, 1.0, 2.0).empty());
    }

    SUBCASE("Chirp sweeps its phase quadratically") {
        const std::vector<double> t = {0.0, 0.5, 1.0};
        const auto                u = chirp(t, 0.0, 1.0);
        // Phase 2 pi (f1 / 2) t^2 at t = 1 is pi
        CHECK(u[0] == doctest::Approx(0.0));
        CHECK(u[2] == doctest::Approx(0.0).epsilon(1e-12));
        CHECK(u[1] == doctest::Approx(std::sin(std::numbers::pi * 0.25)));
    }

    SUBCASE("Step signal") {
        const auto u = stepSignal({0.0, 0.5, 1.0, 1.5}, 1.0, 3.0);
        CHECK(u == std::vector<double>{0.0, 0.0, 3.0, 3.0});
    }

    SUBCASE("White noise statistics") {
        const auto e = whiteNoise(20000, 0.5, 7);
        REQUIRE(e.size() == 20000);
        CHECK(e == whiteNoise(20000, 0.5, 7));
        CHECK(std::abs(mean(e)) < 0.02);
        CHECK(std::sqrt(meanSquare(e)) == doctest::Approx(0.5).epsilon(0.03));

        const auto z = whiteNoise(10, 0.0);
        CHECK(std::all_of(z.begin(), z.end(), [](double v) { return v == 0.0; }));
        CHECK_THROWS_AS(whiteNoise(10, -1.0), std::invalid_argument);
    }
}
