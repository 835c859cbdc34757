#include <cmath>
#include <numbers>

#include "control.hpp"
#include "doctest.h"

using namespace ctrlkit;

namespace {
    // Mass-spring-damper: m = 1, k = 4, c = 2
    StateSpace massSpringDamper() {
        Matrix A(2, 2), B(2, 1), C(1, 2), D(1, 1);
        A << 0.0, 1.0, -4.0, -2.0;
        B << 0.0, 1.0;
        C << 1.0, 0.0;
        D << 0.0;
        return StateSpace{A, B, C, D};
    }
}  // namespace

TEST_CASE("StateSpace Construction and Validation") {
    SUBCASE("Valid construction") {
        const StateSpace sys = massSpringDamper();
        CHECK(sys.states() == 2);
        CHECK(sys.inputs() == 1);
        CHECK(sys.outputs() == 1);
        CHECK(sys.isContinuous());
    }

    SUBCASE("Copy and move keep the realization") {
        const StateSpace sys1 = massSpringDamper();
        StateSpace       sys2 = sys1;
        CHECK(sys2 == sys1);

        StateSpace sys3 = std::move(sys2);
        CHECK(sys3 == sys1);
    }

    SUBCASE("Dimension mismatches throw") {
        Matrix A = Matrix::Identity(2, 2);
        CHECK_THROWS_AS(StateSpace(Matrix::Zero(2, 3), Matrix::Zero(2, 1), Matrix::Zero(1, 2), Matrix::Zero(1, 1)), std::invalid_argument);
        CHECK_THROWS_AS(StateSpace(A, Matrix::Zero(3, 1), Matrix::Zero(1, 2), Matrix::Zero(1, 1)), std::invalid_argument);
        CHECK_THROWS_AS(StateSpace(A, Matrix::Zero(2, 1), Matrix::Zero(1, 3), Matrix::Zero(1, 1)), std::invalid_argument);
        CHECK_THROWS_AS(StateSpace(A, Matrix::Zero(2, 1), Matrix::Zero(1, 2), Matrix::Zero(2, 2)), std::invalid_argument);
    }

    SUBCASE("Non-positive sampling time throws") {
        Matrix A = Matrix::Constant(1, 1, 0.5);
        Matrix I = Matrix::Identity(1, 1);
        CHECK_THROWS_AS(StateSpace(A, I, I, Matrix::Zero(1, 1), 0.0), std::invalid_argument);
    }
}

TEST_CASE("StateSpace Analysis") {
    const StateSpace sys = massSpringDamper();

    SUBCASE("Poles are the eigenvalues of A") {
        const auto p = sys.poles();
        REQUIRE(p.size() == 2);
        for (const auto& pole : p) {
            CHECK(pole.real() == doctest::Approx(-1.0));
            CHECK(std::abs(pole.imag()) == doctest::Approx(std::sqrt(3.0)));
        }
        CHECK(sys.is_stable());
    }

    SUBCASE("Damping of the oscillatory mode") {
        const auto d = sys.damp();
        REQUIRE(d.naturalFrequency.size() == 2);
        CHECK(d.naturalFrequency[0] == doctest::Approx(2.0));
        CHECK(d.dampingRatio[0] == doctest::Approx(0.5));
    }

    SUBCASE("DC gain is 1/k") {
        CHECK(sys.dcgain()(0, 0) == doctest::Approx(0.25));
    }

    SUBCASE("Integrator has an infinite DC gain") {
        StateSpace integ{Matrix::Zero(1, 1), Matrix::Identity(1, 1), Matrix::Identity(1, 1), Matrix::Zero(1, 1)};
        CHECK_THROWS_AS(integ.dcgain(), std::runtime_error);
        CHECK_FALSE(integ.is_stable());
    }

    SUBCASE("Discrete stability uses the unit circle") {
        Matrix     I = Matrix::Identity(1, 1);
        StateSpace inside{Matrix::Constant(1, 1, 0.9), I, I, Matrix::Zero(1, 1), 0.1};
        StateSpace outside{Matrix::Constant(1, 1, 1.1), I, I, Matrix::Zero(1, 1), 0.1};
        CHECK(inside.is_stable());
        CHECK_FALSE(outside.is_stable());
        CHECK(inside.dcgain()(0, 0) == doctest::Approx(10.0));
    }
}

TEST_CASE("StateSpace to TransferFunction") {
    SUBCASE("SISO conversion") {
        const TransferFunction G = massSpringDamper().toTransferFunction();
        REQUIRE(G.num.size() == 1);
        REQUIRE(G.den.size() == 3);
        CHECK(G.num[0] == doctest::Approx(1.0));
        CHECK(G.den[0] == doctest::Approx(1.0));
        CHECK(G.den[1] == doctest::Approx(2.0));
        CHECK(G.den[2] == doctest::Approx(4.0));
    }

    SUBCASE("MIMO channel selection") {
        Matrix A = Matrix::Zero(2, 2);
        A << -1.0, 0.0, 0.0, -2.0;
        Matrix     B = Matrix::Identity(2, 2);
        Matrix     C = Matrix::Identity(2, 2);
        Matrix     D = Matrix::Zero(2, 2);
        StateSpace sys{A, B, C, D};

        CHECK(sys.toTransferFunction(1, 1).dcgain()(0, 0) == doctest::Approx(0.5));
        CHECK(sys.toTransferFunction(0, 0).dcgain()(0, 0) == doctest::Approx(1.0));
        CHECK_THROWS_AS(sys.toTransferFunction(2, 0), std::out_of_range);
        CHECK_THROWS_AS(sys.toTransferFunction(0, -1), std::out_of_range);
    }

    SUBCASE("Zeros of a SISO realization") {
        TransferFunction G{{1.0, 3.0}, {1.0, 3.0, 2.0}};
        const auto       z = G.toStateSpace().zeros();
        REQUIRE(z.size() == 1);
        CHECK(z[0].real() == doctest::Approx(-3.0));
    }

    SUBCASE("Pure gain") {
        StateSpace gain{Matrix::Zero(0, 0), Matrix::Zero(0, 1), Matrix::Zero(1, 0), Matrix::Constant(1, 1, 3.0)};
        const auto G = gain.toTransferFunction();
        CHECK(G.order() == 0);
        CHECK(G.num[0] == doctest::Approx(3.0));
    }
}

TEST_CASE("StateSpace Time Responses") {
    const StateSpace sys = massSpringDamper();

    SUBCASE("Continuous step settles at the DC gain") {
        const auto r = sys.step(0.0, 10.0);
        CHECK(r.output.back()(0) == doctest::Approx(0.25).epsilon(1e-3));
    }

    SUBCASE("Discrete step is sampled at Ts") {
        const StateSpace sysd = c2d(sys, 0.25);
        const auto       r    = sysd.step(0.0, 1.0);
        REQUIRE(r.time.size() == 5);
        CHECK(r.time[1] == doctest::Approx(0.25));
        CHECK(r.output.front()(0) == doctest::Approx(0.0));
    }

    SUBCASE("Discrete impulse response is C A^k B") {
        Matrix     I = Matrix::Identity(1, 1);
        StateSpace sysd{Matrix::Constant(1, 1, 0.5), I, I, Matrix::Zero(1, 1), 1.0};
        const auto r = sysd.impulse(0.0, 3.0);
        REQUIRE(r.output.size() == 4);
        CHECK(r.output[0](0) == doctest::Approx(0.0));
        CHECK(r.output[1](0) == doctest::Approx(1.0));
        CHECK(r.output[2](0) == doctest::Approx(0.5));
        CHECK(r.output[3](0) == doctest::Approx(0.25));
    }

    SUBCASE("Step information of the mass-spring-damper") {
        const auto info = sys.stepinfo(10.0);
        // zeta = 0.5
        CHECK(info.overshoot[0] == doctest::Approx(16.3).epsilon(0.02));
        CHECK(info.peakTime[0] == doctest::Approx(std::numbers::pi / std::sqrt(3.0)).epsilon(0.02));
    }
}

TEST_CASE("StateSpace Frequency Response") {
    const StateSpace sys = massSpringDamper();

    // Resonant peak at wn sqrt(1 - 2 zeta^2) is 1/(2 zeta sqrt(1 - zeta^2)) / k
    const double wr   = 2.0 * std::sqrt(0.5);
    const auto   resp = sys.freqresp({wr / (2.0 * std::numbers::pi)});
    CHECK(std::abs(resp.response[0]) == doctest::Approx(0.25 / std::sqrt(0.75)));

    const auto b = sys.bode(0.01, 100.0, 200);
    CHECK(b.magnitude.front() == doctest::Approx(mag2db(0.25)).epsilon(1e-3));
    CHECK(b.phase.back() == doctest::Approx(-180.0).epsilon(1e-2));
}
