#include <cmath>
#include <limits>

#include "control.hpp"
#include "doctest.h"

using namespace ctrlkit;

TEST_CASE("DC Motor Parameters") {
    CHECK_NOTHROW(validate(DcMotorParams{}));

    DcMotorParams p;
    p.J = 0.0;
    CHECK_THROWS_AS(validate(p), std::invalid_argument);

    p   = DcMotorParams{};
    p.b = -0.1;
    CHECK_THROWS_AS(speedTf(p), std::invalid_argument);

    p   = DcMotorParams{};
    p.L = 0.0;
    CHECK_THROWS_AS(positionSs(p), std::invalid_argument);

    p   = DcMotorParams{};
    p.b = 0.0;  // Frictionless motors are allowed
    CHECK_NOTHROW(speedSs(p));
}

TEST_CASE("DC Motor Linear Models") {
    SUBCASE("Speed transfer function coefficients") {
        const TransferFunction G = speedTf();
        REQUIRE(G.num.size() == 1);
        REQUIRE(G.den.size() == 3);
        CHECK(G.num[0] == doctest::Approx(0.01));
        CHECK(G.den[0] == doctest::Approx(0.005));
        CHECK(G.den[1] == doctest::Approx(0.06));
        CHECK(G.den[2] == doctest::Approx(0.1001));
    }

    SUBCASE("Speed DC gain is K / (b R + K^2)") {
        CHECK(speedTf().dcgain()(0, 0) == doctest::Approx(0.01 / 0.1001));
        CHECK(speedSs().dcgain()(0, 0) == doctest::Approx(0.01 / 0.1001));
    }

    SUBCASE("Transfer function and state-space agree") {
        const std::vector<double> f  = {0.1, 1.0, 10.0};
        const auto                rt = speedTf().freqresp(f);
        const auto                rs = speedSs().freqresp(f);
        for (size_t k = 0; k < f.size(); ++k) {
            CHECK(std::abs(rt.response[k] - rs.response[k]) < 1e-10);
        }

        const auto pt = positionTf().freqresp(f);
        const auto ps = positionSs().freqresp(f);
        for (size_t k = 0; k < f.size(); ++k) {
            CHECK(std::abs(pt.response[k] - ps.response[k]) < 1e-10);
        }
    }

    SUBCASE("Position model adds an integrator") {
        const auto p = positionTf().poles();
        REQUIRE(p.size() == 3);
        int at_origin = 0;
        for (const auto& pole : p) {
            if (std::abs(pole) < 1e-9) ++at_origin;
        }
        CHECK(at_origin == 1);
        CHECK_FALSE(positionSs().is_stable());
        CHECK(speedSs().is_stable());
    }
}

TEST_CASE("DC Motor Nonlinear Model") {
    SUBCASE("Linearization without friction or saturation matches the linear model") {
        const auto       model = nonlinearModel(DcMotorParams{}, 0.0, std::numeric_limits<double>::infinity(), MotorOutput::Position);
        const StateSpace lin   = model.linearize(ColVec::Zero(3), ColVec::Zero(1));
        const StateSpace ref   = positionSs();
        CHECK(lin.A.isApprox(ref.A, 1e-6));
        CHECK(lin.B.isApprox(ref.B, 1e-6));
        CHECK(lin.C.isApprox(ref.C, 1e-6));
    }

    SUBCASE("Speed output selects omega") {
        const auto model = nonlinearModel();
        ColVec     x(3);
        x << 1.0, 2.0, 3.0;
        CHECK(model.output(x, ColVec::Zero(1))(0) == doctest::Approx(2.0));
        CHECK(nonlinearModel(DcMotorParams{}, 0.0, 12.0, MotorOutput::Position).output(x, ColVec::Zero(1))(0) == doctest::Approx(1.0));
    }

    SUBCASE("Voltage is clamped to the limit") {
        const auto model = nonlinearModel(DcMotorParams{}, 0.0, 12.0);
        const ColVec x   = ColVec::Zero(3);
        const ColVec d1  = model.derivative(x, ColVec::Constant(1, 100.0));
        const ColVec d2  = model.derivative(x, ColVec::Constant(1, 12.0));
        CHECK(d1(2) == doctest::Approx(d2(2)));
        CHECK(d1(2) == doctest::Approx(12.0 / 0.5));
    }

    SUBCASE("Coulomb friction opposes motion") {
        const auto model = nonlinearModel(DcMotorParams{}, 0.02);
        ColVec     x(3);
        x << 0.0, 1.0, 0.0;
        // -(b w + Tc) / J
        CHECK(model.derivative(x, ColVec::Zero(1))(1) == doctest::Approx(-(0.1 + 0.02) / 0.01));
        x(1) = -1.0;
        CHECK(model.derivative(x, ColVec::Zero(1))(1) == doctest::Approx((0.1 + 0.02) / 0.01));
    }

    SUBCASE("Invalid arguments throw") {
        CHECK_THROWS_AS(nonlinearModel(DcMotorParams{}, -0.1), std::invalid_argument);
        CHECK_THROWS_AS(nonlinearModel(DcMotorParams{}, 0.0, 0.0), std::invalid_argument);
    }
}
