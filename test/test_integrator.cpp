#include <cmath>
#include <numbers>
#include <variant>

#include "control.hpp"
#include "doctest.h"

using namespace ctrlkit;

TEST_CASE("ForwardEuler Integrator") {
    SUBCASE("Basic integration: x' = -x") {
        ForwardEuler integrator;

        auto f = [](double /*t*/, const ColVec& x) -> ColVec { return -x; };

        // x_new = x + h f(t, x) = 1 + 0.1 * (-1)
        auto result = integrator.evolve(f, ColVec::Constant(1, 1.0), 0.0, 0.1);
        CHECK(result.x(0) == doctest::Approx(0.9));
        CHECK(result.error == doctest::Approx(0.0));
    }

    SUBCASE("Multiple steps convergence") {
        ForwardEuler integrator;

        auto f = [](double /*t*/, const ColVec& x) -> ColVec { return -x; };

        ColVec x = ColVec::Constant(1, 1.0);
        double t = 0.0;
        for (int i = 0; i < 100; ++i) {
            x = integrator.evolve(f, x, t, 0.01).x;
            t += 0.01;
        }
        CHECK(x(0) == doctest::Approx(std::exp(-1.0)).epsilon(0.01));
    }

    SUBCASE("System of equations") {
        ForwardEuler integrator;

        auto f = [](double /*t*/, const ColVec& x) -> ColVec { return ColVec{{-x(0), -2.0 * x(1)}}; };

        auto result = integrator.evolve(f, ColVec{{1.0, 2.0}}, 0.0, 0.01);
        CHECK(result.x(0) == doctest::Approx(1.0 - 0.01 * 1.0));
        CHECK(result.x(1) == doctest::Approx(2.0 - 0.01 * 2.0 * 2.0));
    }
}

TEST_CASE("Heun Integrator") {
    Heun integrator;

    auto f = [](double /*t*/, const ColVec& x) -> ColVec { return -x; };

    // One step is the second-order Taylor polynomial 1 - h + h^2/2
    auto result = integrator.evolve(f, ColVec::Constant(1, 1.0), 0.0, 0.1);
    CHECK(result.x(0) == doctest::Approx(1.0 - 0.1 + 0.005));
}

TEST_CASE("RK4 Integrator") {
    SUBCASE("High accuracy for smooth functions") {
        RK4  integrator;
        auto f = [](double /*t*/, const ColVec& x) -> ColVec { return -x; };

        auto result = integrator.evolve(f, ColVec::Constant(1, 1.0), 0.0, 0.1);
        CHECK(result.x(0) == doctest::Approx(std::exp(-0.1)).epsilon(1e-6));
    }

    SUBCASE("Harmonic oscillator keeps its energy") {
        RK4 integrator;

        auto f = [](double /*t*/, const ColVec& s) -> ColVec { return ColVec{{s(1), -s(0)}}; };

        ColVec       state = ColVec{{1.0, 0.0}};
        const double h     = 0.01;
        const int    steps = static_cast<int>(2.0 * std::numbers::pi / h);

        double t = 0.0;
        for (int i = 0; i < steps; ++i) {
            state = integrator.evolve(f, state, t, h).x;
            t += h;
        }
        CHECK(state.squaredNorm() == doctest::Approx(1.0).epsilon(1e-6));
    }

    SUBCASE("Constant forcing from rest") {
        RK4 integrator;

        // x' = -x + 1: x(h) = 1 - e^-h
        auto f = [](double /*t*/, const ColVec& x) -> ColVec { return ColVec::Ones(1) - x; };

        auto result = integrator.evolve(f, ColVec::Zero(1), 0.0, 0.1);
        CHECK(result.x(0) == doctest::Approx(1.0 - std::exp(-0.1)).epsilon(1e-6));
    }
}

TEST_CASE("RK45 Integrator") {
    SUBCASE("Embedded error estimate") {
        RK45 integrator;
        auto f = [](double /*t*/, const ColVec& x) -> ColVec { return -x; };

        auto coarse = integrator.evolve(f, ColVec::Constant(1, 1.0), 0.0, 0.5);
        auto fine   = integrator.evolve(f, ColVec::Constant(1, 1.0), 0.0, 0.05);

        CHECK(coarse.error > 0.0);
        CHECK(fine.error < coarse.error);
        CHECK(fine.x(0) == doctest::Approx(std::exp(-0.05)).epsilon(1e-9));
    }

    SUBCASE("Time-dependent right-hand side") {
        RK45 integrator;

        // x' = cos(t): x(pi/2) = 1
        auto f = [](double t, const ColVec& /*x*/) -> ColVec { return ColVec::Constant(1, std::cos(t)); };

        const double tEnd = std::numbers::pi / 2.0;
        const int    n    = 16;
        ColVec       x    = ColVec::Zero(1);
        for (int i = 0; i < n; ++i) {
            x = integrator.evolve(f, x, i * tEnd / n, tEnd / n).x;
        }
        CHECK(x(0) == doctest::Approx(1.0).epsilon(1e-7));
    }
}

TEST_CASE("Runtime integrator selection") {
    auto f = [](double /*t*/, const ColVec& x) -> ColVec { return -x; };

    Integrator method = Heun{};
    CHECK(std::holds_alternative<Heun>(method));

    method = RK4{};
    const double x1 = std::visit([&](const auto& integrator) { return integrator.evolve(f, ColVec::Constant(1, 1.0), 0.0, 0.1).x(0); },
                                 method);
    CHECK(x1 == doctest::Approx(std::exp(-0.1)).epsilon(1e-6));
}
