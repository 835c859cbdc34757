#include <filesystem>

#include <fmt/core.h>

#include "control.hpp"
#include "matplot/matplot.h"

int main() {
    using namespace ctrlkit;
    namespace plt = matplot;

    fmt::print("=== DC Motor System Identification Example ===\n");
    fmt::print("PRBS voltage experiment on the nonlinear motor, then ARX, OE and N4SID fits\n\n");

    log::setLevel(log::Level::Info);

    const DcMotorParams params{};
    const double        Ts = 0.05;
    const size_t        N  = 1000;

    // Experiment: PRBS voltage held for 4 samples, small Coulomb friction, 12 V supply
    const auto t = sampleTimes(0.0, Ts, N);
    const auto u = prbs(N, 2.0, 0xACE1, 4);

    const auto plant   = nonlinearModel(params, 0.002, 12.0, MotorOutput::Speed);
    const auto sim     = simulate(plant, holdInput(t, u), ColVec::Zero(3), {t.front(), t.back()}, t, 1e-8, Ts / 4);
    auto       y       = sim.outputSeries();
    const auto noise   = whiteNoise(N, 0.002, 7);
    for (size_t k = 0; k < N; ++k) y[k] += noise[k];

    // Round trip through a CSV file as a lab logger would produce it
    const auto path = (std::filesystem::temp_directory_path() / "ctrlkit_motor_experiment.csv").string();
    writeCsv(path, IdData{y, u, Ts});
    const IdData data = readCsv(path);
    fmt::print("Loaded {}\n", data);

    const auto [estimation, validation] = data.split(0.7);
    fmt::print("Estimation samples: {}, validation samples: {}\n\n", estimation.size(), validation.size());

    // Models
    const IdPoly     arxModel = arx(estimation, 2, 2, 1);
    const IdPoly     oeModel  = oe(estimation, 2, 2, 1);
    const StateSpace ssModel  = n4sid(estimation, 2);

    fmt::print("ARX(2,2,1):\n{}\n", arxModel);
    fmt::print("OE(2,2,1):\n{}\n", oeModel);
    fmt::print("N4SID order 2:\n{}\n", ssModel);

    const StateSpace truth = c2d(speedSs(params), Ts);
    fmt::print("True discrete DC gain:  {:.4f}\n", dcgain(truth)(0, 0));
    fmt::print("OE discrete DC gain:    {:.4f}\n", dcgain(oeModel.toStateSpace())(0, 0));
    fmt::print("N4SID discrete DC gain: {:.4f}\n\n", dcgain(ssModel)(0, 0));

    fmt::print("Validation fit (simulation):\n");
    fmt::print("  ARX:   {:.2f}%\n", compare(arxModel, validation));
    fmt::print("  OE:    {:.2f}%\n", compare(oeModel, validation));
    fmt::print("  N4SID: {:.2f}%\n", compare(ssModel, validation));
    fmt::print("ARX one-step fit: {:.2f}%\n", compare(arxModel, validation, 1));

    const auto residuals = resid(oeModel, validation);
    fmt::print("OE residual mean square: {:.3e} (baseline {:.3e})\n", meanSquare(residuals), meanBaselineError(validation));

    // Plot validation outputs
    const auto tv    = validation.time();
    const auto yArx  = simulateModel(arxModel, validation.input());
    const auto yOe   = simulateModel(oeModel, validation.input());
    const auto yN4   = simulateModel(ssModel, validation.input());

    auto fig = plt::figure(true);
    fig->size(1200, 800);

    plt::sgtitle("DC Motor Identification - Validation Data");
    plt::subplot(2, 1, 0);
    plt::plot(tv, validation.output())->display_name("Measured");
    plt::hold(true);
    plt::plot(tv, yArx, "--")->display_name("ARX");
    plt::plot(tv, yOe, "-.")->display_name("OE");
    plt::plot(tv, yN4, ":")->display_name("N4SID");
    plt::hold(false);
    plt::ylabel("Speed [rad/s]");
    plt::legend();
    plt::grid(true);

    plt::subplot(2, 1, 1);
    plt::stairs(tv, validation.input());
    plt::xlabel("Time [s]");
    plt::ylabel("Voltage [V]");
    plt::grid(true);

    plt::show();

    std::filesystem::remove(path);
    return 0;
}
