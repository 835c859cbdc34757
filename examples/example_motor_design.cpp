#include <complex>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "control.hpp"
#include "matplot/matplot.h"

int main() {
    using namespace ctrlkit;
    namespace plt = matplot;

    fmt::print("=== DC Motor Position Control Design Example ===\n\n");

    const DcMotorParams params{};
    const auto          plantTf = positionTf(params);
    const auto          plantSs = positionSs(params);
    fmt::print("Position plant theta(s)/V(s):\n{}\n", plantTf);

    // Root locus: proportional gain giving a dominant pair with 0.7 damping
    const auto locus = rlocus(plantTf, 0.0, 100.0, 400);
    const auto gain  = rlocusGainForDamping(plantTf, 0.7);
    fmt::print("Root locus gain for zeta = 0.7: k = {:.4f} (zeta = {:.3f})\n", gain.gain, gain.dampingRatio);

    const auto pStep = closedLoopStep(plantTf, TransferFunction{{gain.gain}, {1.0}}, 5.0);

    // State feedback with an observer
    const std::vector<Pole> controllerPoles = {{-5.0, 0.0}, {-6.0, 3.0}, {-6.0, -3.0}};
    const std::vector<Pole> observerPoles   = {{-20.0, 0.0}, {-22.0, 0.0}, {-24.0, 0.0}};

    const Matrix K = place(plantSs.A, plantSs.B, controllerPoles);
    const Matrix L = placeObserver(plantSs.A, plantSs.C, observerPoles);
    fmt::print("State feedback K = [{}]\n", fmt::join(K.reshaped(), ", "));
    fmt::print("Observer gain    L = [{}]\n", fmt::join(L.reshaped(), ", "));

    const StateSpace controller = reg(plantSs, K, L);
    const StateSpace loop       = feedback(plantSs, controller, +1);
    fmt::print("Closed loop is {}stable\n", is_stable(loop) ? "" : "un");
    for (const auto& p : poles(loop)) {
        fmt::print("  pole {:.3f} {:+.3f}j\n", p.real(), p.imag());
    }

    // The regulator has no reference input. Start from a 1 rad offset and let it settle.
    const auto   t  = linspace(0.0, 3.0, 601);
    ColVec       x0 = ColVec::Zero(static_cast<Eigen::Index>(loop.states()));
    x0(0)           = 1.0;
    const auto regResp = lsim(loop, std::vector<double>(t.size(), 0.0), t, x0);

    // Loop shaping alternative: PID on the same plant
    const auto pidTf   = pid(20.0, 5.0, 2.0, 0.01);
    const auto pidStep = closedLoopStep(plantTf, pidTf, 5.0);
    const auto loopTf  = pidTf * plantTf;
    const auto margins = loopTf.margin();
    fmt::print("PID loop: gain margin {:.1f} dB, phase margin {:.1f} deg at {:.2f} Hz\n", margins.gainMargin,
               margins.phaseMargin, margins.gainCrossover);

    // Plots
    auto fig = plt::figure(true);
    fig->size(1200, 900);
    plt::sgtitle("DC Motor Position Control");

    plt::subplot(2, 2, 0);
    plt::hold(true);
    for (const auto& branch : locus.branches) {
        std::vector<double> re, im;
        for (const auto& p : branch) {
            re.push_back(p.real());
            im.push_back(p.imag());
        }
        plt::plot(re, im);
    }
    for (const auto& p : gain.poles) {
        plt::scatter(std::vector<double>{p.real()}, std::vector<double>{p.imag()})->marker_face(true);
    }
    plt::hold(false);
    plt::title("Root locus");
    plt::xlabel("Real");
    plt::ylabel("Imaginary");
    plt::grid(true);

    auto outputOf = [](const StepResponse& r) {
        std::vector<double> y;
        for (const auto& v : r.output) y.push_back(v(0));
        return y;
    };

    plt::subplot(2, 2, 1);
    plt::plot(pStep.time, outputOf(pStep))->display_name("P (root locus)");
    plt::hold(true);
    plt::plot(pidStep.time, outputOf(pidStep), "--")->display_name("PID");
    plt::hold(false);
    plt::title("Closed-loop step");
    plt::xlabel("Time [s]");
    plt::ylabel("Position [rad]");
    plt::legend();
    plt::grid(true);

    plt::subplot(2, 2, 2);
    plt::plot(regResp.time, regResp.outputSeries());
    plt::title("Observer-based regulator, 1 rad initial offset");
    plt::xlabel("Time [s]");
    plt::ylabel("Position [rad]");
    plt::grid(true);

    const auto bodeData = loopTf.bode(0.01, 100.0, 200);
    plt::subplot(2, 2, 3);
    plt::semilogx(bodeData.freq, bodeData.magnitude);
    plt::title("PID loop gain");
    plt::xlabel("Frequency [Hz]");
    plt::ylabel("Magnitude [dB]");
    plt::grid(true);

    plt::show();
    return 0;
}
