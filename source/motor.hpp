#pragma once

#include <limits>

#include "nonlinear.hpp"
#include "ss.hpp"
#include "tf.hpp"

namespace ctrlkit {

/**
 * @brief Physical constants of an armature-controlled DC motor.
 *
 * Defaults are the classic speed-control tutorial values.
 */
struct DcMotorParams {
    double J = 0.01;  // Rotor inertia [kg*m^2]
    double b = 0.1;   // Viscous friction [N*m*s]
    double K = 0.01;  // Motor constant, Kt = Ke [N*m/A] = [V*s/rad]
    double R = 1.0;   // Armature resistance [Ohm]
    double L = 0.5;   // Armature inductance [H]
};

// Throws std::invalid_argument unless J, K, R, L > 0 and b >= 0
void validate(const DcMotorParams& p);

// omega(s)/V(s) = K / ((J s + b)(L s + R) + K^2)
TransferFunction speedTf(const DcMotorParams& p = {});

// theta(s)/V(s) = speedTf / s
TransferFunction positionTf(const DcMotorParams& p = {});

// States [omega, i], input V, output omega
StateSpace speedSs(const DcMotorParams& p = {});

// States [theta, omega, i], input V, output theta
StateSpace positionSs(const DcMotorParams& p = {});

enum class MotorOutput {
    Speed,
    Position,
};

/**
 * @brief Motor with Coulomb friction and a saturated voltage input.
 *
 * States [theta, omega, i], input V. The friction torque coulomb*tanh(omega/0.001) is a smooth
 * stand-in for coulomb*sign(omega) so that the model stays differentiable for the ODE solvers and
 * linearize(). The applied voltage is clamped to [-vmax, vmax].
 *
 * @throws std::invalid_argument for invalid parameters, negative coulomb or non-positive vmax
 */
NonlinearSystem nonlinearModel(const DcMotorParams& p = {},
                               double               coulomb = 0.0,
                               double               vmax    = std::numeric_limits<double>::infinity(),
                               MotorOutput          output  = MotorOutput::Speed);

}  // namespace ctrlkit
