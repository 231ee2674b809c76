#ifndef TAUBERT__OMNI_KINEMATICS_HPP_
#define TAUBERT__OMNI_KINEMATICS_HPP_

#include <boost/system/error_code.hpp>
#include <array>

namespace taubert {

/// Robot-frame velocity as fractions of full speed. +vy is forward, +vx is right,
/// +omega is counter-clockwise seen from above.
struct RobotVelocity
{
    double vx = 0.0;
    double vy = 0.0;
    double omega = 0.0;
};

using WheelSpeeds = std::array<double, 3>;

/// Three omni-wheels at 0, 120 and 240 degrees around the rotation center.
/// Wheel i runs at  w_i = -sin(theta_i) * vx + cos(theta_i) * vy + R * omega
/// and the three results are scaled down together if any exceeds full speed.
class OmniKinematics {
public:
    explicit OmniKinematics(double wheel_radius = 1.0);

    /// Forward transform. Out-of-range input is brought back only by the uniform
    /// rescale; non-finite input yields DriveErrc::invalid_velocity and leaves
    /// speeds untouched.
    boost::system::error_code computeWheelSpeeds(const RobotVelocity& velocity, WheelSpeeds& speeds) const;

    /// Forward transform without the saturation rescale.
    WheelSpeeds rawWheelSpeeds(const RobotVelocity& velocity) const;

    /// Inverse transform, for telemetry.
    RobotVelocity computeRobotVelocity(const WheelSpeeds& speeds) const;

    /// Divide all speeds by the largest magnitude when that exceeds 1.
    static void normalize(WheelSpeeds& speeds);

    static const std::array<double, 3>& wheelAngles();
    double wheelRadius() const { return wheel_radius_; }

private:
    double wheel_radius_;
};

}  // namespace taubert

#endif // TAUBERT__OMNI_KINEMATICS_HPP_
