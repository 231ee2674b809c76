#include "taubert/omni_kinematics.hpp"
#include "taubert/error.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace taubert {

namespace {

constexpr double kPi = 3.14159265358979323846;

}  // namespace

OmniKinematics::OmniKinematics(double wheel_radius)
    : wheel_radius_(wheel_radius)
{
    if (!std::isfinite(wheel_radius_) || wheel_radius_ <= 0.0)
    {
        throw std::invalid_argument("OmniKinematics: wheel_radius must be positive");
    }
}

const std::array<double, 3>& OmniKinematics::wheelAngles()
{
    static const std::array<double, 3> angles = {0.0, 2.0 * kPi / 3.0, 4.0 * kPi / 3.0};
    return angles;
}

WheelSpeeds OmniKinematics::rawWheelSpeeds(const RobotVelocity& velocity) const
{
    // One snapshot of the inputs feeds all three rows
    const double vx = velocity.vx;
    const double vy = velocity.vy;
    const double omega = velocity.omega;
    const double R = wheel_radius_;

    WheelSpeeds speeds;
    for (std::size_t i = 0; i < speeds.size(); ++i)
    {
        const double theta = wheelAngles()[i];
        speeds[i] = -std::sin(theta) * vx + std::cos(theta) * vy + R * omega;
    }
    return speeds;
}

void OmniKinematics::normalize(WheelSpeeds& speeds)
{
    double peak = 0.0;
    for (double w : speeds)
    {
        peak = std::max(peak, std::abs(w));
    }
    if (peak > 1.0)
    {
        for (double& w : speeds)
        {
            w /= peak;
        }
    }
}

boost::system::error_code OmniKinematics::computeWheelSpeeds(const RobotVelocity& velocity,
                                                             WheelSpeeds& speeds) const
{
    if (!std::isfinite(velocity.vx) || !std::isfinite(velocity.vy) || !std::isfinite(velocity.omega))
    {
        return DriveErrc::invalid_velocity;
    }
    WheelSpeeds raw = rawWheelSpeeds(velocity);
    // Finite but huge inputs can still overflow a row
    for (double w : raw)
    {
        if (!std::isfinite(w))
        {
            return DriveErrc::invalid_velocity;
        }
    }
    normalize(raw);
    speeds = raw;
    return {};
}

RobotVelocity OmniKinematics::computeRobotVelocity(const WheelSpeeds& speeds) const
{
    // Closed form for the symmetric layout: sum(sin^2) = sum(cos^2) = 3/2, cross terms vanish
    RobotVelocity v;
    double sum = 0.0;
    for (std::size_t i = 0; i < speeds.size(); ++i)
    {
        const double theta = wheelAngles()[i];
        v.vx += -std::sin(theta) * speeds[i];
        v.vy += std::cos(theta) * speeds[i];
        sum += speeds[i];
    }
    v.vx *= 2.0 / 3.0;
    v.vy *= 2.0 / 3.0;
    v.omega = sum / (3.0 * wheel_radius_);
    return v;
}

}  // namespace taubert
