#include "taubert/omni_drive.hpp"
#include "taubert/error.hpp"

#include <rclcpp/rclcpp.hpp>

#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace taubert {

namespace {

rclcpp::Logger logger()
{
  return rclcpp::get_logger("taubert.omni_drive");
}

}  // namespace

const char * toString(DriveState state)
{
  switch (state) {
    case DriveState::Idle: return "Idle";
    case DriveState::Driving: return "Driving";
  }
  return "Unknown";
}

// -------------------------
// CommandResult
// -------------------------

void CommandResult::setWheelError(std::size_t wheel, const boost::system::error_code & ec)
{
  wheel_errors_.at(wheel) = ec;
  if (ec) {
    error_ = DriveErrc::partial_command_failure;
  }
}

std::vector<std::size_t> CommandResult::failedWheels() const
{
  std::vector<std::size_t> wheels;
  if (error_ == DriveErrc::invalid_velocity) {
    return wheels;
  }
  for (std::size_t i = 0; i < wheel_errors_.size(); ++i) {
    if (wheel_errors_[i]) {
      wheels.push_back(i);
    }
  }
  return wheels;
}

std::vector<std::size_t> CommandResult::succeededWheels() const
{
  std::vector<std::size_t> wheels;
  if (error_ == DriveErrc::invalid_velocity) {
    return wheels;
  }
  for (std::size_t i = 0; i < wheel_errors_.size(); ++i) {
    if (!wheel_errors_[i]) {
      wheels.push_back(i);
    }
  }
  return wheels;
}

std::string CommandResult::describe() const
{
  if (ok()) {
    return "ok";
  }
  std::ostringstream oss;
  oss << error_.message();
  for (std::size_t wheel : failedWheels()) {
    oss << "; wheel " << wheel << ": " << wheel_errors_[wheel].message();
  }
  return oss.str();
}

// -------------------------
// OmniDrive
// -------------------------

OmniDrive::OmniDrive(
  MotorLink & link, const std::vector<MotorConfig> & motors,
  double wheel_radius, const MotorDriver::Options & options)
: kinematics_(wheel_radius)
{
  if (motors.size() != kWheelCount) {
    throw std::invalid_argument("OmniDrive requires exactly 3 motor configs");
  }
  std::set<int> ids;
  for (const auto & motor : motors) {
    if (!ids.insert(motor.servo_id).second) {
      throw std::invalid_argument(
        "OmniDrive: servo id " + std::to_string(motor.servo_id) + " used twice");
    }
    wheels_.push_back(std::make_unique<MotorDriver>(link, motor, options));
  }
}

template<typename Fn>
CommandResult OmniDrive::forEachWheel(const char * what, Fn && fn)
{
  CommandResult result;
  for (std::size_t i = 0; i < wheels_.size(); ++i) {
    const auto ec = fn(i, *wheels_[i]);
    if (ec) {
      RCLCPP_WARN(logger(), "%s failed on wheel %zu (servo %d): %s",
        what, i, wheels_[i]->config().servo_id, ec.message().c_str());
    }
    result.setWheelError(i, ec);
  }
  return result;
}

CommandResult OmniDrive::move(double vx, double vy, double omega)
{
  return move(RobotVelocity{vx, vy, omega});
}

CommandResult OmniDrive::move(const RobotVelocity & velocity)
{
  WheelSpeeds speeds;
  const auto ec = kinematics_.computeWheelSpeeds(velocity, speeds);
  if (ec) {
    RCLCPP_ERROR(logger(), "Rejected velocity vx=%f vy=%f omega=%f: %s",
      velocity.vx, velocity.vy, velocity.omega, ec.message().c_str());
    return CommandResult(ec);
  }

  auto result = forEachWheel(
    "set_speed", [&speeds](std::size_t i, MotorDriver & wheel) {
      return wheel.setSpeed(speeds[i]);
    });

  // Only wheels that accepted the command change their last-commanded speed
  for (std::size_t i : result.succeededWheels()) {
    last_speeds_[i] = speeds[i];
  }
  updateState();

  if (result.ok()) {
    RCLCPP_INFO(logger(), "Moving with vx=%.3f vy=%.3f omega=%.3f, wheels=[%.3f %.3f %.3f]",
      velocity.vx, velocity.vy, velocity.omega, speeds[0], speeds[1], speeds[2]);
  } else {
    RCLCPP_ERROR(logger(), "Move vx=%.3f vy=%.3f omega=%.3f incomplete (%s): %s",
      velocity.vx, velocity.vy, velocity.omega, toString(state_), result.describe().c_str());
  }
  return result;
}

CommandResult OmniDrive::moveForward(double speed)
{
  return move(0.0, speed, 0.0);
}

CommandResult OmniDrive::moveBackward(double speed)
{
  return move(0.0, -speed, 0.0);
}

CommandResult OmniDrive::moveLeft(double speed)
{
  return move(-speed, 0.0, 0.0);
}

CommandResult OmniDrive::moveRight(double speed)
{
  return move(speed, 0.0, 0.0);
}

CommandResult OmniDrive::rotateClockwise(double speed)
{
  return move(0.0, 0.0, -speed);
}

CommandResult OmniDrive::rotateCounterClockwise(double speed)
{
  return move(0.0, 0.0, speed);
}

CommandResult OmniDrive::stop() noexcept
{
  CommandResult result;
  for (std::size_t i = 0; i < wheels_.size(); ++i) {
    boost::system::error_code ec;
    try {
      ec = wheels_[i]->stop();
      if (ec) {
        RCLCPP_WARN(logger(), "stop failed on wheel %zu (servo %d): %s",
          i, wheels_[i]->config().servo_id, ec.message().c_str());
      }
    } catch (const std::exception & e) {
      ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
      RCLCPP_ERROR(logger(), "stop raised on wheel %zu: %s", i, e.what());
    }
    result.setWheelError(i, ec);
  }
  last_speeds_ = WheelSpeeds{};
  const DriveState previous = state_;
  state_ = DriveState::Idle;
  if (result.ok()) {
    RCLCPP_INFO(logger(), "Stopped all motors (%s -> %s)", toString(previous), toString(state_));
  }
  return result;
}

void OmniDrive::updateState()
{
  const bool moving = last_speeds_[0] != 0.0 || last_speeds_[1] != 0.0 || last_speeds_[2] != 0.0;
  state_ = moving ? DriveState::Driving : DriveState::Idle;
}

CommandResult OmniDrive::enableWheelMode()
{
  return forEachWheel(
    "wheel mode", [](std::size_t, MotorDriver & wheel) {
      return wheel.setWheelMode();
    });
}

CommandResult OmniDrive::setTorqueEnabled(bool enabled)
{
  return forEachWheel(
    "torque", [enabled](std::size_t, MotorDriver & wheel) {
      return wheel.setTorqueEnabled(enabled);
    });
}

CommandResult OmniDrive::readVelocity(RobotVelocity & velocity)
{
  WheelSpeeds speeds{};
  auto result = forEachWheel(
    "read_status", [&speeds](std::size_t i, MotorDriver & wheel) {
      MotorStatus status;
      const auto ec = wheel.readStatus(status);
      if (!ec) {
        speeds[i] = static_cast<double>(status.speed) / wheel.options().max_speed;
      }
      return ec;
    });
  if (result.ok()) {
    velocity = kinematics_.computeRobotVelocity(speeds);
  }
  return result;
}

}  // namespace taubert
