#ifndef TAUBERT__OMNI_DRIVE_HPP_
#define TAUBERT__OMNI_DRIVE_HPP_

#include "taubert/motor_driver.hpp"
#include "taubert/omni_kinematics.hpp"

#include <boost/system/error_code.hpp>
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace taubert {

enum class DriveState {
  Idle,
  Driving,
};

const char * toString(DriveState state);

/// Outcome of a command fanned out to the three wheels.
class CommandResult {
public:
  CommandResult() = default;
  explicit CommandResult(const boost::system::error_code & error) : error_(error) {}

  void setWheelError(std::size_t wheel, const boost::system::error_code & ec);

  /// Success, DriveErrc::invalid_velocity or DriveErrc::partial_command_failure.
  const boost::system::error_code & error() const {return error_;}
  bool ok() const {return !error_;}

  const boost::system::error_code & wheelError(std::size_t wheel) const {return wheel_errors_.at(wheel);}
  std::vector<std::size_t> failedWheels() const;
  std::vector<std::size_t> succeededWheels() const;

  std::string describe() const;

private:
  boost::system::error_code error_;
  std::array<boost::system::error_code, 3> wheel_errors_;
};

/// Three-wheel holonomic base.
/// Wheel i is driven by the i-th motor config. Commands go out in wheel
/// order on the caller's thread; a failure on one wheel never stops the
/// others from being commanded.
class OmniDrive {
public:
  static constexpr std::size_t kWheelCount = 3;

  OmniDrive(
    MotorLink & link, const std::vector<MotorConfig> & motors,
    double wheel_radius = 1.0, const MotorDriver::Options & options = MotorDriver::Options{});

  CommandResult move(double vx, double vy, double omega);
  CommandResult move(const RobotVelocity & velocity);

  CommandResult moveForward(double speed = 0.5);
  CommandResult moveBackward(double speed = 0.5);
  CommandResult moveLeft(double speed = 0.5);
  CommandResult moveRight(double speed = 0.5);
  /// Clockwise seen from above, i.e. negative omega.
  CommandResult rotateClockwise(double speed = 0.5);
  CommandResult rotateCounterClockwise(double speed = 0.5);

  /// Commands zero on every wheel, each attempted on its own, and always ends Idle.
  CommandResult stop() noexcept;

  CommandResult enableWheelMode();
  CommandResult setTorqueEnabled(bool enabled);

  /// Read wheel speeds back and apply the inverse kinematics.
  CommandResult readVelocity(RobotVelocity & velocity);

  DriveState state() const {return state_;}
  const WheelSpeeds & lastWheelSpeeds() const {return last_speeds_;}
  const OmniKinematics & kinematics() const {return kinematics_;}
  MotorDriver & wheel(std::size_t index) {return *wheels_.at(index);}

private:
  template<typename Fn>
  CommandResult forEachWheel(const char * what, Fn && fn);
  // Driving while any wheel's last accepted speed is nonzero
  void updateState();

  OmniKinematics kinematics_;
  std::vector<std::unique_ptr<MotorDriver>> wheels_;
  WheelSpeeds last_speeds_{};
  DriveState state_ = DriveState::Idle;
};

}  // namespace taubert

#endif  // TAUBERT__OMNI_DRIVE_HPP_
