#include "taubert/robot.hpp"

#include <rclcpp/rclcpp.hpp>

#include <thread>

namespace taubert {

namespace {

rclcpp::Logger logger()
{
  return rclcpp::get_logger("taubert.robot");
}

}  // namespace

std::vector<MotorConfig> RobotConfig::motorConfigs() const
{
  std::vector<MotorConfig> motors;
  for (int id : servo_ids) {
    MotorConfig motor;
    motor.servo_id = id;
    motor.port = port;
    motor.baudrate = baudrate;
    motors.push_back(motor);
  }
  return motors;
}

Robot::Robot(const RobotConfig & config)
: Robot(config, std::make_unique<AsioSerialTransport>())
{
}

Robot::Robot(const RobotConfig & config, std::unique_ptr<SerialTransport> transport)
: config_(config),
  link_(std::make_unique<MotorLink>(std::move(transport))),
  omni_drive_(std::make_unique<OmniDrive>(
      *link_, config_.motorConfigs(), config_.wheel_radius, config_.driver))
{
}

Robot::~Robot()
{
  disconnect();
}

bool Robot::connect()
{
  const auto ec = link_->open(config_.port, config_.baudrate);
  if (ec) {
    RCLCPP_ERROR(logger(), "Failed to connect on %s: %s",
      config_.port.c_str(), ec.message().c_str());
    return false;
  }
  RCLCPP_INFO(logger(), "Connected on %s (servos %d, %d, %d)", config_.port.c_str(),
    omni_drive_->wheel(0).config().servo_id,
    omni_drive_->wheel(1).config().servo_id,
    omni_drive_->wheel(2).config().servo_id);
  return true;
}

void Robot::disconnect()
{
  if (!link_->isOpen()) {
    return;
  }
  const auto result = omni_drive_->stop();
  if (!result.ok()) {
    RCLCPP_WARN(logger(), "Stop before disconnect incomplete: %s", result.describe().c_str());
  }
  link_->close();
  RCLCPP_INFO(logger(), "Disconnected from %s", link_->portName().c_str());
}

CommandResult Robot::stop()
{
  return omni_drive_->stop();
}

CommandResult Robot::enableTorque(bool enabled)
{
  if (enabled) {
    const auto mode = omni_drive_->enableWheelMode();
    if (!mode.ok()) {
      return mode;
    }
  }
  return omni_drive_->setTorqueEnabled(enabled);
}

ConnectionState Robot::connectionState() const
{
  return link_->isOpen() ? ConnectionState::Connected : ConnectionState::Disconnected;
}

void Robot::demoMovement(std::chrono::milliseconds duration)
{
  RCLCPP_INFO(logger(), "Starting movement demonstration");

  struct Step
  {
    const char * label;
    CommandResult (OmniDrive::* action)(double);
  };
  const Step steps[] = {
    {"Moving forward", &OmniDrive::moveForward},
    {"Moving backward", &OmniDrive::moveBackward},
    {"Moving left", &OmniDrive::moveLeft},
    {"Moving right", &OmniDrive::moveRight},
    {"Rotating clockwise", &OmniDrive::rotateClockwise},
    {"Rotating counterclockwise", &OmniDrive::rotateCounterClockwise},
  };

  for (const auto & step : steps) {
    RCLCPP_INFO(logger(), "%s", step.label);
    const auto result = ((*omni_drive_).*step.action)(0.5);
    if (!result.ok()) {
      RCLCPP_WARN(logger(), "%s: %s", step.label, result.describe().c_str());
    }
    std::this_thread::sleep_for(duration);
  }

  const auto stopped = stop();
  if (!stopped.ok()) {
    RCLCPP_WARN(logger(), "Stop after demonstration incomplete: %s", stopped.describe().c_str());
  }
  RCLCPP_INFO(logger(), "Movement demonstration completed");
}

}  // namespace taubert
