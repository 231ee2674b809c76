#include "taubert/motor_driver.hpp"
#include "taubert/error.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace taubert {

namespace {

rclcpp::Logger logger()
{
  return rclcpp::get_logger("taubert.motor_driver");
}

inline double clampd(double x, double lo, double hi)
{
  return std::max(lo, std::min(hi, x));
}

bool isRetryable(const boost::system::error_code & ec)
{
  return ec == MotorErrc::timeout || ec == MotorErrc::checksum_mismatch;
}

}  // namespace

void MotorConfig::validate() const
{
  if (servo_id < 0 || servo_id > sts::kMaxServoId) {
    throw std::invalid_argument(
      "MotorConfig: servo_id " + std::to_string(servo_id) + " outside 0.." +
      std::to_string(sts::kMaxServoId));
  }
  if (port.empty()) {
    throw std::invalid_argument("MotorConfig: port must not be empty");
  }
  if (baudrate == 0) {
    throw std::invalid_argument("MotorConfig: baudrate must be positive");
  }
}

MotorDriver::MotorDriver(MotorLink & link, const MotorConfig & config)
: MotorDriver(link, config, Options{})
{
}

MotorDriver::MotorDriver(MotorLink & link, const MotorConfig & config, const Options & options)
: link_(link), config_(config), options_(options)
{
  config_.validate();
  if (options_.max_speed <= 0 || options_.max_speed > 0x7FFF) {
    throw std::invalid_argument("MotorDriver: max_speed must be in 1..32767");
  }
  if (options_.max_retries < 0) {
    throw std::invalid_argument("MotorDriver: max_retries must not be negative");
  }
}

int32_t MotorDriver::toRawSpeed(double fraction) const
{
  const double f = std::isfinite(fraction) ? clampd(fraction, -1.0, 1.0) : 0.0;
  return static_cast<int32_t>(std::lround(f * options_.max_speed));
}

boost::system::error_code MotorDriver::setSpeed(double fraction)
{
  if (!std::isfinite(fraction)) {
    return DriveErrc::invalid_velocity;
  }
  last_speed_ = clampd(fraction, -1.0, 1.0);
  return sendSpeed(last_speed_);
}

boost::system::error_code MotorDriver::stop()
{
  last_speed_ = 0.0;
  return sendSpeed(0.0);
}

boost::system::error_code MotorDriver::resend()
{
  return sendSpeed(last_speed_);
}

boost::system::error_code MotorDriver::sendSpeed(double fraction)
{
  const int32_t raw = toRawSpeed(fraction);
  RCLCPP_DEBUG(logger(), "Servo %d -> speed %.3f (raw %d)", config_.servo_id, fraction, raw);
  const auto ec = command(
    FrameCodec::makeWriteWord(servoId(), sts::kRegGoalSpeed, FrameCodec::toSignMagnitude(raw)));
  if (ec) {
    RCLCPP_WARN(logger(), "Servo %d speed command failed: %s",
      config_.servo_id, ec.message().c_str());
  }
  return ec;
}

boost::system::error_code MotorDriver::readStatus(MotorStatus & status)
{
  ProtocolFrame response;
  const auto ec = transact(
    FrameCodec::makeRead(servoId(), sts::kRegPresentPosition, sts::kStatusBlockSize), response);
  if (ec) {
    return ec;
  }
  const auto & p = response.params;
  if (p.size() != sts::kStatusBlockSize) {
    return MotorErrc::malformed_response;
  }
  status.position = static_cast<uint16_t>(p[0] | (p[1] << 8));
  status.speed = FrameCodec::fromSignMagnitude(static_cast<uint16_t>(p[2] | (p[3] << 8)));
  status.load = FrameCodec::fromSignMagnitude(
    static_cast<uint16_t>(p[4] | (p[5] << 8)), sts::kLoadSignBit);
  status.voltage = p[6];
  status.temperature = p[7];
  status.error_flags = response.instruction;
  return {};
}

boost::system::error_code MotorDriver::ping()
{
  ProtocolFrame response;
  const auto ec = transact(FrameCodec::makePing(servoId()), response);
  return ec ? ec : checkStatus(response);
}

boost::system::error_code MotorDriver::setWheelMode()
{
  return command(FrameCodec::makeWrite(servoId(), sts::kRegOperatingMode, {sts::kModeWheel}));
}

boost::system::error_code MotorDriver::setTorqueEnabled(bool enabled)
{
  return command(
    FrameCodec::makeWrite(
      servoId(), sts::kRegTorqueEnable, {static_cast<uint8_t>(enabled ? 1 : 0)}));
}

boost::system::error_code MotorDriver::command(const ProtocolFrame & request)
{
  if (!options_.await_ack) {
    if (!link_.isOpen()) {
      return MotorErrc::disconnected;
    }
    return toMotorError(link_.sendFrame(request));
  }
  ProtocolFrame response;
  const auto ec = transact(request, response);
  return ec ? ec : checkStatus(response);
}

boost::system::error_code MotorDriver::transact(
  const ProtocolFrame & request, ProtocolFrame & response)
{
  boost::system::error_code ec;
  for (int attempt = 0; attempt <= options_.max_retries; ++attempt) {
    ec = transactOnce(request, response);
    if (!ec || !isRetryable(ec)) {
      return ec;
    }
    RCLCPP_DEBUG(logger(), "Servo %d attempt %d failed: %s",
      config_.servo_id, attempt + 1, ec.message().c_str());
  }
  return ec;
}

boost::system::error_code MotorDriver::transactOnce(
  const ProtocolFrame & request, ProtocolFrame & response)
{
  // Fail fast without touching the bus
  if (!link_.isOpen()) {
    return MotorErrc::disconnected;
  }

  const auto ec = link_.exchange(request, options_.response_timeout, response);
  if (ec) {
    return toMotorError(ec);
  }
  if (response.id != servoId()) {
    RCLCPP_WARN(logger(), "Expected reply from servo %d, got %d",
      config_.servo_id, response.id);
    return MotorErrc::unexpected_servo_id;
  }
  return {};
}

boost::system::error_code MotorDriver::checkStatus(const ProtocolFrame & response) const
{
  if (response.instruction != 0) {
    RCLCPP_WARN(logger(), "Servo %d status error 0x%02X",
      config_.servo_id, response.instruction);
    return MotorErrc::servo_fault;
  }
  return {};
}

}  // namespace taubert
