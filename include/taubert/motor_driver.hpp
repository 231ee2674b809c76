#ifndef TAUBERT__MOTOR_DRIVER_HPP_
#define TAUBERT__MOTOR_DRIVER_HPP_

#include "taubert/motor_link.hpp"

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace taubert {

/// Identity of one physical motor on the bus.
struct MotorConfig
{
  int servo_id = 1;
  std::string port = "/dev/ttyAMA0";
  unsigned int baudrate = 115200;

  /// Throws std::invalid_argument when a field is out of range.
  void validate() const;
};

/// Snapshot of the servo's present-state block.
struct MotorStatus
{
  uint16_t position = 0;
  int32_t speed = 0;
  int32_t load = 0;
  uint8_t voltage = 0;
  uint8_t temperature = 0;
  uint8_t error_flags = 0;
};

/// Addresses one servo id over a shared MotorLink.
/// The link is not owned; it must outlive the driver.
class MotorDriver {
public:
  struct Options
  {
    int max_speed = 1023;
    std::chrono::milliseconds response_timeout{20};
    int max_retries = 1;
    bool await_ack = true;
  };

  MotorDriver(MotorLink & link, const MotorConfig & config);
  MotorDriver(MotorLink & link, const MotorConfig & config, const Options & options);

  /// fraction is clamped to [-1, 1].
  boost::system::error_code setSpeed(double fraction);

  /// setSpeed(0.0), attempted regardless of link state.
  boost::system::error_code stop();

  /// Re-send the last commanded speed.
  boost::system::error_code resend();

  boost::system::error_code readStatus(MotorStatus & status);
  boost::system::error_code ping();
  boost::system::error_code setWheelMode();
  boost::system::error_code setTorqueEnabled(bool enabled);

  double lastCommandedSpeed() const {return last_speed_;}
  const MotorConfig & config() const {return config_;}
  const Options & options() const {return options_;}
  uint8_t servoId() const {return static_cast<uint8_t>(config_.servo_id);}

  /// Raw goal-speed units for a fraction; clamps to [-1, 1] first.
  int32_t toRawSpeed(double fraction) const;

private:
  boost::system::error_code sendSpeed(double fraction);
  // Send and, when acknowledgments are on, wait for the status frame.
  boost::system::error_code command(const ProtocolFrame & request);
  boost::system::error_code transact(const ProtocolFrame & request, ProtocolFrame & response);
  boost::system::error_code transactOnce(const ProtocolFrame & request, ProtocolFrame & response);
  boost::system::error_code checkStatus(const ProtocolFrame & response) const;

  MotorLink & link_;
  const MotorConfig config_;
  const Options options_;
  double last_speed_ = 0.0;
};

}  // namespace taubert

#endif  // TAUBERT__MOTOR_DRIVER_HPP_
