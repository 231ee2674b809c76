#ifndef TAUBERT__ROBOT_HPP_
#define TAUBERT__ROBOT_HPP_

#include "taubert/motor_link.hpp"
#include "taubert/omni_drive.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace taubert {

enum class ConnectionState {
  Disconnected,
  Connected,
};

struct RobotConfig
{
  std::string port = "/dev/ttyAMA0";
  unsigned int baudrate = 115200;
  std::vector<int> servo_ids = {1, 2, 3};
  double wheel_radius = 1.0;
  MotorDriver::Options driver;

  std::vector<MotorConfig> motorConfigs() const;
};

/// Connection lifecycle around one omni drive.
class Robot {
public:
  explicit Robot(const RobotConfig & config = RobotConfig{});
  Robot(const RobotConfig & config, std::unique_ptr<SerialTransport> transport);
  ~Robot();

  Robot(const Robot &) = delete;
  Robot & operator=(const Robot &) = delete;

  /// Open the link. On failure the robot stays Disconnected.
  bool connect();

  /// Best-effort stop, then close. Idempotent.
  void disconnect();

  CommandResult stop();
  CommandResult enableTorque(bool enabled);

  /// Forward, backward, left, right, clockwise, counter-clockwise, stop.
  void demoMovement(std::chrono::milliseconds duration = std::chrono::seconds(1));

  ConnectionState connectionState() const;
  bool isConnected() const {return connectionState() == ConnectionState::Connected;}

  OmniDrive & omniDrive() {return *omni_drive_;}
  const RobotConfig & config() const {return config_;}

private:
  RobotConfig config_;
  std::unique_ptr<MotorLink> link_;
  std::unique_ptr<OmniDrive> omni_drive_;
};

}  // namespace taubert

#endif  // TAUBERT__ROBOT_HPP_
