#ifndef TAUBERT__MOTOR_LINK_HPP_
#define TAUBERT__MOTOR_LINK_HPP_

#include "taubert/protocol_frame.hpp"
#include "taubert/serial_transport.hpp"

#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace taubert {

/// Sole owner of the serial handle shared by every motor on the bus.
/// The bus is half-duplex, so a request and its response form one unit:
/// exchange() holds the bus lock across both. sendFrame() and readFrame()
/// lock individually.
class MotorLink {
public:
  explicit MotorLink(std::unique_ptr<SerialTransport> transport = std::make_unique<AsioSerialTransport>());
  ~MotorLink();

  MotorLink(const MotorLink &) = delete;
  MotorLink & operator=(const MotorLink &) = delete;

  /// Opening an already open link is a no-op that succeeds.
  boost::system::error_code open(const std::string & port_name, unsigned int baud_rate);

  /// Safe to call when already closed.
  void close();

  bool isOpen() const;

  boost::system::error_code sendFrame(const ProtocolFrame & frame);
  boost::system::error_code readFrame(std::chrono::milliseconds timeout, ProtocolFrame & frame);

  /// Write request then read one response, without letting other traffic in between.
  boost::system::error_code exchange(
    const ProtocolFrame & request, std::chrono::milliseconds timeout, ProtocolFrame & response);

  const std::string & portName() const {return port_name_;}

private:
  boost::system::error_code sendLocked(const ProtocolFrame & frame);
  boost::system::error_code readLocked(std::chrono::milliseconds timeout, ProtocolFrame & frame);
  // Drop bytes up to the next plausible frame start.
  void resync();
  void closeLocked();

  std::unique_ptr<SerialTransport> transport_;
  mutable std::mutex bus_mutex_;
  std::vector<uint8_t> rx_buffer_;
  std::string port_name_;
};

}  // namespace taubert

#endif  // TAUBERT__MOTOR_LINK_HPP_
