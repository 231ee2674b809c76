#include "taubert/motor_link.hpp"
#include "taubert/error.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <stdexcept>

namespace taubert {

namespace {

rclcpp::Logger logger()
{
  return rclcpp::get_logger("taubert.motor_link");
}

bool isTimeout(const boost::system::error_code & ec)
{
  return ec == boost::asio::error::timed_out || ec == boost::asio::error::operation_aborted;
}

}  // namespace

MotorLink::MotorLink(std::unique_ptr<SerialTransport> transport)
: transport_(std::move(transport))
{
  if (!transport_) {
    throw std::invalid_argument("MotorLink requires a transport");
  }
}

MotorLink::~MotorLink()
{
  close();
}

boost::system::error_code MotorLink::open(const std::string & port_name, unsigned int baud_rate)
{
  std::lock_guard<std::mutex> lock(bus_mutex_);
  if (transport_->isOpen()) {
    RCLCPP_DEBUG(logger(), "Link to %s already open", port_name_.c_str());
    return {};
  }

  const auto ec = transport_->open(port_name, baud_rate);
  if (ec) {
    RCLCPP_ERROR(logger(), "Failed to open %s: %s", port_name.c_str(), ec.message().c_str());
    return LinkErrc::open_failed;
  }
  port_name_ = port_name;
  rx_buffer_.clear();
  RCLCPP_INFO(logger(), "Link open: %s @ %u baud", port_name.c_str(), baud_rate);
  return {};
}

void MotorLink::close()
{
  std::lock_guard<std::mutex> lock(bus_mutex_);
  closeLocked();
}

void MotorLink::closeLocked()
{
  if (!transport_->isOpen()) {
    return;
  }
  transport_->close();
  rx_buffer_.clear();
  RCLCPP_INFO(logger(), "Link to %s closed", port_name_.c_str());
}

bool MotorLink::isOpen() const
{
  std::lock_guard<std::mutex> lock(bus_mutex_);
  return transport_->isOpen();
}

boost::system::error_code MotorLink::sendFrame(const ProtocolFrame & frame)
{
  std::lock_guard<std::mutex> lock(bus_mutex_);
  return sendLocked(frame);
}

boost::system::error_code MotorLink::readFrame(
  std::chrono::milliseconds timeout, ProtocolFrame & frame)
{
  std::lock_guard<std::mutex> lock(bus_mutex_);
  return readLocked(timeout, frame);
}

boost::system::error_code MotorLink::exchange(
  const ProtocolFrame & request, std::chrono::milliseconds timeout, ProtocolFrame & response)
{
  std::lock_guard<std::mutex> lock(bus_mutex_);
  if (!transport_->isOpen()) {
    return LinkErrc::not_open;
  }
  // Anything still buffered belongs to an earlier, abandoned exchange
  transport_->discardInput();
  rx_buffer_.clear();

  auto ec = sendLocked(request);
  if (ec) {
    return ec;
  }
  return readLocked(timeout, response);
}

boost::system::error_code MotorLink::sendLocked(const ProtocolFrame & frame)
{
  if (!transport_->isOpen()) {
    return LinkErrc::not_open;
  }
  const auto bytes = FrameCodec::encode(frame);
  RCLCPP_DEBUG(logger(), "TX %s", FrameCodec::toHex(bytes).c_str());

  const auto ec = transport_->write(bytes);
  if (ec) {
    RCLCPP_ERROR(logger(), "Write error on %s: %s", port_name_.c_str(), ec.message().c_str());
    closeLocked();
    return LinkErrc::io_error;
  }
  return {};
}

void MotorLink::resync()
{
  // A frame starts with FF FF followed by an addressable id (not FF)
  std::size_t start = 0;
  while (start < rx_buffer_.size()) {
    if (rx_buffer_[start] != sts::kHeader) {
      ++start;
      continue;
    }
    if (start + 1 < rx_buffer_.size() && rx_buffer_[start + 1] != sts::kHeader) {
      ++start;
      continue;
    }
    if (start + 2 < rx_buffer_.size() && rx_buffer_[start + 2] == sts::kHeader) {
      ++start;
      continue;
    }
    break;
  }
  rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + start);
}

boost::system::error_code MotorLink::readLocked(
  std::chrono::milliseconds timeout, ProtocolFrame & frame)
{
  if (!transport_->isOpen()) {
    return LinkErrc::not_open;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  uint8_t chunk[64];

  for (;;) {
    resync();

    if (rx_buffer_.size() >= 4) {
      const uint8_t length = rx_buffer_[3];
      if (length < sts::kMinLength || length > sts::kMaxLength) {
        RCLCPP_DEBUG(logger(), "Skipping header with implausible length %u", length);
        rx_buffer_.erase(rx_buffer_.begin());
        continue;
      }
      const std::size_t total = 4u + length;
      if (rx_buffer_.size() >= total) {
        std::vector<uint8_t> raw(rx_buffer_.begin(), rx_buffer_.begin() + total);
        rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + total);
        RCLCPP_DEBUG(logger(), "RX %s", FrameCodec::toHex(raw).c_str());

        const auto ec = FrameCodec::decode(raw, frame);
        if (ec) {
          RCLCPP_WARN(logger(), "Discarding frame %s: %s",
            FrameCodec::toHex(raw).c_str(), ec.message().c_str());
        }
        return ec;
      }
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return LinkErrc::timeout;
    }
    const auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
      std::chrono::milliseconds(1);

    boost::system::error_code ec;
    const std::size_t n = transport_->readSome(chunk, sizeof(chunk), remaining, ec);
    if (ec) {
      if (isTimeout(ec)) {
        return LinkErrc::timeout;
      }
      RCLCPP_ERROR(logger(), "Read error on %s: %s", port_name_.c_str(), ec.message().c_str());
      closeLocked();
      return LinkErrc::io_error;
    }
    rx_buffer_.insert(rx_buffer_.end(), chunk, chunk + n);
  }
}

}  // namespace taubert
