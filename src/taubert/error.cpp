#include "taubert/error.hpp"

#include <string>

namespace taubert {

namespace {

class LinkCategory : public boost::system::error_category
{
public:
  const char * name() const noexcept override {return "taubert.link";}

  std::string message(int ev) const override
  {
    switch (static_cast<LinkErrc>(ev)) {
      case LinkErrc::open_failed: return "serial port could not be opened";
      case LinkErrc::not_open: return "serial link is not open";
      case LinkErrc::timeout: return "timed out waiting for a frame";
      case LinkErrc::checksum_mismatch: return "frame checksum mismatch";
      case LinkErrc::bad_header: return "frame header is invalid";
      case LinkErrc::bad_length: return "frame length does not match its length field";
      case LinkErrc::io_error: return "serial I/O error";
    }
    return "unknown link error";
  }
};

class MotorCategory : public boost::system::error_category
{
public:
  const char * name() const noexcept override {return "taubert.motor";}

  std::string message(int ev) const override
  {
    switch (static_cast<MotorErrc>(ev)) {
      case MotorErrc::disconnected: return "motor link is disconnected";
      case MotorErrc::timeout: return "motor did not respond in time";
      case MotorErrc::checksum_mismatch: return "motor response failed its checksum";
      case MotorErrc::unexpected_servo_id: return "response came from a different servo id";
      case MotorErrc::malformed_response: return "motor response is malformed";
      case MotorErrc::servo_fault: return "servo reported an error status";
    }
    return "unknown motor error";
  }
};

class DriveCategory : public boost::system::error_category
{
public:
  const char * name() const noexcept override {return "taubert.drive";}

  std::string message(int ev) const override
  {
    switch (static_cast<DriveErrc>(ev)) {
      case DriveErrc::invalid_velocity: return "velocity component is not finite";
      case DriveErrc::partial_command_failure: return "command failed on one or more wheels";
    }
    return "unknown drive error";
  }
};

}  // namespace

const boost::system::error_category & link_category() noexcept
{
  static const LinkCategory category;
  return category;
}

const boost::system::error_category & motor_category() noexcept
{
  static const MotorCategory category;
  return category;
}

const boost::system::error_category & drive_category() noexcept
{
  static const DriveCategory category;
  return category;
}

boost::system::error_code make_error_code(LinkErrc e) noexcept
{
  return {static_cast<int>(e), link_category()};
}

boost::system::error_code make_error_code(MotorErrc e) noexcept
{
  return {static_cast<int>(e), motor_category()};
}

boost::system::error_code make_error_code(DriveErrc e) noexcept
{
  return {static_cast<int>(e), drive_category()};
}

boost::system::error_code toMotorError(const boost::system::error_code & link_ec)
{
  if (!link_ec || link_ec.category() != link_category()) {
    return link_ec;
  }
  switch (static_cast<LinkErrc>(link_ec.value())) {
    case LinkErrc::timeout:
      return MotorErrc::timeout;
    case LinkErrc::checksum_mismatch:
      return MotorErrc::checksum_mismatch;
    case LinkErrc::bad_header:
    case LinkErrc::bad_length:
      return MotorErrc::malformed_response;
    case LinkErrc::open_failed:
    case LinkErrc::not_open:
    case LinkErrc::io_error:
      return MotorErrc::disconnected;
  }
  return MotorErrc::disconnected;
}

}  // namespace taubert
