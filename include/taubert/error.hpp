#ifndef TAUBERT__ERROR_HPP_
#define TAUBERT__ERROR_HPP_

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace taubert {

/// Failures of the serial link and the frame layer.
enum class LinkErrc {
  open_failed = 1,
  not_open,
  timeout,
  checksum_mismatch,
  bad_header,
  bad_length,
  io_error,
};

/// Failures of a single addressed motor.
enum class MotorErrc {
  disconnected = 1,
  timeout,
  checksum_mismatch,
  unexpected_servo_id,
  malformed_response,
  servo_fault,
};

/// Failures of a whole-robot drive command.
enum class DriveErrc {
  invalid_velocity = 1,
  partial_command_failure,
};

const boost::system::error_category & link_category() noexcept;
const boost::system::error_category & motor_category() noexcept;
const boost::system::error_category & drive_category() noexcept;

boost::system::error_code make_error_code(LinkErrc e) noexcept;
boost::system::error_code make_error_code(MotorErrc e) noexcept;
boost::system::error_code make_error_code(DriveErrc e) noexcept;

/// Translate a link-level error into what the motor driver reports.
boost::system::error_code toMotorError(const boost::system::error_code & link_ec);

}  // namespace taubert

namespace boost {
namespace system {

template<>
struct is_error_code_enum<taubert::LinkErrc>: std::true_type {};
template<>
struct is_error_code_enum<taubert::MotorErrc>: std::true_type {};
template<>
struct is_error_code_enum<taubert::DriveErrc>: std::true_type {};

}  // namespace system
}  // namespace boost

#endif  // TAUBERT__ERROR_HPP_
