// protocol_frame.hpp
#ifndef TAUBERT__PROTOCOL_FRAME_HPP_
#define TAUBERT__PROTOCOL_FRAME_HPP_

#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace taubert {

/// STS3215 serial bus protocol constants.
namespace sts {

constexpr uint8_t kHeader = 0xFF;
constexpr uint8_t kMaxServoId = 0xFD;
constexpr uint8_t kMinLength = 2;
constexpr uint8_t kMaxLength = 250;

// Instructions
constexpr uint8_t kPing = 0x01;
constexpr uint8_t kRead = 0x02;
constexpr uint8_t kWrite = 0x03;

// Control table
constexpr uint8_t kRegOperatingMode = 0x21;
constexpr uint8_t kRegTorqueEnable = 0x28;
constexpr uint8_t kRegGoalSpeed = 0x2E;
constexpr uint8_t kRegPresentPosition = 0x38;
constexpr uint8_t kStatusBlockSize = 8;
constexpr unsigned int kLoadSignBit = 10;

constexpr uint8_t kModeWheel = 1;

}  // namespace sts

/// One protocol message: `FF FF ID LEN INSTR PARAM... CHK`.
/// For status (response) frames `instruction` carries the servo error byte.
struct ProtocolFrame
{
  uint8_t id = 0;
  uint8_t instruction = 0;
  std::vector<uint8_t> params;
};

class FrameCodec {
public:
  /// Low byte of the complement of the sum of [begin, end).
  static uint8_t checksum(const uint8_t * begin, const uint8_t * end);

  /// Build the wire bytes, e.g. "FF FF 01 05 03 2E 00 02 C6".
  /// Throws std::invalid_argument when params do not fit the length byte.
  static std::vector<uint8_t> encode(const ProtocolFrame & frame);

  /// Decode exactly one frame from bytes.
  /// Checks, in order: header, checksum, declared length against size.
  /// Any single corrupted byte after the header therefore reports
  /// LinkErrc::checksum_mismatch.
  static boost::system::error_code decode(
    const std::vector<uint8_t> & bytes, ProtocolFrame & frame);

  /// Sign-magnitude encoding used by the firmware. Speeds carry the sign in
  /// bit 15; the present load register carries it in bit 10.
  static uint16_t toSignMagnitude(int32_t value);
  static int32_t fromSignMagnitude(uint16_t raw, unsigned int sign_bit = 15);

  /// Space separated upper case hex, for logs.
  static std::string toHex(const std::vector<uint8_t> & bytes);

  static ProtocolFrame makePing(uint8_t id);
  static ProtocolFrame makeRead(uint8_t id, uint8_t address, uint8_t length);
  static ProtocolFrame makeWrite(uint8_t id, uint8_t address, const std::vector<uint8_t> & data);
  static ProtocolFrame makeWriteWord(uint8_t id, uint8_t address, uint16_t value);
};

}  // namespace taubert

#endif  // TAUBERT__PROTOCOL_FRAME_HPP_
