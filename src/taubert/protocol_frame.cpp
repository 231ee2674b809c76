// protocol_frame.cpp
#include "taubert/protocol_frame.hpp"
#include "taubert/error.hpp"

#include <cstdio>   // for std::snprintf
#include <algorithm>
#include <cstdlib>  // for std::abs
#include <stdexcept>

namespace taubert {

uint8_t FrameCodec::checksum(const uint8_t * begin, const uint8_t * end)
{
  unsigned int sum = 0;
  for (const uint8_t * p = begin; p != end; ++p) {
    sum += *p;
  }
  return static_cast<uint8_t>(~sum & 0xFF);
}

std::vector<uint8_t> FrameCodec::encode(const ProtocolFrame & frame)
{
  if (frame.params.size() > sts::kMaxLength - 2u) {
    throw std::invalid_argument(
      "FrameCodec::encode: " + std::to_string(frame.params.size()) + " parameter bytes exceed " +
      std::to_string(sts::kMaxLength - 2u));
  }
  std::vector<uint8_t> bytes;
  bytes.reserve(6 + frame.params.size());
  bytes.push_back(sts::kHeader);
  bytes.push_back(sts::kHeader);
  bytes.push_back(frame.id);
  bytes.push_back(static_cast<uint8_t>(frame.params.size() + 2));
  bytes.push_back(frame.instruction);
  bytes.insert(bytes.end(), frame.params.begin(), frame.params.end());
  // Checksum covers everything after the two header bytes
  bytes.push_back(checksum(bytes.data() + 2, bytes.data() + bytes.size()));
  return bytes;
}

boost::system::error_code FrameCodec::decode(
  const std::vector<uint8_t> & bytes, ProtocolFrame & frame)
{
  if (bytes.size() < 6 || bytes[0] != sts::kHeader || bytes[1] != sts::kHeader) {
    return LinkErrc::bad_header;
  }

  const uint8_t * body = bytes.data() + 2;
  const uint8_t * chk = bytes.data() + bytes.size() - 1;
  if (checksum(body, chk) != *chk) {
    return LinkErrc::checksum_mismatch;
  }

  const std::size_t length = bytes[3];
  if (length < sts::kMinLength || length + 4 != bytes.size()) {
    return LinkErrc::bad_length;
  }

  frame.id = bytes[2];
  frame.instruction = bytes[4];
  frame.params.assign(bytes.begin() + 5, bytes.end() - 1);
  return {};
}

uint16_t FrameCodec::toSignMagnitude(int32_t value)
{
  // Clamp first so the magnitude never overflows
  const int32_t limited = std::max<int32_t>(-0x7FFF, std::min<int32_t>(0x7FFF, value));
  uint16_t raw = static_cast<uint16_t>(std::abs(limited));
  if (limited < 0) {
    raw |= 0x8000;
  }
  return raw;
}

int32_t FrameCodec::fromSignMagnitude(uint16_t raw, unsigned int sign_bit)
{
  const uint16_t sign = static_cast<uint16_t>(1u << sign_bit);
  const int32_t magnitude = raw & (sign - 1u);
  return (raw & sign) ? -magnitude : magnitude;
}

std::string FrameCodec::toHex(const std::vector<uint8_t> & bytes)
{
  std::string out;
  out.reserve(bytes.size() * 3);
  char buf[4];
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    std::snprintf(buf, sizeof(buf), "%02X", bytes[i]);
    if (i != 0) {
      out += ' ';
    }
    out += buf;
  }
  return out;
}

ProtocolFrame FrameCodec::makePing(uint8_t id)
{
  return ProtocolFrame{id, sts::kPing, {}};
}

ProtocolFrame FrameCodec::makeRead(uint8_t id, uint8_t address, uint8_t length)
{
  return ProtocolFrame{id, sts::kRead, {address, length}};
}

ProtocolFrame FrameCodec::makeWrite(uint8_t id, uint8_t address, const std::vector<uint8_t> & data)
{
  ProtocolFrame frame{id, sts::kWrite, {address}};
  frame.params.insert(frame.params.end(), data.begin(), data.end());
  return frame;
}

ProtocolFrame FrameCodec::makeWriteWord(uint8_t id, uint8_t address, uint16_t value)
{
  // Little-endian on the wire
  return makeWrite(
    id, address,
    {static_cast<uint8_t>(value & 0xFF), static_cast<uint8_t>((value >> 8) & 0xFF)});
}

}  // namespace taubert
