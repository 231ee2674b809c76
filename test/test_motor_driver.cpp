#include <gtest/gtest.h>

#include "fake_transport.hpp"
#include "taubert/error.hpp"
#include "taubert/motor_driver.hpp"

#include <limits>
#include <memory>
#include <stdexcept>

using taubert::DriveErrc;
using taubert::FrameCodec;
using taubert::MotorConfig;
using taubert::MotorDriver;
using taubert::MotorErrc;
using taubert::MotorLink;
using taubert::MotorStatus;
using taubert::ProtocolFrame;
using taubert::test::FakeBus;
using taubert::test::FakeTransport;
using taubert::test::statusFrame;

namespace {

MotorConfig motor(int id)
{
  MotorConfig config;
  config.servo_id = id;
  config.port = "/dev/ttyFAKE";
  return config;
}

}  // namespace

class MotorDriverTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    bus_ = std::make_shared<FakeBus>();
    bus_->responder = taubert::test::ackAll;
    link_ = std::make_unique<MotorLink>(std::make_unique<FakeTransport>(bus_));
    ASSERT_FALSE(link_->open("/dev/ttyFAKE", 115200));
  }

  std::shared_ptr<FakeBus> bus_;
  std::unique_ptr<MotorLink> link_;
};

TEST(MotorConfig, RejectsOutOfRangeFields)
{
  MotorConfig config;
  config.servo_id = 254;
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.servo_id = -1;
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.servo_id = 1;
  config.port.clear();
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.port = "/dev/ttyAMA0";
  config.baudrate = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.baudrate = 1000000;
  EXPECT_NO_THROW(config.validate());
}

TEST_F(MotorDriverTest, SetSpeedWritesGoalSpeedAddressedToServo)
{
  MotorDriver driver(*link_, motor(1));
  ASSERT_FALSE(driver.setSpeed(0.5));

  ASSERT_EQ(1u, bus_->writes.size());
  const std::vector<uint8_t> expected = {0xFF, 0xFF, 0x01, 0x05, 0x03, 0x2E, 0x00, 0x02, 0xC6};
  EXPECT_EQ(expected, bus_->writes[0]);
  EXPECT_DOUBLE_EQ(0.5, driver.lastCommandedSpeed());
}

TEST_F(MotorDriverTest, NegativeSpeedSetsDirectionBit)
{
  MotorDriver driver(*link_, motor(2));
  ASSERT_FALSE(driver.setSpeed(-1.0));
  const auto frames = bus_->writtenFrames();
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ((std::vector<uint8_t>{taubert::sts::kRegGoalSpeed, 0xFF, 0x83}), frames[0].params);
}

TEST_F(MotorDriverTest, OutOfRangeSpeedIsClamped)
{
  MotorDriver driver(*link_, motor(1));
  EXPECT_FALSE(driver.setSpeed(3.0));
  EXPECT_DOUBLE_EQ(1.0, driver.lastCommandedSpeed());
  EXPECT_EQ(1023, driver.toRawSpeed(3.0));
  EXPECT_EQ(-1023, driver.toRawSpeed(-7.0));
}

TEST_F(MotorDriverTest, NonFiniteSpeedIsRejectedWithoutIo)
{
  MotorDriver driver(*link_, motor(1));
  EXPECT_EQ(
    boost::system::error_code(DriveErrc::invalid_velocity),
    driver.setSpeed(std::numeric_limits<double>::quiet_NaN()));
  EXPECT_TRUE(bus_->writes.empty());
}

TEST_F(MotorDriverTest, StopSendsZero)
{
  MotorDriver driver(*link_, motor(3));
  ASSERT_FALSE(driver.setSpeed(0.25));
  ASSERT_FALSE(driver.stop());
  const auto frames = bus_->writtenFrames();
  ASSERT_EQ(2u, frames.size());
  EXPECT_EQ((std::vector<uint8_t>{taubert::sts::kRegGoalSpeed, 0x00, 0x00}), frames[1].params);
  EXPECT_DOUBLE_EQ(0.0, driver.lastCommandedSpeed());
}

TEST_F(MotorDriverTest, ResendRepeatsLastCommand)
{
  MotorDriver driver(*link_, motor(1));
  ASSERT_FALSE(driver.setSpeed(-0.5));
  ASSERT_FALSE(driver.resend());
  ASSERT_EQ(2u, bus_->writes.size());
  EXPECT_EQ(bus_->writes[0], bus_->writes[1]);
}

TEST_F(MotorDriverTest, WrongResponderIsUnexpectedServoId)
{
  bus_->responder = [](const ProtocolFrame &, FakeBus & bus) {
      bus.queue(statusFrame(9));
    };
  MotorDriver driver(*link_, motor(1));
  EXPECT_EQ(boost::system::error_code(MotorErrc::unexpected_servo_id), driver.setSpeed(0.1));
}

TEST_F(MotorDriverTest, CorruptResponseIsChecksumMismatchAfterRetries)
{
  bus_->responder = [](const ProtocolFrame & request, FakeBus & bus) {
      auto bytes = statusFrame(request.id);
      bytes.back() ^= 0x01;
      bus.queue(bytes);
    };
  MotorDriver::Options options;
  options.max_retries = 2;
  MotorDriver driver(*link_, motor(1), options);
  EXPECT_EQ(boost::system::error_code(MotorErrc::checksum_mismatch), driver.setSpeed(0.1));
  EXPECT_EQ(3u, bus_->writes.size());
}

TEST_F(MotorDriverTest, SilentServoTimesOut)
{
  bus_->responder = nullptr;
  MotorDriver::Options options;
  options.max_retries = 0;
  MotorDriver driver(*link_, motor(1), options);
  EXPECT_EQ(boost::system::error_code(MotorErrc::timeout), driver.setSpeed(0.1));
  EXPECT_EQ(1u, bus_->writes.size());
}

TEST_F(MotorDriverTest, SingleTimeoutIsRetried)
{
  int calls = 0;
  bus_->responder = [&calls](const ProtocolFrame & request, FakeBus & bus) {
      if (++calls > 1) {
        bus.queue(statusFrame(request.id));
      }
    };
  MotorDriver driver(*link_, motor(1));
  EXPECT_FALSE(driver.setSpeed(0.2));
  EXPECT_EQ(2u, bus_->writes.size());
}

TEST_F(MotorDriverTest, ServoErrorByteIsServoFault)
{
  bus_->responder = [](const ProtocolFrame & request, FakeBus & bus) {
      bus.queue(statusFrame(request.id, 0x20));
    };
  MotorDriver driver(*link_, motor(1));
  EXPECT_EQ(boost::system::error_code(MotorErrc::servo_fault), driver.setSpeed(0.1));
}

TEST_F(MotorDriverTest, ClosedLinkFailsFastWithoutIo)
{
  link_->close();
  MotorDriver driver(*link_, motor(1));
  EXPECT_EQ(boost::system::error_code(MotorErrc::disconnected), driver.setSpeed(0.4));
  EXPECT_EQ(boost::system::error_code(MotorErrc::disconnected), driver.stop());
  EXPECT_TRUE(bus_->writes.empty());
}

TEST_F(MotorDriverTest, WithoutAckOnlyWrites)
{
  bus_->responder = nullptr;
  MotorDriver::Options options;
  options.await_ack = false;
  MotorDriver driver(*link_, motor(1), options);
  EXPECT_FALSE(driver.setSpeed(0.3));
  EXPECT_EQ(1u, bus_->writes.size());
  EXPECT_EQ(0, bus_->read_calls);
}

TEST_F(MotorDriverTest, ReadStatusDecodesBlock)
{
  bus_->responder = [](const ProtocolFrame & request, FakeBus & bus) {
      // position 2048, speed -300, load 100, 12.0 V, 35 C, overload flag
      bus.queue(statusFrame(request.id, 0x20, {0x00, 0x08, 0x2C, 0x81, 0x64, 0x00, 120, 35}));
    };
  MotorDriver driver(*link_, motor(4));
  MotorStatus status;
  ASSERT_FALSE(driver.readStatus(status));

  const auto frames = bus_->writtenFrames();
  ASSERT_EQ(1u, frames.size());
  EXPECT_EQ(taubert::sts::kRead, frames[0].instruction);
  EXPECT_EQ((std::vector<uint8_t>{taubert::sts::kRegPresentPosition, 8}), frames[0].params);

  EXPECT_EQ(2048, status.position);
  EXPECT_EQ(-300, status.speed);
  EXPECT_EQ(100, status.load);
  EXPECT_EQ(120, status.voltage);
  EXPECT_EQ(35, status.temperature);
  EXPECT_EQ(0x20, status.error_flags);
}

TEST_F(MotorDriverTest, ReadStatusDecodesNegativeLoad)
{
  bus_->responder = [](const ProtocolFrame & request, FakeBus & bus) {
      // load 0x0464: direction bit 10 set, magnitude 100
      bus.queue(statusFrame(request.id, 0, {0x00, 0x08, 0x00, 0x00, 0x64, 0x04, 120, 35}));
    };
  MotorDriver driver(*link_, motor(4));
  MotorStatus status;
  ASSERT_FALSE(driver.readStatus(status));
  EXPECT_EQ(-100, status.load);
}

TEST_F(MotorDriverTest, ShortStatusBlockIsMalformed)
{
  bus_->responder = [](const ProtocolFrame & request, FakeBus & bus) {
      bus.queue(statusFrame(request.id, 0, {0x00, 0x08}));
    };
  MotorDriver driver(*link_, motor(4));
  MotorStatus status;
  EXPECT_EQ(boost::system::error_code(MotorErrc::malformed_response), driver.readStatus(status));
}

TEST_F(MotorDriverTest, WheelModeAndTorqueWrites)
{
  MotorDriver driver(*link_, motor(6));
  ASSERT_FALSE(driver.setWheelMode());
  ASSERT_FALSE(driver.setTorqueEnabled(true));
  ASSERT_FALSE(driver.ping());
  const auto frames = bus_->writtenFrames();
  ASSERT_EQ(3u, frames.size());
  EXPECT_EQ((std::vector<uint8_t>{taubert::sts::kRegOperatingMode, 1}), frames[0].params);
  EXPECT_EQ((std::vector<uint8_t>{taubert::sts::kRegTorqueEnable, 1}), frames[1].params);
  EXPECT_EQ(taubert::sts::kPing, frames[2].instruction);
}
