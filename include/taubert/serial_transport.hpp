#ifndef TAUBERT__SERIAL_TRANSPORT_HPP_
#define TAUBERT__SERIAL_TRANSPORT_HPP_

#include <boost/asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace taubert {

/// Raw byte pipe underneath the motor link.
class SerialTransport {
public:
    virtual ~SerialTransport() = default;

    virtual boost::system::error_code open(const std::string& port_name, unsigned int baud_rate) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual boost::system::error_code write(const std::vector<uint8_t>& bytes) = 0;

    /// Read at least one byte, waiting no longer than timeout.
    /// Sets ec to boost::asio::error::timed_out when nothing arrived.
    virtual std::size_t readSome(uint8_t* data, std::size_t size,
                                 std::chrono::milliseconds timeout,
                                 boost::system::error_code& ec) = 0;

    /// Drop anything already buffered on the input side.
    virtual void discardInput() = 0;
};

/// 8N1 serial port with no flow control.
class AsioSerialTransport : public SerialTransport {
public:
    AsioSerialTransport();
    ~AsioSerialTransport() override;

    AsioSerialTransport(const AsioSerialTransport&) = delete;
    AsioSerialTransport& operator=(const AsioSerialTransport&) = delete;

    boost::system::error_code open(const std::string& port_name, unsigned int baud_rate) override;
    void close() override;
    bool isOpen() const override;

    boost::system::error_code write(const std::vector<uint8_t>& bytes) override;
    std::size_t readSome(uint8_t* data, std::size_t size,
                         std::chrono::milliseconds timeout,
                         boost::system::error_code& ec) override;
    void discardInput() override;

private:
    boost::asio::io_service io_;
    boost::asio::serial_port serial_;
    boost::asio::steady_timer timer_;
};

}  // namespace taubert

#endif // TAUBERT__SERIAL_TRANSPORT_HPP_
