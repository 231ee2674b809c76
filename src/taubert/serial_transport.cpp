#include "taubert/serial_transport.hpp"

#include <rclcpp/rclcpp.hpp>
#include <termios.h>

namespace taubert {

AsioSerialTransport::AsioSerialTransport()
    : serial_(io_), timer_(io_)
{
}

AsioSerialTransport::~AsioSerialTransport()
{
    close();
}

boost::system::error_code AsioSerialTransport::open(const std::string &port_name, unsigned int baud_rate)
{
    boost::system::error_code ec;
    serial_.open(port_name, ec);
    if (ec)
    {
        return ec;
    }

    using boost::asio::serial_port_base;
    serial_.set_option(serial_port_base::baud_rate(baud_rate), ec);
    if (!ec)
        serial_.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
    if (!ec)
        serial_.set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
    if (!ec)
        serial_.set_option(serial_port_base::character_size(8), ec);
    if (!ec)
        serial_.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);

    if (ec)
    {
        boost::system::error_code ignored;
        serial_.close(ignored);
        return ec;
    }
    RCLCPP_INFO(rclcpp::get_logger("taubert.serial"),
                "Serial port %s opened at %u baud", port_name.c_str(), baud_rate);
    return {};
}

void AsioSerialTransport::close()
{
    if (serial_.is_open())
    {
        boost::system::error_code ec;
        serial_.cancel(ec);
        serial_.close(ec);
        if (ec)
        {
            RCLCPP_WARN(rclcpp::get_logger("taubert.serial"),
                        "Serial close reported: %s", ec.message().c_str());
        }
    }
}

bool AsioSerialTransport::isOpen() const
{
    return serial_.is_open();
}

boost::system::error_code AsioSerialTransport::write(const std::vector<uint8_t> &bytes)
{
    boost::system::error_code ec;
    boost::asio::write(serial_, boost::asio::buffer(bytes), ec);
    return ec;
}

std::size_t AsioSerialTransport::readSome(uint8_t *data, std::size_t size,
                                          std::chrono::milliseconds timeout,
                                          boost::system::error_code &ec)
{
    // Race an async read against a timer; whichever finishes first cancels the other.
    std::size_t received = 0;
    boost::system::error_code read_ec = boost::asio::error::would_block;
    bool timed_out = false;

    serial_.async_read_some(
        boost::asio::buffer(data, size),
        [&](const boost::system::error_code &e, std::size_t n)
        {
            read_ec = e;
            received = n;
            timer_.cancel();
        });

    timer_.expires_after(timeout);
    timer_.async_wait(
        [&](const boost::system::error_code &e)
        {
            if (!e)
            {
                timed_out = true;
                boost::system::error_code ignored;
                serial_.cancel(ignored);
            }
        });

    io_.restart();
    io_.run();

    if (timed_out && received == 0)
    {
        ec = boost::asio::error::timed_out;
        return 0;
    }
    ec = read_ec;
    return received;
}

void AsioSerialTransport::discardInput()
{
    if (serial_.is_open())
    {
        ::tcflush(serial_.native_handle(), TCIFLUSH);
    }
}

}  // namespace taubert
