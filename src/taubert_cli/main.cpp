#include "taubert/robot.hpp"

#include <boost/program_options.hpp>
#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

int main(int argc, char **argv)
{
    const auto logger = rclcpp::get_logger("taubert.cli");

    taubert::RobotConfig config;
    double duration = 1.0;

    po::options_description desc("Taubert robot control");
    desc.add_options()
        ("help,h", "show this help")
        ("port", po::value<std::string>(&config.port)->default_value(config.port),
         "serial port for servo communication")
        ("baudrate", po::value<unsigned int>(&config.baudrate)->default_value(config.baudrate),
         "baud rate for serial communication")
        ("servo-ids", po::value<std::vector<int>>(&config.servo_ids)->multitoken()
             ->default_value(config.servo_ids, "1 2 3"),
         "ids of the three wheel servos")
        ("demo", "run a movement demonstration")
        ("duration", po::value<double>(&duration)->default_value(duration),
         "seconds per demonstration step");

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        std::cerr << e.what() << "\n" << desc << std::endl;
        return 2;
    }

    if (vm.count("help"))
    {
        std::cout << desc << std::endl;
        return 0;
    }
    if (config.servo_ids.size() != 3)
    {
        std::cerr << "--servo-ids needs exactly three ids\n" << desc << std::endl;
        return 2;
    }
    if (!(duration >= 0.0))
    {
        std::cerr << "--duration must not be negative" << std::endl;
        return 2;
    }

    std::unique_ptr<taubert::Robot> robot;
    try
    {
        robot = std::make_unique<taubert::Robot>(config);
    }
    catch (const std::invalid_argument &e)
    {
        RCLCPP_ERROR(logger, "Invalid configuration: %s", e.what());
        return 2;
    }

    if (!robot->connect())
    {
        RCLCPP_ERROR(logger, "Failed to connect to hardware. Exiting.");
        return 1;
    }
    RCLCPP_INFO(logger, "Connected to hardware successfully");

    int rc = 0;
    try
    {
        const auto torque = robot->enableTorque(true);
        if (!torque.ok())
        {
            RCLCPP_WARN(logger, "Torque enable incomplete: %s", torque.describe().c_str());
        }

        if (vm.count("demo"))
        {
            robot->demoMovement(std::chrono::milliseconds(static_cast<long>(duration * 1000.0)));
        }
        else
        {
            RCLCPP_INFO(logger, "No action specified. Use --demo to run a movement demonstration.");
        }
    }
    catch (const std::exception &e)
    {
        RCLCPP_ERROR(logger, "An error occurred: %s", e.what());
        rc = 1;
    }

    // Stops every wheel before closing the port
    robot->disconnect();
    RCLCPP_INFO(logger, "Disconnected from hardware");
    return rc;
}
