#include "taubert_node/taubert_node.hpp"
#include <chrono>
#include <vector>

namespace taubert {

TaubertNode::TaubertNode(const rclcpp::NodeOptions & options)
    : Node("taubert_node", options)
{
    RobotConfig config;
    config.port = declare_parameter<std::string>("port", config.port);
    config.baudrate = static_cast<unsigned int>(
        declare_parameter<int>("baudrate", static_cast<int>(config.baudrate)));
    const auto ids = declare_parameter<std::vector<int64_t>>("servo_ids", std::vector<int64_t>{1, 2, 3});
    config.servo_ids.assign(ids.begin(), ids.end());
    config.wheel_radius = declare_parameter<double>("wheel_radius", config.wheel_radius);
    config.driver.max_speed = declare_parameter<int>("max_speed", config.driver.max_speed);
    config.driver.response_timeout = std::chrono::milliseconds(
        declare_parameter<int>("response_timeout_ms", static_cast<int>(config.driver.response_timeout.count())));
    config.driver.max_retries = declare_parameter<int>("max_retries", config.driver.max_retries);

    max_linear_mps_ = declare_parameter<double>("max_linear_mps", 0.3);
    max_angular_rps_ = declare_parameter<double>("max_angular_rps", 2.0);
    cmd_timeout_sec_ = declare_parameter<double>("cmd_timeout_sec", 0.5);

    robot_ = std::make_unique<Robot>(config);
    if (!robot_->connect())
    {
        RCLCPP_ERROR(get_logger(), "Failed to open %s; motor commands will be rejected",
                     config.port.c_str());
    }

    sub_ = create_subscription<geometry_msgs::msg::Twist>(
        "cmd_vel", 10,
        std::bind(&TaubertNode::twistCallback, this, std::placeholders::_1));
    bool_sub_ = create_subscription<std_msgs::msg::Bool>(
        "activate", 10,
        std::bind(&TaubertNode::boolCallback, this, std::placeholders::_1));

    last_cmd_time_ = now();
    watchdog_timer_ = create_wall_timer(
        std::chrono::milliseconds(50),
        std::bind(&TaubertNode::watchdogCallback, this));
}

TaubertNode::~TaubertNode()
{
    robot_->disconnect();
}

void TaubertNode::twistCallback(const geometry_msgs::msg::Twist::SharedPtr msg)
{
    last_cmd_time_ = now();

    // ROS x is forward and y is left; the robot frame has +vy forward and +vx right
    const double vx = max_linear_mps_ > 0.0 ? -msg->linear.y / max_linear_mps_ : 0.0;
    const double vy = max_linear_mps_ > 0.0 ? msg->linear.x / max_linear_mps_ : 0.0;
    const double omega = max_angular_rps_ > 0.0 ? msg->angular.z / max_angular_rps_ : 0.0;

    const auto result = robot_->omniDrive().move(vx, vy, omega);
    if (!result.ok())
    {
        RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 1000,
                             "cmd_vel not fully applied: %s", result.describe().c_str());
    }
}

void TaubertNode::boolCallback(const std_msgs::msg::Bool::SharedPtr msg)
{
    RCLCPP_DEBUG(get_logger(), "activate %s", msg->data ? "true" : "false");
    if (!msg->data)
    {
        const auto stopped = robot_->stop();
        if (!stopped.ok())
        {
            RCLCPP_ERROR(get_logger(), "Stop incomplete: %s", stopped.describe().c_str());
        }
    }
    const auto result = robot_->enableTorque(msg->data);
    if (!result.ok())
    {
        RCLCPP_ERROR(get_logger(), "Torque %s incomplete: %s",
                     msg->data ? "enable" : "disable", result.describe().c_str());
    }
}

void TaubertNode::watchdogCallback()
{
    if (robot_->omniDrive().state() != DriveState::Driving)
    {
        return;
    }
    if ((now() - last_cmd_time_).seconds() > cmd_timeout_sec_)
    {
        RCLCPP_WARN(get_logger(), "No cmd_vel for %.2f s, stopping", cmd_timeout_sec_);
        const auto result = robot_->stop();
        if (!result.ok())
        {
            RCLCPP_ERROR(get_logger(), "Watchdog stop incomplete: %s", result.describe().c_str());
        }
    }
}

}  // namespace taubert

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = std::make_shared<taubert::TaubertNode>();
    RCLCPP_INFO(node->get_logger(), "TaubertNode starting up…");
    rclcpp::spin(node);
    rclcpp::shutdown();
    return 0;
}
