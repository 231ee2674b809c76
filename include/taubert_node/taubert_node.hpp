#ifndef TAUBERT_NODE__TAUBERT_NODE_HPP_
#define TAUBERT_NODE__TAUBERT_NODE_HPP_

#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/bool.hpp>
#include <geometry_msgs/msg/twist.hpp>
#include "taubert/robot.hpp"
#include <memory>
#include <string>

namespace taubert {

class TaubertNode : public rclcpp::Node {
public:
    explicit TaubertNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
    ~TaubertNode() override;

private:
    void twistCallback(const geometry_msgs::msg::Twist::SharedPtr msg);
    void boolCallback(const std_msgs::msg::Bool::SharedPtr msg);
    void watchdogCallback();

    // Parameters
    double max_linear_mps_;
    double max_angular_rps_;
    double cmd_timeout_sec_;

    // ROS interfaces
    rclcpp::Subscription<geometry_msgs::msg::Twist>::SharedPtr sub_;
    rclcpp::Subscription<std_msgs::msg::Bool>::SharedPtr bool_sub_;
    rclcpp::TimerBase::SharedPtr watchdog_timer_;

    rclcpp::Time last_cmd_time_;

    std::unique_ptr<Robot> robot_;
};

}  // namespace taubert

#endif // TAUBERT_NODE__TAUBERT_NODE_HPP_
