#pragma once

#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/string.hpp>
#include <std_srvs/srv/trigger.hpp>

#include <idasen_tray/msg/desk_status.hpp>
#include <idasen_tray/srv/list_positions.hpp>
#include <idasen_tray/srv/request_position.hpp>

#include <memory>

#include "idasen_tray/config_source.hpp"
#include "idasen_tray/position_controller.hpp"

namespace idasen_tray {

class DeskTrayNode : public rclcpp::Node {
public:
  using RequestPosition = idasen_tray::srv::RequestPosition;
  using ListPositions = idasen_tray::srv::ListPositions;
  using DeskStatus = idasen_tray::msg::DeskStatus;

  explicit DeskTrayNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~DeskTrayNode() override;

private:
  std::shared_ptr<YamlConfigSource> config_;
  std::unique_ptr<PositionController> controller_;
  bool nagging_enabled_{true};

  rclcpp::Service<RequestPosition>::SharedPtr request_srv_;
  rclcpp::Service<ListPositions>::SharedPtr list_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr exit_srv_;
  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr command_sub_;
  rclcpp::Publisher<DeskStatus>::SharedPtr status_pub_;
  rclcpp::TimerBase::SharedPtr shutdown_timer_;

  static PositionController::Options load_options(rclcpp::Node & node);

  void handle_request(const std::shared_ptr<RequestPosition::Request> request,
                      std::shared_ptr<RequestPosition::Response> response);
  void handle_list(const std::shared_ptr<ListPositions::Request> request,
                   std::shared_ptr<ListPositions::Response> response);
  void handle_exit(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                   std::shared_ptr<std_srvs::srv::Trigger::Response> response);
  void commandCb(const std_msgs::msg::String::SharedPtr msg);
  void publishStatus(const std::string & position, ChangeSource source,
                     const ControllerSnapshot & snapshot);
};

} // namespace idasen_tray
