#include "idasen_tray/desk_tray_node.hpp"

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<idasen_tray::DeskTrayNode>();
  RCLCPP_INFO(node->get_logger(), "Starting...");
  rclcpp::spin(node);
  RCLCPP_INFO(node->get_logger(), "Stopping...");
  node.reset();
  rclcpp::shutdown();
  return 0;
}
