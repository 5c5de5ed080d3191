#include <rclcpp/rclcpp.hpp>
#include <idasen_tray/srv/list_positions.hpp>
#include <idasen_tray/srv/request_position.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <string>

using RequestPosition = idasen_tray::srv::RequestPosition;
using ListPositions = idasen_tray::srv::ListPositions;

namespace
{

constexpr auto kServiceTimeout = std::chrono::seconds(5);

int list_positions(const rclcpp::Node::SharedPtr & node)
{
  auto client = node->create_client<ListPositions>("list_positions");
  if (!client->wait_for_service(kServiceTimeout)) {
    RCLCPP_ERROR(node->get_logger(), "No list_positions service");
    return 1;
  }
  auto future = client->async_send_request(std::make_shared<ListPositions::Request>());
  if (rclcpp::spin_until_future_complete(node, future, kServiceTimeout) !=
      rclcpp::FutureReturnCode::SUCCESS)
  {
    RCLCPP_ERROR(node->get_logger(), "list_positions call failed");
    return 1;
  }
  auto resp = future.get();
  if (!resp->success) {
    RCLCPP_ERROR(node->get_logger(), "%s", resp->message.c_str());
    return 1;
  }
  const std::size_t n = std::min(resp->names.size(), resp->heights.size());
  for (std::size_t i = 0; i < n; ++i) {
    std::printf("%s  (%.2fm)\n", resp->names[i].c_str(), resp->heights[i]);
  }
  return 0;
}

int request_position(const rclcpp::Node::SharedPtr & node, const std::string & position)
{
  auto client = node->create_client<RequestPosition>("request_position");
  if (!client->wait_for_service(kServiceTimeout)) {
    RCLCPP_ERROR(node->get_logger(), "No request_position service");
    return 1;
  }
  auto req = std::make_shared<RequestPosition::Request>();
  req->position = position;
  auto future = client->async_send_request(req);
  if (rclcpp::spin_until_future_complete(node, future, kServiceTimeout) !=
      rclcpp::FutureReturnCode::SUCCESS)
  {
    RCLCPP_ERROR(node->get_logger(), "request_position call failed");
    return 1;
  }
  auto resp = future.get();
  if (!resp->success) {
    RCLCPP_ERROR(node->get_logger(), "status=%u msg=%s", static_cast<unsigned>(resp->status), resp->message.c_str());
    return 1;
  }
  RCLCPP_INFO(node->get_logger(), "status=%u current=%s msg=%s",
              static_cast<unsigned>(resp->status), resp->current_position.c_str(), resp->message.c_str());
  return 0;
}

} // namespace

int main(int argc, char ** argv)
{
  const auto args = rclcpp::init_and_remove_ros_arguments(argc, argv);
  if (args.size() != 2) {
    std::fprintf(stderr, "usage: %s <position> | --list\n", args.empty() ? "desk_position_client" : args[0].c_str());
    rclcpp::shutdown();
    return 1;
  }
  auto node = rclcpp::Node::make_shared("desk_position_client");

  const int rc = args[1] == "--list" ? list_positions(node) : request_position(node, args[1]);
  rclcpp::shutdown();
  return rc;
}
