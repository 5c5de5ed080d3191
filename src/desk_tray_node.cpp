#include "idasen_tray/desk_tray_node.hpp"

#include <chrono>
#include <stdexcept>

#include "idasen_tray/desk_mover.hpp"

using namespace std::chrono_literals;

namespace idasen_tray {

DeskTrayNode::DeskTrayNode(const rclcpp::NodeOptions & options)
: rclcpp::Node("idasen_tray", options)
{
  this->declare_parameter<std::string>("config_path", "~/.config/idasen/idasen.yaml");
  this->declare_parameter<std::string>("mover_command", "idasen");
  this->declare_parameter<bool>("nagging_enabled", true);
  this->declare_parameter<std::vector<std::string>>("toggle_positions", {"sit", "stand"});
  this->declare_parameter<std::vector<std::string>>("dwell_positions", {"stand", "sit"});
  this->declare_parameter<std::vector<double>>("dwell_minutes", {1.0, 1.0});
  nagging_enabled_ = this->get_parameter("nagging_enabled").as_bool();

  config_ = std::make_shared<YamlConfigSource>(this->get_parameter("config_path").as_string());
  auto mover = std::make_shared<CliDeskMover>(this->get_parameter("mover_command").as_string());
  controller_ = std::make_unique<PositionController>(config_, mover, load_options(*this));
  controller_->setChangeListener(
    std::bind(&DeskTrayNode::publishStatus, this,
              std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));

  // Latched so a menu started later still sees the current position.
  status_pub_ = this->create_publisher<DeskStatus>("desk_status", rclcpp::QoS(1).transient_local());

  request_srv_ = this->create_service<RequestPosition>(
    "request_position",
    std::bind(&DeskTrayNode::handle_request, this, std::placeholders::_1, std::placeholders::_2));
  list_srv_ = this->create_service<ListPositions>(
    "list_positions",
    std::bind(&DeskTrayNode::handle_list, this, std::placeholders::_1, std::placeholders::_2));
  exit_srv_ = this->create_service<std_srvs::srv::Trigger>(
    "exit",
    std::bind(&DeskTrayNode::handle_exit, this, std::placeholders::_1, std::placeholders::_2));
  command_sub_ = this->create_subscription<std_msgs::msg::String>(
    "position_command", 10, std::bind(&DeskTrayNode::commandCb, this, std::placeholders::_1));

  RCLCPP_INFO(this->get_logger(), "Positions file: %s, nagging %s",
              expand_user_path(config_->path()).c_str(),
              nagging_enabled_ ? "enabled" : "disabled");
}

DeskTrayNode::~DeskTrayNode()
{
  // Join the command and timer threads while the publisher is still alive.
  controller_.reset();
}

PositionController::Options DeskTrayNode::load_options(rclcpp::Node & node)
{
  PositionController::Options opts;
  opts.nagging_enabled = node.get_parameter("nagging_enabled").as_bool();
  try {
    opts.toggle_pair = TogglePair::fromList(node.get_parameter("toggle_positions").as_string_array());
    opts.dwell_policy = DwellPolicy::fromMinutes(
      node.get_parameter("dwell_positions").as_string_array(),
      node.get_parameter("dwell_minutes").as_double_array());
  } catch (const std::invalid_argument & e) {
    RCLCPP_FATAL(node.get_logger(), "Invalid dwell configuration: %s", e.what());
    throw;
  }
  return opts;
}

void DeskTrayNode::handle_request(const std::shared_ptr<RequestPosition::Request> request,
                                  std::shared_ptr<RequestPosition::Response> response)
{
  ApplyResult result;
  try {
    result = controller_->requestPositionChange(request->position).get();
  } catch (const std::future_error & e) {
    response->success = false;
    response->status = static_cast<uint8_t>(ApplyStatus::kConfigUnavailable);
    response->message = std::string("Controller is shutting down: ") + e.what();
    return;
  } catch (const std::exception & e) {
    RCLCPP_ERROR(this->get_logger(), "Position request %s failed: %s",
                 request->position.c_str(), e.what());
    response->success = false;
    response->status = static_cast<uint8_t>(ApplyStatus::kConfigUnavailable);
    response->message = e.what();
    return;
  }
  response->success = result.ok();
  response->status = static_cast<uint8_t>(result.status);
  response->message = result.message;
  response->current_position = result.current_position.value_or("");
}

void DeskTrayNode::handle_list(const std::shared_ptr<ListPositions::Request>,
                               std::shared_ptr<ListPositions::Response> response)
{
  PositionMap positions;
  try {
    positions = config_->positions();
  } catch (const ConfigUnavailableError & e) {
    RCLCPP_ERROR(this->get_logger(), "Cannot list positions: %s", e.what());
    response->success = false;
    response->message = e.what();
    return;
  }
  for (const auto & [name, height] : positions) {
    response->names.push_back(name);
    response->heights.push_back(height);
  }
  response->success = true;
  response->message = std::to_string(positions.size()) + " positions";
}

void DeskTrayNode::handle_exit(const std::shared_ptr<std_srvs::srv::Trigger::Request>,
                               std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  RCLCPP_INFO(this->get_logger(), "Exit requested");
  response->success = true;
  response->message = "Shutting down";
  // Give the response a moment to go out before the context is torn down.
  shutdown_timer_ = this->create_wall_timer(200ms, [this]() {
    shutdown_timer_->cancel();
    rclcpp::shutdown();
  });
}

void DeskTrayNode::commandCb(const std_msgs::msg::String::SharedPtr msg)
{
  // Fire-and-forget; the controller logs rejected names.
  (void)controller_->requestPositionChange(msg->data);
}

void DeskTrayNode::publishStatus(const std::string & position, ChangeSource source,
                                 const ControllerSnapshot & snapshot)
{
  DeskStatus st;
  st.stamp = this->now();
  st.current_position = position;
  st.dwell_active = snapshot.active_timer.has_value();
  st.dwell_minutes = std::chrono::duration<double, std::ratio<60>>(snapshot.active_dwell).count();
  st.nagging_enabled = nagging_enabled_;
  st.change_source = source == ChangeSource::kDwellTimeout ? "dwell_timeout" : "request";
  status_pub_->publish(st);
}

} // namespace idasen_tray
