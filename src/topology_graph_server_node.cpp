#include "topomap/topology_graph_server_node.hpp"

#include <functional>

using std::placeholders::_1;
using std::placeholders::_2;

namespace topomap {

TopologyGraphServerNode::TopologyGraphServerNode(const rclcpp::NodeOptions& options)
    : rclcpp::Node("topology_graph_server", options) {
  loadParameters();

  // The id sequence lives as long as the node, so ids are never reused
  ids_ = std::make_shared<NodeIdSequence>();
  service_ = std::make_unique<GraphService>(params_, ids_);

  map_group_ = this->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
  service_group_ = this->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

  // Subscribers
  rclcpp::SubscriptionOptions sub_options;
  sub_options.callback_group = map_group_;
  map_sub_ = this->create_subscription<nav_msgs::msg::OccupancyGrid>(
      map_topic_, rclcpp::QoS(1).reliable(),
      std::bind(&TopologyGraphServerNode::mapCallback, this, _1), sub_options);

  // Publishers
  if (publish_graph_) {
    graph_pub_ = this->create_publisher<std_msgs::msg::String>(graph_topic_, 10);
  }

  // Services
  graph_srv_ = this->create_service<std_srvs::srv::Trigger>(
      service_name_,
      std::bind(&TopologyGraphServerNode::graphCallback, this, _1, _2),
      rmw_qos_profile_services_default, service_group_);

  RCLCPP_INFO(this->get_logger(), "Subscribing map: %s", map_topic_.c_str());
  RCLCPP_INFO(this->get_logger(), "Serving graph: %s", service_name_.c_str());
  if (publish_graph_) {
    RCLCPP_INFO(this->get_logger(), "Publishing graph JSON: %s", graph_topic_.c_str());
  }
}

void TopologyGraphServerNode::loadParameters() {
  this->declare_parameter<std::string>("map_topic", "/static_map");
  this->declare_parameter<std::string>("service_name", "graph");
  this->declare_parameter<std::string>("graph_topic", "graph_json");
  this->declare_parameter<bool>("publish_graph", false);

  this->declare_parameter<int>("occupied_threshold", params_.occupied_threshold);
  this->declare_parameter<int>("dilation_half_width", params_.dilation_half_width);
  this->declare_parameter<double>("threshold_ratio", params_.threshold_ratio);
  this->declare_parameter<double>("harris_k", params_.harris_k);
  this->declare_parameter<int>("harris_block_size", params_.harris_block_size);
  this->declare_parameter<int>("harris_aperture", params_.harris_aperture);
  this->declare_parameter<int>("min_peak_distance", params_.min_peak_distance);
  this->declare_parameter<double>("peak_threshold_ratio", params_.peak_threshold_ratio);
  this->declare_parameter<int>("discovery_passes", params_.discovery_passes);
  this->declare_parameter<double>("prune_distance", params_.prune_distance);

  map_topic_ = this->get_parameter("map_topic").as_string();
  service_name_ = this->get_parameter("service_name").as_string();
  graph_topic_ = this->get_parameter("graph_topic").as_string();
  publish_graph_ = this->get_parameter("publish_graph").as_bool();

  params_.occupied_threshold = static_cast<int>(this->get_parameter("occupied_threshold").as_int());
  params_.dilation_half_width = static_cast<int>(this->get_parameter("dilation_half_width").as_int());
  params_.threshold_ratio = this->get_parameter("threshold_ratio").as_double();
  params_.harris_k = this->get_parameter("harris_k").as_double();
  params_.harris_block_size = static_cast<int>(this->get_parameter("harris_block_size").as_int());
  params_.harris_aperture = static_cast<int>(this->get_parameter("harris_aperture").as_int());
  params_.min_peak_distance = static_cast<int>(this->get_parameter("min_peak_distance").as_int());
  params_.peak_threshold_ratio = this->get_parameter("peak_threshold_ratio").as_double();
  params_.discovery_passes = static_cast<int>(this->get_parameter("discovery_passes").as_int());
  params_.prune_distance = this->get_parameter("prune_distance").as_double();

  RCLCPP_INFO(this->get_logger(),
              "Dilation half-width %d, threshold ratio %.2f, Harris k %.3f, prune distance %.1f px",
              params_.dilation_half_width, params_.threshold_ratio, params_.harris_k,
              params_.prune_distance);
}

void TopologyGraphServerNode::mapCallback(const nav_msgs::msg::OccupancyGrid::SharedPtr msg) {
  if (service_->ingestGrid(msg)) {
    RCLCPP_DEBUG(this->get_logger(), "Map updated: %ux%u, %.3f m/cell, origin (%.2f, %.2f)",
                 msg->info.width, msg->info.height, msg->info.resolution,
                 msg->info.origin.position.x, msg->info.origin.position.y);
  }
}

void TopologyGraphServerNode::graphCallback(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response) {
  (void)request;

  const GraphResponse result = service_->handleRequest();
  response->success = result.success;
  response->message = result.message;

  if (result.success && graph_pub_) {
    std_msgs::msg::String msg;
    msg.data = result.message;
    graph_pub_->publish(msg);
  }
}

}  // namespace topomap
