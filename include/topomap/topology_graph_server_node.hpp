#pragma once

#include <rclcpp/rclcpp.hpp>
#include <nav_msgs/msg/occupancy_grid.hpp>
#include <std_msgs/msg/string.hpp>
#include <std_srvs/srv/trigger.hpp>

#include <memory>
#include <string>

#include "topomap/graph_service.hpp"
#include "topomap/node_id_sequence.hpp"
#include "topomap/topology_parameters.hpp"

namespace topomap {

// ROS 2 front end of GraphService: map subscription in, Trigger service out.
//
// The map subscription and the service sit in separate callback groups so a
// request waiting for the first map does not block map delivery. Spin the
// node with a MultiThreadedExecutor.
class TopologyGraphServerNode : public rclcpp::Node {
public:
  explicit TopologyGraphServerNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

  GraphService& service() { return *service_; }

private:
  void loadParameters();

  void mapCallback(const nav_msgs::msg::OccupancyGrid::SharedPtr msg);
  void graphCallback(const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
                     std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  // Params
  std::string map_topic_;
  std::string service_name_;
  std::string graph_topic_;
  bool publish_graph_ = false;
  TopologyParameters params_;

  // Core
  std::shared_ptr<NodeIdSequence> ids_;
  std::unique_ptr<GraphService> service_;

  // ROS
  rclcpp::CallbackGroup::SharedPtr map_group_;
  rclcpp::CallbackGroup::SharedPtr service_group_;
  rclcpp::Subscription<nav_msgs::msg::OccupancyGrid>::SharedPtr map_sub_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr graph_srv_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr graph_pub_;
};

}  // namespace topomap
