#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <rclcpp/rclcpp.hpp>
#include <nav_msgs/msg/occupancy_grid.hpp>

#include "topomap/map_loader.hpp"

// Loads a stored occupancy grid (image + JSON metadata sidecar) and
// re-publishes it at a fixed rate, optionally with an inflated copy.
class MapBroadcasterNode : public rclcpp::Node
{
public:
  MapBroadcasterNode()
  : Node("map_broadcaster")
  {
    // Parameters
    this->declare_parameter<std::string>("map_image_path", "");
    this->declare_parameter<std::string>("map_metadata_path", "");
    this->declare_parameter<std::string>("publish_topic", "/static_map");
    this->declare_parameter<double>("publish_rate", 10.0);
    this->declare_parameter<bool>("publish_blurred", false);
    this->declare_parameter<std::string>("blurred_topic", "/static_map_blurred");
    this->declare_parameter<int>("blur_half_width", 5);

    map_image_path_ = this->get_parameter("map_image_path").as_string();
    map_metadata_path_ = this->get_parameter("map_metadata_path").as_string();
    publish_topic_ = this->get_parameter("publish_topic").as_string();
    publish_rate_ = this->get_parameter("publish_rate").as_double();
    publish_blurred_ = this->get_parameter("publish_blurred").as_bool();
    blurred_topic_ = this->get_parameter("blurred_topic").as_string();
    blur_half_width_ = static_cast<int>(this->get_parameter("blur_half_width").as_int());

    if (publish_rate_ <= 0.0) {
      throw std::runtime_error("publish_rate must be positive");
    }

    map_ = topomap::MapLoader::load(map_image_path_, map_metadata_path_);
    map_.info.map_load_time = this->now();

    map_pub_ = this->create_publisher<nav_msgs::msg::OccupancyGrid>(publish_topic_, 1);
    RCLCPP_INFO(get_logger(), "Publishing map: %s (%ux%u, %.3f m/cell)", publish_topic_.c_str(),
                map_.info.width, map_.info.height, map_.info.resolution);

    if (publish_blurred_) {
      blurred_map_ = topomap::MapLoader::inflate(map_, blur_half_width_);
      blurred_pub_ = this->create_publisher<nav_msgs::msg::OccupancyGrid>(blurred_topic_, 1);
      RCLCPP_INFO(get_logger(), "Publishing blurred map: %s (half-width %d cells)",
                  blurred_topic_.c_str(), blur_half_width_);
    }

    timer_ = this->create_wall_timer(
      std::chrono::duration<double>(1.0 / publish_rate_),
      std::bind(&MapBroadcasterNode::publishMaps, this));
  }

private:
  void publishMaps()
  {
    const auto stamp = this->now();
    map_.header.stamp = stamp;
    map_pub_->publish(map_);

    if (blurred_pub_) {
      blurred_map_.header.stamp = stamp;
      blurred_pub_->publish(blurred_map_);
    }
  }

  // Params
  std::string map_image_path_;
  std::string map_metadata_path_;
  std::string publish_topic_;
  double publish_rate_;
  bool publish_blurred_;
  std::string blurred_topic_;
  int blur_half_width_;

  // Map data
  nav_msgs::msg::OccupancyGrid map_;
  nav_msgs::msg::OccupancyGrid blurred_map_;

  // ROS
  rclcpp::Publisher<nav_msgs::msg::OccupancyGrid>::SharedPtr map_pub_;
  rclcpp::Publisher<nav_msgs::msg::OccupancyGrid>::SharedPtr blurred_pub_;
  rclcpp::TimerBase::SharedPtr timer_;
};

int main(int argc, char **argv)
{
  rclcpp::init(argc, argv);
  int exit_code = 0;
  try {
    rclcpp::spin(std::make_shared<MapBroadcasterNode>());
  } catch (const std::runtime_error & e) {
    RCLCPP_FATAL(rclcpp::get_logger("map_broadcaster"), "%s", e.what());
    exit_code = 1;
  }
  rclcpp::shutdown();
  return exit_code;
}
