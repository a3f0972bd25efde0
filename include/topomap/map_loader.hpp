#pragma once

#include <nav_msgs/msg/occupancy_grid.hpp>
#include <opencv2/core.hpp>

#include <string>

namespace topomap {

// Reads a stored occupancy grid: a single channel 8-bit image holding the
// cell values plus a JSON sidecar with resolution, size, origin and frame.
// All failures throw std::runtime_error.
class MapLoader {
public:
  // Pixel value used on disk for unknown cells
  static constexpr uchar kUnknownPixel = 255;

  // Grid with header and info filled from the sidecar, data left empty
  static nav_msgs::msg::OccupancyGrid readMetadata(const std::string& path);

  // Fills grid.data from the image; its size must match grid.info.
  // 255 becomes -1 (unknown), anything else is clamped to [0, 100].
  static void decodeImage(const cv::Mat& image, nav_msgs::msg::OccupancyGrid& grid);

  static nav_msgs::msg::OccupancyGrid load(const std::string& image_path,
                                           const std::string& metadata_path);

  // Known cells within the (2*half_width+1) square of an occupied cell become
  // 100. Unknown cells stay unknown.
  static nav_msgs::msg::OccupancyGrid inflate(const nav_msgs::msg::OccupancyGrid& grid,
                                              int half_width);
};

}  // namespace topomap
