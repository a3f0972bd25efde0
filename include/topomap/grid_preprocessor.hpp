#pragma once

#include <nav_msgs/msg/occupancy_grid.hpp>
#include <opencv2/core.hpp>

namespace topomap {

// Turns a raw occupancy grid into a distance field over inflated free space.
//
// Unknown cells (negative values) count as obstacles. The obstacle mask is
// dilated with a square element so walls get a safety margin, and the exact
// Euclidean distance (in cells) to the nearest inflated obstacle is computed
// for every cell. A grid without any obstacle gives a field of +infinity.
class GridPreprocessor {
public:
  GridPreprocessor(int dilation_half_width, int occupied_threshold);

  // CV_8U, 255 where the cell is an obstacle or unknown
  cv::Mat obstacleMask(const nav_msgs::msg::OccupancyGrid& grid) const;

  cv::Mat dilate(const cv::Mat& obstacle_mask) const;

  // CV_32F distance field, rows = height, cols = width.
  // Throws std::invalid_argument for empty or inconsistent grids.
  cv::Mat distanceField(const nav_msgs::msg::OccupancyGrid& grid) const;

  int dilationHalfWidth() const { return dilation_half_width_; }

private:
  int dilation_half_width_;
  int occupied_threshold_;
};

}  // namespace topomap
