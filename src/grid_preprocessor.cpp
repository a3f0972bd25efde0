#include "topomap/grid_preprocessor.hpp"

#include <opencv2/imgproc.hpp>
#include <rclcpp/rclcpp.hpp>

#include <limits>
#include <stdexcept>
#include <string>

namespace topomap {

GridPreprocessor::GridPreprocessor(int dilation_half_width, int occupied_threshold)
    : dilation_half_width_(dilation_half_width), occupied_threshold_(occupied_threshold) {
  if (dilation_half_width_ < 0) {
    throw std::invalid_argument("dilation half-width must be non-negative");
  }
}

cv::Mat GridPreprocessor::obstacleMask(const nav_msgs::msg::OccupancyGrid& grid) const {
  const int width = static_cast<int>(grid.info.width);
  const int height = static_cast<int>(grid.info.height);

  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("occupancy grid is empty");
  }
  if (grid.data.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
    throw std::invalid_argument(
        "occupancy grid data length " + std::to_string(grid.data.size()) +
        " does not match " + std::to_string(width) + "x" + std::to_string(height));
  }

  cv::Mat mask(height, width, CV_8UC1, cv::Scalar(0));
  for (int y = 0; y < height; ++y) {
    uchar* row = mask.ptr<uchar>(y);
    for (int x = 0; x < width; ++x) {
      const int8_t value = grid.data[x + y * width];
      // -1 (unknown) is treated as an obstacle
      if (value < 0 || value >= occupied_threshold_) {
        row[x] = 255;
      }
    }
  }
  return mask;
}

cv::Mat GridPreprocessor::dilate(const cv::Mat& obstacle_mask) const {
  if (dilation_half_width_ == 0) {
    return obstacle_mask.clone();
  }
  const int side = 2 * dilation_half_width_ + 1;
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(side, side));
  cv::Mat dilated;
  // Cells outside the map never contribute obstacles
  cv::dilate(obstacle_mask, dilated, kernel, cv::Point(-1, -1), 1,
             cv::BORDER_CONSTANT, cv::Scalar(0));
  return dilated;
}

cv::Mat GridPreprocessor::distanceField(const nav_msgs::msg::OccupancyGrid& grid) const {
  cv::Mat dilated = dilate(obstacleMask(grid));

  const int obstacle_cells = cv::countNonZero(dilated);
  if (obstacle_cells == 0) {
    RCLCPP_DEBUG(rclcpp::get_logger("topomap.grid_preprocessor"),
                 "No obstacle cells after dilation, distance field is unbounded");
    return cv::Mat(dilated.size(), CV_32FC1,
                   cv::Scalar(std::numeric_limits<float>::infinity()));
  }

  cv::Mat free_mask;
  cv::bitwise_not(dilated, free_mask);

  cv::Mat field;
  cv::distanceTransform(free_mask, field, cv::DIST_L2, cv::DIST_MASK_PRECISE, CV_32F);

  RCLCPP_DEBUG(rclcpp::get_logger("topomap.grid_preprocessor"),
               "Distance field %dx%d, %d of %d cells inflated to obstacles",
               field.cols, field.rows, obstacle_cells, static_cast<int>(field.total()));
  return field;
}

}  // namespace topomap
