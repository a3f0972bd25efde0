#include "topomap/map_loader.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace topomap {

nav_msgs::msg::OccupancyGrid MapLoader::readMetadata(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open map metadata file: " + path);
  }

  nlohmann::json json_data;
  try {
    file >> json_data;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Invalid map metadata JSON: " + std::string(e.what()));
  }

  if (!json_data.contains("info") || !json_data["info"].is_object()) {
    throw std::runtime_error("Invalid map metadata: 'info' object not found");
  }

  nav_msgs::msg::OccupancyGrid grid;
  try {
    const auto& info = json_data["info"];
    grid.info.resolution = info.at("resolution").get<float>();
    grid.info.width = info.at("width").get<uint32_t>();
    grid.info.height = info.at("height").get<uint32_t>();

    const auto& position = info.at("origin").at("position");
    grid.info.origin.position.x = position.at("x").get<double>();
    grid.info.origin.position.y = position.at("y").get<double>();
    grid.info.origin.position.z = position.value("z", 0.0);

    const auto& orientation = info.at("origin").at("orientation");
    grid.info.origin.orientation.x = orientation.value("x", 0.0);
    grid.info.origin.orientation.y = orientation.value("y", 0.0);
    grid.info.origin.orientation.z = orientation.value("z", 0.0);
    grid.info.origin.orientation.w = orientation.value("w", 1.0);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Invalid map metadata: " + std::string(e.what()));
  }

  grid.header.frame_id = "map";
  if (json_data.contains("header") && json_data["header"].contains("frame_id")) {
    grid.header.frame_id = json_data["header"]["frame_id"].get<std::string>();
  }

  RCLCPP_INFO(rclcpp::get_logger("topomap.map_loader"),
              "Map metadata loaded from %s (frame '%s')", path.c_str(),
              grid.header.frame_id.c_str());
  return grid;
}

void MapLoader::decodeImage(const cv::Mat& image, nav_msgs::msg::OccupancyGrid& grid) {
  if (image.empty() || image.type() != CV_8UC1) {
    throw std::runtime_error("Map image must be a non-empty single channel 8-bit image");
  }
  if (static_cast<uint32_t>(image.cols) != grid.info.width ||
      static_cast<uint32_t>(image.rows) != grid.info.height) {
    throw std::runtime_error(
        "Map image is " + std::to_string(image.cols) + "x" + std::to_string(image.rows) +
        " but metadata says " + std::to_string(grid.info.width) + "x" +
        std::to_string(grid.info.height));
  }

  grid.data.resize(static_cast<size_t>(image.cols) * image.rows);
  for (int y = 0; y < image.rows; ++y) {
    const uchar* row = image.ptr<uchar>(y);
    for (int x = 0; x < image.cols; ++x) {
      int8_t value = -1;
      if (row[x] != kUnknownPixel) {
        value = static_cast<int8_t>(std::min<int>(row[x], 100));
      }
      grid.data[x + y * image.cols] = value;
    }
  }
}

nav_msgs::msg::OccupancyGrid MapLoader::load(const std::string& image_path,
                                             const std::string& metadata_path) {
  nav_msgs::msg::OccupancyGrid grid = readMetadata(metadata_path);

  cv::Mat image = cv::imread(image_path, cv::IMREAD_GRAYSCALE);
  if (image.empty()) {
    throw std::runtime_error("Failed to read map image: " + image_path);
  }
  decodeImage(image, grid);
  return grid;
}

nav_msgs::msg::OccupancyGrid MapLoader::inflate(const nav_msgs::msg::OccupancyGrid& grid,
                                                int half_width) {
  const int width = static_cast<int>(grid.info.width);
  const int height = static_cast<int>(grid.info.height);
  if (grid.data.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
    throw std::runtime_error("Cannot inflate a grid whose data does not match its size");
  }

  cv::Mat occupied(height, width, CV_8UC1, cv::Scalar(0));
  for (int i = 0; i < width * height; ++i) {
    if (grid.data[i] > 0) {
      occupied.data[i] = 255;
    }
  }

  cv::Mat inflated = occupied;
  if (half_width > 0) {
    cv::Mat kernel = cv::getStructuringElement(
        cv::MORPH_RECT, cv::Size(2 * half_width + 1, 2 * half_width + 1));
    cv::dilate(occupied, inflated, kernel, cv::Point(-1, -1), 1,
               cv::BORDER_CONSTANT, cv::Scalar(0));
  }

  nav_msgs::msg::OccupancyGrid result = grid;
  for (int i = 0; i < width * height; ++i) {
    if (grid.data[i] >= 0 && inflated.data[i] != 0) {
      result.data[i] = 100;
    }
  }
  return result;
}

}  // namespace topomap
