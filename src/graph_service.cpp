#include "topomap/graph_service.hpp"

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace topomap {

GraphService::GraphService(const TopologyParameters& params, std::shared_ptr<NodeIdSequence> ids)
    : params_(params),
      ids_(std::move(ids)),
      preprocessor_(params.dilation_half_width, params.occupied_threshold),
      extractor_(params),
      builder_(ids_, params.discovery_passes),
      refiner_(params.prune_distance) {}

std::string GraphService::validateGrid(const nav_msgs::msg::OccupancyGrid& grid) {
  if (grid.info.width == 0 || grid.info.height == 0) {
    return "grid has zero width or height";
  }
  if (!(grid.info.resolution > 0.0f)) {
    return "grid resolution must be positive";
  }
  const size_t expected = static_cast<size_t>(grid.info.width) * grid.info.height;
  if (grid.data.size() != expected) {
    return "grid data has " + std::to_string(grid.data.size()) + " cells, expected " +
           std::to_string(expected) + " (" + std::to_string(grid.info.width) + "x" +
           std::to_string(grid.info.height) + ")";
  }
  return "";
}

bool GraphService::ingestGrid(nav_msgs::msg::OccupancyGrid::ConstSharedPtr grid) {
  auto logger = rclcpp::get_logger("topomap.graph_service");
  if (!grid) {
    RCLCPP_WARN(logger, "Rejected null occupancy grid");
    return false;
  }

  const std::string problem = validateGrid(*grid);
  if (!problem.empty()) {
    RCLCPP_WARN(logger, "Rejected occupancy grid: %s", problem.c_str());
    return false;
  }

  bool first = false;
  {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    first = (grid_ == nullptr);
    grid_ = std::move(grid);
  }
  map_ready_.notify_all();

  if (first) {
    RCLCPP_INFO(logger, "First map received, graph requests can be served");
  }
  return true;
}

bool GraphService::hasMap() const {
  std::lock_guard<std::mutex> lock(grid_mutex_);
  return grid_ != nullptr;
}

nav_msgs::msg::OccupancyGrid::ConstSharedPtr GraphService::waitForMap() const {
  std::unique_lock<std::mutex> lock(grid_mutex_);
  if (!grid_) {
    RCLCPP_INFO(rclcpp::get_logger("topomap.graph_service"),
                "No map yet, waiting for the first occupancy grid");
  }
  map_ready_.wait(lock, [this] { return grid_ != nullptr || shutting_down_; });
  if (!grid_) {
    throw std::runtime_error("service is shutting down before any map was received");
  }
  return grid_;
}

void GraphService::shutdown() {
  {
    std::lock_guard<std::mutex> lock(grid_mutex_);
    shutting_down_ = true;
  }
  map_ready_.notify_all();
}

PipelineResult GraphService::computeGraph() {
  // Grid is immutable once ingested, so only the pointer capture is locked
  const auto grid = waitForMap();

  std::lock_guard<std::mutex> lock(pipeline_mutex_);
  return runPipeline(*grid);
}

GraphResponse GraphService::handleRequest() {
  GraphResponse response;
  try {
    const auto start = std::chrono::steady_clock::now();
    PipelineResult result = computeGraph();
    response.message = CoordinateMapper::toJson(result.graph);
    response.success = true;

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    RCLCPP_INFO(rclcpp::get_logger("topomap.graph_service"),
                "Graph computed in %.3f s: %zu key points, %zu nodes (frame '%s')",
                elapsed, result.keypoint_count, result.graph.size(), result.frame_id.c_str());
  } catch (const std::exception& e) {
    response.success = false;
    response.message = std::string("Graph computation failed: ") + e.what();
    RCLCPP_ERROR(rclcpp::get_logger("topomap.graph_service"), "%s", response.message.c_str());
  }
  return response;
}

PipelineResult GraphService::runPipeline(const nav_msgs::msg::OccupancyGrid& grid) {
  PipelineResult result;
  result.frame_id = grid.header.frame_id;

  RCLCPP_INFO(rclcpp::get_logger("topomap.graph_service"),
              "Computing the graph for a %ux%u map at %.3f m/cell",
              grid.info.width, grid.info.height, grid.info.resolution);

  // 1) Inflate obstacles and measure clearance
  const cv::Mat field = preprocessor_.distanceField(grid);

  // 2) Skeleton and key points
  const SkeletonResult skeleton = extractor_.extract(field);
  result.keypoint_count = skeleton.keypoints.size();
  if (skeleton.keypoints.empty()) {
    return result;
  }

  // 3) Raw graph on the skeleton
  const RawGraph raw = builder_.build(skeleton.keypoints, skeleton.skeleton);
  result.raw_node_count = raw.size();

  // 4) Two-round refinement
  const Graph refined = refiner_.refine(raw, skeleton.skeleton, builder_);

  // 5) World frame
  result.graph = CoordinateMapper::toWorld(refined, grid.info.resolution, grid.info.origin.position);
  return result;
}

}  // namespace topomap
