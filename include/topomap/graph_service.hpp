/**
 * @file graph_service.hpp
 * @brief Owner of the latest map and entry point of the grid to graph pipeline
 *
 * @details
 * GraphService has two states. Before the first valid grid arrives it is in
 * NoMap and every graph request blocks (condition variable, no polling and no
 * timeout) until a grid is ingested. Afterwards it is in HasMap; each new grid
 * replaces the previous one wholesale.
 *
 * Every request recomputes the graph from the current grid:
 * - GridPreprocessor: dilation + exact Euclidean distance transform
 * - SkeletonExtractor: thresholding, Zhang-Suen thinning, Harris keypoints
 * - GraphBuilder: one node per keypoint, skeleton walks for adjacency
 * - GraphRefiner: id resolution, symmetry, pruning, reconnection, cleanup
 * - CoordinateMapper: pixel to world conversion, JSON output
 *
 * Only one pipeline runs at a time so node ids stay deterministic.
 *
 * shutdown() releases requests still waiting for a map; they fail instead of
 * blocking process exit.
 */

#pragma once

#include <nav_msgs/msg/occupancy_grid.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "topomap/coordinate_mapper.hpp"
#include "topomap/graph_builder.hpp"
#include "topomap/graph_refiner.hpp"
#include "topomap/grid_preprocessor.hpp"
#include "topomap/node_id_sequence.hpp"
#include "topomap/skeleton_extractor.hpp"
#include "topomap/topology_parameters.hpp"
#include "topomap/topology_types.hpp"

namespace topomap {

struct PipelineResult {
  WorldGraph graph;
  size_t keypoint_count = 0;
  size_t raw_node_count = 0;
  std::string frame_id;
};

class GraphService {
public:
  GraphService(const TopologyParameters& params, std::shared_ptr<NodeIdSequence> ids);

  // Returns false (and keeps the current grid) if the grid is malformed
  bool ingestGrid(nav_msgs::msg::OccupancyGrid::ConstSharedPtr grid);

  bool hasMap() const;

  // Blocks until a grid has been ingested, then returns it.
  // Throws std::runtime_error if shutdown() is called while waiting.
  nav_msgs::msg::OccupancyGrid::ConstSharedPtr waitForMap() const;

  // Wakes every waiter; later requests without a map fail immediately
  void shutdown();

  // Runs the whole pipeline on the current grid. May throw.
  PipelineResult computeGraph();

  // computeGraph() serialized for the transport; never throws on pipeline errors
  GraphResponse handleRequest();

  // Empty string when the grid is well formed
  static std::string validateGrid(const nav_msgs::msg::OccupancyGrid& grid);

  const std::shared_ptr<NodeIdSequence>& ids() const { return ids_; }
  const TopologyParameters& parameters() const { return params_; }

private:
  PipelineResult runPipeline(const nav_msgs::msg::OccupancyGrid& grid);

  TopologyParameters params_;
  std::shared_ptr<NodeIdSequence> ids_;

  GridPreprocessor preprocessor_;
  SkeletonExtractor extractor_;
  GraphBuilder builder_;
  GraphRefiner refiner_;

  // Current grid, guarded by grid_mutex_
  mutable std::mutex grid_mutex_;
  mutable std::condition_variable map_ready_;
  nav_msgs::msg::OccupancyGrid::ConstSharedPtr grid_;
  bool shutting_down_ = false;

  // One computation in flight at a time
  std::mutex pipeline_mutex_;
};

}  // namespace topomap
