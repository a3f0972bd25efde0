#pragma once

#include <geometry_msgs/msg/point.hpp>

#include <string>

#include "topomap/topology_types.hpp"

namespace topomap {

// Pixel -> world conversion and JSON output of the refined graph.
//
// Only the origin translation is applied. Maps whose origin carries a
// rotation must be rotated by the consumer.
class CoordinateMapper {
public:
  static WorldGraph toWorld(const Graph& graph, double resolution,
                            const geometry_msgs::msg::Point& origin);

  // [{"x": .., "y": .., "id": .., "neighbors": [..]}, ...]
  static std::string toJson(const WorldGraph& graph);
};

}  // namespace topomap
