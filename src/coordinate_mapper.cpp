#include "topomap/coordinate_mapper.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace topomap {

WorldGraph CoordinateMapper::toWorld(const Graph& graph, double resolution,
                                     const geometry_msgs::msg::Point& origin) {
  WorldGraph world;
  world.reserve(graph.size());
  for (const auto& node : graph) {
    WorldNode w;
    w.id = node.id;
    w.x = node.pixel.x * resolution + origin.x;
    w.y = node.pixel.y * resolution + origin.y;
    // std::set iterates in ascending order
    w.neighbors.assign(node.neighbors.begin(), node.neighbors.end());
    world.push_back(std::move(w));
  }
  return world;
}

std::string CoordinateMapper::toJson(const WorldGraph& graph) {
  nlohmann::ordered_json doc = nlohmann::ordered_json::array();
  for (const auto& node : graph) {
    nlohmann::ordered_json entry;
    entry["x"] = node.x;
    entry["y"] = node.y;
    entry["id"] = node.id;
    entry["neighbors"] = node.neighbors;
    doc.push_back(entry);
  }
  return doc.dump();
}

}  // namespace topomap
