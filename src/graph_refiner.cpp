#include "topomap/graph_refiner.hpp"

#include <Eigen/Dense>
#include <rclcpp/rclcpp.hpp>

#include <map>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace topomap {

GraphRefiner::GraphRefiner(double prune_distance) : prune_distance_(prune_distance) {
  if (prune_distance_ < 0.0) {
    throw std::invalid_argument("prune distance must be non-negative");
  }
}

Graph GraphRefiner::resolveIds(const RawGraph& raw) const {
  std::map<PixelRef, int> ids;
  for (const auto& node : raw) {
    ids[toPixelRef(node.pixel)] = node.id;
  }

  Graph graph;
  graph.reserve(raw.size());
  size_t unresolved = 0;
  for (const auto& node : raw) {
    GraphNode resolved{node.id, node.pixel, {}};
    for (const auto& ref : node.neighbors) {
      if (const auto* id = std::get_if<int>(&ref)) {
        resolved.neighbors.insert(*id);
        continue;
      }
      const auto& pixel = std::get<PixelRef>(ref);
      auto it = ids.find(pixel);
      if (it == ids.end()) {
        ++unresolved;
        continue;
      }
      resolved.neighbors.insert(it->second);
    }
    graph.push_back(std::move(resolved));
  }

  if (unresolved > 0) {
    RCLCPP_DEBUG(rclcpp::get_logger("topomap.graph_refiner"),
                 "Dropped %zu neighbor references with no node at their pixel", unresolved);
  }
  return graph;
}

Graph GraphRefiner::symmetrize(const Graph& graph) const {
  Graph result = graph;
  for (size_t i = 0; i < result.size(); ++i) {
    for (size_t j = 0; j < result.size(); ++j) {
      if (i == j)
        continue;
      GraphNode& node = result[i];
      const GraphNode& other = result[j];
      if (other.neighbors.count(node.id) > 0) {
        node.neighbors.insert(other.id);
      }
    }
  }
  return result;
}

Graph GraphRefiner::prune(const Graph& graph) const {
  // Compared against the full list, not the shrinking one: earlier nodes win
  std::unordered_set<int> to_remove;
  for (size_t i = 0; i < graph.size(); ++i) {
    const GraphNode& node = graph[i];
    if (to_remove.count(node.id) > 0)
      continue;
    const Eigen::Vector2d p(node.pixel.x, node.pixel.y);
    for (size_t j = 0; j < graph.size(); ++j) {
      if (i == j)
        continue;
      const Eigen::Vector2d q(graph[j].pixel.x, graph[j].pixel.y);
      if ((q - p).norm() < prune_distance_) {
        to_remove.insert(graph[j].id);
      }
    }
  }

  Graph pruned;
  for (const auto& node : graph) {
    if (to_remove.count(node.id) == 0) {
      pruned.push_back(node);
    }
  }

  RCLCPP_DEBUG(rclcpp::get_logger("topomap.graph_refiner"),
               "Pruned %zu of %zu nodes closer than %.1f px", graph.size() - pruned.size(),
               graph.size(), prune_distance_);
  return pruned;
}

Graph GraphRefiner::removeDanglingEdges(const Graph& graph) const {
  std::unordered_set<int> present;
  for (const auto& node : graph) {
    present.insert(node.id);
  }

  Graph result;
  result.reserve(graph.size());
  for (const auto& node : graph) {
    GraphNode cleaned{node.id, node.pixel, {}};
    for (int n : node.neighbors) {
      if (present.count(n) > 0) {
        cleaned.neighbors.insert(n);
      }
    }
    result.push_back(std::move(cleaned));
  }
  return result;
}

RawGraph GraphRefiner::toRaw(const Graph& graph) {
  RawGraph raw;
  raw.reserve(graph.size());
  for (const auto& node : graph) {
    RawNode r{node.id, node.pixel, {}};
    for (int n : node.neighbors) {
      r.neighbors.insert(NeighborRef(n));
    }
    raw.push_back(std::move(r));
  }
  return raw;
}

Graph GraphRefiner::refine(const RawGraph& raw, const cv::Mat& skeleton,
                           const GraphBuilder& builder) const {
  // Round 1: ids, symmetry, pruning
  const Graph first = symmetrize(resolveIds(raw));
  const Graph pruned = prune(first);

  // Round 2: reconnect survivors on the skeleton, then clean up
  std::vector<cv::Point> survivors;
  survivors.reserve(pruned.size());
  for (const auto& node : pruned) {
    survivors.push_back(node.pixel);
  }
  const RawGraph reconnected = builder.discoverNeighbors(toRaw(pruned), skeleton, survivors);
  Graph refined = removeDanglingEdges(symmetrize(resolveIds(reconnected)));

  RCLCPP_INFO(rclcpp::get_logger("topomap.graph_refiner"),
              "Refined graph: %zu raw nodes -> %zu nodes", raw.size(), refined.size());
  return refined;
}

}  // namespace topomap
