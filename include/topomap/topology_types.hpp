#pragma once

#include <opencv2/core.hpp>

#include <set>
#include <string>
#include <variant>
#include <vector>

namespace topomap {

// Pixel coordinate of a node that has not been turned into an id yet
struct PixelRef {
  int x;
  int y;

  bool operator==(const PixelRef& other) const { return x == other.x && y == other.y; }
  bool operator!=(const PixelRef& other) const { return !(*this == other); }
  bool operator<(const PixelRef& other) const {
    return (x < other.x) || (x == other.x && y < other.y);
  }
};

// Edge reference during construction: unresolved pixel or resolved node id
using NeighborRef = std::variant<PixelRef, int>;

struct RawNode {
  int id;
  cv::Point pixel;
  std::set<NeighborRef> neighbors;
};

using RawGraph = std::vector<RawNode>;

struct GraphNode {
  int id;
  cv::Point pixel;
  std::set<int> neighbors;
};

using Graph = std::vector<GraphNode>;

// Node in world frame, ready for serialization
struct WorldNode {
  int id;
  double x;
  double y;
  std::vector<int> neighbors;
};

using WorldGraph = std::vector<WorldNode>;

struct GraphResponse {
  bool success = false;
  std::string message;
};

inline PixelRef toPixelRef(const cv::Point& p) { return PixelRef{p.x, p.y}; }

}  // namespace topomap
