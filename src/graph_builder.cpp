#include "topomap/graph_builder.hpp"

#include <rclcpp/rclcpp.hpp>

#include <queue>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace topomap {

GraphBuilder::GraphBuilder(std::shared_ptr<NodeIdSequence> ids, int discovery_passes)
    : ids_(std::move(ids)), discovery_passes_(discovery_passes) {
  if (!ids_) {
    throw std::invalid_argument("GraphBuilder requires a node id sequence");
  }
  if (discovery_passes_ < 1) {
    throw std::invalid_argument("GraphBuilder requires at least one discovery pass");
  }
}

RawGraph GraphBuilder::createNodes(const std::vector<cv::Point>& keypoints) {
  RawGraph graph;
  graph.reserve(keypoints.size());
  for (const auto& kp : keypoints) {
    graph.push_back(RawNode{ids_->next(), kp, {}});
  }
  return graph;
}

RawGraph GraphBuilder::discoverNeighbors(RawGraph graph, const cv::Mat& skeleton,
                                         const std::vector<cv::Point>& targets) const {
  if (graph.empty()) {
    return graph;
  }
  if (skeleton.empty() || skeleton.type() != CV_8UC1) {
    throw std::invalid_argument("skeleton must be a non-empty CV_8UC1 image");
  }

  const cv::Rect bounds(0, 0, skeleton.cols, skeleton.rows);
  cv::Mat target_mask = cv::Mat::zeros(skeleton.size(), CV_8UC1);
  for (const auto& t : targets) {
    if (bounds.contains(t)) {
      target_mask.at<uchar>(t) = 255;
    }
  }

  // A single pass under-connects because of walk ordering; repeat it
  for (int pass = 0; pass < discovery_passes_; ++pass) {
    size_t added = 0;
    for (auto& node : graph) {
      if (!bounds.contains(node.pixel)) {
        continue;
      }
      for (const auto& start : eightNeighbors(node.pixel, skeleton.size())) {
        if (skeleton.at<uchar>(start) == 0) {
          continue;
        }
        cv::Point hit;
        if (walk(start, node.pixel, skeleton, target_mask, hit)) {
          if (node.neighbors.insert(toPixelRef(hit)).second) {
            ++added;
          }
        }
      }
    }
    RCLCPP_DEBUG(rclcpp::get_logger("topomap.graph_builder"),
                 "Discovery pass %d: %zu new neighbor references", pass, added);
  }
  return graph;
}

RawGraph GraphBuilder::build(const std::vector<cv::Point>& keypoints, const cv::Mat& skeleton) {
  return discoverNeighbors(createNodes(keypoints), skeleton, keypoints);
}

std::vector<cv::Point> GraphBuilder::eightNeighbors(const cv::Point& p, const cv::Size& size) {
  static const int dx[8] = {0, 1, 1, 1, 0, -1, -1, -1};
  static const int dy[8] = {-1, -1, 0, 1, 1, 1, 0, -1};

  std::vector<cv::Point> result;
  result.reserve(8);
  for (int k = 0; k < 8; ++k) {
    const int nx = p.x + dx[k];
    const int ny = p.y + dy[k];
    if (nx < 0 || nx >= size.width || ny < 0 || ny >= size.height)
      continue;
    result.emplace_back(nx, ny);
  }
  return result;
}

bool GraphBuilder::walk(const cv::Point& start, const cv::Point& home, const cv::Mat& skeleton,
                        const cv::Mat& target_mask, cv::Point& hit) const {
  const int width = skeleton.cols;
  std::unordered_set<int> seen;
  std::queue<cv::Point> q;

  seen.insert(start.x + start.y * width);
  if (start != home && target_mask.at<uchar>(start) != 0) {
    hit = start;
    return true;
  }
  q.push(start);

  while (!q.empty()) {
    const cv::Point curr = q.front();
    q.pop();
    for (const auto& n : eightNeighbors(curr, skeleton.size())) {
      if (!seen.insert(n.x + n.y * width).second)
        continue;
      if (n != home && target_mask.at<uchar>(n) != 0) {
        hit = n;
        return true;
      }
      if (skeleton.at<uchar>(n) != 0) {
        q.push(n);
      }
    }
  }
  return false;
}

}  // namespace topomap
