#pragma once

#include <opencv2/core.hpp>

#include <memory>
#include <vector>

#include "topomap/node_id_sequence.hpp"
#include "topomap/topology_types.hpp"

namespace topomap {

/**
 * @brief Builds the raw keypoint graph on top of a skeleton image.
 *
 * Every keypoint becomes a node. Adjacency is discovered by walking the
 * skeleton outward from each node until another target keypoint is hit;
 * the hit is recorded as an unresolved PixelRef, to be turned into an id
 * by GraphRefiner.
 */
class GraphBuilder {
public:
  GraphBuilder(std::shared_ptr<NodeIdSequence> ids, int discovery_passes = 10);

  // One node per keypoint, in keypoint order, with fresh ids
  RawGraph createNodes(const std::vector<cv::Point>& keypoints);

  /**
   * @brief Adds PixelRef neighbors found by skeleton walks.
   *
   * Runs discovery_passes passes. In each pass, for every node and every
   * 8-neighbour of it that lies on the skeleton, a breadth-first walk starts
   * at that pixel. The walk stops at the first target other than the node
   * itself and links it; it only expands skeleton pixels.
   *
   * @param graph    nodes to connect; existing neighbors are kept
   * @param skeleton CV_8U skeleton image (non-zero = skeleton)
   * @param targets  pixels that terminate a walk
   */
  RawGraph discoverNeighbors(RawGraph graph, const cv::Mat& skeleton,
                             const std::vector<cv::Point>& targets) const;

  // createNodes + discoverNeighbors against all keypoints
  RawGraph build(const std::vector<cv::Point>& keypoints, const cv::Mat& skeleton);

  // In-bounds 8-neighbours in N, NE, E, SE, S, SW, W, NW order, never p itself
  static std::vector<cv::Point> eightNeighbors(const cv::Point& p, const cv::Size& size);

  int discoveryPasses() const { return discovery_passes_; }
  const std::shared_ptr<NodeIdSequence>& ids() const { return ids_; }

private:
  // Returns true and fills hit when a target other than home is reached
  bool walk(const cv::Point& start, const cv::Point& home, const cv::Mat& skeleton,
            const cv::Mat& target_mask, cv::Point& hit) const;

  std::shared_ptr<NodeIdSequence> ids_;
  int discovery_passes_;
};

}  // namespace topomap
