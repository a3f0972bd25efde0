#pragma once

#include <opencv2/core.hpp>

#include "topomap/graph_builder.hpp"
#include "topomap/topology_types.hpp"

namespace topomap {

// Turns a raw keypoint graph into the final symmetric, pruned graph.
// Every step takes a graph generation and returns the next one.
class GraphRefiner {
public:
  explicit GraphRefiner(double prune_distance = 100.0);

  // PixelRef -> node id at that pixel; ids pass through unchanged
  Graph resolveIds(const RawGraph& raw) const;

  // b in a.neighbors implies a in b.neighbors
  Graph symmetrize(const Graph& graph) const;

  // Drops every node closer than prune_distance (pixels) to an earlier kept node
  Graph prune(const Graph& graph) const;

  // Removes neighbor ids that do not belong to any node of the graph
  Graph removeDanglingEdges(const Graph& graph) const;

  static RawGraph toRaw(const Graph& graph);

  /**
   * @brief Full two-round refinement.
   *
   * Pruning throws away edges of the removed nodes, so the surviving nodes
   * are reconnected with a second skeleton discovery before the final
   * resolution and cleanup.
   */
  Graph refine(const RawGraph& raw, const cv::Mat& skeleton, const GraphBuilder& builder) const;

  double pruneDistance() const { return prune_distance_; }

private:
  double prune_distance_;
};

}  // namespace topomap
