// Tests for id resolution, symmetry, pruning and reconnection

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

#include "topomap/graph_builder.hpp"
#include "topomap/graph_refiner.hpp"

using topomap::Graph;
using topomap::GraphNode;
using topomap::GraphRefiner;
using topomap::PixelRef;
using topomap::RawGraph;
using topomap::RawNode;

namespace {

const GraphNode* findNode(const Graph& graph, int id)
{
  for (const auto& node : graph) {
    if (node.id == id) {
      return &node;
    }
  }
  return nullptr;
}

}  // namespace

TEST(GraphRefinerTest, PixelReferencesResolveToIds)
{
  RawGraph raw;
  raw.push_back(RawNode{5, {0, 0}, {PixelRef{10, 0}}});
  raw.push_back(RawNode{6, {10, 0}, {5, PixelRef{99, 99}}});

  GraphRefiner refiner;
  Graph graph = refiner.resolveIds(raw);

  ASSERT_EQ(graph.size(), 2u);
  EXPECT_EQ(graph[0].neighbors, std::set<int>({6}));
  // Plain ids pass through, unknown pixels are dropped
  EXPECT_EQ(graph[1].neighbors, std::set<int>({5}));
  EXPECT_EQ(graph[1].pixel, cv::Point(10, 0));
}

TEST(GraphRefinerTest, SymmetrizeAddsReverseEdges)
{
  Graph graph = {
    GraphNode{1, {0, 0}, {2}},
    GraphNode{2, {5, 0}, {}},
    GraphNode{3, {9, 0}, {1}},
  };

  GraphRefiner refiner;
  Graph sym = refiner.symmetrize(graph);

  EXPECT_EQ(sym[0].neighbors, std::set<int>({2, 3}));
  EXPECT_EQ(sym[1].neighbors, std::set<int>({1}));
  EXPECT_EQ(sym[2].neighbors, std::set<int>({1}));
  // Input is untouched
  EXPECT_TRUE(graph[1].neighbors.empty());
}

TEST(GraphRefinerTest, SymmetrizeIsIdempotent)
{
  Graph graph = {
    GraphNode{1, {0, 0}, {2, 3}},
    GraphNode{2, {5, 0}, {3}},
    GraphNode{3, {9, 0}, {}},
  };

  GraphRefiner refiner;
  Graph once = refiner.symmetrize(graph);
  Graph twice = refiner.symmetrize(once);

  ASSERT_EQ(once.size(), twice.size());
  for (size_t i = 0; i < once.size(); ++i) {
    EXPECT_EQ(once[i].neighbors, twice[i].neighbors);
  }
}

TEST(GraphRefinerTest, CloseNodesCollapseToTheFirst)
{
  Graph graph = {
    GraphNode{1, {0, 0}, {2}},
    GraphNode{2, {50, 0}, {1}},
  };

  GraphRefiner refiner(100.0);
  Graph pruned = refiner.prune(graph);

  ASSERT_EQ(pruned.size(), 1u);
  EXPECT_EQ(pruned[0].id, 1);
}

TEST(GraphRefinerTest, PruneDependsOnListOrder)
{
  // B is near A and C, but A and C are far apart
  Graph graph = {
    GraphNode{1, {0, 0}, {}},
    GraphNode{2, {60, 0}, {}},
    GraphNode{3, {120, 0}, {}},
  };

  GraphRefiner refiner(100.0);
  Graph pruned = refiner.prune(graph);
  ASSERT_EQ(pruned.size(), 2u);
  EXPECT_EQ(pruned[0].id, 1);
  EXPECT_EQ(pruned[1].id, 3);

  // With B first, it removes both of the others
  Graph reordered = {graph[1], graph[0], graph[2]};
  Graph pruned_reordered = refiner.prune(reordered);
  ASSERT_EQ(pruned_reordered.size(), 1u);
  EXPECT_EQ(pruned_reordered[0].id, 2);
}

TEST(GraphRefinerTest, PruneDistanceIsStrict)
{
  Graph graph = {
    GraphNode{1, {0, 0}, {}},
    GraphNode{2, {60, 80}, {}},  // exactly 100 px away
  };

  GraphRefiner refiner(100.0);
  EXPECT_EQ(refiner.prune(graph).size(), 2u);
}

TEST(GraphRefinerTest, DanglingEdgesAreRemoved)
{
  Graph graph = {
    GraphNode{1, {0, 0}, {2, 7}},
    GraphNode{2, {200, 0}, {1, 8}},
  };

  GraphRefiner refiner;
  Graph cleaned = refiner.removeDanglingEdges(graph);

  EXPECT_EQ(cleaned[0].neighbors, std::set<int>({2}));
  EXPECT_EQ(cleaned[1].neighbors, std::set<int>({1}));
}

TEST(GraphRefinerTest, RefineReconnectsSurvivors)
{
  cv::Mat skeleton = cv::Mat::zeros(40, 230, CV_8UC1);
  cv::line(skeleton, cv::Point(10, 20), cv::Point(210, 20), cv::Scalar(255));
  const cv::Point a(10, 20), m(60, 20), b(210, 20);

  topomap::GraphBuilder builder(std::make_shared<topomap::NodeIdSequence>());
  RawGraph raw = builder.build({a, m, b}, skeleton);
  ASSERT_EQ(raw.size(), 3u);
  const int id_a = raw[0].id;
  const int id_m = raw[1].id;
  const int id_b = raw[2].id;

  // Before refinement A and B only reach each other through M
  GraphRefiner refiner(100.0);
  Graph refined = refiner.refine(raw, skeleton, builder);

  ASSERT_EQ(refined.size(), 2u);
  EXPECT_EQ(findNode(refined, id_m), nullptr);
  const GraphNode* na = findNode(refined, id_a);
  const GraphNode* nb = findNode(refined, id_b);
  ASSERT_NE(na, nullptr);
  ASSERT_NE(nb, nullptr);
  EXPECT_EQ(na->neighbors, std::set<int>({id_b}));
  EXPECT_EQ(nb->neighbors, std::set<int>({id_a}));
}

TEST(GraphRefinerTest, RefinedGraphIsSymmetricWithoutDanglingEdges)
{
  cv::Mat skeleton = cv::Mat::zeros(300, 300, CV_8UC1);
  cv::line(skeleton, cv::Point(20, 150), cv::Point(280, 150), cv::Scalar(255));
  cv::line(skeleton, cv::Point(150, 20), cv::Point(150, 280), cv::Scalar(255));
  const std::vector<cv::Point> keypoints = {
    {20, 150}, {150, 150}, {280, 150}, {150, 20}, {150, 280}, {160, 150}};

  topomap::GraphBuilder builder(std::make_shared<topomap::NodeIdSequence>());
  GraphRefiner refiner(100.0);
  Graph refined = refiner.refine(builder.build(keypoints, skeleton), skeleton, builder);

  for (const auto& node : refined) {
    for (int n : node.neighbors) {
      const GraphNode* other = findNode(refined, n);
      ASSERT_NE(other, nullptr) << "dangling edge " << node.id << " -> " << n;
      EXPECT_EQ(other->neighbors.count(node.id), 1u);
    }
    for (const auto& other : refined) {
      if (other.id != node.id) {
        EXPECT_GE(cv::norm(other.pixel - node.pixel), 100.0);
      }
    }
  }
}

TEST(GraphRefinerTest, NegativePruneDistanceRejected)
{
  EXPECT_THROW(GraphRefiner(-1.0), std::invalid_argument);
}
