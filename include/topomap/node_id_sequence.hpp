#pragma once

#include <atomic>

namespace topomap {

// Monotonic node id source. Ids handed out are never reused for the
// lifetime of the sequence, across any number of graph computations.
class NodeIdSequence {
public:
  explicit NodeIdSequence(int first = 0) : next_(first) {}

  NodeIdSequence(const NodeIdSequence&) = delete;
  NodeIdSequence& operator=(const NodeIdSequence&) = delete;

  int next() { return next_.fetch_add(1); }

  // Id the next call to next() will return
  int peek() const { return next_.load(); }

private:
  std::atomic<int> next_;
};

}  // namespace topomap
