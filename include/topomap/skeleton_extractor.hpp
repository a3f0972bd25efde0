#pragma once

#include <opencv2/core.hpp>

#include <vector>

#include "topomap/topology_parameters.hpp"

namespace topomap {

struct SkeletonResult {
  cv::Mat skeleton;                 // CV_8U, 255 on the medial axis
  std::vector<cv::Point> keypoints; // (column, row), detection order
};

class SkeletonExtractor {
public:
  explicit SkeletonExtractor(const TopologyParameters& params);

  SkeletonResult extract(const cv::Mat& distance_field) const;

  // distance > mean(distance) * threshold_ratio
  cv::Mat candidateMask(const cv::Mat& distance_field) const;

  cv::Mat skeletonize(const cv::Mat& mask) const;

  // Local maxima of the Harris response over a skeleton image
  std::vector<cv::Point> detectKeypoints(const cv::Mat& skeleton) const;

private:
  double threshold_ratio_;
  double harris_k_;
  int harris_block_size_;
  int harris_aperture_;
  int min_peak_distance_;
  double peak_threshold_ratio_;
};

}  // namespace topomap
