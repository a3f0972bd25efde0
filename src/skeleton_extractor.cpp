#include "topomap/skeleton_extractor.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/ximgproc.hpp>
#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace topomap {

namespace {

struct Peak {
  float response;
  cv::Point pixel;
};

}  // namespace

SkeletonExtractor::SkeletonExtractor(const TopologyParameters& params)
    : threshold_ratio_(params.threshold_ratio),
      harris_k_(params.harris_k),
      harris_block_size_(params.harris_block_size),
      harris_aperture_(params.harris_aperture),
      min_peak_distance_(params.min_peak_distance),
      peak_threshold_ratio_(params.peak_threshold_ratio) {
  if (min_peak_distance_ < 1) {
    throw std::invalid_argument("minimum keypoint distance must be at least 1 pixel");
  }
}

SkeletonResult SkeletonExtractor::extract(const cv::Mat& distance_field) const {
  SkeletonResult result;
  result.skeleton = skeletonize(candidateMask(distance_field));
  result.keypoints = detectKeypoints(result.skeleton);

  RCLCPP_INFO(rclcpp::get_logger("topomap.skeleton_extractor"),
              "Skeleton has %d pixels, detected %zu key points",
              cv::countNonZero(result.skeleton), result.keypoints.size());
  return result;
}

cv::Mat SkeletonExtractor::candidateMask(const cv::Mat& distance_field) const {
  if (distance_field.empty() || distance_field.type() != CV_32FC1) {
    throw std::invalid_argument("distance field must be a non-empty CV_32FC1 matrix");
  }

  cv::Mat mask = cv::Mat::zeros(distance_field.size(), CV_8UC1);
  const double mean = cv::mean(distance_field)[0];
  if (!std::isfinite(mean)) {
    // No obstacle anywhere: nothing is "far from obstacles" in a meaningful way
    return mask;
  }

  cv::compare(distance_field, mean * threshold_ratio_, mask, cv::CMP_GT);
  return mask;
}

cv::Mat SkeletonExtractor::skeletonize(const cv::Mat& mask) const {
  if (cv::countNonZero(mask) == 0) {
    return cv::Mat::zeros(mask.size(), CV_8UC1);
  }

  // Zhang-Suen never touches the outermost pixel ring, so pad first
  cv::Mat padded;
  cv::copyMakeBorder(mask, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));

  cv::Mat thinned;
  cv::ximgproc::thinning(padded, thinned, cv::ximgproc::THINNING_ZHANGSUEN);

  return thinned(cv::Rect(1, 1, mask.cols, mask.rows)).clone();
}

std::vector<cv::Point> SkeletonExtractor::detectKeypoints(const cv::Mat& skeleton) const {
  std::vector<cv::Point> keypoints;
  if (cv::countNonZero(skeleton) == 0) {
    return keypoints;
  }

  cv::Mat image;
  skeleton.convertTo(image, CV_32F, 1.0 / 255.0);

  cv::Mat response;
  cv::cornerHarris(image, response, harris_block_size_, harris_aperture_, harris_k_);

  double max_response = 0.0;
  cv::minMaxLoc(response, nullptr, &max_response);
  if (max_response <= 0.0) {
    return keypoints;
  }
  const double threshold = max_response * peak_threshold_ratio_;

  const int d = min_peak_distance_;
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(2 * d + 1, 2 * d + 1));
  cv::Mat local_max;
  cv::dilate(response, local_max, kernel);

  std::vector<Peak> peaks;
  for (int y = d; y < response.rows - d; ++y) {
    const float* r_row = response.ptr<float>(y);
    const float* m_row = local_max.ptr<float>(y);
    for (int x = d; x < response.cols - d; ++x) {
      if (r_row[x] > 0.0f && r_row[x] > threshold && r_row[x] >= m_row[x]) {
        peaks.push_back({r_row[x], cv::Point(x, y)});
      }
    }
  }

  // Strongest first; equal responses keep row-major order
  std::stable_sort(peaks.begin(), peaks.end(),
                   [](const Peak& a, const Peak& b) { return a.response > b.response; });

  // Plateaus produce several equal maxima next to each other; keep one
  cv::Mat taken = cv::Mat::zeros(response.size(), CV_8UC1);
  for (const auto& peak : peaks) {
    const cv::Rect window(peak.pixel.x - d, peak.pixel.y - d, 2 * d + 1, 2 * d + 1);
    const cv::Rect clipped = window & cv::Rect(0, 0, taken.cols, taken.rows);
    if (cv::countNonZero(taken(clipped)) > 0) {
      continue;
    }
    taken.at<uchar>(peak.pixel) = 255;
    keypoints.push_back(peak.pixel);
  }

  RCLCPP_DEBUG(rclcpp::get_logger("topomap.skeleton_extractor"),
               "Harris max response %.4f, %zu peak candidates, %zu accepted",
               max_response, peaks.size(), keypoints.size());
  return keypoints;
}

}  // namespace topomap
