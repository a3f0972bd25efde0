#pragma once

namespace topomap {

// Tuning values for the grid to graph pipeline.
// Defaults are tuned for maps around 0.05 m/cell; adjust per map.
struct TopologyParameters {
  // Grid preprocessing
  int occupied_threshold = 1;        // occupancy >= this (or unknown) is an obstacle
  int dilation_half_width = 40;      // square structuring element half-width (cells)

  // Skeleton and corners
  double threshold_ratio = 0.5;      // skeleton mask: distance > mean * ratio
  double harris_k = 0.025;           // Harris sensitivity
  int harris_block_size = 3;
  int harris_aperture = 3;
  int min_peak_distance = 1;         // minimum separation between keypoints (pixels)
  double peak_threshold_ratio = 0.1; // relative to strongest corner response

  // Graph construction
  int discovery_passes = 10;
  double prune_distance = 100.0;     // pixels
};

}  // namespace topomap
