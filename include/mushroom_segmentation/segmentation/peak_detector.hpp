#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

#include "mushroom_segmentation/segmentation/settings.hpp"

namespace segmentation {

struct Peak {
  int row{0};
  int col{0};
  // Distance map value at (row, col)
  float value{0.0f};
};

/**
 * Finds local maxima of a distance map.
 *
 * A pixel is a candidate when it is the maximum of its square neighborhood of
 * radius minPeakDistance(settings) and its value is strictly above
 * max(min(map), peaksRelThreshold * max(map)). Candidates are visited by
 * descending value (row-major on ties) and rejected when they lie closer than
 * minPeakDistance to an already accepted peak.
 *
 * @param distanceMap CV_32FC1 distance map.
 * @param settings Uses minDiameter, peaksRelThreshold and excludeBorder.
 * @return Accepted peaks, strongest first. Empty if the map is all zero.
 */
std::vector<Peak> detectPeaks(const cv::Mat& distanceMap,
                              const Settings& settings);

}  // namespace segmentation
