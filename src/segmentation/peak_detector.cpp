#include "mushroom_segmentation/segmentation/peak_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

std::vector<segmentation::Peak> segmentation::detectPeaks(
    const cv::Mat& distanceMap, const Settings& settings) {
  std::vector<Peak> peaks;
  if (distanceMap.empty()) {
    return peaks;
  }

  double minVal{0.0};
  double maxVal{0.0};
  cv::minMaxLoc(distanceMap, &minVal, &maxVal);
  if (maxVal <= 0.0) {
    return peaks;
  }
  float threshold{static_cast<float>(
      std::max(minVal, settings.peaksRelThreshold * maxVal))};

  int minDistance{minPeakDistance(settings)};

  // A pixel is a local maximum when it survives a maximum filter unchanged
  cv::Mat maxFiltered;
  cv::Mat window{cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(2 * minDistance + 1, 2 * minDistance + 1))};
  cv::dilate(distanceMap, maxFiltered, window);

  int border{settings.excludeBorder ? minDistance : 0};
  std::vector<Peak> candidates;
  for (int y = border; y < distanceMap.rows - border; ++y) {
    const float* drow{distanceMap.ptr<float>(y)};
    const float* mrow{maxFiltered.ptr<float>(y)};
    for (int x = border; x < distanceMap.cols - border; ++x) {
      float v{drow[x]};
      if (v > threshold && v == mrow[x]) {
        candidates.push_back({y, x, v});
      }
    }
  }

  // Strongest first; stable so ties keep row-major order
  std::stable_sort(
      candidates.begin(), candidates.end(),
      [](const Peak& a, const Peak& b) { return a.value > b.value; });

  int minDistanceSq{minDistance * minDistance};
  for (const auto& candidate : candidates) {
    bool tooClose{std::any_of(
        peaks.begin(), peaks.end(), [&](const Peak& accepted) {
          int dy{candidate.row - accepted.row};
          int dx{candidate.col - accepted.col};
          return dx * dx + dy * dy < minDistanceSq;
        })};
    if (!tooClose) {
      peaks.push_back(candidate);
    }
  }

  spdlog::debug("Found {} local maxima out of {} candidates", peaks.size(),
                candidates.size());
  return peaks;
}
