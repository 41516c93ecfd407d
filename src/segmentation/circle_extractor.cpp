#include "mushroom_segmentation/segmentation/circle_extractor.hpp"

#include <spdlog/spdlog.h>

std::vector<segmentation::Circle> segmentation::extractCircles(
    const std::vector<Peak>& peaks, const cv::Mat& plainDistanceMap,
    const cv::Mat& equalizedDistanceMap, const Settings& settings) {
  double coeff{compensationCoefficient(settings)};
  cv::Rect plainBounds{0, 0, plainDistanceMap.cols, plainDistanceMap.rows};
  cv::Rect equalizedBounds{0, 0, equalizedDistanceMap.cols,
                           equalizedDistanceMap.rows};

  std::vector<Circle> circles;
  circles.reserve(peaks.size());
  for (const auto& peak : peaks) {
    cv::Point point{peak.col, peak.row};
    if (!plainBounds.contains(point) || !equalizedBounds.contains(point)) {
      spdlog::warn("Peak ({}, {}) lies outside of the distance maps", point.x,
                   point.y);
      continue;
    }

    Circle circle;
    circle.center = point;
    circle.radius1 = static_cast<float>(
        plainDistanceMap.at<float>(peak.row, peak.col) * coeff);
    circle.radius2 = static_cast<float>(
        equalizedDistanceMap.at<float>(peak.row, peak.col) * coeff);

    if (2.0f * circle.radius1 < settings.minDiameter) {
      continue;
    }
    circles.push_back(circle);
  }

  spdlog::debug("Kept {} of {} peaks (compensation coefficient {:.3f})",
                circles.size(), peaks.size(), coeff);
  return circles;
}
