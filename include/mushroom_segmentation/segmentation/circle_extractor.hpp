#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

#include "mushroom_segmentation/segmentation/peak_detector.hpp"
#include "mushroom_segmentation/segmentation/settings.hpp"

namespace segmentation {

struct Circle {
  // Center in image pixel coordinates
  cv::Point center{-1, -1};
  // Radius read from the plain distance map
  float radius1{0.0f};
  // Radius read from the equalized distance map
  float radius2{0.0f};
};

/**
 * Turns peaks into circles. Both radii are scaled by
 * compensationCoefficient(settings). Circles whose diameter, taken from
 * radius1, is below settings.minDiameter are dropped.
 *
 * @param peaks Peaks from detectPeaks, in detection order.
 * @param plainDistanceMap CV_32FC1 map used for radius1.
 * @param equalizedDistanceMap CV_32FC1 map used for radius2.
 * @param settings Segmentation settings.
 * @return Circles in peak order.
 */
std::vector<Circle> extractCircles(const std::vector<Peak>& peaks,
                                   const cv::Mat& plainDistanceMap,
                                   const cv::Mat& equalizedDistanceMap,
                                   const Settings& settings);

}  // namespace segmentation
