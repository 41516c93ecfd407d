#pragma once

#include <opencv2/opencv.hpp>

#include "mushroom_segmentation/segmentation/settings.hpp"

namespace segmentation {

struct DistanceMaps {
  // Distance map of the background-threshold mask
  cv::Mat plain;
  // Distance map of the equalized-path object mask
  cv::Mat equalized;
};

/**
 * Replaces every foreground pixel with its exact Euclidean distance to the
 * nearest background pixel. Background pixels are 0.
 *
 * @param mask CV_8UC1 binary mask, non-zero for foreground.
 * @return CV_32FC1 distance map.
 */
cv::Mat distanceTransform(const cv::Mat& mask);

/**
 * Computes the plain and equalized distance maps.
 *
 * @param foregroundMask Mask returned by segmentBackground.
 * @param equalizedGray Contrast-equalized grayscale from preprocess.
 * @param settings Segmentation settings.
 * @return Both distance maps, where equalized <= plain pixel-wise.
 */
DistanceMaps computeDistanceMaps(const cv::Mat& foregroundMask,
                                 const cv::Mat& equalizedGray,
                                 const Settings& settings);

}  // namespace segmentation
