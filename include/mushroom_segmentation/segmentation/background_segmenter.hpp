#pragma once

#include <opencv2/opencv.hpp>

#include "mushroom_segmentation/segmentation/settings.hpp"

namespace segmentation {

/**
 * Separates objects from the background. Objects are assumed to be brighter
 * than the background: pixels with intensity strictly above
 * settings.backThreshold are foreground.
 *
 * The binary image is opened max(1, minDiameter / 3) times with a square
 * element of morphologyKernelSize to drop noise blobs, then dilated
 * dilateIterations times to reconnect fragmented objects.
 *
 * @param blurredGray CV_8UC1 blurred grayscale image.
 * @param settings Segmentation settings.
 * @return CV_8UC1 mask, 255 for foreground and 0 for background.
 */
cv::Mat segmentBackground(const cv::Mat& blurredGray,
                          const Settings& settings);

/**
 * Builds the object mask of the equalized path: pixels of equalizedGray above
 * settings.threshold, cleaned up the same way as segmentBackground, and
 * restricted to foregroundMask.
 *
 * @param equalizedGray CV_8UC1 contrast-equalized grayscale image.
 * @param foregroundMask Mask returned by segmentBackground.
 * @param settings Segmentation settings.
 * @return CV_8UC1 mask that is a subset of foregroundMask.
 */
cv::Mat segmentObjects(const cv::Mat& equalizedGray,
                       const cv::Mat& foregroundMask, const Settings& settings);

}  // namespace segmentation
