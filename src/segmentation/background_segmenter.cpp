#include "mushroom_segmentation/segmentation/background_segmenter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

/**
 * Thresholds at cutoff (strictly greater is foreground), opens to remove
 * small blobs and dilates to reconnect broken objects.
 */
cv::Mat thresholdAndClean(const cv::Mat& gray, int cutoff,
                          const segmentation::Settings& settings) {
  cv::Mat binary;
  cv::threshold(gray, binary, cutoff, 255, cv::THRESH_BINARY);

  cv::Mat kernel{cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(settings.morphologyKernelSize,
                               settings.morphologyKernelSize))};

  // Larger objects tolerate more aggressive noise removal
  int openIterations{std::max(1, settings.minDiameter / 3)};
  cv::Mat opened;
  cv::morphologyEx(binary, opened, cv::MORPH_OPEN, kernel, cv::Point(-1, -1),
                   openIterations);

  if (settings.dilateIterations == 0) {
    return opened;
  }

  cv::Mat dilated;
  cv::dilate(opened, dilated, kernel, cv::Point(-1, -1),
             settings.dilateIterations);
  return dilated;
}

}  // namespace

cv::Mat segmentation::segmentBackground(const cv::Mat& blurredGray,
                                        const Settings& settings) {
  cv::Mat mask{thresholdAndClean(blurredGray, settings.backThreshold, settings)};
  spdlog::debug("Foreground mask covers {} of {} pixels",
                cv::countNonZero(mask), mask.total());
  return mask;
}

cv::Mat segmentation::segmentObjects(const cv::Mat& equalizedGray,
                                     const cv::Mat& foregroundMask,
                                     const Settings& settings) {
  cv::Mat cleaned{thresholdAndClean(equalizedGray, settings.threshold, settings)};

  cv::Mat mask;
  cv::bitwise_and(cleaned, foregroundMask, mask);
  return mask;
}
