#include "mushroom_segmentation/segmentation/mushroom_segmenter.hpp"

#include <spdlog/spdlog.h>

#include "mushroom_segmentation/segmentation/background_segmenter.hpp"
#include "mushroom_segmentation/segmentation/distance_transformer.hpp"
#include "mushroom_segmentation/segmentation/peak_detector.hpp"
#include "mushroom_segmentation/segmentation/preprocessor.hpp"

MushroomSegmenter::MushroomSegmenter(const segmentation::Settings& settings)
    : settings_(settings) {
  segmentation::validateSettings(settings_);
}

std::vector<MushroomSegmenter::Circle> MushroomSegmenter::segment(
    const cv::Mat& image) const {
  if (image.empty()) {
    spdlog::warn("Empty image, nothing to segment");
    return {};
  }

  spdlog::debug("Starting segmentation of {}x{} image with {} channel(s)",
                image.cols, image.rows, image.channels());

  auto preprocessed{segmentation::preprocess(image, settings_)};

  cv::Mat foregroundMask{
      segmentation::segmentBackground(preprocessed.blurred, settings_)};
  if (cv::countNonZero(foregroundMask) == 0) {
    spdlog::info("Segmentation complete. No foreground found");
    return {};
  }

  auto distanceMaps{segmentation::computeDistanceMaps(
      foregroundMask, preprocessed.equalized, settings_)};

  // Centers come from the plain map only
  auto peaks{segmentation::detectPeaks(distanceMaps.plain, settings_)};

  auto circles{segmentation::extractCircles(peaks, distanceMaps.plain,
                                            distanceMaps.equalized, settings_)};

  spdlog::info("Segmentation complete. Found {} objects", circles.size());
  return circles;
}
