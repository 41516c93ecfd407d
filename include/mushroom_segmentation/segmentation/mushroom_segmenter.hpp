#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

#include "mushroom_segmentation/segmentation/circle_extractor.hpp"
#include "mushroom_segmentation/segmentation/settings.hpp"

class MushroomSegmenter {
 public:
  using Circle = segmentation::Circle;

  /**
   * @param settings Segmentation settings, validated on construction.
   * @throws segmentation::InvalidParameterError if a setting is invalid.
   */
  explicit MushroomSegmenter(const segmentation::Settings& settings);
  MushroomSegmenter(const MushroomSegmenter&) = default;
  MushroomSegmenter& operator=(const MushroomSegmenter&) = default;
  MushroomSegmenter(MushroomSegmenter&&) noexcept = default;
  MushroomSegmenter& operator=(MushroomSegmenter&&) noexcept = default;
  ~MushroomSegmenter() = default;

  /**
   * Detects circular objects in an image.
   *
   * @param image CV_8UC3 (BGR) or CV_8UC1 image.
   * @return Detected circles in peak detection order. Empty for an empty
   * image or when nothing is found.
   * @throws segmentation::InvalidImageError for unsupported image types.
   */
  std::vector<Circle> segment(const cv::Mat& image) const;

  const segmentation::Settings& settings() const { return settings_; }

 private:
  segmentation::Settings settings_;
};
