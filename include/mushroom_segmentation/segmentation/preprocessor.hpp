#pragma once

#include <opencv2/opencv.hpp>

#include "mushroom_segmentation/segmentation/settings.hpp"

namespace segmentation {

struct PreprocessedImages {
  // Denoised single channel image
  cv::Mat blurred;
  // CLAHE output of the blurred image
  cv::Mat equalized;
};

/**
 * Converts an image to grayscale, blurs it and produces a contrast-equalized
 * variant of the blurred grayscale.
 *
 * @param image CV_8UC3 (BGR) or CV_8UC1 image.
 * @param settings Uses gaussianKernelSize, claheClipLimit and claheTileSize.
 * @return Blurred and equalized CV_8UC1 images of the same size as the input.
 * @throws InvalidParameterError if the blur kernel size is even or
 * non-positive.
 * @throws InvalidImageError if the image is not 8-bit with 1 or 3 channels.
 */
PreprocessedImages preprocess(const cv::Mat& image, const Settings& settings);

/**
 * Converts an 8-bit image to single channel. Grayscale input is returned
 * as-is (shallow copy).
 */
cv::Mat toGrayscale(const cv::Mat& image);

}  // namespace segmentation
