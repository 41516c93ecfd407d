#pragma once

#include <opencv2/opencv.hpp>
#include <string>

namespace io {

/**
 * Decodes an image file into a BGR cv::Mat.
 *
 * @param path Image path with a supported extension.
 * @return CV_8UC3 image.
 * @throws std::invalid_argument if the extension is not supported.
 * @throws std::runtime_error if the file cannot be decoded.
 */
cv::Mat loadImage(const std::string& path);

/**
 * Encodes an image to disk, creating parent directories as needed.
 *
 * @throws std::runtime_error if the image cannot be written.
 */
void saveImage(const cv::Mat& image, const std::string& path);

}  // namespace io
