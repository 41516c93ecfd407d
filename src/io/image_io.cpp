#include "mushroom_segmentation/io/image_io.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>

#include "mushroom_segmentation/io/validators.hpp"

cv::Mat io::loadImage(const std::string& path) {
  std::filesystem::path filePath{path};
  if (!isSupportedImageExtension(filePath)) {
    throw std::invalid_argument("Unsupported image format: " +
                                filePath.extension().string());
  }

  cv::Mat image{cv::imread(filePath.string(), cv::IMREAD_COLOR)};
  if (image.empty()) {
    throw std::runtime_error("Failed to load image: " + path);
  }

  spdlog::debug("Loaded image: {} ({}x{})", path, image.cols, image.rows);
  return image;
}

void io::saveImage(const cv::Mat& image, const std::string& path) {
  auto filePath{validateOutputPath(path)};

  bool success{false};
  try {
    success = cv::imwrite(filePath.string(), image);
  } catch (const cv::Exception& e) {
    throw std::runtime_error("Failed to save image: " + path + " (" +
                             e.what() + ")");
  }
  if (!success) {
    throw std::runtime_error("Failed to save image: " + path);
  }

  spdlog::debug("Saved image: {}", path);
}
