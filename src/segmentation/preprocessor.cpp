#include "mushroom_segmentation/segmentation/preprocessor.hpp"

#include <string>

#include "mushroom_segmentation/segmentation/errors.hpp"

cv::Mat segmentation::toGrayscale(const cv::Mat& image) {
  if (image.depth() != CV_8U) {
    throw InvalidImageError("expected 8-bit samples, got depth " +
                            std::to_string(image.depth()));
  }

  switch (image.channels()) {
    case 1:
      return image;
    case 3: {
      cv::Mat gray;
      cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
      return gray;
    }
    default:
      throw InvalidImageError("expected 1 or 3 channels, got " +
                              std::to_string(image.channels()));
  }
}

segmentation::PreprocessedImages segmentation::preprocess(
    const cv::Mat& image, const Settings& settings) {
  int kernelSize{settings.gaussianKernelSize};
  if (kernelSize < 1 || kernelSize % 2 == 0) {
    throw InvalidParameterError(
        "gaussian_kernel_size",
        "must be a positive odd integer, got " + std::to_string(kernelSize));
  }

  cv::Mat gray{toGrayscale(image)};

  PreprocessedImages result;
  // Sigma of 0 lets OpenCV derive it from the kernel size
  cv::GaussianBlur(gray, result.blurred, cv::Size(kernelSize, kernelSize), 0);

  cv::Ptr<cv::CLAHE> clahe{cv::createCLAHE(
      settings.claheClipLimit,
      cv::Size(settings.claheTileSize, settings.claheTileSize))};
  clahe->apply(result.blurred, result.equalized);

  return result;
}
