#include "mushroom_segmentation/visualization/visualizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

cv::Mat toBgr(const cv::Mat& image) {
  cv::Mat bgr;
  if (image.channels() == 1) {
    cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
  } else {
    bgr = image.clone();
  }
  return bgr;
}

}  // namespace

Visualizer::Visualizer() = default;

Visualizer::Visualizer(const Style& style) : style_(style) {}

cv::Mat Visualizer::drawCircles(
    const cv::Mat& image,
    const std::vector<segmentation::Circle>& circles) const {
  cv::Mat annotated{toBgr(image)};
  drawOnto(annotated, circles);
  return annotated;
}

cv::Mat Visualizer::createOverlay(
    const cv::Mat& image, const std::vector<segmentation::Circle>& circles,
    double alpha) const {
  alpha = std::clamp(alpha, 0.0, 1.0);

  cv::Mat output{toBgr(image)};
  cv::Mat overlay{output.clone()};
  for (const auto& circle : circles) {
    cv::circle(overlay, circle.center, cvRound(circle.radius2),
               style_.radius2Color, cv::FILLED);
  }
  cv::addWeighted(overlay, alpha, output, 1.0 - alpha, 0.0, output);

  drawOnto(output, circles);
  return output;
}

cv::Mat Visualizer::createComparison(const cv::Mat& original,
                                     const cv::Mat& processed,
                                     Orientation orientation) {
  cv::Mat left{original};
  cv::Mat right{processed};
  // Annotated images are always BGR, so promote grayscale originals
  if (left.channels() != right.channels()) {
    left = toBgr(left);
    right = toBgr(right);
  }

  cv::Mat comparison;
  if (orientation == Orientation::HORIZONTAL) {
    if (left.rows != right.rows) {
      throw std::invalid_argument(
          "Images must have the same height for a horizontal comparison");
    }
    cv::hconcat(left, right, comparison);
  } else {
    if (left.cols != right.cols) {
      throw std::invalid_argument(
          "Images must have the same width for a vertical comparison");
    }
    cv::vconcat(left, right, comparison);
  }
  return comparison;
}

void Visualizer::display(const cv::Mat& image, const std::string& windowName,
                         bool wait) {
  cv::imshow(windowName, image);
  if (wait) {
    cv::waitKey(0);
    cv::destroyAllWindows();
  }
}

void Visualizer::drawOnto(
    cv::Mat& target, const std::vector<segmentation::Circle>& circles) const {
  for (const auto& circle : circles) {
    cv::circle(target, circle.center, style_.centerRadius, style_.centerColor,
               cv::FILLED);
    cv::circle(target, circle.center, cvRound(circle.radius1),
               style_.radius1Color, style_.lineThickness);
    // radius2 comes from the equalized path
    cv::circle(target, circle.center, cvRound(circle.radius2),
               style_.radius2Color, style_.lineThickness);
  }
}
