#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "mushroom_segmentation/segmentation/circle_extractor.hpp"

class Visualizer {
 public:
  struct Style {
    // BGR colors
    cv::Scalar centerColor{255, 0, 0};
    cv::Scalar radius1Color{0, 255, 0};
    cv::Scalar radius2Color{0, 0, 255};
    int lineThickness{2};
    int centerRadius{3};
  };

  enum class Orientation { HORIZONTAL, VERTICAL };

  Visualizer();
  explicit Visualizer(const Style& style);

  /**
   * Draws each circle's center, its radius1 outline and its radius2 outline.
   *
   * @param image Image to annotate. Grayscale images are converted to BGR.
   * @param circles Circles to draw.
   * @return Annotated BGR image. The input is not modified.
   */
  cv::Mat drawCircles(const cv::Mat& image,
                      const std::vector<segmentation::Circle>& circles) const;

  /**
   * Fills each radius2 disk with a translucent color, then draws the circle
   * outlines on top.
   *
   * @param alpha Opacity of the filled disks, in [0, 1].
   */
  cv::Mat createOverlay(const cv::Mat& image,
                        const std::vector<segmentation::Circle>& circles,
                        double alpha = 0.3) const;

  /**
   * Places two images of equal type side by side or on top of each other.
   */
  static cv::Mat createComparison(
      const cv::Mat& original, const cv::Mat& processed,
      Orientation orientation = Orientation::HORIZONTAL);

  static void display(const cv::Mat& image,
                      const std::string& windowName = "Segmentation Results",
                      bool wait = true);

  const Style& style() const { return style_; }

 private:
  void drawOnto(cv::Mat& target,
                const std::vector<segmentation::Circle>& circles) const;

  Style style_;
};
