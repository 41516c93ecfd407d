#include <gtest/gtest.h>

#include "mushroom_segmentation/visualization/visualizer.hpp"
#include "test_utils.hpp"

using segmentation::Circle;

namespace {

Circle makeCircle(int x, int y, float radius1, float radius2) {
  Circle circle;
  circle.center = {x, y};
  circle.radius1 = radius1;
  circle.radius2 = radius2;
  return circle;
}

}  // namespace

TEST(VisualizerTest, DrawsCenterAndBothRadii) {
  cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));
  Visualizer visualizer;

  cv::Mat annotated{
      visualizer.drawCircles(image, {makeCircle(50, 50, 30.0f, 20.0f)})};

  const auto& style{visualizer.style()};
  EXPECT_EQ(annotated.at<cv::Vec3b>(50, 50),
            cv::Vec3b(style.centerColor[0], style.centerColor[1],
                      style.centerColor[2]));
  EXPECT_EQ(annotated.at<cv::Vec3b>(50, 80),
            cv::Vec3b(style.radius1Color[0], style.radius1Color[1],
                      style.radius1Color[2]));
  EXPECT_EQ(annotated.at<cv::Vec3b>(50, 70),
            cv::Vec3b(style.radius2Color[0], style.radius2Color[1],
                      style.radius2Color[2]));
  // The input stays untouched
  EXPECT_EQ(cv::countNonZero(image.reshape(1)), 0);
}

TEST(VisualizerTest, GrayscaleInputIsPromotedToBgr) {
  cv::Mat gray(40, 40, CV_8UC1, cv::Scalar(0));
  Visualizer visualizer;

  cv::Mat annotated{
      visualizer.drawCircles(gray, {makeCircle(20, 20, 10.0f, 5.0f)})};
  EXPECT_EQ(annotated.type(), CV_8UC3);
}

TEST(VisualizerTest, OverlayBlendsFilledDisk) {
  cv::Mat image(100, 100, CV_8UC3, cv::Scalar::all(0));
  Visualizer::Style style;
  style.radius2Color = cv::Scalar(0, 0, 200);
  Visualizer visualizer{style};

  cv::Mat overlay{visualizer.createOverlay(
      image, {makeCircle(50, 50, 30.0f, 20.0f)}, 0.5)};

  // Inside radius2 but away from the outlines and the center dot
  EXPECT_NEAR(overlay.at<cv::Vec3b>(50, 60)[2], 100, 1);
  EXPECT_EQ(overlay.at<cv::Vec3b>(5, 5), cv::Vec3b(0, 0, 0));
}

TEST(VisualizerTest, ComparisonConcatenatesImages) {
  cv::Mat original(30, 40, CV_8UC3, cv::Scalar::all(10));
  cv::Mat processed(30, 40, CV_8UC3, cv::Scalar::all(20));

  cv::Mat horizontal{Visualizer::createComparison(original, processed)};
  EXPECT_EQ(horizontal.size(), cv::Size(80, 30));

  cv::Mat vertical{Visualizer::createComparison(
      original, processed, Visualizer::Orientation::VERTICAL)};
  EXPECT_EQ(vertical.size(), cv::Size(40, 60));

  cv::Mat gray(30, 40, CV_8UC1, cv::Scalar(10));
  EXPECT_EQ(Visualizer::createComparison(gray, processed).type(), CV_8UC3);

  cv::Mat taller(31, 40, CV_8UC3, cv::Scalar::all(0));
  EXPECT_THROW(Visualizer::createComparison(original, taller),
               std::invalid_argument);
}
