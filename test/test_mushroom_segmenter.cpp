#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "mushroom_segmentation/segmentation/errors.hpp"
#include "mushroom_segmentation/segmentation/mushroom_segmenter.hpp"
#include "test_utils.hpp"

using segmentation::Settings;

namespace {

double centerDistance(const MushroomSegmenter::Circle& circle,
                      const cv::Point& expected) {
  return cv::norm(circle.center - expected);
}

}  // namespace

class MushroomSegmenterTest : public ::testing::Test {
 protected:
  void SetUp() override { settings_.compensationCoefficient = 1.0; }

  Settings settings_;
};

TEST_F(MushroomSegmenterTest, RejectsInvalidSettingsOnConstruction) {
  settings_.gaussianKernelSize = 6;
  try {
    MushroomSegmenter segmenter{settings_};
    FAIL() << "Expected InvalidParameterError";
  } catch (const segmentation::InvalidParameterError& e) {
    EXPECT_EQ(e.parameter(), "gaussian_kernel_size");
  }
}

TEST_F(MushroomSegmenterTest, EmptyImageGivesNoCircles) {
  MushroomSegmenter segmenter{settings_};
  EXPECT_TRUE(segmenter.segment(cv::Mat{}).empty());
}

TEST_F(MushroomSegmenterTest, AllBackgroundImageGivesNoCircles) {
  MushroomSegmenter segmenter{settings_};
  cv::Mat image(200, 200, CV_8UC3, cv::Scalar::all(0));
  EXPECT_TRUE(segmenter.segment(image).empty());
}

TEST_F(MushroomSegmenterTest, RejectsUnsupportedImageType) {
  MushroomSegmenter segmenter{settings_};
  cv::Mat image(50, 50, CV_8UC4, cv::Scalar::all(0));
  EXPECT_THROW(segmenter.segment(image), segmentation::InvalidImageError);
}

TEST_F(MushroomSegmenterTest, RecoversSingleDisk) {
  const cv::Point center{100, 100};
  const int radius{40};
  cv::Mat image{test_utils::makeDiskImage({200, 200}, {{center, radius}})};

  MushroomSegmenter segmenter{settings_};
  auto circles{segmenter.segment(image)};

  ASSERT_EQ(circles.size(), 1u);
  EXPECT_LE(centerDistance(circles[0], center), 2.0);
  // The dilation pass inflates the mask by a few pixels
  EXPECT_GE(circles[0].radius1, radius - 2);
  EXPECT_LE(circles[0].radius1, radius + 10);
  EXPECT_GT(circles[0].radius2, 0.0f);
  EXPECT_LE(circles[0].radius2, circles[0].radius1 + 1e-3f);
}

TEST_F(MushroomSegmenterTest, RecoversSingleDiskInGrayscale) {
  cv::Mat image{
      test_utils::makeDiskImage({200, 200}, {{{90, 110}, 35}}, false)};

  MushroomSegmenter segmenter{settings_};
  auto circles{segmenter.segment(image)};

  ASSERT_EQ(circles.size(), 1u);
  EXPECT_LE(centerDistance(circles[0], {90, 110}), 2.0);
}

TEST_F(MushroomSegmenterTest, DerivedCompensationScalesRadius) {
  cv::Mat image{test_utils::makeDiskImage({200, 200}, {{{100, 100}, 40}})};

  MushroomSegmenter uncompensated{settings_};
  settings_.compensationCoefficient.reset();
  MushroomSegmenter compensated{settings_};

  auto plain{uncompensated.segment(image)};
  auto scaled{compensated.segment(image)};

  ASSERT_EQ(plain.size(), 1u);
  ASSERT_EQ(scaled.size(), 1u);
  double coeff{segmentation::compensationCoefficient(settings_)};
  EXPECT_NEAR(scaled[0].radius1, plain[0].radius1 * coeff, 1e-3);
  EXPECT_NEAR(scaled[0].radius2, plain[0].radius2 * coeff, 1e-3);
}

TEST_F(MushroomSegmenterTest, SeparatesTwoDisjointDisks) {
  const cv::Point left{80, 100};
  const cv::Point right{220, 100};
  cv::Mat image{
      test_utils::makeDiskImage({300, 200}, {{left, 35}, {right, 35}})};

  MushroomSegmenter segmenter{settings_};
  auto circles{segmenter.segment(image)};

  ASSERT_EQ(circles.size(), 2u);
  bool leftFirst{circles[0].center.x < circles[1].center.x};
  const auto& leftCircle{leftFirst ? circles[0] : circles[1]};
  const auto& rightCircle{leftFirst ? circles[1] : circles[0]};
  EXPECT_LE(centerDistance(leftCircle, left), 2.0);
  EXPECT_LE(centerDistance(rightCircle, right), 2.0);
}

TEST_F(MushroomSegmenterTest, MergesDisksCloserThanMinPeakDistance) {
  // Centers 12 pixels apart, below the minimum peak distance of 15
  cv::Mat image{test_utils::makeDiskImage({200, 200},
                                          {{{90, 100}, 25}, {{102, 100}, 25}})};

  MushroomSegmenter segmenter{settings_};
  auto circles{segmenter.segment(image)};

  ASSERT_EQ(circles.size(), 1u);
  EXPECT_GE(circles[0].center.x, 85);
  EXPECT_LE(circles[0].center.x, 107);
  EXPECT_NEAR(circles[0].center.y, 100, 3);
}

TEST_F(MushroomSegmenterTest, Deterministic) {
  cv::Mat image{test_utils::makeDiskImage(
      {320, 240}, {{{70, 70}, 40}, {{200, 70}, 25}, {{70, 180}, 30}})};

  MushroomSegmenter segmenter{settings_};
  auto first{segmenter.segment(image)};
  auto second{segmenter.segment(image)};

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].center, second[i].center);
    EXPECT_EQ(first[i].radius1, second[i].radius1);
    EXPECT_EQ(first[i].radius2, second[i].radius2);
  }
}

TEST_F(MushroomSegmenterTest, HigherPeakThresholdNeverAddsCircles) {
  cv::Mat image{test_utils::makeDiskImage(
      {320, 280}, {{{70, 70}, 40}, {{200, 70}, 25}, {{70, 200}, 18}})};
  settings_.minDiameter = 20;

  size_t previous{std::numeric_limits<size_t>::max()};
  for (double rel : {0.0, 0.3, 0.55, 0.7, 0.9, 1.0}) {
    settings_.peaksRelThreshold = rel;
    MushroomSegmenter segmenter{settings_};
    size_t count{segmenter.segment(image).size()};
    EXPECT_LE(count, previous) << "peaks_rel_threshold " << rel;
    previous = count;
  }
}

TEST_F(MushroomSegmenterTest, NoCircleBelowMinimumDiameter) {
  cv::Mat image{test_utils::makeDiskImage(
      {320, 280}, {{{70, 70}, 40}, {{200, 70}, 25}, {{70, 200}, 18}})};

  for (int minDiameter : {20, 40, 60}) {
    settings_.minDiameter = minDiameter;
    MushroomSegmenter segmenter{settings_};
    auto circles{segmenter.segment(image)};

    EXPECT_FALSE(circles.empty()) << "min_diameter " << minDiameter;
    for (const auto& circle : circles) {
      EXPECT_GE(2.0f * circle.radius1, static_cast<float>(minDiameter));
    }
  }
}

TEST_F(MushroomSegmenterTest, SegmenterIsCopyable) {
  MushroomSegmenter segmenter{settings_};
  MushroomSegmenter copy{segmenter};
  EXPECT_EQ(copy.settings().minDiameter, settings_.minDiameter);
}
