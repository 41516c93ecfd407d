#include <gtest/gtest.h>

#include "mushroom_segmentation/segmentation/background_segmenter.hpp"
#include "test_utils.hpp"

using segmentation::Settings;

TEST(BackgroundSegmenterTest, AllBackgroundGivesEmptyMask) {
  cv::Mat gray(100, 100, CV_8UC1, cv::Scalar(0));
  cv::Mat mask{segmentation::segmentBackground(gray, Settings{})};

  EXPECT_EQ(mask.type(), CV_8UC1);
  EXPECT_EQ(mask.size(), gray.size());
  EXPECT_EQ(cv::countNonZero(mask), 0);
}

TEST(BackgroundSegmenterTest, BrightObjectsAreForeground) {
  cv::Mat gray{test_utils::makeDiskImage({100, 100}, {{{50, 50}, 30}}, false)};
  cv::Mat mask{segmentation::segmentBackground(gray, Settings{})};

  EXPECT_EQ(mask.at<uchar>(50, 50), 255);
  EXPECT_EQ(mask.at<uchar>(2, 2), 0);
}

TEST(BackgroundSegmenterTest, DarkObjectsOnBrightBackgroundAreBackground) {
  cv::Mat gray{test_utils::makeDiskImage({100, 100}, {{{50, 50}, 30}}, false,
                                         0, 200)};
  cv::Mat mask{segmentation::segmentBackground(gray, Settings{})};

  EXPECT_EQ(mask.at<uchar>(50, 50), 0);
  EXPECT_EQ(mask.at<uchar>(2, 2), 255);
}

TEST(BackgroundSegmenterTest, OpeningRemovesSmallBlobs) {
  cv::Mat gray(120, 120, CV_8UC1, cv::Scalar(0));
  gray(cv::Rect(10, 10, 2, 2)).setTo(255);
  gray(cv::Rect(100, 15, 3, 3)).setTo(255);
  gray(cv::Rect(20, 100, 4, 4)).setTo(255);

  cv::Mat mask{segmentation::segmentBackground(gray, Settings{})};
  EXPECT_EQ(cv::countNonZero(mask), 0);

  cv::circle(gray, {60, 60}, 25, cv::Scalar(255), cv::FILLED);
  mask = segmentation::segmentBackground(gray, Settings{});
  EXPECT_EQ(mask.at<uchar>(60, 60), 255);
  EXPECT_EQ(mask.at<uchar>(11, 11), 0);
  EXPECT_EQ(mask.at<uchar>(101, 21), 0);
}

TEST(BackgroundSegmenterTest, DilationGrowsObjects) {
  cv::Mat gray{test_utils::makeDiskImage({100, 100}, {{{50, 50}, 30}}, false)};

  Settings noDilation;
  noDilation.dilateIterations = 0;
  Settings withDilation;
  withDilation.dilateIterations = 5;

  int areaWithout{
      cv::countNonZero(segmentation::segmentBackground(gray, noDilation))};
  int areaWith{
      cv::countNonZero(segmentation::segmentBackground(gray, withDilation))};
  EXPECT_GT(areaWith, areaWithout);
}

TEST(BackgroundSegmenterTest, ObjectMaskIsRestrictedToForeground) {
  cv::Mat foreground(60, 60, CV_8UC1, cv::Scalar(0));
  foreground(cv::Rect(0, 0, 30, 60)).setTo(255);
  cv::Mat equalized(60, 60, CV_8UC1, cv::Scalar(255));

  cv::Mat objects{
      segmentation::segmentObjects(equalized, foreground, Settings{})};

  EXPECT_EQ(objects.at<uchar>(30, 10), 255);
  EXPECT_EQ(objects.at<uchar>(30, 50), 0);
  cv::Mat outside;
  cv::bitwise_and(objects, ~foreground, outside);
  EXPECT_EQ(cv::countNonZero(outside), 0);
}

TEST(BackgroundSegmenterTest, ObjectMaskUsesObjectThreshold) {
  cv::Mat foreground(60, 60, CV_8UC1, cv::Scalar(255));
  cv::Mat equalized(60, 60, CV_8UC1, cv::Scalar(140));

  Settings settings;
  settings.threshold = 150;
  EXPECT_EQ(cv::countNonZero(
                segmentation::segmentObjects(equalized, foreground, settings)),
            0);

  settings.threshold = 130;
  EXPECT_EQ(cv::countNonZero(
                segmentation::segmentObjects(equalized, foreground, settings)),
            60 * 60);
}
