#include "mushroom_segmentation/segmentation/distance_transformer.hpp"

#include "mushroom_segmentation/segmentation/background_segmenter.hpp"

cv::Mat segmentation::distanceTransform(const cv::Mat& mask) {
  cv::Mat dist;
  cv::distanceTransform(mask, dist, cv::DIST_L2, cv::DIST_MASK_PRECISE,
                        CV_32F);
  return dist;
}

segmentation::DistanceMaps segmentation::computeDistanceMaps(
    const cv::Mat& foregroundMask, const cv::Mat& equalizedGray,
    const Settings& settings) {
  DistanceMaps maps;
  maps.plain = distanceTransform(foregroundMask);

  cv::Mat objectMask{segmentObjects(equalizedGray, foregroundMask, settings)};
  maps.equalized = distanceTransform(objectMask);

  return maps;
}
