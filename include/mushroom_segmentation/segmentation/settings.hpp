#pragma once

#include <optional>

namespace segmentation {

struct Settings {
  // Pixels brighter than this are foreground in the plain path
  int backThreshold{100};
  // Object boundary cut used in the equalized path
  int threshold{150};
  // Minimum accepted object diameter, in pixels
  int minDiameter{30};
  // Peaks must exceed this fraction of the distance map maximum
  double peaksRelThreshold{0.1};
  // Gaussian blur kernel extent, must be odd
  int gaussianKernelSize{5};
  double claheClipLimit{2.0};
  int claheTileSize{8};
  // Square structuring element size for opening and dilation, must be odd
  int morphologyKernelSize{3};
  int dilateIterations{5};
  // Discard peaks closer to the image border than the minimum peak distance
  bool excludeBorder{true};
  // Radius correction factor. Derived from the thresholds when unset.
  std::optional<double> compensationCoefficient;
};

/**
 * Checks every field of the settings.
 *
 * @param settings Settings to validate.
 * @throws InvalidParameterError naming the first invalid field.
 */
void validateSettings(const Settings& settings);

/**
 * Multiplicative factor applied to raw distance map radii to counteract the
 * boundary shift introduced by thresholding.
 *
 * @return settings.compensationCoefficient if set, otherwise
 * 1 + (threshold - backThreshold) / (255 - backThreshold).
 */
double compensationCoefficient(const Settings& settings);

/**
 * Minimum allowed distance between two accepted peaks, i.e. the minimum
 * object radius.
 */
int minPeakDistance(const Settings& settings);

}  // namespace segmentation
