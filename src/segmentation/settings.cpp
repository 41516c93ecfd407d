#include "mushroom_segmentation/segmentation/settings.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "mushroom_segmentation/segmentation/errors.hpp"

namespace {

void checkIntensity(const std::string& name, int value) {
  if (value < 0 || value > 255) {
    throw segmentation::InvalidParameterError(
        name, "must be between 0 and 255, got " + std::to_string(value));
  }
}

void checkOddKernel(const std::string& name, int value) {
  if (value < 1 || value % 2 == 0) {
    throw segmentation::InvalidParameterError(
        name, "must be a positive odd integer, got " + std::to_string(value));
  }
}

}  // namespace

void segmentation::validateSettings(const Settings& settings) {
  checkIntensity("back_threshold", settings.backThreshold);
  checkIntensity("threshold", settings.threshold);

  if (settings.minDiameter < 1) {
    throw InvalidParameterError(
        "min_diameter",
        "must be a positive integer, got " +
            std::to_string(settings.minDiameter));
  }

  if (!std::isfinite(settings.peaksRelThreshold) ||
      settings.peaksRelThreshold < 0.0 || settings.peaksRelThreshold > 1.0) {
    throw InvalidParameterError("peaks_rel_threshold",
                                "must be between 0 and 1, got " +
                                    std::to_string(settings.peaksRelThreshold));
  }

  checkOddKernel("gaussian_kernel_size", settings.gaussianKernelSize);

  if (!std::isfinite(settings.claheClipLimit) ||
      settings.claheClipLimit < 0.0) {
    throw InvalidParameterError("clahe_clip_limit",
                                "must be non-negative, got " +
                                    std::to_string(settings.claheClipLimit));
  }
  if (settings.claheTileSize < 1) {
    throw InvalidParameterError(
        "clahe_tile_size",
        "must be at least 1, got " + std::to_string(settings.claheTileSize));
  }

  checkOddKernel("morphology_kernel_size", settings.morphologyKernelSize);

  if (settings.dilateIterations < 0) {
    throw InvalidParameterError("dilate_iterations",
                                "must be non-negative, got " +
                                    std::to_string(settings.dilateIterations));
  }

  double coeff{compensationCoefficient(settings)};
  if (settings.compensationCoefficient) {
    if (!std::isfinite(coeff) || coeff <= 0.0) {
      throw InvalidParameterError(
          "compensation_coefficient",
          "must be positive, got " + std::to_string(coeff));
    }
  } else if (coeff <= 0.0) {
    // The derived coefficient is positive only while
    // threshold > 2 * back_threshold - 255
    throw InvalidParameterError(
        "threshold",
        "gives a non-positive compensation coefficient (" +
            std::to_string(coeff) + ") with back_threshold " +
            std::to_string(settings.backThreshold) +
            "; raise threshold or set compensation_coefficient");
  }
}

double segmentation::compensationCoefficient(const Settings& settings) {
  if (settings.compensationCoefficient) {
    return *settings.compensationCoefficient;
  }
  if (settings.backThreshold >= 255) {
    return 1.0;
  }
  return 1.0 + static_cast<double>(settings.threshold - settings.backThreshold) /
                   (255 - settings.backThreshold);
}

int segmentation::minPeakDistance(const Settings& settings) {
  return std::max(1, settings.minDiameter / 2);
}
