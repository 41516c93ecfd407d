#pragma once

#include <stdexcept>
#include <string>

namespace segmentation {

/**
 * Thrown when a Settings field is outside of its valid range. Raised before
 * any pixel processing takes place.
 */
class InvalidParameterError : public std::invalid_argument {
 public:
  InvalidParameterError(const std::string& parameter, const std::string& reason)
      : std::invalid_argument("Invalid parameter '" + parameter +
                              "': " + reason),
        parameter_(parameter) {}

  const std::string& parameter() const noexcept { return parameter_; }

 private:
  std::string parameter_;
};

/**
 * Thrown when an input image is not 8-bit single or three channel.
 */
class InvalidImageError : public std::invalid_argument {
 public:
  explicit InvalidImageError(const std::string& reason)
      : std::invalid_argument("Invalid image: " + reason) {}
};

}  // namespace segmentation
