#pragma once

#include <filesystem>
#include <string>

namespace io {

/**
 * Checks that a path points to an existing file with a supported image
 * extension (.jpg, .jpeg, .png, .bmp, .tiff, .tif).
 *
 * @throws std::runtime_error if the file does not exist.
 * @throws std::invalid_argument if the path is not a regular file or has an
 * unsupported extension.
 */
std::filesystem::path validateImagePath(const std::string& path);

/**
 * Makes sure the parent directory of an output path exists, creating it if
 * needed.
 *
 * @throws std::runtime_error if the directory cannot be created.
 */
std::filesystem::path validateOutputPath(const std::string& path);

bool isSupportedImageExtension(const std::filesystem::path& path);

}  // namespace io
