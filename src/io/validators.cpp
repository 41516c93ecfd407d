#include "mushroom_segmentation/io/validators.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace {

constexpr std::array<const char*, 6> SUPPORTED_EXTENSIONS{
    ".jpg", ".jpeg", ".png", ".bmp", ".tiff", ".tif"};

std::string supportedExtensionsList() {
  std::string list;
  for (const char* ext : SUPPORTED_EXTENSIONS) {
    if (!list.empty()) {
      list += ", ";
    }
    list += ext;
  }
  return list;
}

}  // namespace

bool io::isSupportedImageExtension(const std::filesystem::path& path) {
  std::string ext{path.extension().string()};
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::find(SUPPORTED_EXTENSIONS.begin(), SUPPORTED_EXTENSIONS.end(),
                   ext) != SUPPORTED_EXTENSIONS.end();
}

std::filesystem::path io::validateImagePath(const std::string& path) {
  std::filesystem::path filePath{path};
  if (!std::filesystem::exists(filePath)) {
    throw std::runtime_error("Image file not found: " + path);
  }
  if (!std::filesystem::is_regular_file(filePath)) {
    throw std::invalid_argument("Path is not a file: " + path);
  }
  if (!isSupportedImageExtension(filePath)) {
    throw std::invalid_argument("Invalid image format: " +
                                filePath.extension().string() +
                                ". Supported formats: " +
                                supportedExtensionsList());
  }
  return filePath;
}

std::filesystem::path io::validateOutputPath(const std::string& path) {
  std::filesystem::path filePath{path};
  std::filesystem::path parent{filePath.parent_path()};
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("Cannot create output directory " +
                               parent.string() + ": " + ec.message());
    }
  }
  return filePath;
}
