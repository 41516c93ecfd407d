#include "mushroom_segmentation/io/results_exporter.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

#include "mushroom_segmentation/io/validators.hpp"

void io::exportCsv(const std::vector<segmentation::Circle>& circles,
                   const std::string& path, bool header) {
  auto filePath{validateOutputPath(path)};

  std::ofstream file{filePath};
  if (!file.is_open()) {
    throw std::runtime_error("Could not open CSV file for writing: " + path);
  }

  if (header) {
    file << "X,Y,Radius_1,Radius_2\n";
  }
  for (const auto& circle : circles) {
    file << circle.center.x << "," << circle.center.y << ","
         << cvRound(circle.radius1) << "," << cvRound(circle.radius2) << "\n";
  }

  if (!file) {
    throw std::runtime_error("Failed writing CSV file: " + path);
  }
  spdlog::debug("Exported {} circles to {}", circles.size(), path);
}

void io::exportJson(const std::vector<segmentation::Circle>& circles,
                    const std::string& path,
                    const std::map<std::string, std::string>& metadata) {
  auto filePath{validateOutputPath(path)};

  try {
    cv::FileStorage fs{filePath.string(),
                       cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON};
    if (!fs.isOpened()) {
      throw std::runtime_error("Could not open JSON file for writing: " +
                               path);
    }

    fs << "circles" << "[";
    for (const auto& circle : circles) {
      fs << "{";
      fs << "x" << circle.center.x;
      fs << "y" << circle.center.y;
      fs << "radius_1" << circle.radius1;
      fs << "radius_2" << circle.radius2;
      fs << "}";
    }
    fs << "]";
    fs << "count" << static_cast<int>(circles.size());

    if (!metadata.empty()) {
      fs << "metadata" << "{";
      for (const auto& [key, value] : metadata) {
        fs << key << value;
      }
      fs << "}";
    }
    fs.release();
  } catch (const cv::Exception& e) {
    throw std::runtime_error("Failed writing JSON file " + path + ": " +
                             e.what());
  }

  spdlog::debug("Exported results to JSON: {}", path);
}
