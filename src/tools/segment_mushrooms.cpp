#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <filesystem>
#include <map>
#include <opencv2/opencv.hpp>

#include "mushroom_segmentation/config/settings_loader.hpp"
#include "mushroom_segmentation/io/image_io.hpp"
#include "mushroom_segmentation/io/results_exporter.hpp"
#include "mushroom_segmentation/io/validators.hpp"
#include "mushroom_segmentation/segmentation/errors.hpp"
#include "mushroom_segmentation/segmentation/mushroom_segmenter.hpp"
#include "mushroom_segmentation/visualization/visualizer.hpp"

int main(int argc, char* argv[]) {
  CLI::App app{"Detect and segment circular objects (mushrooms) in images"};

  std::string imageFile;
  std::string outputCsv{"results.csv"};
  std::string outputJson;
  std::string visualizationFile;
  std::string configFile;
  std::string logLevel{"info"};
  bool display{false};
  int backThreshold{0};
  int threshold{0};
  int minDiameter{0};
  double peaksThreshold{0.0};

  app.add_option("image_file", imageFile, "Input image file")
      ->required()
      ->check(CLI::ExistingFile);
  app.add_option("-o,--output_csv", outputCsv, "Output CSV file path")
      ->capture_default_str();
  app.add_option("-j,--output_json", outputJson, "Output JSON file path");
  app.add_option("-s,--save_visualization", visualizationFile,
                 "Save the annotated image to this path");
  app.add_flag("--display", display,
               "Display the annotated image in a window");
  app.add_option("-c,--config", configFile,
                 "Settings file (.yaml, .yml, .json, .xml or dotenv)")
      ->check(CLI::ExistingFile);
  auto* backThresholdOpt{
      app.add_option("--back_threshold", backThreshold,
                     "Background threshold value (0-255)")
          ->check(CLI::Range(0, 255))};
  auto* thresholdOpt{app.add_option("--threshold", threshold,
                                    "Segmentation threshold value (0-255)")
                         ->check(CLI::Range(0, 255))};
  auto* minDiameterOpt{
      app.add_option("--min_diameter", minDiameter,
                     "Minimum diameter for detection (pixels)")
          ->check(CLI::PositiveNumber)};
  auto* peaksThresholdOpt{
      app.add_option("--peaks_threshold", peaksThreshold,
                     "Relative threshold for peak detection (0-1)")
          ->check(CLI::Range(0.0, 1.0))};
  app.add_option("--log_level", logLevel, "Logging level")
      ->capture_default_str()
      ->check(
          [](const std::string& name) {
            return config::parseLogLevel(name)
                       ? std::string{}
                       : "Unknown log level '" + name +
                             "', expected one of trace, debug, info, warn, "
                             "error, critical, off";
          },
          "LEVEL");

  CLI11_PARSE(app, argc, argv);

  spdlog::set_level(*config::parseLogLevel(logLevel));

  try {
    config::SettingsOverrides overrides;
    if (*backThresholdOpt) {
      overrides.backThreshold = backThreshold;
    }
    if (*thresholdOpt) {
      overrides.threshold = threshold;
    }
    if (*minDiameterOpt) {
      overrides.minDiameter = minDiameter;
    }
    if (*peaksThresholdOpt) {
      overrides.peaksRelThreshold = peaksThreshold;
    }

    auto settings{config::resolveSettings(configFile, overrides)};
    if (!settings) {
      spdlog::error("Could not load settings from {}", configFile);
      return 1;
    }

    auto inputPath{io::validateImagePath(imageFile)};
    auto csvPath{io::validateOutputPath(outputCsv)};

    spdlog::info("Processing image: {}", inputPath.string());
    cv::Mat image{io::loadImage(inputPath.string())};

    MushroomSegmenter segmenter{*settings};
    auto circles{segmenter.segment(image)};
    spdlog::info("Detected {} objects", circles.size());

    io::exportCsv(circles, csvPath.string());
    spdlog::info("Results saved to: {}", csvPath.string());

    if (!outputJson.empty()) {
      std::map<std::string, std::string> metadata{
          {"input_image", inputPath.string()},
          {"image_width", std::to_string(image.cols)},
          {"image_height", std::to_string(image.rows)}};
      io::exportJson(circles, outputJson, metadata);
      spdlog::info("JSON results saved to: {}", outputJson);
    }

    if (display || !visualizationFile.empty()) {
      auto style{config::resolveVisualizerStyle(configFile)};
      if (!style) {
        spdlog::error("Could not load drawing style from {}", configFile);
        return 1;
      }
      Visualizer visualizer{*style};
      cv::Mat annotated{visualizer.drawCircles(image, circles)};

      if (!visualizationFile.empty()) {
        io::saveImage(annotated, visualizationFile);
        spdlog::info("Visualization saved to: {}", visualizationFile);
      }
      if (display) {
        Visualizer::display(annotated, "Mushroom Segmentation Results");
      }
    }
  } catch (const segmentation::InvalidParameterError& e) {
    spdlog::error("Invalid settings: {}", e.what());
    return 2;
  } catch (const std::exception& e) {
    spdlog::error("Error: {}", e.what());
    return 1;
  }

  spdlog::info("Processing completed successfully");
  return 0;
}
