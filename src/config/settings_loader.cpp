#include "mushroom_segmentation/config/settings_loader.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <opencv2/opencv.hpp>

#include "mushroom_segmentation/segmentation/errors.hpp"

namespace {

std::string toLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string toUpper(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return str;
}

std::string trim(const std::string& str) {
  auto begin{str.find_first_not_of(" \t\r\n")};
  if (begin == std::string::npos) {
    return "";
  }
  auto end{str.find_last_not_of(" \t\r\n")};
  return str.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& str) {
  if (str.size() >= 2 && (str.front() == '"' || str.front() == '\'') &&
      str.back() == str.front()) {
    return str.substr(1, str.size() - 2);
  }
  return str;
}

int parseInt(const std::string& key, const std::string& value) {
  try {
    size_t pos{0};
    int result{std::stoi(value, &pos)};
    if (pos == value.size()) {
      return result;
    }
  } catch (const std::logic_error&) {
  }
  throw segmentation::InvalidParameterError(
      key, "expected an integer, got '" + value + "'");
}

double parseDouble(const std::string& key, const std::string& value) {
  try {
    size_t pos{0};
    double result{std::stod(value, &pos)};
    if (pos == value.size()) {
      return result;
    }
  } catch (const std::logic_error&) {
  }
  throw segmentation::InvalidParameterError(
      key, "expected a number, got '" + value + "'");
}

bool parseBool(const std::string& key, const std::string& value) {
  std::string lower{toLower(value)};
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  throw segmentation::InvalidParameterError(
      key, "expected a boolean, got '" + value + "'");
}

std::optional<std::string> scalarToString(const cv::FileNode& node) {
  if (node.isInt()) {
    return std::to_string(static_cast<int>(node));
  }
  if (node.isReal()) {
    return fmt::format("{}", static_cast<double>(node));
  }
  if (node.isString()) {
    return static_cast<std::string>(node);
  }
  return std::nullopt;
}

/**
 * Renders a cv::FileStorage node as text so that every source goes through
 * the same parser. A sequence of scalars becomes a comma-separated list, e.g.
 * [255, 0, 0] becomes "255,0,0".
 */
std::optional<std::string> nodeToString(const cv::FileNode& node) {
  if (!node.isSeq()) {
    return scalarToString(node);
  }
  std::string joined;
  for (const auto& item : node) {
    auto text{scalarToString(item)};
    if (!text) {
      return std::nullopt;
    }
    if (!joined.empty()) {
      joined += ",";
    }
    joined += *text;
  }
  return joined;
}

/**
 * Parses a BGR color written as "B,G,R". Surrounding brackets or parentheses
 * are accepted, e.g. "[255, 0, 0]".
 */
cv::Scalar parseColor(const std::string& key, const std::string& value) {
  std::string text{trim(value)};
  if (text.size() >= 2 && (text.front() == '[' || text.front() == '(') &&
      (text.back() == ']' || text.back() == ')')) {
    text = text.substr(1, text.size() - 2);
  }

  std::vector<int> channels;
  size_t start{0};
  while (start <= text.size()) {
    auto end{text.find(',', start)};
    if (end == std::string::npos) {
      end = text.size();
    }
    channels.push_back(parseInt(key, trim(text.substr(start, end - start))));
    start = end + 1;
  }

  if (channels.size() != 3) {
    throw segmentation::InvalidParameterError(
        key, "expected three B,G,R components, got '" + value + "'");
  }
  for (int channel : channels) {
    if (channel < 0 || channel > 255) {
      throw segmentation::InvalidParameterError(
          key, "color components must be between 0 and 255, got '" + value +
                   "'");
    }
  }
  return cv::Scalar(channels[0], channels[1], channels[2]);
}

bool containsKey(const std::vector<std::string>& keys, const std::string& key) {
  return std::find(keys.begin(), keys.end(), toLower(trim(key))) != keys.end();
}

bool isSettingKey(const std::string& key) {
  return containsKey(config::settingKeys(), key);
}

bool isStyleKey(const std::string& key) {
  return containsKey(config::styleKeys(), key);
}

using KeyValueSetter =
    std::function<bool(const std::string& key, const std::string& value)>;

bool isStructuredFile(const std::filesystem::path& filePath) {
  std::string ext{toLower(filePath.extension().string())};
  return ext == ".yaml" || ext == ".yml" || ext == ".json" || ext == ".xml";
}

bool readStructuredFile(const std::filesystem::path& filePath,
                        const KeyValueSetter& set) {
  cv::FileStorage fs;
  try {
    fs.open(filePath.string(), cv::FileStorage::READ);
  } catch (const cv::Exception& e) {
    spdlog::error("Could not parse settings file {}: {}", filePath.string(),
                  e.what());
    return false;
  }
  if (!fs.isOpened()) {
    spdlog::error("Could not read settings file: {}", filePath.string());
    return false;
  }

  cv::FileNode root{fs.root()};
  for (const auto& node : root) {
    std::string key{node.name()};
    auto value{nodeToString(node)};
    if (!value) {
      spdlog::warn("Ignoring unsupported value of '{}' in {}", key,
                   filePath.string());
      continue;
    }
    if (!set(key, *value)) {
      spdlog::debug("Ignoring unknown setting '{}'", key);
    }
  }
  fs.release();

  return true;
}

bool readEnvFile(const std::filesystem::path& filePath,
                 const KeyValueSetter& set) {
  std::ifstream file{filePath};
  if (!file.is_open()) {
    spdlog::error("Could not read settings file: {}", filePath.string());
    return false;
  }

  std::string line;
  int lineNumber{0};
  while (std::getline(file, line)) {
    ++lineNumber;
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    auto separator{line.find('=')};
    if (separator == std::string::npos) {
      spdlog::warn("Ignoring malformed line {} in {}", lineNumber,
                   filePath.string());
      continue;
    }

    std::string key{trim(line.substr(0, separator))};
    std::string value{unquote(trim(line.substr(separator + 1)))};
    if (!set(key, value)) {
      spdlog::debug("Ignoring unknown setting '{}'", key);
    }
  }

  return true;
}

bool readKeyValueFile(const std::string& settingsFile,
                      const KeyValueSetter& set) {
  std::filesystem::path filePath{config::expandUser(settingsFile)};
  if (!std::filesystem::exists(filePath)) {
    spdlog::error("Settings file does not exist: {}", filePath.string());
    return false;
  }

  spdlog::debug("Loading settings from {}", filePath.string());
  if (isStructuredFile(filePath)) {
    return readStructuredFile(filePath, set);
  }
  return readEnvFile(filePath, set);
}

void applyEnvironment(const std::vector<std::string>& keys,
                      const KeyValueSetter& set) {
  for (const auto& key : keys) {
    const char* value{std::getenv(toUpper(key).c_str())};
    if (value) {
      spdlog::debug("Setting {} from environment", key);
      set(key, value);
    }
  }
}

}  // namespace

segmentation::Settings config::defaultSettings() {
  segmentation::Settings settings;
  segmentation::validateSettings(settings);
  return settings;
}

const std::vector<std::string>& config::settingKeys() {
  static const std::vector<std::string> keys{
      "back_threshold",         "threshold",
      "min_diameter",           "peaks_rel_threshold",
      "gaussian_kernel_size",   "clahe_clip_limit",
      "clahe_tile_size",        "morphology_kernel_size",
      "dilate_iterations",      "exclude_border",
      "compensation_coefficient"};
  return keys;
}

bool config::setSetting(segmentation::Settings& settings,
                        const std::string& key, const std::string& value) {
  std::string name{toLower(trim(key))};
  std::string text{trim(value)};

  if (name == "back_threshold") {
    settings.backThreshold = parseInt(name, text);
  } else if (name == "threshold") {
    settings.threshold = parseInt(name, text);
  } else if (name == "min_diameter") {
    settings.minDiameter = parseInt(name, text);
  } else if (name == "peaks_rel_threshold") {
    settings.peaksRelThreshold = parseDouble(name, text);
  } else if (name == "gaussian_kernel_size") {
    settings.gaussianKernelSize = parseInt(name, text);
  } else if (name == "clahe_clip_limit") {
    settings.claheClipLimit = parseDouble(name, text);
  } else if (name == "clahe_tile_size") {
    settings.claheTileSize = parseInt(name, text);
  } else if (name == "morphology_kernel_size") {
    settings.morphologyKernelSize = parseInt(name, text);
  } else if (name == "dilate_iterations") {
    settings.dilateIterations = parseInt(name, text);
  } else if (name == "exclude_border") {
    settings.excludeBorder = parseBool(name, text);
  } else if (name == "compensation_coefficient") {
    // An empty value restores the threshold-derived coefficient
    if (text.empty()) {
      settings.compensationCoefficient.reset();
    } else {
      settings.compensationCoefficient = parseDouble(name, text);
    }
  } else {
    return false;
  }
  return true;
}

const std::vector<std::string>& config::styleKeys() {
  static const std::vector<std::string> keys{"center_color", "radius1_color",
                                             "radius2_color", "line_thickness"};
  return keys;
}

bool config::setStyleSetting(Visualizer::Style& style, const std::string& key,
                             const std::string& value) {
  std::string name{toLower(trim(key))};
  std::string text{trim(value)};

  if (name == "center_color") {
    style.centerColor = parseColor(name, text);
  } else if (name == "radius1_color") {
    style.radius1Color = parseColor(name, text);
  } else if (name == "radius2_color") {
    style.radius2Color = parseColor(name, text);
  } else if (name == "line_thickness") {
    int thickness{parseInt(name, text)};
    if (thickness < 1) {
      throw segmentation::InvalidParameterError(
          name, "must be at least 1, got " + std::to_string(thickness));
    }
    style.lineThickness = thickness;
  } else {
    return false;
  }
  return true;
}

std::optional<segmentation::Settings> config::readSettingsFile(
    const std::string& settingsFile, segmentation::Settings settings) {
  bool ok{readKeyValueFile(
      settingsFile, [&settings](const std::string& key,
                                const std::string& value) {
        return setSetting(settings, key, value) || isStyleKey(key);
      })};
  if (!ok) {
    return std::nullopt;
  }
  return settings;
}

std::optional<Visualizer::Style> config::readVisualizerStyle(
    const std::string& settingsFile, Visualizer::Style style) {
  bool ok{readKeyValueFile(
      settingsFile,
      [&style](const std::string& key, const std::string& value) {
        return setStyleSetting(style, key, value) || isSettingKey(key);
      })};
  if (!ok) {
    return std::nullopt;
  }
  return style;
}

segmentation::Settings config::applyEnvironmentOverrides(
    segmentation::Settings settings) {
  applyEnvironment(settingKeys(), [&settings](const std::string& key,
                                              const std::string& value) {
    return setSetting(settings, key, value);
  });
  return settings;
}

Visualizer::Style config::applyEnvironmentOverrides(Visualizer::Style style) {
  applyEnvironment(styleKeys(), [&style](const std::string& key,
                                         const std::string& value) {
    return setStyleSetting(style, key, value);
  });
  return style;
}

std::optional<segmentation::Settings> config::resolveSettings(
    const std::string& settingsFile, const SettingsOverrides& overrides) {
  segmentation::Settings settings{defaultSettings()};
  if (!settingsFile.empty()) {
    auto fileSettings{readSettingsFile(settingsFile, settings)};
    if (!fileSettings) {
      return std::nullopt;
    }
    settings = *fileSettings;
  }
  settings = applyEnvironmentOverrides(settings);

  if (overrides.backThreshold) {
    settings.backThreshold = *overrides.backThreshold;
  }
  if (overrides.threshold) {
    settings.threshold = *overrides.threshold;
  }
  if (overrides.minDiameter) {
    settings.minDiameter = *overrides.minDiameter;
  }
  if (overrides.peaksRelThreshold) {
    settings.peaksRelThreshold = *overrides.peaksRelThreshold;
  }

  segmentation::validateSettings(settings);
  return settings;
}

std::optional<Visualizer::Style> config::resolveVisualizerStyle(
    const std::string& settingsFile) {
  Visualizer::Style style;
  if (!settingsFile.empty()) {
    auto fileStyle{readVisualizerStyle(settingsFile, style)};
    if (!fileStyle) {
      return std::nullopt;
    }
    style = *fileStyle;
  }
  return applyEnvironmentOverrides(style);
}

std::optional<spdlog::level::level_enum> config::parseLogLevel(
    const std::string& name) {
  std::string lower{toLower(trim(name))};
  // spdlog maps unknown names to off
  auto level{spdlog::level::from_str(lower)};
  if (level == spdlog::level::off && lower != "off") {
    return std::nullopt;
  }
  return level;
}

std::string config::expandUser(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }

  const char* home{std::getenv("HOME")};
  if (!home) {
    throw std::runtime_error("HOME environment variable not set");
  }

  return std::string(home) + path.substr(1);
}
