#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string>
#include <vector>

#include "mushroom_segmentation/segmentation/settings.hpp"
#include "mushroom_segmentation/visualization/visualizer.hpp"

namespace config {

/**
 * Command line values that take precedence over files and environment.
 */
struct SettingsOverrides {
  std::optional<int> backThreshold;
  std::optional<int> threshold;
  std::optional<int> minDiameter;
  std::optional<double> peaksRelThreshold;
};

/**
 * Default settings, validated.
 */
segmentation::Settings defaultSettings();

/**
 * Keys recognized in settings files and environment variables. Matching is
 * case-insensitive.
 */
const std::vector<std::string>& settingKeys();

/**
 * Keys of the drawing style: center_color, radius1_color, radius2_color and
 * line_thickness.
 */
const std::vector<std::string>& styleKeys();

/**
 * Sets a single field from its textual value.
 *
 * @param settings Settings to modify.
 * @param key Field name, e.g. "back_threshold". Case-insensitive.
 * @param value Textual value, e.g. "120".
 * @return true if the key is recognized, false if it was ignored.
 * @throws segmentation::InvalidParameterError if the value cannot be parsed.
 */
bool setSetting(segmentation::Settings& settings, const std::string& key,
                const std::string& value);

/**
 * Sets a single drawing style field from its textual value. Colors are given
 * as "B,G,R", optionally enclosed in brackets.
 *
 * @return true if the key is recognized, false if it was ignored.
 * @throws segmentation::InvalidParameterError if the value cannot be parsed
 * or is out of range.
 */
bool setStyleSetting(Visualizer::Style& style, const std::string& key,
                     const std::string& value);

/**
 * Reads a settings file on top of the given settings. Files ending in .yaml,
 * .yml, .json or .xml are read with cv::FileStorage; any other file is parsed
 * as a dotenv file of KEY=VALUE lines. Unknown keys are ignored.
 *
 * @param settingsFile Path to the settings file. A leading ~ is expanded.
 * @param settings Base settings the file values are applied on.
 * @return The merged settings, or std::nullopt if the file could not be read.
 * @throws segmentation::InvalidParameterError if a value cannot be parsed.
 */
std::optional<segmentation::Settings> readSettingsFile(
    const std::string& settingsFile, segmentation::Settings settings = {});

/**
 * Reads the drawing style keys of a settings file on top of the given style.
 * Accepts the same file formats as readSettingsFile. In structured files a
 * color may also be a sequence, e.g. center_color: [255, 0, 0].
 *
 * @return The merged style, or std::nullopt if the file could not be read.
 * @throws segmentation::InvalidParameterError if a value cannot be parsed.
 */
std::optional<Visualizer::Style> readVisualizerStyle(
    const std::string& settingsFile, Visualizer::Style style = {});

/**
 * Applies environment variables named after the setting keys in upper case,
 * e.g. BACK_THRESHOLD=120.
 */
segmentation::Settings applyEnvironmentOverrides(
    segmentation::Settings settings);

/**
 * Applies environment variables named after the style keys in upper case,
 * e.g. LINE_THICKNESS=4 or CENTER_COLOR=255,0,0.
 */
Visualizer::Style applyEnvironmentOverrides(Visualizer::Style style);

/**
 * Builds the settings used by the command line tool: defaults, then the
 * settings file (if not empty), then the environment, then the overrides.
 *
 * @return Validated settings, or std::nullopt if the file could not be read.
 * @throws segmentation::InvalidParameterError if the result is invalid.
 */
std::optional<segmentation::Settings> resolveSettings(
    const std::string& settingsFile, const SettingsOverrides& overrides = {});

/**
 * Builds the drawing style: defaults, then the settings file (if not empty),
 * then the environment.
 */
std::optional<Visualizer::Style> resolveVisualizerStyle(
    const std::string& settingsFile);

/**
 * Parses a log level name such as "debug" or "warn". Case-insensitive.
 *
 * @return The level, or std::nullopt for an unknown name.
 */
std::optional<spdlog::level::level_enum> parseLogLevel(
    const std::string& name);

/**
 * Performs tilde expansion for a file path.
 *
 * @param path Path to expand.
 * @return Fully qualified file path.
 */
std::string expandUser(const std::string& path);

}  // namespace config
