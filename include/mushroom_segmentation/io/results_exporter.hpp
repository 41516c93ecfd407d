#pragma once

#include <map>
#include <string>
#include <vector>

#include "mushroom_segmentation/segmentation/circle_extractor.hpp"

namespace io {

/**
 * Writes circles as CSV rows of integer-rounded X,Y,Radius_1,Radius_2.
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void exportCsv(const std::vector<segmentation::Circle>& circles,
               const std::string& path, bool header = true);

/**
 * Writes circles as a JSON document:
 * {"circles": [{"x", "y", "radius_1", "radius_2"}], "count", "metadata"}.
 * The metadata object is omitted when empty. Metadata keys must be valid
 * identifiers (letters, digits, '_' and '-').
 *
 * @throws std::runtime_error if the file cannot be written.
 */
void exportJson(const std::vector<segmentation::Circle>& circles,
                const std::string& path,
                const std::map<std::string, std::string>& metadata = {});

}  // namespace io
