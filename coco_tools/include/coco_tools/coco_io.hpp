#pragma once

#include "dataset.hpp"

#include <string>

namespace coco_tools {

// Parse a COCO document. Throws MalformedInput on missing or mistyped fields.
Dataset parseDataset(const Json& doc);
Json toJson(const Dataset& dataset);

// File helpers. Throws IOError when the file cannot be read or written.
Dataset loadDataset(const std::string& path);

// Writes <path>.tmp and renames it over path, creating parent directories.
void saveDataset(const Dataset& dataset, const std::string& path, int indent = -1);

} // namespace coco_tools
