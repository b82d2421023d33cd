#pragma once

#include "dataset.hpp"

#include <string>

namespace coco_tools {

struct ConvertOptions {
    std::string input_dir;
    int jpeg_quality = 100;
    bool recursive = true;
    std::string annotation_file;  // optional: rename file_name entries too
    int io_retries = 3;
    int json_indent = -1;
    bool verbose = true;
};

struct ConvertReport {
    size_t converted = 0;
    size_t renamed_entries = 0;
    std::string output_annotation;
};

// "a/b.PNG" -> "a/b.jpg"; other names are returned unchanged.
std::string pngToJpgName(const std::string& file_name);
bool isPng(const std::string& file_name);

// Point every .png file_name at its .jpg sibling. Returns the count changed.
size_t renamePngEntries(Dataset& dataset);

// Writes a .jpg next to every .png under input_dir. When an annotation file
// is given, saves <stem>_jpg.json with the renamed entries beside it.
ConvertReport convertPngToJpg(const ConvertOptions& options);

} // namespace coco_tools
