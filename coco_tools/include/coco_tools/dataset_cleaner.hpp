#pragma once

#include "dataset.hpp"

#include <string>
#include <vector>

namespace coco_tools {

struct CleanOptions {
    std::string annotation_file;
    std::string image_root;
    std::string output_annotation;  // empty = new_annotations.json beside the input
    bool dry_run = false;
    int json_indent = -1;
    bool verbose = true;
};

struct CleanReport {
    size_t removed_images = 0;
    size_t moved_files = 0;
    size_t missing_files = 0;
    std::string output_annotation;
};

// Drop every image without annotations. The removed images are returned
// through `removed` when given.
Dataset removeUnannotated(const Dataset& dataset, std::vector<Image>* removed = nullptr);

// Writes the cleaned dataset, then moves the dropped image files into
// <image_root>/_trash/.
CleanReport cleanDataset(const CleanOptions& options);

} // namespace coco_tools
