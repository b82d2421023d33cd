#pragma once

#include "dataset.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace coco_tools {

struct SplitOptions {
    std::string annotation_file;
    std::string image_root;
    std::string output_dir;
    double split_ratio = 0.8;   // share of images that go to train
    uint32_t seed = 42;
    bool copy_images = false;   // move by default
    int json_indent = -1;
    bool verbose = true;
};

struct SplitReport {
    size_t train_images = 0;
    size_t val_images = 0;
    size_t train_annotations = 0;
    size_t val_annotations = 0;
};

// Seeded shuffle of the image ids; the first ratio * n go to train.
// Image order inside each half follows the source.
std::pair<Dataset, Dataset> splitDataset(const Dataset& dataset, double ratio, uint32_t seed);

// Writes <out>/annotations/{train,val}.json, transfers the image files to
// <out>/images/{train,val}/ and checks the result.
SplitReport splitToDirectory(const SplitOptions& options);

// Every annotation image_id resolves and every listed image file exists.
void checkSplit(const std::string& annotation_file, const std::string& image_dir);

} // namespace coco_tools
