#pragma once

#include "dataset.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace coco_tools {

struct PreviewOptions {
    std::string annotation_file;
    std::string image_root;
    std::string output_path;
    int64_t image_id = -1;  // -1 = first image in the file
    int thickness = 2;
};

// Boxes in green, polygon outlines in blue (BGR), on a copy of `image`.
cv::Mat drawAnnotations(const cv::Mat& image, const std::vector<const Annotation*>& annotations,
                        int thickness = 2);

// Renders one image with its annotations and writes it to output_path.
// Returns the id of the rendered image.
int64_t writePreview(const PreviewOptions& options);

} // namespace coco_tools
