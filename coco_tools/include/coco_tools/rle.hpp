#pragma once

#include "dataset.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace coco_tools {

class RleCodec {
public:
    // Mask of rle.height x rle.width, CV_8U, 1 inside the region.
    static cv::Mat decode(const Rle& rle);

    // Encode a CV_8U mask (non-zero = inside), column-major like COCO.
    static Rle encode(const cv::Mat& mask, bool compressed);

    // COCO compressed counts string (pycocotools rleToString layout).
    static std::string toString(const std::vector<uint32_t>& counts);
    static bool fromString(const std::string& s, std::vector<uint32_t>& counts);

    // Nearest-neighbour resample; keeps the list/string representation.
    static Rle resize(const Rle& rle, int width, int height);

    static uint64_t pixelCount(const Rle& rle);
    static uint64_t totalCount(const Rle& rle);
};

} // namespace coco_tools
