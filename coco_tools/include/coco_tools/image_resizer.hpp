#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace coco_tools {

struct RetryPolicy {
    int retries = 3;      // extra attempts after the first one
    int delay_ms = 50;
};

struct ResizeTask {
    int64_t image_id = 0;
    std::string source;
    std::string destination;
    std::string encode_ext;     // e.g. ".jpg"; picks the encoder
    cv::Size expected_source;   // declared size before scaling
    cv::Size target;
    double sx = 1.0;
    double sy = 1.0;
};

class ImageResizer {
public:
    // INTER_AREA when shrinking on both axes, INTER_LINEAR otherwise.
    static int interpolationFor(double sx, double sy);

    // Retried reads/writes; IOError naming the path once attempts run out.
    static cv::Mat readImage(const std::string& path, const RetryPolicy& retry,
                             int64_t image_id = -1);
    static void writeImage(const std::string& path, const cv::Mat& image,
                           const std::string& ext, const RetryPolicy& retry,
                           int64_t image_id = -1,
                           const std::vector<int>& params = std::vector<int>());

    static cv::Size probeSize(const std::string& path, const RetryPolicy& retry,
                              int64_t image_id = -1);

    // Read, check the raster matches the declared size, resize, write.
    static void resizeOne(const ResizeTask& task, const RetryPolicy& retry);
};

} // namespace coco_tools
