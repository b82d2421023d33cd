#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <string>

namespace coco_tools {

enum class OutputMode {
    SeparateDirectory,
    InPlace
};

enum class SegmentationPolicy {
    Reject,
    Rescale
};

enum class SourceSizePolicy {
    PerImage,
    RequireUniform
};

// Either an absolute resolution or a uniform scale factor.
struct TargetSpec {
    enum class Mode { Size, Scale };

    Mode mode = Mode::Scale;
    int width = 0;
    int height = 0;
    double scale = 1.0;

    static TargetSpec size(int w, int h) {
        TargetSpec t;
        t.mode = Mode::Size;
        t.width = w;
        t.height = h;
        return t;
    }

    static TargetSpec factor(double s) {
        TargetSpec t;
        t.mode = Mode::Scale;
        t.scale = s;
        return t;
    }
};

struct AdjustConfig {
    std::string annotation_file;
    std::string image_root;
    std::string output_dir;
    std::string output_annotation;  // empty = derived from annotation_file

    TargetSpec target;
    bool resize_images = false;
    OutputMode output_mode = OutputMode::SeparateDirectory;
    SegmentationPolicy segmentation_policy = SegmentationPolicy::Reject;
    SourceSizePolicy source_size_policy = SourceSizePolicy::PerImage;

    // Source resolution for images whose entry does not declare one.
    std::map<std::string, cv::Size> source_size_overrides;

    double bounds_tolerance = 1.0;
    int workers = 0;  // 0 = hardware concurrency
    int io_retries = 3;
    int retry_delay_ms = 50;
    int json_indent = -1;
    bool verbose = true;
};

OutputMode parseOutputMode(const std::string& s);
SegmentationPolicy parseSegmentationPolicy(const std::string& s);
SourceSizePolicy parseSourceSizePolicy(const std::string& s);

const char* toString(OutputMode mode);
const char* toString(SegmentationPolicy policy);
const char* toString(SourceSizePolicy policy);

// Overlay values from a YAML/JSON file read through cv::FileStorage.
// Keys that are absent keep the current value.
void loadAdjustConfig(const std::string& path, AdjustConfig& config);

void printSummary(const AdjustConfig& config);

} // namespace coco_tools
