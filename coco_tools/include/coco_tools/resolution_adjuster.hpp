#pragma once

#include "adjust_config.hpp"
#include "dataset.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <unordered_map>

namespace coco_tools {

struct ImageScale {
    double sx = 1.0;
    double sy = 1.0;
    int src_width = 0;
    int src_height = 0;
    int dst_width = 0;
    int dst_height = 0;
};

using ScaleTable = std::unordered_map<int64_t, ImageScale>;
using SizeTable = std::unordered_map<int64_t, cv::Size>;

class ResolutionAdjuster {
public:
    explicit ResolutionAdjuster(const AdjustConfig& config);

    // Per-image factors. `probed` supplies raster sizes for images whose
    // entry does not declare one and has no configured override.
    ScaleTable computeScales(const Dataset& dataset, const SizeTable& probed = {}) const;

    // Validate, compute scales and rescale every image and annotation.
    Dataset adjust(const Dataset& dataset, const SizeTable& probed = {}) const;

    // Rescale with precomputed factors. Throws UnsupportedGeometry for RLE
    // masks under SegmentationPolicy::Reject before touching anything.
    Dataset apply(const Dataset& dataset, const ScaleTable& scales) const;

    // round(length * factor), half away from zero, at least one pixel.
    // MalformedInput when the result does not fit an int.
    static int scaledLength(int length, double factor);

    // Scaled geometry is clamped to [0, dst_width] x [0, dst_height].
    static void scaleAnnotation(Annotation& ann, const ImageScale& scale,
                                SegmentationPolicy policy);

    const AdjustConfig& config() const { return config_; }

private:
    void checkTarget() const;

    AdjustConfig config_;
};

// Convenience wrapper for one-off transforms.
Dataset adjust(const Dataset& dataset, const TargetSpec& target,
               const AdjustConfig& config = {});

} // namespace coco_tools
