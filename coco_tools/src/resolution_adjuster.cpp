#include "coco_tools/resolution_adjuster.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/rle.hpp"
#include "coco_tools/validation.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace coco_tools {

ResolutionAdjuster::ResolutionAdjuster(const AdjustConfig& config)
    : config_(config) {}

int ResolutionAdjuster::scaledLength(int length, double factor) {
    const double scaled = length * factor;
    if (!std::isfinite(scaled) || scaled >= static_cast<double>(std::numeric_limits<int>::max())) {
        throw MalformedInput("scaled length " + std::to_string(length) + " x " +
                             std::to_string(factor) + " does not fit an image dimension");
    }
    return std::max(1, static_cast<int>(std::lround(scaled)));
}

void ResolutionAdjuster::checkTarget() const {
    const TargetSpec& t = config_.target;
    if (t.mode == TargetSpec::Mode::Size) {
        if (t.width <= 0 || t.height <= 0) {
            throw MalformedInput("target resolution must be positive, got " +
                                 std::to_string(t.width) + "x" + std::to_string(t.height));
        }
    } else if (!(t.scale > 0.0) || !std::isfinite(t.scale)) {
        throw MalformedInput("scale factor must be positive, got " + std::to_string(t.scale));
    }
}

ScaleTable ResolutionAdjuster::computeScales(const Dataset& dataset, const SizeTable& probed) const {
    checkTarget();

    std::vector<std::pair<int64_t, cv::Size>> sources;
    sources.reserve(dataset.images.size());
    std::vector<int64_t> unknown;

    for (const auto& image : dataset.images) {
        if (image.hasDeclaredSize()) {
            sources.emplace_back(image.id, cv::Size(image.width, image.height));
            continue;
        }
        auto override_it = config_.source_size_overrides.find(image.file_name);
        if (override_it != config_.source_size_overrides.end()) {
            sources.emplace_back(image.id, override_it->second);
            continue;
        }
        auto probed_it = probed.find(image.id);
        if (probed_it != probed.end()) {
            sources.emplace_back(image.id, probed_it->second);
            continue;
        }
        unknown.push_back(image.id);
    }

    std::vector<int64_t> empty;
    for (const auto& s : sources) {
        if (s.second.width <= 0 || s.second.height <= 0) empty.push_back(s.first);
    }
    if (!empty.empty()) {
        throw MalformedInput("source resolution override must be positive", empty);
    }
    if (!unknown.empty()) {
        throw DimensionMismatch("source resolution unknown and no per-image override given", unknown);
    }

    if (config_.source_size_policy == SourceSizePolicy::RequireUniform && !sources.empty()) {
        const cv::Size first = sources.front().second;
        std::vector<int64_t> differing;
        for (const auto& s : sources) {
            if (s.second != first) differing.push_back(s.first);
        }
        if (!differing.empty()) {
            throw DimensionMismatch("source images do not share one resolution (expected " +
                                    std::to_string(first.width) + "x" +
                                    std::to_string(first.height) + ")", differing);
        }
    }

    const TargetSpec& t = config_.target;
    ScaleTable scales;
    scales.reserve(sources.size());
    for (const auto& s : sources) {
        ImageScale scale;
        scale.src_width = s.second.width;
        scale.src_height = s.second.height;
        if (t.mode == TargetSpec::Mode::Size) {
            scale.sx = static_cast<double>(t.width) / scale.src_width;
            scale.sy = static_cast<double>(t.height) / scale.src_height;
        } else {
            scale.sx = t.scale;
            scale.sy = t.scale;
        }
        scale.dst_width = scaledLength(scale.src_width, scale.sx);
        scale.dst_height = scaledLength(scale.src_height, scale.sy);
        scales.emplace(s.first, scale);
    }
    return scales;
}

void ResolutionAdjuster::scaleAnnotation(Annotation& ann, const ImageScale& scale,
                                         SegmentationPolicy policy) {
    // Validation lets geometry overhang the image by the bounds tolerance;
    // scaled coordinates are clamped so the overhang does not grow with s.
    const double max_x = scale.dst_width;
    const double max_y = scale.dst_height;
    auto clampX = [max_x](double v) { return std::min(std::max(v, 0.0), max_x); };
    auto clampY = [max_y](double v) { return std::min(std::max(v, 0.0), max_y); };

    auto& b = ann.bbox;
    const double x1 = clampX(b[0] * scale.sx);
    const double y1 = clampY(b[1] * scale.sy);
    const double x2 = clampX((b[0] + b[2]) * scale.sx);
    const double y2 = clampY((b[1] + b[3]) * scale.sy);
    const bool inside = x1 == b[0] * scale.sx && y1 == b[1] * scale.sy &&
                        x2 == (b[0] + b[2]) * scale.sx && y2 == (b[1] + b[3]) * scale.sy;
    if (inside) {
        b[0] *= scale.sx;
        b[1] *= scale.sy;
        b[2] *= scale.sx;
        b[3] *= scale.sy;
    } else {
        b = {x1, y1, x2 - x1, y2 - y1};
    }

    Segmentation& seg = ann.segmentation;
    if (seg.type == Segmentation::Type::Polygons) {
        for (auto& ring : seg.polygons) {
            for (size_t i = 0; i + 1 < ring.size(); i += 2) {
                ring[i] = clampX(ring[i] * scale.sx);
                ring[i + 1] = clampY(ring[i + 1] * scale.sy);
            }
        }
    } else if (seg.type == Segmentation::Type::Rle) {
        if (policy != SegmentationPolicy::Rescale) {
            throw UnsupportedGeometry("RLE segmentation cannot be rescaled under the reject policy",
                                      {ann.id});
        }
        seg.rle = RleCodec::resize(seg.rle, scale.dst_width, scale.dst_height);
    }

    // Affine area scaling, not re-derived from the rounded geometry.
    if (ann.area) *ann.area *= scale.sx * scale.sy;
}

Dataset ResolutionAdjuster::apply(const Dataset& dataset, const ScaleTable& scales) const {
    if (config_.segmentation_policy == SegmentationPolicy::Reject) {
        std::vector<int64_t> rle_ids;
        for (const auto& ann : dataset.annotations) {
            if (ann.segmentation.isRle()) rle_ids.push_back(ann.id);
        }
        if (!rle_ids.empty()) {
            throw UnsupportedGeometry("RLE segmentation cannot be rescaled under the reject policy",
                                      rle_ids);
        }
    }

    Dataset out = dataset;
    for (auto& image : out.images) {
        const ImageScale& scale = scales.at(image.id);
        image.width = scale.dst_width;
        image.height = scale.dst_height;
    }
    for (auto& ann : out.annotations) {
        scaleAnnotation(ann, scales.at(ann.image_id), config_.segmentation_policy);
    }
    return out;
}

Dataset ResolutionAdjuster::adjust(const Dataset& dataset, const SizeTable& probed) const {
    ValidationOptions options;
    options.bounds_tolerance = config_.bounds_tolerance;
    validate(dataset, options);
    return apply(dataset, computeScales(dataset, probed));
}

Dataset adjust(const Dataset& dataset, const TargetSpec& target, const AdjustConfig& config) {
    AdjustConfig c = config;
    c.target = target;
    return ResolutionAdjuster(c).adjust(dataset);
}

} // namespace coco_tools
