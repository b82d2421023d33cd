#include "coco_tools/validation.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/rle.hpp"

#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace coco_tools {

namespace {

template <typename T>
std::vector<int64_t> duplicateIds(const std::vector<T>& items) {
    std::unordered_set<int64_t> seen;
    std::vector<int64_t> dupes;
    for (const auto& item : items) {
        if (!seen.insert(item.id).second) dupes.push_back(item.id);
    }
    return dupes;
}

bool geometryWellFormed(const Annotation& ann) {
    for (double v : ann.bbox) {
        if (!std::isfinite(v)) return false;
    }
    if (ann.bbox[2] < 0.0 || ann.bbox[3] < 0.0) return false;

    if (ann.area && !std::isfinite(*ann.area)) return false;

    const Segmentation& seg = ann.segmentation;
    if (seg.type == Segmentation::Type::Polygons) {
        for (const auto& ring : seg.polygons) {
            if (ring.size() < 6 || ring.size() % 2 != 0) return false;
            for (double v : ring) {
                if (!std::isfinite(v)) return false;
            }
        }
    } else if (seg.type == Segmentation::Type::Rle) {
        if (seg.rle.height <= 0 || seg.rle.width <= 0) return false;
        const uint64_t cells = static_cast<uint64_t>(seg.rle.height) * seg.rle.width;
        if (RleCodec::totalCount(seg.rle) != cells) return false;
    }
    return true;
}

bool withinImage(const Annotation& ann, const Image& image, double tol) {
    const double max_x = image.width + tol;
    const double max_y = image.height + tol;
    const auto& b = ann.bbox;
    if (b[0] < -tol || b[1] < -tol) return false;
    if (b[0] + b[2] > max_x || b[1] + b[3] > max_y) return false;

    const Segmentation& seg = ann.segmentation;
    if (seg.type == Segmentation::Type::Polygons) {
        for (const auto& ring : seg.polygons) {
            for (size_t i = 0; i + 1 < ring.size(); i += 2) {
                if (ring[i] < -tol || ring[i] > max_x) return false;
                if (ring[i + 1] < -tol || ring[i + 1] > max_y) return false;
            }
        }
    } else if (seg.type == Segmentation::Type::Rle) {
        if (seg.rle.width != image.width || seg.rle.height != image.height) return false;
    }
    return true;
}

} // namespace

void validate(const Dataset& dataset, const ValidationOptions& options) {
    auto dupes = duplicateIds(dataset.images);
    if (!dupes.empty()) throw MalformedInput("duplicate image ids", dupes);
    dupes = duplicateIds(dataset.annotations);
    if (!dupes.empty()) throw MalformedInput("duplicate annotation ids", dupes);
    dupes = duplicateIds(dataset.categories);
    if (!dupes.empty()) throw MalformedInput("duplicate category ids", dupes);

    std::vector<int64_t> bad;
    for (const auto& image : dataset.images) {
        if (image.width < 0 || image.height < 0) bad.push_back(image.id);
    }
    if (!bad.empty()) throw MalformedInput("negative image size", bad);

    for (const auto& ann : dataset.annotations) {
        if (!geometryWellFormed(ann)) bad.push_back(ann.id);
    }
    if (!bad.empty()) throw MalformedInput("malformed annotation geometry", bad);

    std::unordered_map<int64_t, const Image*> images;
    for (const auto& image : dataset.images) images.emplace(image.id, &image);
    std::unordered_set<int64_t> categories;
    for (const auto& cat : dataset.categories) categories.insert(cat.id);

    for (const auto& ann : dataset.annotations) {
        if (!images.count(ann.image_id) || !categories.count(ann.category_id)) {
            bad.push_back(ann.id);
        }
    }
    if (!bad.empty()) {
        throw DanglingReference("annotations reference a missing image or category", bad);
    }

    if (!options.check_bounds) return;
    for (const auto& ann : dataset.annotations) {
        const Image* image = images.at(ann.image_id);
        if (!image->hasDeclaredSize()) continue;
        if (!withinImage(ann, *image, options.bounds_tolerance)) bad.push_back(ann.id);
    }
    if (!bad.empty()) throw MalformedInput("annotation geometry lies outside its image", bad);
}

} // namespace coco_tools
