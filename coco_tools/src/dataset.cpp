#include "coco_tools/dataset.hpp"

namespace coco_tools {

const Image* Dataset::findImage(int64_t id) const {
    for (const auto& image : images) {
        if (image.id == id) return &image;
    }
    return nullptr;
}

const Category* Dataset::findCategory(int64_t id) const {
    for (const auto& category : categories) {
        if (category.id == id) return &category;
    }
    return nullptr;
}

} // namespace coco_tools
