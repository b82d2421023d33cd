#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace coco_tools {

// Insertion-ordered so files keep the exporter's key order.
using Json = nlohmann::ordered_json;

struct Image {
    int64_t id = 0;
    std::string file_name;
    int width = 0;   // 0 = not declared by the exporter
    int height = 0;
    Json extra = Json::object();

    bool hasDeclaredSize() const { return width > 0 && height > 0; }
};

// Column-major run-length mask, as COCO stores it.
struct Rle {
    int height = 0;
    int width = 0;
    std::vector<uint32_t> counts;
    bool compressed = false;  // counts were given as a COCO string
};

struct Segmentation {
    enum class Type { None, Polygons, Rle };

    Type type = Type::None;
    std::vector<std::vector<double>> polygons;
    coco_tools::Rle rle;

    bool isRle() const { return type == Type::Rle; }
};

struct Annotation {
    int64_t id = 0;
    int64_t image_id = 0;
    int64_t category_id = 0;
    std::array<double, 4> bbox{};  // x, y, w, h
    Segmentation segmentation;
    std::optional<double> area;
    std::optional<int> iscrowd;
    Json extra = Json::object();
};

struct Category {
    int64_t id = 0;
    std::string name;
    Json raw;  // written back untouched
};

struct Dataset {
    std::vector<Image> images;
    std::vector<Annotation> annotations;
    std::vector<Category> categories;
    Json extra = Json::object();  // info, licenses, ...

    const Image* findImage(int64_t id) const;
    const Category* findCategory(int64_t id) const;
};

} // namespace coco_tools
