#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/rle.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace coco_tools {

namespace {

std::string where(const char* section, size_t index) {
    return std::string(section) + "[" + std::to_string(index) + "]";
}

const Json& field(const Json& obj, const char* key, const std::string& ctx) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw MalformedInput(ctx + " is missing required field '" + key + "'");
    }
    return *it;
}

int64_t toId(const Json& value, const std::string& ctx, const char* key) {
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return value.get<int64_t>();
        }
    } else if (value.is_number_integer()) {
        return value.get<int64_t>();
    } else if (value.is_number_float()) {
        // 2^63 is exactly representable; anything at or past it does not fit.
        const double d = value.get<double>();
        const double limit = 9223372036854775808.0;
        if (std::isfinite(d) && d == std::floor(d) && d >= -limit && d < limit) {
            return static_cast<int64_t>(d);
        }
    } else {
        throw MalformedInput(ctx + " field '" + key + "' is not an integer");
    }
    throw MalformedInput(ctx + " field '" + key + "' is out of range");
}

int toInt(const Json& value, const std::string& ctx, const char* key) {
    const int64_t v = toId(value, ctx, key);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw MalformedInput(ctx + " field '" + key + "' is out of range");
    }
    return static_cast<int>(v);
}

double toNumber(const Json& value, const std::string& ctx, const char* key) {
    if (!value.is_number()) {
        throw MalformedInput(ctx + " field '" + key + "' is not a number");
    }
    return value.get<double>();
}

Json stripKeys(const Json& obj, std::initializer_list<const char*> keys) {
    Json extra = obj;
    for (const char* key : keys) extra.erase(key);
    return extra;
}

Segmentation parseSegmentation(const Json& value, int64_t ann_id, const std::string& ctx) {
    Segmentation seg;
    if (value.is_null()) return seg;

    if (value.is_array()) {
        seg.type = Segmentation::Type::Polygons;
        for (const auto& ring : value) {
            if (!ring.is_array()) {
                throw MalformedInput(ctx + " polygon segmentation must be a list of lists", {ann_id});
            }
            std::vector<double> coords;
            coords.reserve(ring.size());
            for (const auto& v : ring) coords.push_back(toNumber(v, ctx, "segmentation"));
            seg.polygons.push_back(std::move(coords));
        }
        return seg;
    }

    if (value.is_object() && value.contains("counts") && value.contains("size")) {
        seg.type = Segmentation::Type::Rle;
        const Json& size = value.at("size");
        if (!size.is_array() || size.size() != 2) {
            throw MalformedInput(ctx + " RLE size must be [height, width]", {ann_id});
        }
        seg.rle.height = toInt(size[0], ctx, "size");
        seg.rle.width = toInt(size[1], ctx, "size");

        const Json& counts = value.at("counts");
        if (counts.is_string()) {
            seg.rle.compressed = true;
            if (!RleCodec::fromString(counts.get<std::string>(), seg.rle.counts)) {
                throw MalformedInput(ctx + " RLE counts string does not decode", {ann_id});
            }
        } else if (counts.is_array()) {
            for (const auto& c : counts) {
                const int64_t run = toId(c, ctx, "counts");
                if (run < 0 || run > std::numeric_limits<uint32_t>::max()) {
                    throw MalformedInput(ctx + " RLE run is out of range", {ann_id});
                }
                seg.rle.counts.push_back(static_cast<uint32_t>(run));
            }
        } else {
            throw MalformedInput(ctx + " RLE counts must be a list or a string", {ann_id});
        }
        return seg;
    }

    throw MalformedInput(ctx + " has an unrecognised segmentation format", {ann_id});
}

Json segmentationToJson(const Segmentation& seg) {
    switch (seg.type) {
        case Segmentation::Type::Polygons: {
            Json rings = Json::array();
            for (const auto& ring : seg.polygons) rings.push_back(ring);
            return rings;
        }
        case Segmentation::Type::Rle: {
            Json rle = Json::object();
            rle["size"] = {seg.rle.height, seg.rle.width};
            if (seg.rle.compressed) {
                rle["counts"] = RleCodec::toString(seg.rle.counts);
            } else {
                rle["counts"] = seg.rle.counts;
            }
            return rle;
        }
        case Segmentation::Type::None:
            break;
    }
    return nullptr;
}

Image parseImage(const Json& obj, size_t index) {
    const std::string ctx = where("images", index);
    if (!obj.is_object()) throw MalformedInput(ctx + " is not an object");

    Image image;
    image.id = toId(field(obj, "id", ctx), ctx, "id");
    const Json& name = field(obj, "file_name", ctx);
    if (!name.is_string()) throw MalformedInput(ctx + " field 'file_name' is not a string", {image.id});
    image.file_name = name.get<std::string>();

    auto w = obj.find("width");
    auto h = obj.find("height");
    if (w != obj.end() && !w->is_null()) image.width = toInt(*w, ctx, "width");
    if (h != obj.end() && !h->is_null()) image.height = toInt(*h, ctx, "height");

    image.extra = stripKeys(obj, {"id", "file_name", "width", "height"});
    return image;
}

Annotation parseAnnotation(const Json& obj, size_t index) {
    const std::string ctx = where("annotations", index);
    if (!obj.is_object()) throw MalformedInput(ctx + " is not an object");

    Annotation ann;
    ann.id = toId(field(obj, "id", ctx), ctx, "id");
    ann.image_id = toId(field(obj, "image_id", ctx), ctx, "image_id");
    ann.category_id = toId(field(obj, "category_id", ctx), ctx, "category_id");

    const Json& bbox = field(obj, "bbox", ctx);
    if (!bbox.is_array() || bbox.size() != 4) {
        throw MalformedInput(ctx + " bbox must hold 4 numbers", {ann.id});
    }
    for (size_t i = 0; i < 4; ++i) ann.bbox[i] = toNumber(bbox[i], ctx, "bbox");

    auto seg = obj.find("segmentation");
    if (seg != obj.end()) ann.segmentation = parseSegmentation(*seg, ann.id, ctx);

    auto area = obj.find("area");
    if (area != obj.end() && !area->is_null()) ann.area = toNumber(*area, ctx, "area");

    auto crowd = obj.find("iscrowd");
    if (crowd != obj.end() && !crowd->is_null()) ann.iscrowd = toInt(*crowd, ctx, "iscrowd");

    ann.extra = stripKeys(obj, {"id", "image_id", "category_id", "bbox",
                                "segmentation", "area", "iscrowd"});
    return ann;
}

Category parseCategory(const Json& obj, size_t index) {
    const std::string ctx = where("categories", index);
    if (!obj.is_object()) throw MalformedInput(ctx + " is not an object");

    Category cat;
    cat.id = toId(field(obj, "id", ctx), ctx, "id");
    const Json& name = field(obj, "name", ctx);
    if (!name.is_string()) throw MalformedInput(ctx + " field 'name' is not a string", {cat.id});
    cat.name = name.get<std::string>();
    cat.raw = obj;
    return cat;
}

const Json& section(const Json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_array()) {
        throw MalformedInput(std::string("document has no '") + key + "' array");
    }
    return *it;
}

} // namespace

Dataset parseDataset(const Json& doc) {
    if (!doc.is_object()) throw MalformedInput("COCO document is not a JSON object");

    Dataset dataset;
    const Json& images = section(doc, "images");
    const Json& annotations = section(doc, "annotations");
    const Json& categories = section(doc, "categories");

    dataset.images.reserve(images.size());
    for (size_t i = 0; i < images.size(); ++i) {
        dataset.images.push_back(parseImage(images[i], i));
    }
    dataset.annotations.reserve(annotations.size());
    for (size_t i = 0; i < annotations.size(); ++i) {
        dataset.annotations.push_back(parseAnnotation(annotations[i], i));
    }
    dataset.categories.reserve(categories.size());
    for (size_t i = 0; i < categories.size(); ++i) {
        dataset.categories.push_back(parseCategory(categories[i], i));
    }

    dataset.extra = stripKeys(doc, {"images", "annotations", "categories"});
    return dataset;
}

Json toJson(const Dataset& dataset) {
    Json doc = dataset.extra;

    Json categories = Json::array();
    for (const auto& cat : dataset.categories) categories.push_back(cat.raw);
    doc["categories"] = std::move(categories);

    Json images = Json::array();
    for (const auto& image : dataset.images) {
        Json obj = Json::object();
        obj["id"] = image.id;
        if (image.width > 0) obj["width"] = image.width;
        if (image.height > 0) obj["height"] = image.height;
        obj["file_name"] = image.file_name;
        for (auto it = image.extra.begin(); it != image.extra.end(); ++it) obj[it.key()] = it.value();
        images.push_back(std::move(obj));
    }
    doc["images"] = std::move(images);

    Json annotations = Json::array();
    for (const auto& ann : dataset.annotations) {
        Json obj = Json::object();
        obj["id"] = ann.id;
        obj["image_id"] = ann.image_id;
        obj["category_id"] = ann.category_id;
        if (ann.segmentation.type != Segmentation::Type::None) {
            obj["segmentation"] = segmentationToJson(ann.segmentation);
        }
        if (ann.area) obj["area"] = *ann.area;
        obj["bbox"] = {ann.bbox[0], ann.bbox[1], ann.bbox[2], ann.bbox[3]};
        if (ann.iscrowd) obj["iscrowd"] = *ann.iscrowd;
        for (auto it = ann.extra.begin(); it != ann.extra.end(); ++it) obj[it.key()] = it.value();
        annotations.push_back(std::move(obj));
    }
    doc["annotations"] = std::move(annotations);
    return doc;
}

Dataset loadDataset(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw IOError("cannot open annotation file '" + path + "'");

    Json doc;
    try {
        doc = Json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInput("'" + path + "' is not valid JSON: " + e.what());
    }
    return parseDataset(doc);
}

void saveDataset(const Dataset& dataset, const std::string& path, int indent) {
    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw IOError("cannot create directory '" + target.parent_path().string() +
                          "': " + ec.message());
        }
    }

    const std::string text = toJson(dataset).dump(indent);
    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw IOError("cannot write '" + tmp.string() + "'");
        out << text;
        if (indent >= 0) out << '\n';
        out.flush();
        if (!out) throw IOError("short write to '" + tmp.string() + "'");
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw IOError("cannot move '" + tmp.string() + "' to '" + path + "': " + ec.message());
    }
}

} // namespace coco_tools
