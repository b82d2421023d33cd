#include "coco_tools/dataset_splitter.hpp"
#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/file_ops.hpp"
#include "coco_tools/validation.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <random>
#include <unordered_set>

namespace fs = std::filesystem;

namespace coco_tools {

namespace {

Dataset subset(const Dataset& dataset, const std::unordered_set<int64_t>& ids) {
    Dataset out;
    out.categories = dataset.categories;
    out.extra = dataset.extra;
    for (const auto& image : dataset.images) {
        if (ids.count(image.id)) out.images.push_back(image);
    }
    for (const auto& ann : dataset.annotations) {
        if (ids.count(ann.image_id)) out.annotations.push_back(ann);
    }
    return out;
}

} // namespace

std::pair<Dataset, Dataset> splitDataset(const Dataset& dataset, double ratio, uint32_t seed) {
    if (!(ratio > 0.0 && ratio <= 1.0)) {
        throw MalformedInput("split ratio must be in (0, 1], got " + std::to_string(ratio));
    }

    std::vector<int64_t> ids;
    ids.reserve(dataset.images.size());
    for (const auto& image : dataset.images) ids.push_back(image.id);
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    std::mt19937 rng(seed);
    std::shuffle(ids.begin(), ids.end(), rng);

    const size_t split = static_cast<size_t>(ratio * ids.size());
    const auto middle = ids.begin() + static_cast<std::ptrdiff_t>(split);
    std::unordered_set<int64_t> train(ids.begin(), middle);
    std::unordered_set<int64_t> val(middle, ids.end());
    return {subset(dataset, train), subset(dataset, val)};
}

void checkSplit(const std::string& annotation_file, const std::string& image_dir) {
    Dataset dataset = loadDataset(annotation_file);

    std::unordered_set<int64_t> image_ids;
    for (const auto& image : dataset.images) image_ids.insert(image.id);
    std::vector<int64_t> dangling;
    for (const auto& ann : dataset.annotations) {
        if (!image_ids.count(ann.image_id)) dangling.push_back(ann.id);
    }
    if (!dangling.empty()) {
        throw DanglingReference("annotations in '" + annotation_file + "' reference missing images",
                                dangling);
    }

    std::vector<int64_t> missing;
    for (const auto& image : dataset.images) {
        std::error_code ec;
        if (!fs::is_regular_file(fs::path(image_dir) / image.file_name, ec)) missing.push_back(image.id);
    }
    if (!missing.empty()) {
        throw IOError("images listed in '" + annotation_file + "' are missing from '" + image_dir + "'",
                      missing);
    }
}

SplitReport splitToDirectory(const SplitOptions& options) {
    Dataset dataset = loadDataset(options.annotation_file);
    ValidationOptions validation;
    validation.check_bounds = false;
    validate(dataset, validation);

    std::vector<int64_t> missing;
    for (const auto& image : dataset.images) {
        std::error_code ec;
        if (!fs::is_regular_file(fs::path(options.image_root) / image.file_name, ec)) {
            missing.push_back(image.id);
        }
    }
    if (!missing.empty()) {
        throw IOError("source images are missing from '" + options.image_root + "'", missing);
    }

    auto halves = splitDataset(dataset, options.split_ratio, options.seed);
    const fs::path out(options.output_dir);

    struct Part { const Dataset* data; const char* name; };
    const Part parts[] = {{&halves.first, "train"}, {&halves.second, "val"}};

    for (const auto& part : parts) {
        const fs::path image_dir = out / "images" / part.name;
        std::error_code ec;
        fs::create_directories(image_dir, ec);
        if (ec) throw IOError("cannot create '" + image_dir.string() + "': " + ec.message());

        if (options.verbose) {
            std::cout << "[split] " << (options.copy_images ? "copying " : "moving ")
                      << part.data->images.size() << " images to " << image_dir.string() << std::endl;
        }
        for (const auto& image : part.data->images) {
            const std::string from = (fs::path(options.image_root) / image.file_name).string();
            const std::string to = (image_dir / image.file_name).string();
            if (options.copy_images) {
                copyFile(from, to, image.id);
            } else {
                moveFile(from, to, image.id);
            }
        }

        const std::string json_path = (out / "annotations" / (std::string(part.name) + ".json")).string();
        saveDataset(*part.data, json_path, options.json_indent);
    }

    for (const auto& part : parts) {
        checkSplit((out / "annotations" / (std::string(part.name) + ".json")).string(),
                   (out / "images" / part.name).string());
    }

    SplitReport report;
    report.train_images = halves.first.images.size();
    report.val_images = halves.second.images.size();
    report.train_annotations = halves.first.annotations.size();
    report.val_annotations = halves.second.annotations.size();
    if (options.verbose) {
        std::cout << "[split] train " << report.train_images << " images / "
                  << report.train_annotations << " annotations, val " << report.val_images
                  << " images / " << report.val_annotations << " annotations" << std::endl;
    }
    return report;
}

} // namespace coco_tools
