#include "coco_tools/dataset_cleaner.hpp"
#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/file_ops.hpp"
#include "coco_tools/validation.hpp"

#include <filesystem>
#include <iostream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace coco_tools {

Dataset removeUnannotated(const Dataset& dataset, std::vector<Image>* removed) {
    std::unordered_set<int64_t> annotated;
    for (const auto& ann : dataset.annotations) annotated.insert(ann.image_id);

    Dataset out;
    out.annotations = dataset.annotations;
    out.categories = dataset.categories;
    out.extra = dataset.extra;
    for (const auto& image : dataset.images) {
        if (annotated.count(image.id)) {
            out.images.push_back(image);
        } else if (removed) {
            removed->push_back(image);
        }
    }
    return out;
}

CleanReport cleanDataset(const CleanOptions& options) {
    Dataset dataset = loadDataset(options.annotation_file);
    ValidationOptions validation;
    validation.check_bounds = false;
    validate(dataset, validation);

    std::vector<Image> removed;
    Dataset cleaned = removeUnannotated(dataset, &removed);

    CleanReport report;
    report.removed_images = removed.size();
    report.output_annotation = options.output_annotation.empty()
        ? (fs::path(options.annotation_file).parent_path() / "new_annotations.json").string()
        : options.output_annotation;
    if (samePath(report.output_annotation, options.annotation_file)) {
        throw MalformedInput("refusing to overwrite the input annotation file");
    }

    std::vector<std::pair<std::string, int64_t>> to_move;
    for (const auto& image : removed) {
        const fs::path file = fs::path(options.image_root) / image.file_name;
        std::error_code ec;
        if (!options.image_root.empty() && fs::exists(file, ec)) {
            to_move.emplace_back(image.file_name, image.id);
        } else {
            ++report.missing_files;
            if (options.verbose) {
                std::cout << "[clean] " << image.file_name << " is not on disk, dropped from annotations"
                          << std::endl;
            }
        }
    }

    if (options.dry_run) {
        if (options.verbose) {
            std::cout << "[clean] dry run: would remove " << removed.size() << " images and move "
                      << to_move.size() << " files" << std::endl;
        }
        return report;
    }

    saveDataset(cleaned, report.output_annotation, options.json_indent);

    const fs::path trash = fs::path(options.image_root) / "_trash";
    for (const auto& entry : to_move) {
        moveFile((fs::path(options.image_root) / entry.first).string(),
                 (trash / entry.first).string(), entry.second);
        ++report.moved_files;
    }

    if (options.verbose) {
        std::cout << "[clean] removed " << report.removed_images << " unannotated images, moved "
                  << report.moved_files << " files to " << trash.string() << std::endl;
    }
    return report;
}

} // namespace coco_tools
