#include "coco_tools/adjust_service.hpp"
#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/file_ops.hpp"
#include "coco_tools/resize_pool.hpp"
#include "coco_tools/validation.hpp"

#include <filesystem>
#include <iostream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace coco_tools {

namespace {

const std::string kStagingSuffix = ".coco_tools.tmp";
const std::string kBackupSuffix = ".coco_tools.bak";

} // namespace

AdjustService::AdjustService(const AdjustConfig& config)
    : config_(config) {}

std::string AdjustService::stagingPath(const std::string& destination) {
    return destination + kStagingSuffix;
}

std::string AdjustService::backupPath(const std::string& destination) {
    return destination + kBackupSuffix;
}

std::string AdjustService::outputAnnotationPath() const {
    if (!config_.output_annotation.empty()) return config_.output_annotation;

    const fs::path input(config_.annotation_file);
    const std::string name = input.stem().string() + "_adjusted.json";
    if (config_.output_mode == OutputMode::InPlace) {
        return (input.parent_path() / name).string();
    }
    if (config_.output_dir.empty()) {
        throw MalformedInput("output_dir is required in separate_directory mode");
    }
    return (fs::path(config_.output_dir) / "annotations" / name).string();
}

std::string AdjustService::sourcePath(const Image& image) const {
    return (fs::path(config_.image_root) / image.file_name).string();
}

std::string AdjustService::destinationPath(const Image& image) const {
    if (config_.output_mode == OutputMode::InPlace) return sourcePath(image);
    return (fs::path(config_.output_dir) / "images" / image.file_name).string();
}

SizeTable AdjustService::probeUndeclaredSizes(const Dataset& dataset, const RetryPolicy& retry) const {
    SizeTable probed;
    for (const auto& image : dataset.images) {
        if (image.hasDeclaredSize()) continue;
        if (config_.source_size_overrides.count(image.file_name)) continue;
        probed.emplace(image.id, ImageResizer::probeSize(sourcePath(image), retry, image.id));
    }
    return probed;
}

std::vector<ResizeTask> AdjustService::planResizeTasks(const Dataset& source,
                                                       const ScaleTable& scales) const {
    std::unordered_set<std::string> seen;
    std::vector<int64_t> duplicates;
    std::vector<ResizeTask> tasks;
    tasks.reserve(source.images.size());

    for (const auto& image : source.images) {
        if (!seen.insert(image.file_name).second) {
            duplicates.push_back(image.id);
            continue;
        }
        const ImageScale& scale = scales.at(image.id);

        ResizeTask task;
        task.image_id = image.id;
        task.source = sourcePath(image);
        task.destination = stagingPath(destinationPath(image));
        task.encode_ext = fs::path(image.file_name).extension().string();
        task.expected_source = cv::Size(scale.src_width, scale.src_height);
        task.target = cv::Size(scale.dst_width, scale.dst_height);
        task.sx = scale.sx;
        task.sy = scale.sy;
        tasks.push_back(std::move(task));
    }
    if (!duplicates.empty()) {
        throw MalformedInput("several images share one file_name", duplicates);
    }
    return tasks;
}

void AdjustService::discardStaging(const std::vector<ResizeTask>& tasks) const {
    for (const auto& task : tasks) {
        std::error_code ec;
        fs::remove(task.destination, ec);
        if (ec) {
            std::cerr << "[adjust] could not remove staging file '" << task.destination
                      << "': " << ec.message() << std::endl;
        }
    }
}

std::vector<std::string> AdjustService::commit(const std::vector<ResizeTask>& tasks) const {
    std::vector<std::string> committed;
    committed.reserve(tasks.size());

    for (const auto& task : tasks) {
        const std::string final_path =
            task.destination.substr(0, task.destination.size() - kStagingSuffix.size());
        std::error_code ec;
        if (fs::exists(final_path, ec)) {
            fs::rename(final_path, backupPath(final_path), ec);
            if (ec) {
                restore(tasks, committed);
                throw IOError("cannot back up '" + final_path + "': " + ec.message(), {task.image_id});
            }
        }
        fs::rename(task.destination, final_path, ec);
        if (ec) {
            std::error_code undo;
            if (fs::exists(backupPath(final_path), undo)) {
                fs::rename(backupPath(final_path), final_path, undo);
            }
            restore(tasks, committed);
            throw IOError("cannot move '" + task.destination + "' into place: " + ec.message(),
                          {task.image_id});
        }
        committed.push_back(final_path);
    }
    return committed;
}

void AdjustService::restore(const std::vector<ResizeTask>& tasks,
                            const std::vector<std::string>& committed) const {
    for (const auto& path : committed) {
        std::error_code ec;
        const std::string backup = backupPath(path);
        if (fs::exists(backup, ec)) {
            fs::rename(backup, path, ec);
        } else {
            fs::remove(path, ec);
        }
        if (ec) {
            std::cerr << "[adjust] could not restore '" << path << "': " << ec.message() << std::endl;
        }
    }
    discardStaging(tasks);
}

void AdjustService::finalize(const std::vector<std::string>& committed) const {
    for (const auto& path : committed) {
        std::error_code ec;
        fs::remove(backupPath(path), ec);
        if (ec) {
            std::cerr << "[adjust] could not remove backup of '" << path << "': "
                      << ec.message() << std::endl;
        }
    }
}

AdjustReport AdjustService::run() {
    if (config_.verbose) printSummary(config_);
    if (config_.resize_images && config_.image_root.empty()) {
        throw MalformedInput("image_root is required when resize_images is set");
    }

    const std::string output_path = outputAnnotationPath();
    if (samePath(output_path, config_.annotation_file)) {
        throw MalformedInput("refusing to overwrite the input annotation file '" + output_path + "'");
    }

    Dataset dataset = loadDataset(config_.annotation_file);
    ValidationOptions options;
    options.bounds_tolerance = config_.bounds_tolerance;
    validate(dataset, options);

    RetryPolicy retry;
    retry.retries = config_.io_retries;
    retry.delay_ms = config_.retry_delay_ms;

    ResolutionAdjuster adjuster(config_);
    SizeTable probed;
    if (config_.resize_images) probed = probeUndeclaredSizes(dataset, retry);
    const ScaleTable scales = adjuster.computeScales(dataset, probed);
    Dataset adjusted = adjuster.apply(dataset, scales);

    if (config_.verbose) {
        std::cout << "[adjust] rescaled " << adjusted.images.size() << " images and "
                  << adjusted.annotations.size() << " annotations in memory" << std::endl;
    }

    AdjustReport report;
    report.images = adjusted.images.size();
    report.annotations = adjusted.annotations.size();
    report.output_annotation = output_path;

    std::vector<ResizeTask> tasks;
    std::vector<std::string> committed;
    if (config_.resize_images) {
        tasks = planResizeTasks(dataset, scales);
        ResizePool pool(config_.workers);
        try {
            pool.run(tasks, retry);
        } catch (const std::exception&) {
            discardStaging(tasks);
            throw;
        }
        committed = commit(tasks);
        report.resized_files = committed.size();
        if (config_.verbose) {
            std::cout << "[adjust] resized " << committed.size() << " images with "
                      << pool.workers() << " workers" << std::endl;
        }
    }

    try {
        saveDataset(adjusted, output_path, config_.json_indent);
    } catch (const std::exception&) {
        restore({}, committed);
        throw;
    }
    finalize(committed);

    if (config_.verbose) {
        std::cout << "[adjust] wrote " << output_path << std::endl;
    }
    return report;
}

} // namespace coco_tools
