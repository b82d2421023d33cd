#include "coco_tools/adjust_config.hpp"
#include "coco_tools/errors.hpp"

#include <iostream>

namespace coco_tools {

OutputMode parseOutputMode(const std::string& s) {
    if (s == "separate_directory") return OutputMode::SeparateDirectory;
    if (s == "in_place") return OutputMode::InPlace;
    throw MalformedInput("unknown output_mode '" + s + "'");
}

SegmentationPolicy parseSegmentationPolicy(const std::string& s) {
    if (s == "reject") return SegmentationPolicy::Reject;
    if (s == "rescale") return SegmentationPolicy::Rescale;
    throw MalformedInput("unknown segmentation_policy '" + s + "'");
}

SourceSizePolicy parseSourceSizePolicy(const std::string& s) {
    if (s == "per_image") return SourceSizePolicy::PerImage;
    if (s == "require_uniform") return SourceSizePolicy::RequireUniform;
    throw MalformedInput("unknown source_size_policy '" + s + "'");
}

const char* toString(OutputMode mode) {
    return mode == OutputMode::InPlace ? "in_place" : "separate_directory";
}

const char* toString(SegmentationPolicy policy) {
    return policy == SegmentationPolicy::Rescale ? "rescale" : "reject";
}

const char* toString(SourceSizePolicy policy) {
    return policy == SourceSizePolicy::RequireUniform ? "require_uniform" : "per_image";
}

void loadAdjustConfig(const std::string& path, AdjustConfig& config) {
    cv::FileStorage fs;
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        throw MalformedInput("cannot parse config '" + path + "': " + e.what());
    }
    if (!fs.isOpened()) throw IOError("cannot open config '" + path + "'");

    auto get = [&](const char* key, auto& target) {
        if (!fs[key].empty()) fs[key] >> target;
    };
    auto getEnum = [&](const char* key, auto& target, auto parse) {
        if (fs[key].empty()) return;
        std::string value;
        fs[key] >> value;
        target = parse(value);
    };

    get("annotation_file", config.annotation_file);
    get("image_root", config.image_root);
    get("output_dir", config.output_dir);
    get("output_annotation", config.output_annotation);

    if (!fs["scale"].empty()) {
        double s = 0.0;
        fs["scale"] >> s;
        config.target = TargetSpec::factor(s);
    }
    if (!fs["target_width"].empty() || !fs["target_height"].empty()) {
        int w = 0, h = 0;
        fs["target_width"] >> w;
        fs["target_height"] >> h;
        config.target = TargetSpec::size(w, h);
    }

    get("resize_images", config.resize_images);
    getEnum("output_mode", config.output_mode, parseOutputMode);
    getEnum("segmentation_policy", config.segmentation_policy, parseSegmentationPolicy);
    getEnum("source_size_policy", config.source_size_policy, parseSourceSizePolicy);

    cv::FileNode sizes = fs["source_sizes"];
    if (!sizes.empty()) {
        for (auto it = sizes.begin(); it != sizes.end(); ++it) {
            std::string file;
            int w = 0, h = 0;
            (*it)["file"] >> file;
            (*it)["width"] >> w;
            (*it)["height"] >> h;
            if (file.empty() || w <= 0 || h <= 0) {
                throw MalformedInput("source_sizes entries need file, width and height");
            }
            config.source_size_overrides[file] = cv::Size(w, h);
        }
    }

    get("bounds_tolerance", config.bounds_tolerance);
    get("workers", config.workers);
    get("io_retries", config.io_retries);
    get("retry_delay_ms", config.retry_delay_ms);
    get("json_indent", config.json_indent);
    get("verbose", config.verbose);
}

void printSummary(const AdjustConfig& config) {
    std::cout << "\n=== ADJUST CONFIG ===\n";
    std::cout << "Annotations: " << config.annotation_file << "\n";
    std::cout << "Image root: " << (config.image_root.empty() ? "-" : config.image_root) << "\n";
    std::cout << "Output dir: " << (config.output_dir.empty() ? "-" : config.output_dir) << "\n";
    if (config.target.mode == TargetSpec::Mode::Size) {
        std::cout << "Target: " << config.target.width << "x" << config.target.height << "\n";
    } else {
        std::cout << "Target: scale " << config.target.scale << "\n";
    }
    std::cout << "Resize images: " << (config.resize_images ? "true" : "false")
              << " mode=" << toString(config.output_mode)
              << " workers=" << config.workers
              << " retries=" << config.io_retries << "\n";
    std::cout << "Segmentation: " << toString(config.segmentation_policy)
              << " sources=" << toString(config.source_size_policy)
              << " overrides=" << config.source_size_overrides.size()
              << " boundsTol=" << config.bounds_tolerance << "\n";
    std::cout << "=====================\n\n";
}

} // namespace coco_tools
