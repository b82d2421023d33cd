#include "coco_tools/format_converter.hpp"
#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/image_resizer.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace coco_tools {

bool isPng(const std::string& file_name) {
    std::string ext = fs::path(file_name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".png";
}

std::string pngToJpgName(const std::string& file_name) {
    if (!isPng(file_name)) return file_name;
    return fs::path(file_name).replace_extension(".jpg").string();
}

size_t renamePngEntries(Dataset& dataset) {
    size_t renamed = 0;
    for (auto& image : dataset.images) {
        if (!isPng(image.file_name)) continue;
        image.file_name = pngToJpgName(image.file_name);
        ++renamed;
    }
    return renamed;
}

ConvertReport convertPngToJpg(const ConvertOptions& options) {
    if (options.jpeg_quality < 0 || options.jpeg_quality > 100) {
        throw MalformedInput("jpeg quality must be within 0..100");
    }
    std::error_code ec;
    if (!fs::is_directory(options.input_dir, ec)) {
        throw IOError("'" + options.input_dir + "' is not a directory");
    }

    std::vector<fs::path> sources;
    if (options.recursive) {
        for (fs::recursive_directory_iterator it(options.input_dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file() && isPng(it->path().string())) sources.push_back(it->path());
        }
    } else {
        for (fs::directory_iterator it(options.input_dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file() && isPng(it->path().string())) sources.push_back(it->path());
        }
    }
    if (ec) throw IOError("cannot list '" + options.input_dir + "': " + ec.message());
    std::sort(sources.begin(), sources.end());

    RetryPolicy retry;
    retry.retries = options.io_retries;
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, options.jpeg_quality};

    ConvertReport report;
    for (const auto& src : sources) {
        cv::Mat image = ImageResizer::readImage(src.string(), retry);
        if (image.depth() == CV_16U) {
            cv::Mat narrow;
            image.convertTo(narrow, CV_8U, 1.0 / 257.0);
            image = narrow;
        }
        if (image.channels() == 4) {
            cv::Mat bgr;
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            image = bgr;
        }
        const std::string dst = pngToJpgName(src.string());
        ImageResizer::writeImage(dst, image, ".jpg", retry, -1, params);
        ++report.converted;
    }
    if (options.verbose) {
        std::cout << "[convert] wrote " << report.converted << " jpg files under "
                  << options.input_dir << std::endl;
    }

    if (!options.annotation_file.empty()) {
        Dataset dataset = loadDataset(options.annotation_file);
        report.renamed_entries = renamePngEntries(dataset);
        const fs::path input(options.annotation_file);
        report.output_annotation =
            (input.parent_path() / (input.stem().string() + "_jpg.json")).string();
        saveDataset(dataset, report.output_annotation, options.json_indent);
    }
    return report;
}

} // namespace coco_tools
