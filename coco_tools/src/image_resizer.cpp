#include "coco_tools/image_resizer.hpp"
#include "coco_tools/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace coco_tools {

namespace {

std::vector<int64_t> idList(int64_t image_id) {
    if (image_id < 0) return {};
    return {image_id};
}

void backoff(const RetryPolicy& retry, int attempt, const std::string& what) {
    std::cerr << "[resize] " << what << " failed (attempt " << attempt + 1
              << "/" << retry.retries + 1 << "), retrying" << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(retry.delay_ms));
}

bool writeBytes(const std::string& path, const std::vector<uchar>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.flush();
    return static_cast<bool>(out);
}

} // namespace

int ImageResizer::interpolationFor(double sx, double sy) {
    return (sx <= 1.0 && sy <= 1.0) ? cv::INTER_AREA : cv::INTER_LINEAR;
}

cv::Mat ImageResizer::readImage(const std::string& path, const RetryPolicy& retry,
                                int64_t image_id) {
    for (int attempt = 0; ; ++attempt) {
        cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (!image.empty()) return image;
        if (attempt >= retry.retries) break;
        backoff(retry, attempt, "reading '" + path + "'");
    }
    throw IOError("cannot read image '" + path + "'", idList(image_id));
}

void ImageResizer::writeImage(const std::string& path, const cv::Mat& image,
                              const std::string& ext, const RetryPolicy& retry,
                              int64_t image_id, const std::vector<int>& params) {
    std::vector<uchar> bytes;
    try {
        if (!cv::imencode(ext, image, bytes, params)) {
            throw IOError("cannot encode '" + path + "' as " + ext, idList(image_id));
        }
    } catch (const cv::Exception& e) {
        throw IOError("cannot encode '" + path + "' as " + ext + ": " + e.what(), idList(image_id));
    }

    for (int attempt = 0; ; ++attempt) {
        if (writeBytes(path, bytes)) return;
        if (attempt >= retry.retries) break;
        backoff(retry, attempt, "writing '" + path + "'");
    }
    throw IOError("cannot write image '" + path + "'", idList(image_id));
}

cv::Size ImageResizer::probeSize(const std::string& path, const RetryPolicy& retry,
                                 int64_t image_id) {
    return readImage(path, retry, image_id).size();
}

void ImageResizer::resizeOne(const ResizeTask& task, const RetryPolicy& retry) {
    cv::Mat src = readImage(task.source, retry, task.image_id);

    if (src.size() != task.expected_source) {
        throw DimensionMismatch("raster '" + task.source + "' is " +
                                std::to_string(src.cols) + "x" + std::to_string(src.rows) +
                                " but the dataset declares " +
                                std::to_string(task.expected_source.width) + "x" +
                                std::to_string(task.expected_source.height),
                                {task.image_id});
    }

    cv::Mat dst;
    cv::resize(src, dst, task.target, 0, 0, interpolationFor(task.sx, task.sy));

    const fs::path out(task.destination);
    if (out.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out.parent_path(), ec);
        if (ec) {
            throw IOError("cannot create directory '" + out.parent_path().string() + "': " +
                          ec.message(), {task.image_id});
        }
    }
    writeImage(task.destination, dst, task.encode_ext, retry, task.image_id);
}

} // namespace coco_tools
