#include "coco_tools/preview.hpp"
#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/image_resizer.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

namespace coco_tools {

cv::Mat drawAnnotations(const cv::Mat& image, const std::vector<const Annotation*>& annotations,
                        int thickness) {
    cv::Mat canvas;
    if (image.channels() == 1) {
        cv::cvtColor(image, canvas, cv::COLOR_GRAY2BGR);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, canvas, cv::COLOR_BGRA2BGR);
    } else {
        canvas = image.clone();
    }

    for (const Annotation* ann : annotations) {
        const auto& b = ann->bbox;
        const cv::Point tl(static_cast<int>(b[0]), static_cast<int>(b[1]));
        const cv::Point br(static_cast<int>(b[0] + b[2]), static_cast<int>(b[1] + b[3]));
        cv::rectangle(canvas, tl, br, cv::Scalar(0, 255, 0), thickness);

        if (ann->segmentation.type != Segmentation::Type::Polygons) continue;
        for (const auto& ring : ann->segmentation.polygons) {
            std::vector<cv::Point> pts;
            pts.reserve(ring.size() / 2);
            for (size_t i = 0; i + 1 < ring.size(); i += 2) {
                pts.emplace_back(static_cast<int>(std::lround(ring[i])),
                                 static_cast<int>(std::lround(ring[i + 1])));
            }
            cv::polylines(canvas, pts, true, cv::Scalar(255, 0, 0), 1);
        }
    }
    return canvas;
}

int64_t writePreview(const PreviewOptions& options) {
    Dataset dataset = loadDataset(options.annotation_file);
    if (dataset.images.empty()) throw MalformedInput("dataset has no images");

    const Image* image = options.image_id < 0 ? &dataset.images.front()
                                              : dataset.findImage(options.image_id);
    if (!image) throw DanglingReference("no image with the requested id", {options.image_id});

    std::vector<const Annotation*> annotations;
    for (const auto& ann : dataset.annotations) {
        if (ann.image_id == image->id) annotations.push_back(&ann);
    }

    RetryPolicy retry;
    cv::Mat raster = ImageResizer::readImage((fs::path(options.image_root) / image->file_name).string(),
                                             retry, image->id);
    if (raster.depth() != CV_8U) raster.convertTo(raster, CV_8U, 1.0 / 257.0);
    cv::Mat canvas = drawAnnotations(raster, annotations, options.thickness);

    std::string ext = fs::path(options.output_path).extension().string();
    if (ext.empty()) ext = ".png";
    ImageResizer::writeImage(options.output_path, canvas, ext, retry, image->id);
    return image->id;
}

} // namespace coco_tools
