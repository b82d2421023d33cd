#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/preview.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

namespace coco_tools {
namespace {

TEST(PreviewTest, DrawsBoxesAndPolygons) {
    cv::Mat image = cv::Mat::zeros(100, 100, CV_8UC3);
    Annotation ann;
    ann.bbox = {10.0, 10.0, 30.0, 20.0};
    ann.segmentation.type = Segmentation::Type::Polygons;
    ann.segmentation.polygons = {{60, 60, 90, 60, 90, 90}};

    cv::Mat canvas = drawAnnotations(image, {&ann}, 1);
    EXPECT_EQ(canvas.at<cv::Vec3b>(10, 20), cv::Vec3b(0, 255, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(60, 75), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(80, 20), cv::Vec3b(0, 0, 0));
    // Input untouched.
    EXPECT_EQ(cv::countNonZero(image.reshape(1)), 0);
}

TEST(PreviewTest, GrayscaleInputBecomesColor) {
    cv::Mat gray = cv::Mat::zeros(20, 20, CV_8UC1);
    EXPECT_EQ(drawAnnotations(gray, {}).channels(), 3);
}

TEST(PreviewTest, WritesRequestedImage) {
    testing::TempDir dir;
    Dataset d = testing::twoImageDataset();
    saveDataset(d, dir.file("instances.json"));
    testing::writeTestImage(dir.file("images/frame_000002.png"), 500, 500);

    PreviewOptions options;
    options.annotation_file = dir.file("instances.json");
    options.image_root = dir.file("images");
    options.output_path = dir.file("preview.png");
    options.image_id = 2;
    EXPECT_EQ(writePreview(options), 2);

    cv::Mat out = cv::imread(options.output_path);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.cols, 500);

    options.image_id = 42;
    EXPECT_THROW(writePreview(options), DanglingReference);
}

} // namespace
} // namespace coco_tools
