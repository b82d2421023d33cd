#include "coco_tools/coco_io.hpp"
#include "coco_tools/dataset_cleaner.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace coco_tools {
namespace {

// Image 1 annotated, images 3 and 4 not.
Dataset datasetWithEmptyFrames() {
    Dataset d = testing::singleImageDataset();
    for (int64_t id : {3, 4}) {
        Image image;
        image.id = id;
        image.file_name = "frame_00000" + std::to_string(id) + ".png";
        image.width = 1000;
        image.height = 800;
        d.images.push_back(image);
    }
    return d;
}

TEST(DatasetCleanerTest, RemovesOnlyUnannotatedImages) {
    std::vector<Image> removed;
    Dataset out = removeUnannotated(datasetWithEmptyFrames(), &removed);

    ASSERT_EQ(out.images.size(), 1u);
    EXPECT_EQ(out.images[0].id, 1);
    EXPECT_EQ(out.annotations.size(), 1u);
    ASSERT_EQ(removed.size(), 2u);
    EXPECT_EQ(removed[0].id, 3);
    EXPECT_EQ(removed[1].id, 4);
}

TEST(DatasetCleanerTest, MovesDroppedFilesToTrash) {
    testing::TempDir dir;
    const std::string annotations = dir.file("annotations.json");
    const std::string images = dir.file("images");
    saveDataset(datasetWithEmptyFrames(), annotations);
    testing::writeText(images + "/frame_000001.png", "x");
    testing::writeText(images + "/frame_000003.png", "x");

    CleanOptions options;
    options.annotation_file = annotations;
    options.image_root = images;
    options.verbose = false;
    CleanReport report = cleanDataset(options);

    EXPECT_EQ(report.removed_images, 2u);
    EXPECT_EQ(report.moved_files, 1u);
    EXPECT_EQ(report.missing_files, 1u);
    EXPECT_EQ(report.output_annotation, dir.file("new_annotations.json"));

    EXPECT_TRUE(fs::exists(images + "/frame_000001.png"));
    EXPECT_FALSE(fs::exists(images + "/frame_000003.png"));
    EXPECT_TRUE(fs::exists(images + "/_trash/frame_000003.png"));

    Dataset cleaned = loadDataset(report.output_annotation);
    ASSERT_EQ(cleaned.images.size(), 1u);
    EXPECT_EQ(cleaned.images[0].id, 1);
}

TEST(DatasetCleanerTest, DryRunTouchesNothing) {
    testing::TempDir dir;
    const std::string annotations = dir.file("annotations.json");
    const std::string images = dir.file("images");
    saveDataset(datasetWithEmptyFrames(), annotations);
    testing::writeText(images + "/frame_000003.png", "x");

    CleanOptions options;
    options.annotation_file = annotations;
    options.image_root = images;
    options.dry_run = true;
    options.verbose = false;
    CleanReport report = cleanDataset(options);

    EXPECT_EQ(report.removed_images, 2u);
    EXPECT_EQ(report.moved_files, 0u);
    EXPECT_FALSE(fs::exists(report.output_annotation));
    EXPECT_TRUE(fs::exists(images + "/frame_000003.png"));
}

} // namespace
} // namespace coco_tools
