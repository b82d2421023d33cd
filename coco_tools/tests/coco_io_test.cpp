#include "coco_tools/coco_io.hpp"
#include "coco_tools/errors.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace coco_tools {
namespace {

// Key order matches what CVAT exports and what toJson writes back.
const char* kCvatDocument = R"({
  "licenses": [{"name": "", "id": 0, "url": ""}],
  "info": {"contributor": "", "date_created": "", "description": "", "url": "", "version": "", "year": ""},
  "categories": [
    {"id": 1, "name": "car", "supercategory": ""},
    {"id": 2, "name": "person", "supercategory": ""}
  ],
  "images": [
    {"id": 1, "width": 1920, "height": 1080, "file_name": "frame_000000.PNG", "license": 0, "flickr_url": "", "coco_url": "", "date_captured": 0}
  ],
  "annotations": [
    {"id": 1, "image_id": 1, "category_id": 1, "segmentation": [[10.0, 10.0, 50.0, 10.0, 50.0, 30.0]], "area": 400.0, "bbox": [10.0, 10.0, 40.0, 20.0], "iscrowd": 0, "attributes": {"occluded": false}},
    {"id": 2, "image_id": 1, "category_id": 2, "segmentation": {"size": [1080, 1920], "counts": [100, 20, 2073480]}, "area": 20.0, "bbox": [0.0, 100.0, 1.0, 20.0], "iscrowd": 1, "attributes": {"occluded": true}}
  ]
})";

TEST(CocoIoTest, ParsesCvatExport) {
    Dataset d = parseDataset(Json::parse(kCvatDocument));

    ASSERT_EQ(d.images.size(), 1u);
    EXPECT_EQ(d.images[0].file_name, "frame_000000.PNG");
    EXPECT_EQ(d.images[0].width, 1920);
    EXPECT_EQ(d.images[0].height, 1080);
    EXPECT_TRUE(d.images[0].extra.contains("license"));

    ASSERT_EQ(d.annotations.size(), 2u);
    const Annotation& poly = d.annotations[0];
    EXPECT_EQ(poly.segmentation.type, Segmentation::Type::Polygons);
    ASSERT_EQ(poly.segmentation.polygons.size(), 1u);
    EXPECT_EQ(poly.segmentation.polygons[0].size(), 6u);
    EXPECT_DOUBLE_EQ(*poly.area, 400.0);
    EXPECT_EQ(poly.extra["attributes"]["occluded"], false);

    const Annotation& rle = d.annotations[1];
    ASSERT_TRUE(rle.segmentation.isRle());
    EXPECT_FALSE(rle.segmentation.rle.compressed);
    EXPECT_EQ(rle.segmentation.rle.height, 1080);
    EXPECT_EQ(rle.segmentation.rle.width, 1920);
    EXPECT_EQ(rle.segmentation.rle.counts.size(), 3u);
    EXPECT_EQ(*rle.iscrowd, 1);

    ASSERT_EQ(d.categories.size(), 2u);
    EXPECT_EQ(d.categories[1].name, "person");
    EXPECT_TRUE(d.extra.contains("licenses"));
    EXPECT_TRUE(d.extra.contains("info"));
}

TEST(CocoIoTest, RoundTripKeepsEveryKeyInOrder) {
    const Json doc = Json::parse(kCvatDocument);
    EXPECT_EQ(toJson(parseDataset(doc)).dump(), doc.dump());
}

TEST(CocoIoTest, CompressedRleStaysAString) {
    Json doc = Json::parse(kCvatDocument);
    doc["annotations"][1]["segmentation"]["counts"] = "231";
    doc["annotations"][1]["segmentation"]["size"] = {2, 3};

    Dataset d = parseDataset(doc);
    const Rle& rle = d.annotations[1].segmentation.rle;
    EXPECT_TRUE(rle.compressed);
    EXPECT_EQ(rle.counts, (std::vector<uint32_t>{2, 3, 1}));
    EXPECT_EQ(toJson(d)["annotations"][1]["segmentation"]["counts"], "231");
}

TEST(CocoIoTest, MissingBboxIsMalformedInput) {
    Json doc = Json::parse(kCvatDocument);
    doc["annotations"][0].erase("bbox");
    try {
        parseDataset(doc);
        FAIL() << "expected MalformedInput";
    } catch (const CocoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedInput);
        EXPECT_NE(std::string(e.what()).find("bbox"), std::string::npos);
    }
}

TEST(CocoIoTest, MissingSectionIsMalformedInput) {
    Json doc = Json::parse(kCvatDocument);
    doc.erase("categories");
    EXPECT_THROW(parseDataset(doc), MalformedInput);
}

TEST(CocoIoTest, UndeclaredImageSizeReadsAsZero) {
    Json doc = Json::parse(kCvatDocument);
    doc["images"][0].erase("width");
    doc["images"][0].erase("height");
    Dataset d = parseDataset(doc);
    EXPECT_FALSE(d.images[0].hasDeclaredSize());
    EXPECT_FALSE(toJson(d)["images"][0].contains("width"));
}

TEST(CocoIoTest, FlatPolygonListIsMalformed) {
    Json doc = Json::parse(kCvatDocument);
    doc["annotations"][0]["segmentation"] = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    EXPECT_THROW(parseDataset(doc), MalformedInput);
}

TEST(CocoIoTest, UndecodableRleStringIsMalformed) {
    Json doc = Json::parse(kCvatDocument);
    doc["annotations"][1]["segmentation"]["counts"] = "T";
    EXPECT_THROW(parseDataset(doc), MalformedInput);
}

TEST(CocoIoTest, OutOfRangeIntegersAreMalformed) {
    Json doc = Json::parse(kCvatDocument);
    doc["images"][0]["id"] = 1e300;
    EXPECT_THROW(parseDataset(doc), MalformedInput);

    doc = Json::parse(kCvatDocument);
    doc["images"][0]["id"] = std::numeric_limits<uint64_t>::max();
    EXPECT_THROW(parseDataset(doc), MalformedInput);

    doc = Json::parse(kCvatDocument);
    doc["images"][0]["width"] = 3000000000LL;
    EXPECT_THROW(parseDataset(doc), MalformedInput);

    doc = Json::parse(kCvatDocument);
    doc["annotations"][1]["segmentation"]["size"] = {5000000000LL, 1};
    EXPECT_THROW(parseDataset(doc), MalformedInput);

    doc = Json::parse(kCvatDocument);
    doc["annotations"][1]["segmentation"]["counts"] = {100, 5000000000LL};
    EXPECT_THROW(parseDataset(doc), MalformedInput);

    doc = Json::parse(kCvatDocument);
    doc["annotations"][0]["iscrowd"] = 1e12;
    EXPECT_THROW(parseDataset(doc), MalformedInput);
}

TEST(CocoIoTest, IntegralFloatIdsAreAccepted) {
    Json doc = Json::parse(kCvatDocument);
    doc["images"][0]["id"] = 1.0;
    EXPECT_EQ(parseDataset(doc).images[0].id, 1);
}

TEST(CocoIoTest, SaveCreatesDirectoriesAndLeavesNoTempFile) {
    testing::TempDir dir;
    const std::string path = dir.file("nested/annotations/out.json");
    Dataset d = parseDataset(Json::parse(kCvatDocument));

    saveDataset(d, path, 2);

    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(path + ".tmp"));
    EXPECT_EQ(toJson(loadDataset(path)).dump(), toJson(d).dump());
}

TEST(CocoIoTest, LoadMissingFileIsIOError) {
    testing::TempDir dir;
    EXPECT_THROW(loadDataset(dir.file("absent.json")), IOError);
}

TEST(CocoIoTest, LoadInvalidJsonIsMalformed) {
    testing::TempDir dir;
    testing::writeText(dir.file("broken.json"), "{\"images\": [");
    EXPECT_THROW(loadDataset(dir.file("broken.json")), MalformedInput);
}

} // namespace
} // namespace coco_tools
