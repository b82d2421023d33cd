#include "coco_tools/errors.hpp"
#include "coco_tools/rle.hpp"

#include <gtest/gtest.h>

#include <string>

namespace coco_tools {
namespace {

cv::Mat smallMask() {
    // [[0,1,1],
    //  [0,1,0]]
    cv::Mat mask = cv::Mat::zeros(2, 3, CV_8U);
    mask.at<uint8_t>(0, 1) = 1;
    mask.at<uint8_t>(0, 2) = 1;
    mask.at<uint8_t>(1, 1) = 1;
    return mask;
}

TEST(RleCodecTest, EncodesColumnMajor) {
    Rle rle = RleCodec::encode(smallMask(), false);
    EXPECT_EQ(rle.height, 2);
    EXPECT_EQ(rle.width, 3);
    EXPECT_FALSE(rle.compressed);
    EXPECT_EQ(rle.counts, (std::vector<uint32_t>{2, 3, 1}));
    EXPECT_EQ(RleCodec::pixelCount(rle), 3u);
    EXPECT_EQ(RleCodec::totalCount(rle), 6u);
}

TEST(RleCodecTest, DecodeRestoresMask) {
    Rle rle;
    rle.height = 2;
    rle.width = 3;
    rle.counts = {2, 3, 1};
    cv::Mat mask = RleCodec::decode(rle);
    ASSERT_EQ(mask.rows, 2);
    ASSERT_EQ(mask.cols, 3);
    EXPECT_EQ(cv::countNonZero(mask != smallMask()), 0);
}

TEST(RleCodecTest, DecodeRejectsWrongCoverage) {
    Rle rle;
    rle.height = 2;
    rle.width = 3;
    rle.counts = {2, 3};
    EXPECT_THROW(RleCodec::decode(rle), MalformedInput);
}

TEST(RleCodecTest, CompressedStrings) {
    EXPECT_EQ(RleCodec::toString({2, 3, 1}), "231");
    EXPECT_EQ(RleCodec::toString({5, 10, 2, 3}), "5:2I");
    EXPECT_EQ(RleCodec::toString({100}), "T3");

    std::vector<uint32_t> counts;
    ASSERT_TRUE(RleCodec::fromString("5:2I", counts));
    EXPECT_EQ(counts, (std::vector<uint32_t>{5, 10, 2, 3}));
    ASSERT_TRUE(RleCodec::fromString("T3", counts));
    EXPECT_EQ(counts, (std::vector<uint32_t>{100}));
}

TEST(RleCodecTest, RejectsTruncatedOrForeignCharacters) {
    std::vector<uint32_t> counts;
    EXPECT_FALSE(RleCodec::fromString("T", counts));
    EXPECT_FALSE(RleCodec::fromString("~", counts));
    // Continuation bits that never end within a 32-bit run.
    EXPECT_FALSE(RleCodec::fromString(std::string(13, 'o') + "0", counts));
    EXPECT_FALSE(RleCodec::fromString(std::string(64, 'o'), counts));
}

TEST(RleCodecTest, LargestRunSurvivesTheString) {
    const std::vector<uint32_t> runs = {4294967295u};
    std::vector<uint32_t> counts;
    ASSERT_TRUE(RleCodec::fromString(RleCodec::toString(runs), counts));
    EXPECT_EQ(counts, runs);
}

TEST(RleCodecTest, ResizeKeepsRepresentation) {
    cv::Mat mask = cv::Mat::zeros(4, 4, CV_8U);
    mask(cv::Rect(0, 0, 2, 4)).setTo(1);
    Rle rle = RleCodec::encode(mask, true);
    EXPECT_EQ(rle.counts, (std::vector<uint32_t>{0, 8, 8}));

    Rle small = RleCodec::resize(rle, 2, 2);
    EXPECT_TRUE(small.compressed);
    EXPECT_EQ(small.width, 2);
    EXPECT_EQ(small.height, 2);
    EXPECT_EQ(small.counts, (std::vector<uint32_t>{0, 2, 2}));
}

} // namespace
} // namespace coco_tools
