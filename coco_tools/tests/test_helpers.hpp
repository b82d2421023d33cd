#pragma once

#include "coco_tools/dataset.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <string>

namespace coco_tools {
namespace testing {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// One 1000x800 image, one category, one annotation at [100,100,200,150].
Dataset singleImageDataset();

// Two images (1000x800, 500x500), two categories, polygon segmentations.
Dataset twoImageDataset();

void writeText(const std::string& path, const std::string& text);
std::string readText(const std::string& path);

// Writes a w x h BGR image with a gradient so resizes are not trivial.
void writeTestImage(const std::string& path, int width, int height);

} // namespace testing
} // namespace coco_tools
