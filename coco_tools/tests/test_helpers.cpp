#include "test_helpers.hpp"

#include <opencv2/imgcodecs.hpp>

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace coco_tools {
namespace testing {

namespace {
std::atomic<int> g_counter{0};
}

TempDir::TempDir() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            ("coco_tools_test_" + std::to_string(stamp) + "_" + std::to_string(g_counter++));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

Dataset singleImageDataset() {
    Dataset d;
    Image image;
    image.id = 1;
    image.file_name = "frame_000001.png";
    image.width = 1000;
    image.height = 800;
    d.images.push_back(image);

    Category cat;
    cat.id = 1;
    cat.name = "car";
    cat.raw = Json{{"id", 1}, {"name", "car"}, {"supercategory", ""}};
    d.categories.push_back(cat);

    Annotation ann;
    ann.id = 1;
    ann.image_id = 1;
    ann.category_id = 1;
    ann.bbox = {100.0, 100.0, 200.0, 150.0};
    ann.area = 30000.0;
    ann.iscrowd = 0;
    d.annotations.push_back(ann);
    return d;
}

Dataset twoImageDataset() {
    Dataset d = singleImageDataset();

    Image second;
    second.id = 2;
    second.file_name = "frame_000002.png";
    second.width = 500;
    second.height = 500;
    d.images.push_back(second);

    Category person;
    person.id = 2;
    person.name = "person";
    person.raw = Json{{"id", 2}, {"name", "person"}, {"supercategory", ""}};
    d.categories.push_back(person);

    d.annotations[0].segmentation.type = Segmentation::Type::Polygons;
    d.annotations[0].segmentation.polygons = {{100, 100, 300, 100, 300, 250, 100, 250}};

    Annotation ann;
    ann.id = 2;
    ann.image_id = 2;
    ann.category_id = 2;
    ann.bbox = {10.0, 20.0, 50.0, 40.0};
    ann.area = 1200.0;
    ann.segmentation.type = Segmentation::Type::Polygons;
    ann.segmentation.polygons = {{10, 20, 60, 20, 35, 60}, {40, 40, 50, 40, 50, 50}};
    d.annotations.push_back(ann);

    Annotation third;
    third.id = 3;
    third.image_id = 2;
    third.category_id = 1;
    third.bbox = {400.0, 400.0, 99.5, 99.5};
    third.area = 9900.25;
    d.annotations.push_back(third);
    return d;
}

void writeText(const std::string& path, const std::string& text) {
    fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("cannot write " + path);
    out << text;
}

std::string readText(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeTestImage(const std::string& path, int width, int height) {
    fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x * 255 / width),
                                                  static_cast<uchar>(y * 255 / height), 128);
        }
    }
    if (!cv::imwrite(path, image)) throw std::runtime_error("cannot write image " + path);
}

} // namespace testing
} // namespace coco_tools
