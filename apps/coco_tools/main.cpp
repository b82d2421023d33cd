#include "coco_tools/adjust_config.hpp"
#include "coco_tools/adjust_service.hpp"
#include "coco_tools/dataset_cleaner.hpp"
#include "coco_tools/dataset_splitter.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/format_converter.hpp"
#include "coco_tools/preview.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace coco_tools;

namespace {

struct UsageError : std::runtime_error {
    explicit UsageError(const std::string& m) : std::runtime_error(m) {}
};

void print_usage() {
    std::cout <<
R"(coco-tools: adjust and tidy COCO datasets

Usage:
  coco-tools adjust  --annotations FILE [--config FILE]
                     (--resolution W H | --scale S)
                     [--images DIR] [--output DIR] [--output-annotation FILE]
                     [--resize-images] [--in-place]
                     [--rle reject|rescale] [--require-uniform]
                     [--source-size FILE W H]... [--bounds-tolerance PX]
                     [--workers N] [--retries N] [--indent N] [--quiet]
  coco-tools clean   --annotations FILE --images DIR [--output-annotation FILE]
                     [--dry-run] [--quiet]
  coco-tools split   --annotations FILE --images DIR --output DIR
                     [--ratio R] [--seed N] [--copy] [--quiet]
  coco-tools convert --images DIR [--annotations FILE] [--quality Q]
                     [--no-recursive] [--quiet]
  coco-tools preview --annotations FILE --images DIR --output FILE [--image-id ID]

Examples:
  coco-tools adjust --annotations ann.json --images imgs --output out --resolution 800 800 --resize-images
  coco-tools adjust --annotations ann.json --scale 0.5 --output out
)";
}

int exitCodeFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput:      return 10;
        case ErrorKind::DanglingReference:   return 11;
        case ErrorKind::DimensionMismatch:   return 12;
        case ErrorKind::UnsupportedGeometry: return 13;
        case ErrorKind::IOError:             return 14;
    }
    return 1;
}

class Args {
public:
    Args(int argc, char** argv) : argc_(argc), argv_(argv) {}

    std::string value(int& i) const {
        if (i + 1 >= argc_) throw UsageError(std::string("missing value for ") + argv_[i]);
        return argv_[++i];
    }
    int intValue(int& i) const { return std::stoi(value(i)); }
    double doubleValue(int& i) const { return std::stod(value(i)); }
    const char* at(int i) const { return argv_[i]; }

private:
    int argc_;
    char** argv_;
};

int runAdjust(const Args& args, int argc) {
    AdjustConfig config;
    // The config file is applied first so flags can override it.
    for (int i = 2; i < argc; ++i) {
        if (std::string(args.at(i)) == "--config") {
            loadAdjustConfig(args.value(i), config);
        }
    }

    for (int i = 2; i < argc; ++i) {
        const std::string a(args.at(i));
        if (a == "--config")                 ++i;  // already applied
        else if (a == "--annotations")       config.annotation_file = args.value(i);
        else if (a == "--images")            config.image_root = args.value(i);
        else if (a == "--output")            config.output_dir = args.value(i);
        else if (a == "--output-annotation") config.output_annotation = args.value(i);
        else if (a == "--resolution") {
            const int w = args.intValue(i);
            const int h = args.intValue(i);
            config.target = TargetSpec::size(w, h);
        }
        else if (a == "--scale")             config.target = TargetSpec::factor(args.doubleValue(i));
        else if (a == "--resize-images")     config.resize_images = true;
        else if (a == "--in-place")          config.output_mode = OutputMode::InPlace;
        else if (a == "--rle")               config.segmentation_policy = parseSegmentationPolicy(args.value(i));
        else if (a == "--require-uniform")   config.source_size_policy = SourceSizePolicy::RequireUniform;
        else if (a == "--source-size") {
            const std::string file = args.value(i);
            const int w = args.intValue(i);
            const int h = args.intValue(i);
            config.source_size_overrides[file] = cv::Size(w, h);
        }
        else if (a == "--bounds-tolerance")  config.bounds_tolerance = args.doubleValue(i);
        else if (a == "--workers")           config.workers = args.intValue(i);
        else if (a == "--retries")           config.io_retries = args.intValue(i);
        else if (a == "--indent")            config.json_indent = args.intValue(i);
        else if (a == "--quiet")             config.verbose = false;
        else throw UsageError("unknown flag for adjust: " + a);
    }
    if (config.annotation_file.empty()) throw UsageError("adjust needs --annotations");

    AdjustReport report = AdjustService(config).run();
    std::cout << "Adjusted " << report.images << " images / " << report.annotations
              << " annotations, resized " << report.resized_files << " files -> "
              << report.output_annotation << std::endl;
    return 0;
}

int runClean(const Args& args, int argc) {
    CleanOptions options;
    for (int i = 2; i < argc; ++i) {
        const std::string a(args.at(i));
        if (a == "--annotations")            options.annotation_file = args.value(i);
        else if (a == "--images")            options.image_root = args.value(i);
        else if (a == "--output-annotation") options.output_annotation = args.value(i);
        else if (a == "--dry-run")           options.dry_run = true;
        else if (a == "--quiet")             options.verbose = false;
        else throw UsageError("unknown flag for clean: " + a);
    }
    if (options.annotation_file.empty() || options.image_root.empty()) {
        throw UsageError("clean needs --annotations and --images");
    }

    CleanReport report = cleanDataset(options);
    std::cout << "Removed " << report.removed_images << " images (" << report.moved_files
              << " moved to _trash, " << report.missing_files << " already missing)" << std::endl;
    return 0;
}

int runSplit(const Args& args, int argc) {
    SplitOptions options;
    for (int i = 2; i < argc; ++i) {
        const std::string a(args.at(i));
        if (a == "--annotations")  options.annotation_file = args.value(i);
        else if (a == "--images")  options.image_root = args.value(i);
        else if (a == "--output")  options.output_dir = args.value(i);
        else if (a == "--ratio")   options.split_ratio = args.doubleValue(i);
        else if (a == "--seed")    options.seed = static_cast<uint32_t>(std::stoul(args.value(i)));
        else if (a == "--copy")    options.copy_images = true;
        else if (a == "--quiet")   options.verbose = false;
        else throw UsageError("unknown flag for split: " + a);
    }
    if (options.annotation_file.empty() || options.image_root.empty() || options.output_dir.empty()) {
        throw UsageError("split needs --annotations, --images and --output");
    }

    splitToDirectory(options);
    std::cout << "Output files validation complete. Successfully split dataset." << std::endl;
    return 0;
}

int runConvert(const Args& args, int argc) {
    ConvertOptions options;
    for (int i = 2; i < argc; ++i) {
        const std::string a(args.at(i));
        if (a == "--images")             options.input_dir = args.value(i);
        else if (a == "--annotations")   options.annotation_file = args.value(i);
        else if (a == "--quality")       options.jpeg_quality = args.intValue(i);
        else if (a == "--no-recursive")  options.recursive = false;
        else if (a == "--quiet")         options.verbose = false;
        else throw UsageError("unknown flag for convert: " + a);
    }
    if (options.input_dir.empty()) throw UsageError("convert needs --images");

    ConvertReport report = convertPngToJpg(options);
    std::cout << "Converted " << report.converted << " files";
    if (!report.output_annotation.empty()) std::cout << ", annotations -> " << report.output_annotation;
    std::cout << std::endl;
    return 0;
}

int runPreview(const Args& args, int argc) {
    PreviewOptions options;
    for (int i = 2; i < argc; ++i) {
        const std::string a(args.at(i));
        if (a == "--annotations")     options.annotation_file = args.value(i);
        else if (a == "--images")     options.image_root = args.value(i);
        else if (a == "--output")     options.output_path = args.value(i);
        else if (a == "--image-id")   options.image_id = std::stoll(args.value(i));
        else throw UsageError("unknown flag for preview: " + a);
    }
    if (options.annotation_file.empty() || options.output_path.empty()) {
        throw UsageError("preview needs --annotations and --output");
    }

    const int64_t id = writePreview(options);
    std::cout << "Rendered image " << id << " -> " << options.output_path << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    const std::string command(argv[1]);
    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    Args args(argc, argv);
    try {
        if (command == "adjust")  return runAdjust(args, argc);
        if (command == "clean")   return runClean(args, argc);
        if (command == "split")   return runSplit(args, argc);
        if (command == "convert") return runConvert(args, argc);
        if (command == "preview") return runPreview(args, argc);
        throw UsageError("unknown command '" + command + "'");
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n\n";
        print_usage();
        return 2;
    } catch (const std::logic_error& e) {
        std::cerr << "error: bad numeric argument (" << e.what() << ")\n";
        return 2;
    } catch (const CocoError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return exitCodeFor(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
