#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "coco_tools/adjust_service.hpp"
#include "coco_tools/coco_io.hpp"
#include "coco_tools/dataset_cleaner.hpp"
#include "coco_tools/dataset_splitter.hpp"
#include "coco_tools/errors.hpp"
#include "coco_tools/format_converter.hpp"
#include "coco_tools/preview.hpp"
#include "coco_tools/resolution_adjuster.hpp"

namespace py = pybind11;
using namespace coco_tools;

std::string adjust_json(const std::string& text, py::object scale, int width, int height,
                        const std::string& segmentation_policy, int indent) {
    Json doc;
    try {
        doc = Json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInput(std::string("input is not valid JSON: ") + e.what());
    }

    AdjustConfig config;
    config.verbose = false;
    config.segmentation_policy = parseSegmentationPolicy(segmentation_policy);
    if (!scale.is_none()) {
        config.target = TargetSpec::factor(scale.cast<double>());
    } else {
        config.target = TargetSpec::size(width, height);
    }

    Dataset adjusted;
    {
        Dataset dataset = parseDataset(doc);
        py::gil_scoped_release release;
        adjusted = ResolutionAdjuster(config).adjust(dataset);
    }
    return toJson(adjusted).dump(indent);
}

PYBIND11_MODULE(coco_tools, m) {
    m.doc() = "COCO dataset resolution adjustment and maintenance tools";

    static py::exception<CocoError> coco_error(m, "CocoError");
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const CocoError& e) {
            py::object type = py::reinterpret_borrow<py::object>(coco_error.ptr());
            py::object instance = type(e.what());
            instance.attr("kind") = errorKindName(e.kind());
            instance.attr("ids") = e.ids();
            PyErr_SetObject(coco_error.ptr(), instance.ptr());
        }
    });

    py::enum_<OutputMode>(m, "OutputMode")
        .value("SEPARATE_DIRECTORY", OutputMode::SeparateDirectory)
        .value("IN_PLACE", OutputMode::InPlace);

    py::enum_<SegmentationPolicy>(m, "SegmentationPolicy")
        .value("REJECT", SegmentationPolicy::Reject)
        .value("RESCALE", SegmentationPolicy::Rescale);

    py::enum_<SourceSizePolicy>(m, "SourceSizePolicy")
        .value("PER_IMAGE", SourceSizePolicy::PerImage)
        .value("REQUIRE_UNIFORM", SourceSizePolicy::RequireUniform);

    py::class_<AdjustConfig>(m, "AdjustConfig")
        .def(py::init<>())
        .def_readwrite("annotation_file", &AdjustConfig::annotation_file)
        .def_readwrite("image_root", &AdjustConfig::image_root)
        .def_readwrite("output_dir", &AdjustConfig::output_dir)
        .def_readwrite("output_annotation", &AdjustConfig::output_annotation)
        .def_readwrite("resize_images", &AdjustConfig::resize_images)
        .def_readwrite("output_mode", &AdjustConfig::output_mode)
        .def_readwrite("segmentation_policy", &AdjustConfig::segmentation_policy)
        .def_readwrite("source_size_policy", &AdjustConfig::source_size_policy)
        .def_readwrite("bounds_tolerance", &AdjustConfig::bounds_tolerance)
        .def_readwrite("workers", &AdjustConfig::workers)
        .def_readwrite("io_retries", &AdjustConfig::io_retries)
        .def_readwrite("retry_delay_ms", &AdjustConfig::retry_delay_ms)
        .def_readwrite("json_indent", &AdjustConfig::json_indent)
        .def_readwrite("verbose", &AdjustConfig::verbose)
        .def("set_scale", [](AdjustConfig& self, double s) { self.target = TargetSpec::factor(s); })
        .def("set_resolution", [](AdjustConfig& self, int w, int h) {
            self.target = TargetSpec::size(w, h);
        })
        .def("set_source_size", [](AdjustConfig& self, const std::string& file, int w, int h) {
            self.source_size_overrides[file] = cv::Size(w, h);
        })
        .def("load", [](AdjustConfig& self, const std::string& path) { loadAdjustConfig(path, self); });

    py::class_<AdjustReport>(m, "AdjustReport")
        .def_readonly("images", &AdjustReport::images)
        .def_readonly("annotations", &AdjustReport::annotations)
        .def_readonly("resized_files", &AdjustReport::resized_files)
        .def_readonly("output_annotation", &AdjustReport::output_annotation)
        .def("__repr__", [](const AdjustReport& r) {
            return "<AdjustReport images=" + std::to_string(r.images) +
                   " resized=" + std::to_string(r.resized_files) + ">";
        });

    m.def("adjust_dataset", [](const AdjustConfig& config) {
        py::gil_scoped_release release;
        return AdjustService(config).run();
    }, py::arg("config"));

    m.def("adjust_json", &adjust_json,
          py::arg("json_text"), py::arg("scale") = py::none(),
          py::arg("width") = 0, py::arg("height") = 0,
          py::arg("segmentation_policy") = "reject", py::arg("indent") = -1);

    py::class_<CleanOptions>(m, "CleanOptions")
        .def(py::init<>())
        .def_readwrite("annotation_file", &CleanOptions::annotation_file)
        .def_readwrite("image_root", &CleanOptions::image_root)
        .def_readwrite("output_annotation", &CleanOptions::output_annotation)
        .def_readwrite("dry_run", &CleanOptions::dry_run)
        .def_readwrite("verbose", &CleanOptions::verbose);

    py::class_<CleanReport>(m, "CleanReport")
        .def_readonly("removed_images", &CleanReport::removed_images)
        .def_readonly("moved_files", &CleanReport::moved_files)
        .def_readonly("missing_files", &CleanReport::missing_files)
        .def_readonly("output_annotation", &CleanReport::output_annotation);

    m.def("clean_dataset", [](const CleanOptions& options) {
        py::gil_scoped_release release;
        return cleanDataset(options);
    }, py::arg("options"));

    py::class_<SplitOptions>(m, "SplitOptions")
        .def(py::init<>())
        .def_readwrite("annotation_file", &SplitOptions::annotation_file)
        .def_readwrite("image_root", &SplitOptions::image_root)
        .def_readwrite("output_dir", &SplitOptions::output_dir)
        .def_readwrite("split_ratio", &SplitOptions::split_ratio)
        .def_readwrite("seed", &SplitOptions::seed)
        .def_readwrite("copy_images", &SplitOptions::copy_images)
        .def_readwrite("verbose", &SplitOptions::verbose);

    py::class_<SplitReport>(m, "SplitReport")
        .def_readonly("train_images", &SplitReport::train_images)
        .def_readonly("val_images", &SplitReport::val_images)
        .def_readonly("train_annotations", &SplitReport::train_annotations)
        .def_readonly("val_annotations", &SplitReport::val_annotations);

    m.def("split_dataset", [](const SplitOptions& options) {
        py::gil_scoped_release release;
        return splitToDirectory(options);
    }, py::arg("options"));

    m.def("convert_png_to_jpg", [](const std::string& input_dir, int quality,
                                   const std::string& annotation_file) {
        ConvertOptions options;
        options.input_dir = input_dir;
        options.jpeg_quality = quality;
        options.annotation_file = annotation_file;
        options.verbose = false;
        py::gil_scoped_release release;
        return convertPngToJpg(options).converted;
    }, py::arg("input_dir"), py::arg("quality") = 100, py::arg("annotation_file") = "");

    m.def("write_preview", [](const std::string& annotation_file, const std::string& image_root,
                              const std::string& output_path, int64_t image_id) {
        PreviewOptions options;
        options.annotation_file = annotation_file;
        options.image_root = image_root;
        options.output_path = output_path;
        options.image_id = image_id;
        py::gil_scoped_release release;
        return writePreview(options);
    }, py::arg("annotation_file"), py::arg("image_root"), py::arg("output_path"),
       py::arg("image_id") = -1);
}
