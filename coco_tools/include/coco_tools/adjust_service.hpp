#pragma once

#include "adjust_config.hpp"
#include "dataset.hpp"
#include "image_resizer.hpp"
#include "resolution_adjuster.hpp"

#include <string>
#include <vector>

namespace coco_tools {

struct AdjustReport {
    size_t images = 0;
    size_t annotations = 0;
    size_t resized_files = 0;
    std::string output_annotation;
};

// One resolution-adjustment batch: load, validate, transform in memory,
// resize rasters into staging files, commit them, then write the JSON.
// The annotation file is only written after every raster is in place.
class AdjustService {
public:
    explicit AdjustService(const AdjustConfig& config);

    AdjustReport run();

    std::string outputAnnotationPath() const;
    std::vector<ResizeTask> planResizeTasks(const Dataset& source, const ScaleTable& scales) const;

    static std::string stagingPath(const std::string& destination);
    static std::string backupPath(const std::string& destination);

private:
    SizeTable probeUndeclaredSizes(const Dataset& dataset, const RetryPolicy& retry) const;
    std::string sourcePath(const Image& image) const;
    std::string destinationPath(const Image& image) const;

    void discardStaging(const std::vector<ResizeTask>& tasks) const;
    // Moves staged files over their destinations; originals are kept as
    // backups until finalize() so a later failure can restore them.
    std::vector<std::string> commit(const std::vector<ResizeTask>& tasks) const;
    void restore(const std::vector<ResizeTask>& tasks, const std::vector<std::string>& committed) const;
    void finalize(const std::vector<std::string>& committed) const;

    AdjustConfig config_;
};

} // namespace coco_tools
