#pragma once

#include "dataset.hpp"

namespace coco_tools {

struct ValidationOptions {
    // Allowed overhang of geometry past its image edge, in pixels.
    double bounds_tolerance = 1.0;
    bool check_bounds = true;
};

// Throws MalformedInput or DanglingReference with every offending id of the
// first failing check. Never modifies the dataset.
void validate(const Dataset& dataset, const ValidationOptions& options = {});

} // namespace coco_tools
