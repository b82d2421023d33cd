#pragma once

#include <cstdint>
#include <string>

namespace coco_tools {

// Both create the destination's parent directories and throw IOError.
// moveFile falls back to copy + remove across filesystems.
void moveFile(const std::string& from, const std::string& to, int64_t image_id = -1);
void copyFile(const std::string& from, const std::string& to, int64_t image_id = -1);

// True when both paths name the same file, through relative/absolute
// spellings, ".." segments or symlinks. The files need not exist.
bool samePath(const std::string& a, const std::string& b);

} // namespace coco_tools
