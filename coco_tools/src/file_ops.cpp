#include "coco_tools/file_ops.hpp"
#include "coco_tools/errors.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace coco_tools {

namespace {

std::vector<int64_t> idList(int64_t image_id) {
    if (image_id < 0) return {};
    return {image_id};
}

void ensureParent(const fs::path& to, int64_t image_id) {
    if (!to.has_parent_path()) return;
    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (ec) {
        throw IOError("cannot create directory '" + to.parent_path().string() + "': " + ec.message(),
                      idList(image_id));
    }
}

} // namespace

void copyFile(const std::string& from, const std::string& to, int64_t image_id) {
    ensureParent(to, image_id);
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IOError("cannot copy '" + from + "' to '" + to + "': " + ec.message(), idList(image_id));
    }
}

void moveFile(const std::string& from, const std::string& to, int64_t image_id) {
    ensureParent(to, image_id);
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) {
        throw IOError("cannot move '" + from + "' to '" + to + "': " + ec.message(), idList(image_id));
    }

    copyFile(from, to, image_id);
    fs::remove(from, ec);
    if (ec) {
        throw IOError("copied '" + from + "' but could not remove it: " + ec.message(), idList(image_id));
    }
}

bool samePath(const std::string& a, const std::string& b) {
    std::error_code ec;
    if (fs::exists(a, ec) && fs::exists(b, ec)) {
        const bool same = fs::equivalent(a, b, ec);
        if (!ec) return same;
    }

    auto resolve = [](const std::string& p) {
        std::error_code err;
        fs::path resolved = fs::weakly_canonical(p, err);
        if (err) resolved = fs::absolute(p, err).lexically_normal();
        return resolved;
    };
    return resolve(a) == resolve(b);
}

} // namespace coco_tools
