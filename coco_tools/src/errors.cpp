#include "coco_tools/errors.hpp"

#include <algorithm>
#include <sstream>

namespace coco_tools {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedInput:      return "MalformedInput";
        case ErrorKind::DanglingReference:   return "DanglingReference";
        case ErrorKind::DimensionMismatch:   return "DimensionMismatch";
        case ErrorKind::UnsupportedGeometry: return "UnsupportedGeometry";
        case ErrorKind::IOError:             return "IOError";
    }
    return "Unknown";
}

CocoError::CocoError(ErrorKind kind, const std::string& message,
                     std::vector<int64_t> ids)
    : std::runtime_error(format(kind, message, ids))
    , kind_(kind)
    , message_(message)
    , ids_(std::move(ids)) {}

std::string CocoError::format(ErrorKind kind, const std::string& message,
                              const std::vector<int64_t>& ids) {
    std::ostringstream oss;
    oss << errorKindName(kind) << ": " << message;
    if (!ids.empty()) {
        oss << " [ids:";
        // Long lists are cut so the message stays readable on a terminal.
        const size_t shown = std::min<size_t>(ids.size(), 20);
        for (size_t i = 0; i < shown; ++i) oss << " " << ids[i];
        if (shown < ids.size()) oss << " ... (" << ids.size() << " total)";
        oss << "]";
    }
    return oss.str();
}

} // namespace coco_tools
