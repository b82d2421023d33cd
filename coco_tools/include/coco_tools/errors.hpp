#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace coco_tools {

enum class ErrorKind {
    MalformedInput,
    DanglingReference,
    DimensionMismatch,
    UnsupportedGeometry,
    IOError
};

const char* errorKindName(ErrorKind kind);

// Base for every failure the tools report. Carries the ids of the
// offending entities so the operator can locate them in the dataset.
class CocoError : public std::runtime_error {
public:
    CocoError(ErrorKind kind, const std::string& message,
              std::vector<int64_t> ids = {});

    ErrorKind kind() const { return kind_; }
    const std::vector<int64_t>& ids() const { return ids_; }
    const std::string& message() const { return message_; }

private:
    static std::string format(ErrorKind kind, const std::string& message,
                              const std::vector<int64_t>& ids);

    ErrorKind kind_;
    std::string message_;
    std::vector<int64_t> ids_;
};

class MalformedInput : public CocoError {
public:
    explicit MalformedInput(const std::string& m, std::vector<int64_t> ids = {})
        : CocoError(ErrorKind::MalformedInput, m, std::move(ids)) {}
};

class DanglingReference : public CocoError {
public:
    explicit DanglingReference(const std::string& m, std::vector<int64_t> ids = {})
        : CocoError(ErrorKind::DanglingReference, m, std::move(ids)) {}
};

class DimensionMismatch : public CocoError {
public:
    explicit DimensionMismatch(const std::string& m, std::vector<int64_t> ids = {})
        : CocoError(ErrorKind::DimensionMismatch, m, std::move(ids)) {}
};

class UnsupportedGeometry : public CocoError {
public:
    explicit UnsupportedGeometry(const std::string& m, std::vector<int64_t> ids = {})
        : CocoError(ErrorKind::UnsupportedGeometry, m, std::move(ids)) {}
};

class IOError : public CocoError {
public:
    explicit IOError(const std::string& m, std::vector<int64_t> ids = {})
        : CocoError(ErrorKind::IOError, m, std::move(ids)) {}
};

} // namespace coco_tools
