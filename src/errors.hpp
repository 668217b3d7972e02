#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace exif_redate {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Path or folder missing. Raised before any file is touched.
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::filesystem::path& p)
        : Error("not found: " + p.string()), path_(p) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Out-of-range year/month, non-JPEG input and similar caller mistakes.
class InvalidArgumentError : public Error {
public:
    using Error::Error;
};

// Per-file read or write failure.
class IoError : public Error {
public:
    IoError(const std::filesystem::path& p, const std::string& what)
        : Error(p.string() + " : " + what), path_(p) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// The source day does not exist in the target month/year.
class InvalidDateError : public Error {
public:
    using Error::Error;
};

}  // namespace exif_redate
