#pragma once

#include "datetime.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace exif_redate {

namespace fs = std::filesystem;

struct ReadResult {
    enum class Status { Found, NotFound, ReadFailed };

    Status status = Status::NotFound;
    DateTime value;       // valid when Found
    std::string detail;   // why NotFound / ReadFailed

    static ReadResult Found(const DateTime& dt) { return {Status::Found, dt, {}}; }
    static ReadResult NotFound(std::string why) { return {Status::NotFound, {}, std::move(why)}; }
    static ReadResult ReadFailed(std::string why) { return {Status::ReadFailed, {}, std::move(why)}; }
};

struct WriteResult {
    bool written = false;
    std::string skipped_reason;  // set when the container cannot hold EXIF
};

// Access to the capture-datetime fields embedded in an image file.
class MetadataBackend {
public:
    virtual ~MetadataBackend() = default;

    // Never throws for a missing or malformed field; only the third
    // variant signals an unreadable file.
    virtual ReadResult readCaptureDateTime(const fs::path& file) = 0;

    // Rewrites DateTime, DateTimeOriginal and DateTimeDigitized in place.
    // Throws IoError when the file cannot be read or written.
    virtual WriteResult writeCaptureDateTime(const fs::path& file, const DateTime& dt) = 0;
};

}  // namespace exif_redate
