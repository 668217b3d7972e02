#include "photo_dater.hpp"

#include "errors.hpp"
#include "file_times.hpp"

#include <system_error>

namespace exif_redate {

namespace {

// True when both paths name the same file (or would, once created).
bool IsSameFile(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    if (fs::exists(b, ec)) {
        const bool same = fs::equivalent(a, b, ec);
        if (!ec) return same;
    }
    return fs::weakly_canonical(a, ec) == fs::weakly_canonical(b, ec);
}

}  // namespace

const char* ToString(DateTimeSource source) {
    switch (source) {
        case DateTimeSource::Metadata: return "exif";
        case DateTimeSource::FileTime: return "file time";
    }
    return "?";
}

ImageRecord ReadCurrentDateTime(MetadataBackend& backend, const fs::path& file) {
    ImageRecord record;
    record.path = file;

    const ReadResult read = backend.readCaptureDateTime(file);
    switch (read.status) {
        case ReadResult::Status::Found:
            record.datetime = read.value;
            record.source = DateTimeSource::Metadata;
            return record;
        case ReadResult::Status::NotFound:
            record.datetime = FromTimeT(ReadModificationTime(file));
            record.source = DateTimeSource::FileTime;
            record.note = "using file modification time (" + read.detail + ")";
            return record;
        case ReadResult::Status::ReadFailed:
            break;
    }
    throw IoError(file, read.detail);
}

WriteResult WriteDateTime(MetadataBackend& backend,
                          const fs::path& source,
                          const fs::path& destination,
                          const DateTime& dt,
                          bool make_backup) {
    const std::time_t t = ToTimeT(dt);
    if (t == static_cast<std::time_t>(-1)) {
        throw IoError(destination, "cannot convert " + FormatExifDateTime(dt) + " to a file time");
    }

    if (!IsSameFile(source, destination)) {
        std::error_code ec;
        const fs::path parent = destination.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) throw IoError(parent, ec.message());
        }
        CopyFileBinary(source, destination);
    } else if (make_backup) {
        fs::path backup_path = source;
        backup_path += ".bak";

        // Do not overwrite existing backup silently.
        std::error_code ec;
        if (fs::exists(backup_path, ec)) {
            throw IoError(backup_path, "backup already exists");
        }
        CopyFileBinary(source, backup_path);
    }

    const WriteResult result = backend.writeCaptureDateTime(destination, dt);
    SetFileTimes(destination, t);
    return result;
}

}  // namespace exif_redate
