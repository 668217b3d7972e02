#pragma once

#include "datetime.hpp"
#include "metadata_backend.hpp"

#include <filesystem>
#include <string>

namespace exif_redate {

namespace fs = std::filesystem;

enum class DateTimeSource { Metadata, FileTime };

const char* ToString(DateTimeSource source);

struct ImageRecord {
    fs::path path;
    DateTime datetime;
    DateTimeSource source = DateTimeSource::Metadata;
    std::string note;  // why the file time was used, empty otherwise
};

// Embedded capture datetime, or the file's modification time when the
// file has none. Throws IoError when the file cannot be read.
ImageRecord ReadCurrentDateTime(MetadataBackend& backend, const fs::path& file);

// Copies `source` to `destination` when they differ (bytes only, no
// re-encode), optionally keeps a .bak when overwriting in place, rewrites
// the EXIF datetime fields and finally sets the file times.
// Throws IoError. Returns what happened to the EXIF fields.
WriteResult WriteDateTime(MetadataBackend& backend,
                          const fs::path& source,
                          const fs::path& destination,
                          const DateTime& dt,
                          bool make_backup);

}  // namespace exif_redate
