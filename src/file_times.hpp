#pragma once

#include <ctime>
#include <filesystem>

namespace exif_redate {

namespace fs = std::filesystem;

// Last modification time in seconds since the epoch. Throws IoError.
std::time_t ReadModificationTime(const fs::path& file);

// Sets both access and modification time to `t`. Throws IoError.
void SetFileTimes(const fs::path& file, std::time_t t);

// Byte-for-byte copy, truncating `dst`. Throws IoError.
void CopyFileBinary(const fs::path& src, const fs::path& dst);

}  // namespace exif_redate
