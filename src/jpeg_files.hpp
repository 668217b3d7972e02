#pragma once

#include <filesystem>
#include <vector>

namespace exif_redate {

namespace fs = std::filesystem;

// .jpg / .jpeg in any letter case.
bool IsJpegPath(const fs::path& p);

// Regular JPEG files under `folder`, sorted by full path.
// Throws NotFoundError when `folder` is missing or not a directory,
// IoError when a directory cannot be listed.
std::vector<fs::path> FindJpegFiles(const fs::path& folder, bool recursive);

}  // namespace exif_redate
