#include "jpeg_files.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>

namespace exif_redate {

namespace {

std::string ToLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Lists one folder. An unreadable subfolder is skipped; only the
// top-level folder failing to open is an error.
void Collect(const fs::path& folder, bool recursive, bool top, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::directory_iterator it(folder, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (top) throw IoError(folder, ec.message());
        return;
    }

    std::vector<fs::path> subfolders;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (recursive && it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
            subfolders.push_back(it->path());
            continue;
        }
        if (!it->is_regular_file(type_ec) || type_ec) continue;
        if (IsJpegPath(it->path())) out.push_back(it->path());
    }
    if (ec && top) throw IoError(folder, ec.message());

    for (const auto& sub : subfolders) {
        Collect(sub, recursive, false, out);
    }
}

}  // namespace

bool IsJpegPath(const fs::path& p) {
    const auto ext = ToLower(p.extension().string());
    return (ext == ".jpg" || ext == ".jpeg");
}

std::vector<fs::path> FindJpegFiles(const fs::path& folder, bool recursive) {
    std::error_code ec;
    if (!fs::exists(folder, ec) || !fs::is_directory(folder, ec)) {
        throw NotFoundError(folder);
    }

    std::vector<fs::path> files;
    Collect(folder, recursive, true, files);
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.string() < b.string();
    });
    return files;
}

}  // namespace exif_redate
