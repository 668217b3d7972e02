#include "file_times.hpp"

#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#ifdef _WIN32
#include <sys/stat.h>
#include <sys/utime.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <time.h>
#endif

namespace exif_redate {

std::time_t ReadModificationTime(const fs::path& file) {
#ifdef _WIN32
    struct _stat64 st {};
    if (_wstat64(file.wstring().c_str(), &st) != 0) {
        throw IoError(file, std::strerror(errno));
    }
    return static_cast<std::time_t>(st.st_mtime);
#else
    struct stat st {};
    if (::stat(file.c_str(), &st) != 0) {
        throw IoError(file, std::strerror(errno));
    }
    return st.st_mtime;
#endif
}

void SetFileTimes(const fs::path& file, std::time_t t) {
#ifdef _WIN32
    struct __utimbuf64 times;
    times.actime = t;
    times.modtime = t;
    if (_wutime64(file.wstring().c_str(), &times) != 0) {
        throw IoError(file, std::string("failed to set file time: ") + std::strerror(errno));
    }
#else
    timespec ts[2];
    ts[0].tv_sec = t; ts[0].tv_nsec = 0;  // atime
    ts[1].tv_sec = t; ts[1].tv_nsec = 0;  // mtime
    if (utimensat(AT_FDCWD, file.c_str(), ts, 0) != 0) {
        throw IoError(file, std::string("failed to set file time: ") + std::strerror(errno));
    }
#endif
}

void CopyFileBinary(const fs::path& src, const fs::path& dst) {
    std::ifstream in(src, std::ios::binary);
    if (!in) {
        throw IoError(src, "failed to open source for copy");
    }
    std::ofstream out(dst, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError(dst, "failed to open destination for copy");
    }
    // Inserting an empty streambuf sets failbit on `out`.
    if (in.peek() == std::ifstream::traits_type::eof()) return;
    out << in.rdbuf();
    if (!out.good()) {
        throw IoError(dst, "failed while writing copy");
    }
}

}  // namespace exif_redate
