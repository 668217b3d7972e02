#pragma once

#include "date_substitution.hpp"
#include "datetime.hpp"
#include "metadata_backend.hpp"
#include "photo_dater.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace exif_redate {

namespace fs = std::filesystem;

struct BatchOptions {
    DateSubstitution substitution;
    std::optional<fs::path> output;  // folder for batches, file or folder for one file
    bool recursive = false;
    bool dry_run = false;
    bool backup = false;
};

struct FileOutcome {
    enum class Status { Updated, WouldUpdate, Failed };
    enum class ErrorKind { None, Io, InvalidDate };

    fs::path source;
    fs::path destination;
    Status status = Status::Failed;
    ErrorKind error = ErrorKind::None;
    std::optional<DateTime> before;
    std::optional<DateTime> after;
    DateTimeSource datetime_source = DateTimeSource::Metadata;
    std::string message;
    std::vector<std::string> notes;

    bool ok() const { return status != Status::Failed; }
};

struct BatchResult {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t total = 0;
    std::vector<FileOutcome> outcomes;
};

// Called after each file with its 1-based position.
using ProgressCallback =
    std::function<void(std::size_t index, std::size_t total, const FileOutcome& outcome)>;

// Redates every JPEG under `folder`. Per-file failures are recorded and
// the run continues. Throws InvalidArgumentError / NotFoundError before
// touching any file.
BatchResult ProcessFolder(MetadataBackend& backend,
                          const fs::path& folder,
                          const BatchOptions& options,
                          const ProgressCallback& progress = {});

// Redates one file. Per-file failures come back as a Failed outcome.
FileOutcome ProcessFile(MetadataBackend& backend,
                        const fs::path& file,
                        const BatchOptions& options);

// Current datetime of each file, read-only. A file that cannot be read
// is skipped and reported through `errors` when given.
std::vector<ImageRecord> ShowCurrent(MetadataBackend& backend,
                                     const std::vector<fs::path>& files,
                                     std::vector<std::string>* errors = nullptr);

}  // namespace exif_redate
