#include "batch.hpp"

#include "errors.hpp"
#include "jpeg_files.hpp"

#include <system_error>

namespace exif_redate {

namespace {

FileOutcome RedateOne(MetadataBackend& backend,
                      const fs::path& source,
                      const fs::path& destination,
                      const BatchOptions& options) {
    FileOutcome outcome;
    outcome.source = source;
    outcome.destination = destination;

    try {
        const ImageRecord current = ReadCurrentDateTime(backend, source);
        outcome.before = current.datetime;
        outcome.datetime_source = current.source;
        if (!current.note.empty()) outcome.notes.push_back(current.note);

        const DateTime target = options.substitution.apply(current.datetime);
        outcome.after = target;

        if (options.dry_run) {
            outcome.status = FileOutcome::Status::WouldUpdate;
            return outcome;
        }

        const WriteResult written =
            WriteDateTime(backend, source, destination, target, options.backup);
        if (!written.written) {
            outcome.notes.push_back("EXIF rewrite skipped: " + written.skipped_reason);
        }
        outcome.status = FileOutcome::Status::Updated;

    } catch (const IoError& e) {
        outcome.status = FileOutcome::Status::Failed;
        outcome.error = FileOutcome::ErrorKind::Io;
        outcome.message = e.what();
    } catch (const InvalidDateError& e) {
        outcome.status = FileOutcome::Status::Failed;
        outcome.error = FileOutcome::ErrorKind::InvalidDate;
        outcome.message = e.what();
    } catch (const std::exception& e) {
        // Backends may let std exceptions through (bad_alloc, overflow).
        outcome.status = FileOutcome::Status::Failed;
        outcome.error = FileOutcome::ErrorKind::Io;
        outcome.message = source.string() + " : " + e.what();
    }
    return outcome;
}

fs::path MirroredPath(const fs::path& folder, const fs::path& file, const fs::path& output) {
    std::error_code ec;
    fs::path rel = fs::relative(file, folder, ec);
    if (ec || rel.empty()) rel = file.filename();
    return output / rel;
}

}  // namespace

BatchResult ProcessFolder(MetadataBackend& backend,
                          const fs::path& folder,
                          const BatchOptions& options,
                          const ProgressCallback& progress) {
    options.substitution.validate();
    const std::vector<fs::path> files = FindJpegFiles(folder, options.recursive);

    BatchResult result;
    result.total = files.size();
    result.outcomes.reserve(files.size());

    std::size_t index = 0;
    for (const auto& file : files) {
        const fs::path destination =
            options.output ? MirroredPath(folder, file, *options.output) : file;

        FileOutcome outcome = RedateOne(backend, file, destination, options);
        if (outcome.ok()) {
            ++result.succeeded;
        } else {
            ++result.failed;
        }
        if (progress) progress(++index, files.size(), outcome);
        result.outcomes.push_back(std::move(outcome));
    }
    return result;
}

FileOutcome ProcessFile(MetadataBackend& backend,
                        const fs::path& file,
                        const BatchOptions& options) {
    options.substitution.validate();

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        throw NotFoundError(file);
    }
    if (!IsJpegPath(file)) {
        throw InvalidArgumentError("not a JPEG file: " + file.string());
    }

    fs::path destination = file;
    if (options.output) {
        destination = *options.output;
        if (fs::is_directory(destination, ec)) destination /= file.filename();
    }
    return RedateOne(backend, file, destination, options);
}

std::vector<ImageRecord> ShowCurrent(MetadataBackend& backend,
                                     const std::vector<fs::path>& files,
                                     std::vector<std::string>* errors) {
    std::vector<ImageRecord> records;
    records.reserve(files.size());
    for (const auto& file : files) {
        try {
            records.push_back(ReadCurrentDateTime(backend, file));
        } catch (const IoError& e) {
            if (errors) errors->push_back(e.what());
        }
    }
    return records;
}

}  // namespace exif_redate
