#include "cli.hpp"

#include "batch.hpp"
#include "errors.hpp"
#include "jpeg_files.hpp"

#include <filesystem>
#include <iomanip>
#include <optional>

namespace exif_redate {

namespace fs = std::filesystem;

namespace {

struct CliOptions {
    fs::path path;
    BatchOptions batch;
    bool show_current = false;
    bool quiet = false;
};

void PrintUsage(std::ostream& err) {
    err
        << "Usage:\n"
        << "  exif_redate <file-or-folder> <year> [month] [options]\n"
        << "\nChanges the year (and optionally the month) of the EXIF capture date,\n"
        << "keeping day and time, and sets the file modification time to match.\n"
        << "\nOptions:\n"
        << "  -o, --output <path>  Write to this file/folder instead of overwriting\n"
        << "  -r, --recursive      Process subfolders\n"
        << "  -d, --dry-run        Do not modify files, just print what would be changed\n"
        << "  -s, --show-current   Print the current dates and exit\n"
        << "      --backup         Keep a .bak copy when overwriting in place\n"
        << "  -q, --quiet          Only print errors and the summary\n"
        << "  -h, --help           Show this help\n"
        << "\nExamples:\n"
        << "  exif_redate photo.jpg 2023 12\n"
        << "  exif_redate ./photos 2010 7 -r -o ./modified_photos\n"
        << "  exif_redate ./vacation_pics 2023 --dry-run --recursive\n";
}

std::optional<int> ParseInt(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::size_t pos = 0;
    try {
        const int v = std::stoi(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Returns false on a usage error (already reported).
bool ParseArgs(const std::vector<std::string>& args, CliOptions& opts, bool& help,
               std::ostream& err) {
    std::optional<int> year;
    bool have_path = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            help = true;
            return true;
        } else if (arg == "-r" || arg == "--recursive") {
            opts.batch.recursive = true;
        } else if (arg == "-d" || arg == "--dry-run") {
            opts.batch.dry_run = true;
        } else if (arg == "-s" || arg == "--show-current") {
            opts.show_current = true;
        } else if (arg == "--backup") {
            opts.batch.backup = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= args.size()) {
                err << "Missing value for " << arg << "\n";
                return false;
            }
            opts.batch.output = fs::path(args[++i]);
        } else if (arg.size() > 1 && arg[0] == '-' && !ParseInt(arg)) {
            err << "Unknown option: " << arg << "\n";
            return false;
        } else if (!have_path) {
            opts.path = arg;
            have_path = true;
        } else if (!year) {
            year = ParseInt(arg);
            if (!year) {
                err << "Invalid year: " << arg << "\n";
                return false;
            }
        } else if (!opts.batch.substitution.month) {
            opts.batch.substitution.month = ParseInt(arg);
            if (!opts.batch.substitution.month) {
                err << "Invalid month: " << arg << "\n";
                return false;
            }
        } else {
            err << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }

    if (!have_path || !year) {
        err << "Path and year are required.\n";
        return false;
    }
    opts.batch.substitution.year = *year;
    return true;
}

void PrintOutcome(const FileOutcome& o, bool quiet, std::ostream& out, std::ostream& err) {
    if (!o.ok()) {
        err << "ERR: " << o.source << " : " << o.message << "\n";
        return;
    }
    if (quiet) return;

    const char* tag = (o.status == FileOutcome::Status::WouldUpdate) ? "DRY: " : "OK : ";
    out << tag << o.source;
    if (o.before && o.after) out << "  " << *o.before << " -> " << *o.after;
    if (o.destination != o.source) out << "  => " << o.destination;
    out << "\n";
    for (const auto& note : o.notes) {
        out << "     " << note << "\n";
    }
}

int ShowCurrentDates(MetadataBackend& backend, const CliOptions& opts,
                     std::ostream& out, std::ostream& err) {
    std::error_code ec;
    std::vector<fs::path> files;
    if (fs::is_directory(opts.path, ec)) {
        files = FindJpegFiles(opts.path, opts.batch.recursive);
        if (files.empty()) {
            err << "No JPEG files found in " << opts.path << "\n";
            return kExitFailures;
        }
        out << "Found " << files.size() << " JPEG files:\n";
    } else {
        if (!IsJpegPath(opts.path)) {
            throw InvalidArgumentError("not a JPEG file: " + opts.path.string());
        }
        files.push_back(opts.path);
    }

    std::vector<std::string> errors;
    for (const auto& record : ShowCurrent(backend, files, &errors)) {
        out << record.path.filename().string() << ": " << record.datetime;
        if (record.source == DateTimeSource::FileTime) {
            out << " (" << ToString(record.source) << ")";
        }
        out << "\n";
    }
    for (const auto& e : errors) {
        err << "ERR: " << e << "\n";
    }
    return errors.empty() ? kExitOk : kExitFailures;
}

int Run(const CliOptions& opts, MetadataBackend& backend, std::ostream& out, std::ostream& err) {
    std::error_code ec;
    if (!fs::exists(opts.path, ec)) {
        throw NotFoundError(opts.path);
    }
    opts.batch.substitution.validate();

    if (opts.show_current) {
        return ShowCurrentDates(backend, opts, out, err);
    }

    if (!fs::is_directory(opts.path, ec)) {
        if (opts.batch.dry_run && !opts.quiet) {
            out << "--- DRY RUN MODE (no changes will be made) ---\n";
        }
        const FileOutcome outcome = ProcessFile(backend, opts.path, opts.batch);
        PrintOutcome(outcome, opts.quiet, out, err);
        return outcome.ok() ? kExitOk : kExitFailures;
    }

    if (opts.batch.dry_run && !opts.quiet) {
        out << "--- DRY RUN MODE (no changes will be made) ---\n";
    }
    const BatchResult result = ProcessFolder(
        backend, opts.path, opts.batch,
        [&](std::size_t index, std::size_t total, const FileOutcome& o) {
            if (!opts.quiet) {
                out << "[" << std::setw(3) << index << "/" << total << "] ";
            }
            PrintOutcome(o, opts.quiet, out, err);
        });

    if (result.total == 0) {
        out << "No JPEG files found in " << opts.path
            << (opts.batch.recursive ? " (recursively)" : "") << "\n";
        return kExitOk;
    }

    out << "Done. " << (opts.batch.dry_run ? "Would update " : "Updated ")
        << result.succeeded << " / " << result.total
        << " JPEG files. Failed: " << result.failed << "\n";

    return (result.failed == 0 ? kExitOk : kExitFailures);
}

}  // namespace

int RunCli(const std::vector<std::string>& args,
           MetadataBackend& backend,
           std::ostream& out,
           std::ostream& err) {
    CliOptions opts;
    bool help = false;
    if (!ParseArgs(args, opts, help, err)) {
        PrintUsage(err);
        return kExitUsage;
    }
    if (help) {
        PrintUsage(err);
        return kExitOk;
    }

    try {
        return Run(opts, backend, out, err);
    } catch (const NotFoundError& e) {
        err << "Error: path '" << e.path().string() << "' not found\n";
        return kExitUsage;
    } catch (const InvalidArgumentError& e) {
        err << "Error: " << e.what() << "\n";
        return kExitUsage;
    } catch (const Error& e) {
        err << "ERR: " << e.what() << "\n";
        return kExitFailures;
    }
}

}  // namespace exif_redate
