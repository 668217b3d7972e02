#pragma once

#include "metadata_backend.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace exif_redate {

enum ExitCode { kExitOk = 0, kExitFailures = 1, kExitUsage = 2 };

// Full command line run without the program name. Returns the process
// exit code: 0 all files succeeded, 1 some file failed, 2 bad arguments
// or missing path.
int RunCli(const std::vector<std::string>& args,
           MetadataBackend& backend,
           std::ostream& out,
           std::ostream& err);

}  // namespace exif_redate
