#include "cli.hpp"
#include "exiv2_backend.hpp"

#include <exiv2/exiv2.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    // Exiv2 warnings would interleave with the per-file report.
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::error);

    exif_redate::Exiv2Backend backend;
    const std::vector<std::string> args(argv + 1, argv + argc);
    return exif_redate::RunCli(args, backend, std::cout, std::cerr);
}
