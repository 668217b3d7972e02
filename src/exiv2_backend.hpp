#pragma once

#include "metadata_backend.hpp"

namespace exif_redate {

class Exiv2Backend : public MetadataBackend {
public:
    ReadResult readCaptureDateTime(const fs::path& file) override;
    WriteResult writeCaptureDateTime(const fs::path& file, const DateTime& dt) override;
};

}  // namespace exif_redate
