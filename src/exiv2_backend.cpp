#include "exiv2_backend.hpp"

#include "errors.hpp"

#include <exiv2/exiv2.hpp>

namespace exif_redate {

namespace {

// Read order: the primary field first, then the two Exif sub-IFD ones.
const char* const kDateTimeKeys[] = {
    "Exif.Image.DateTime",            // 0x0132 (ModifyDate)
    "Exif.Photo.DateTimeOriginal",    // 0x9003
    "Exif.Photo.DateTimeDigitized",   // 0x9004
};

}  // namespace

ReadResult Exiv2Backend::readCaptureDateTime(const fs::path& file) {
    try {
        auto image = Exiv2::ImageFactory::open(file.string());
        if (!image.get()) {
            return ReadResult::ReadFailed("open failed");
        }
        image->readMetadata();
        Exiv2::ExifData& exif = image->exifData();
        if (exif.empty()) {
            return ReadResult::NotFound("no EXIF data");
        }

        bool malformed = false;
        for (const char* key : kDateTimeKeys) {
            auto it = exif.findKey(Exiv2::ExifKey(key));
            if (it == exif.end()) continue;
            if (auto dt = ParseExifDateTime(it->toString())) {
                return ReadResult::Found(*dt);
            }
            malformed = true;
        }
        return ReadResult::NotFound(malformed ? "malformed EXIF datetime" : "no EXIF datetime");

    } catch (const Exiv2::Error& e) {
        return ReadResult::ReadFailed(e.what());
    } catch (const std::exception& e) {
        return ReadResult::ReadFailed(e.what());
    }
}

WriteResult Exiv2Backend::writeCaptureDateTime(const fs::path& file, const DateTime& dt) {
    WriteResult result;
    try {
        auto image = Exiv2::ImageFactory::open(file.string());
        if (!image.get()) {
            throw IoError(file, "open failed");
        }
        if (!image->supportsMetadata(Exiv2::mdExif)) {
            result.skipped_reason = "image format cannot hold EXIF";
            return result;
        }

        image->readMetadata();
        Exiv2::ExifData& exif = image->exifData();

        const std::string text = FormatExifDateTime(dt);
        for (const char* key : kDateTimeKeys) {
            exif[key] = text;
        }

        image->setExifData(exif);
        image->writeMetadata();
        result.written = true;
        return result;

    } catch (const Exiv2::Error& e) {
        throw IoError(file, e.what());
    } catch (const IoError&) {
        throw;
    } catch (const std::exception& e) {
        throw IoError(file, e.what());
    }
}

}  // namespace exif_redate
