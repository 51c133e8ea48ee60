#pragma once

#include "../common/types.h"
#include "../extractor/media_extractor.h"
#include <stdexcept>
#include <string>

class CoverError : public std::runtime_error {
public:
    explicit CoverError(const std::string& message) : std::runtime_error(message) {}
};

// Stores one JPEG cover per media id in the user's cover directory
class CoverFetcher {
public:
    CoverFetcher(MediaExtractor& extractor, const std::string& cover_dir,
                 const std::string& ffmpeg_path, int convert_timeout_seconds);

    // File name of the cover inside the cover directory, empty when the
    // entry has no usable id or no thumbnail was produced.
    // Throws CoverError when the thumbnail fetch itself fails.
    std::string fetch(const MediaEntry& entry);

    // Convert <cover_dir>/<source_name> to <id>.jpg. Returns "<id>.jpg" on
    // success (the source is removed), source_name otherwise.
    std::string convertToJpeg(const std::string& source_name, const std::string& id);

private:
    MediaExtractor& extractor_;
    std::string cover_dir_;
    std::string ffmpeg_path_;
    int convert_timeout_seconds_;

    std::string findExisting(const std::string& id, const char* const* extensions, size_t count) const;
};
