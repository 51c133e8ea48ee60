#pragma once

#include "../common/types.h"
#include "../cache/song_cache.h"
#include <string>
#include <vector>

// Drops entries that were already downloaded: known to the song cache by id
// or by title|uploader, or present on disk under their sanitized name.
class DedupFilter {
public:
    // existing_files are names inside the user's output directory
    DedupFilter(const SongCache& cache, const std::vector<std::string>& existing_files);

    bool isDuplicate(const MediaEntry& entry) const;

    std::vector<MediaEntry> filter(const std::vector<MediaEntry>& entries) const;

private:
    const SongCache& cache_;
    std::vector<std::string> existing_files_;
};
