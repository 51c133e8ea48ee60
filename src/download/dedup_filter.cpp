#include "dedup_filter.h"
#include "../common/validation_utils.h"

DedupFilter::DedupFilter(const SongCache& cache, const std::vector<std::string>& existing_files)
    : cache_(cache)
    , existing_files_(existing_files) {
}

bool DedupFilter::isDuplicate(const MediaEntry& entry) const {
    if (cache_.containsEntry(entry)) {
        return true;
    }
    std::string stem = ValidationUtils::sanitizeFilename(entry.title + " # " + entry.uploader);
    for (const auto& name : existing_files_) {
        if (name.find(stem) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<MediaEntry> DedupFilter::filter(const std::vector<MediaEntry>& entries) const {
    std::vector<MediaEntry> survivors;
    for (const auto& entry : entries) {
        if (!isDuplicate(entry)) {
            survivors.push_back(entry);
        }
    }
    return survivors;
}
