#pragma once

#include "../common/types.h"
#include "../common/json_utils.h"
#include "../extractor/media_extractor.h"
#include <string>
#include <vector>

// Outcome of resolving one queued URL. Exactly one of data/error is set.
struct ResolvedUrl {
    std::string url;     // URL as queued
    json data;           // null on failure
    std::string error;   // empty on success

    bool ok() const { return error.empty(); }
};

class MetadataResolver {
public:
    MetadataResolver(MediaExtractor& extractor, int playlist_limit);

    // Resolve one URL. Playlists are resolved flat, single items lose their
    // playlist context first.
    ResolvedUrl resolve(const std::string& url);

    // Resolve every URL on a pool of `workers` threads. Results keep the
    // order of the input.
    std::vector<ResolvedUrl> resolveAll(const std::vector<std::string>& urls, size_t workers,
                                        const std::string& log_tag);

    // Build one MediaEntry from an info document or a flat playlist child
    static MediaEntry entryFromMetadata(const json& data);

    // Playlist documents (non-empty "entries") expand into one entry per
    // non-null child; anything else becomes a single entry
    static std::vector<MediaEntry> expandEntries(const json& data);

    // "20240131" -> "2024-01-31"; anything else yields ""
    static std::string formatUploadDate(const std::string& raw);

private:
    MediaExtractor& extractor_;
    int playlist_limit_;
};
