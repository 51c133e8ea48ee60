#pragma once

#include <string>
#include <vector>

// Optional string fields use an empty string for "absent"; they are
// written as JSON null when persisted.

struct QueueItem {
    std::string url;
    int position;

    QueueItem() : position(0) {}
    QueueItem(const std::string& u, int p) : url(u), position(p) {}
};

// One resolved media item (a single video or one child of a playlist)
struct MediaEntry {
    std::string id;            // media id, empty if unknown
    std::string title;
    std::string uploader;
    std::string url;           // canonical page URL used for download
    std::string album;         // "Nightcore" or empty
    std::string upload_date;   // YYYY-MM-DD or empty
    std::string description;   // trimmed, may be empty

    // Dedup key: id if known, else "title|uploader"
    std::string cacheKey() const {
        return id.empty() ? titleArtistKey() : id;
    }

    std::string titleArtistKey() const {
        return title + "|" + uploader;
    }
};

struct SongCacheRecord {
    std::string id;
    std::string title;
    std::string artist;
    std::string url;
    std::string date;
    std::string cover;   // cover filename inside the user's cover directory

    std::string key() const {
        return id.empty() ? title + "|" + artist : id;
    }
};

struct FailedEntry {
    std::string title;
    std::string artist;
    std::string url;
    std::string reason;
    int attempts;

    FailedEntry() : attempts(0) {}
    FailedEntry(const std::string& t, const std::string& a, const std::string& u,
                const std::string& r, int n)
        : title(t), artist(a), url(u), reason(r), attempts(n) {}
};

struct RunResult {
    int downloaded;
    int duplicates;
    int errors;
    std::vector<FailedEntry> failed;

    RunResult() : downloaded(0), duplicates(0), errors(0) {}
};

// Placeholder for unknown title/artist/url in failure records
const char* const UNKNOWN_FIELD = "\u2014";
