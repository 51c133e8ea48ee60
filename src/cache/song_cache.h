#pragma once

#include "../common/types.h"
#include "../common/json_utils.h"
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

class SongCacheError : public std::runtime_error {
public:
    explicit SongCacheError(const std::string& message) : std::runtime_error(message) {}
};

// Absent optional fields are written as null
inline void to_json(json& j, const SongCacheRecord& r) {
    j = json{
        {"id", JsonUtils::nullableString(r.id)},
        {"title", r.title},
        {"artist", r.artist},
        {"url", r.url},
        {"date", JsonUtils::nullableString(r.date)},
        {"cover", JsonUtils::nullableString(r.cover)}
    };
}

inline void from_json(const json& j, SongCacheRecord& r) {
    r.id = JsonUtils::getString(j, "id");
    r.title = JsonUtils::getString(j, "title");
    r.artist = JsonUtils::getString(j, "artist");
    r.url = JsonUtils::getString(j, "url");
    r.date = JsonUtils::getString(j, "date");
    r.cover = JsonUtils::getString(j, "cover");
}

// Persistent per-user record of completed media
class SongCacheStore {
public:
    virtual ~SongCacheStore() {}

    // Missing store yields an empty list. Unreadable data throws SongCacheError.
    virtual std::vector<SongCacheRecord> load(const std::string& user_id) = 0;

    // Overwrite the stored records. Throws SongCacheError on failure.
    virtual void save(const std::string& user_id, const std::vector<SongCacheRecord>& records) = 0;
};

// <output_root>/<user>/song-list.json, a JSON array indented with 4 spaces
class JsonSongCacheStore : public SongCacheStore {
public:
    explicit JsonSongCacheStore(const std::string& output_root);

    std::vector<SongCacheRecord> load(const std::string& user_id) override;
    void save(const std::string& user_id, const std::vector<SongCacheRecord>& records) override;

    std::string cachePath(const std::string& user_id) const;

    static const char* const FILE_NAME;

private:
    std::string output_root_;
};

// In-memory view of a user's cache during one run. Worker threads insert
// concurrently; every access goes through one mutex.
class SongCache {
public:
    SongCache() {}
    explicit SongCache(const std::vector<SongCacheRecord>& records);

    // Insert or replace the record with the same key
    void insert(const SongCacheRecord& record);

    bool containsKey(const std::string& key) const;
    bool containsEntry(const MediaEntry& entry) const;

    size_t size() const;

    // Snapshot ordered by key
    std::vector<SongCacheRecord> records() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SongCacheRecord> records_;
};
