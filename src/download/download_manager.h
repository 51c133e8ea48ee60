#pragma once

#include <string>
#include <vector>
#include <mutex>
#include "../common/types.h"
#include "../cache/song_cache.h"
#include "../extractor/media_extractor.h"
#include "../queue/queue_store.h"
#include "../settings/settings.h"
#include "download_executor.h"

inline void to_json(json& j, const FailedEntry& f) {
    j = json{
        {"title", f.title},
        {"artist", f.artist},
        {"url", f.url},
        {"reason", f.reason},
        {"attempts", f.attempts}
    };
}

inline void to_json(json& j, const RunResult& r) {
    j = json{
        {"downloaded", r.downloaded},
        {"duplicates", r.duplicates},
        {"errors", r.errors},
        {"failed", r.failed}
    };
}

// Runs one queue snapshot for a user: resolve, dedup, download, persist.
class DownloadManager {
public:
    // Throws std::invalid_argument for an unusable user id and
    // std::runtime_error when the user's directories cannot be created.
    DownloadManager(const std::string& user_id,
                    const Settings& settings,
                    QueueStore& queue_store,
                    SongCacheStore& cache_store,
                    MediaExtractor& extractor);
    ~DownloadManager();

    // Append URLs to the user's queue. Returns the number added.
    int addUrls(const std::vector<std::string>& urls);

    // Process everything queued. The queue is empty afterwards.
    // QueueStoreError propagates to the caller.
    RunResult run(int workers = 4);

    const std::string& userId() const { return user_id_; }
    const std::string& outputDir() const { return output_dir_; }
    const std::string& coverDir() const { return cover_dir_; }

private:
    std::string user_id_;
    std::string output_dir_;
    std::string cover_dir_;
    const Settings& settings_;
    QueueStore& queue_store_;
    SongCacheStore& cache_store_;
    MediaExtractor& extractor_;

    std::string tag(const std::string& step) const;

    bool hasEnoughDiskSpace();
    std::vector<SongCacheRecord> loadCache();
    void saveCache(const SongCache& cache);

    std::vector<EntryOutcome> downloadAll(const std::vector<MediaEntry>& entries, size_t workers,
                                          SongCache& cache);
};
