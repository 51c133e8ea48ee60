#pragma once

#include "../common/types.h"
#include "../cache/song_cache.h"
#include "../extractor/media_extractor.h"
#include "../metadata/cover_fetcher.h"
#include "../metadata/tag_writer.h"
#include <functional>
#include <string>
#include <vector>

// Result of processing one entry on a worker thread
struct EntryOutcome {
    MediaEntry entry;
    bool success;
    int attempts;                          // download attempts made, 1 or 2
    std::vector<std::string> final_files;  // names inside the output directory
    std::string cover;                     // cover file name, may be empty
    FailedEntry failure;                   // set when !success
    std::string stderr_output;             // raw diagnostics of the last attempt

    EntryOutcome() : success(false), attempts(0) {}
};

struct ExecutorConfig {
    std::string user_id;
    std::string output_dir;
    std::string audio_format = "opus";
    int retry_backoff_ms = 800;
};

// Downloads one entry into a uniquely prefixed temporary name, retries once
// with the alternate client on a blocked-access signal, then renames, tags
// and records the result in the shared cache.
class DownloadExecutor {
public:
    // Tags one finished file. Returns false when its container is not supported.
    using TagFunction = std::function<bool(const std::string&, const MediaEntry&)>;

    DownloadExecutor(MediaExtractor& extractor, CoverFetcher& covers, SongCache& cache,
                     const ExecutorConfig& config, TagFunction tag_file = TagWriter::writeTags);

    EntryOutcome process(const MediaEntry& entry);

    // Options for one attempt; the temporary template is shared by both
    DownloadOptions buildOptions(const std::string& output_template, bool alternate_client) const;

    // Rename every "<prefix>_<name>" in the output directory to "<name>".
    // Returns the final names.
    std::vector<std::string> finalizeFiles(const std::string& prefix, const std::string& log_tag) const;

    // Remove every "<prefix>_<name>" left behind by a failed download
    void discardFiles(const std::string& prefix, const std::string& log_tag) const;

private:
    MediaExtractor& extractor_;
    CoverFetcher& covers_;
    SongCache& cache_;
    ExecutorConfig config_;
    TagFunction tag_file_;

    std::vector<std::string> prefixedFiles(const std::string& prefix, const std::string& log_tag) const;
};
