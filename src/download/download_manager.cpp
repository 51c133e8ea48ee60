#include "download_manager.h"
#include "dedup_filter.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/validation_utils.h"
#include "../common/worker_pool.h"
#include "../metadata/cover_fetcher.h"
#include "../metadata/metadata_resolver.h"
#include <stdexcept>

DownloadManager::DownloadManager(const std::string& user_id,
                                 const Settings& settings,
                                 QueueStore& queue_store,
                                 SongCacheStore& cache_store,
                                 MediaExtractor& extractor)
    : user_id_(ValidationUtils::sanitizeUserId(user_id))
    , settings_(settings)
    , queue_store_(queue_store)
    , cache_store_(cache_store)
    , extractor_(extractor) {
    output_dir_ = PathUtils::joinPath(settings_.output_root, user_id_);
    cover_dir_ = PathUtils::joinPath(settings_.covers_root, user_id_);

    if (!PathUtils::createDirectories(output_dir_)) {
        LOG_ERROR(tag(""), "Failed to create output directory " << output_dir_);
        throw std::runtime_error("Cannot create output directory: " + output_dir_);
    }
    if (!PathUtils::createDirectories(cover_dir_)) {
        LOG_ERROR(tag(""), "Failed to create cover directory " << cover_dir_);
        throw std::runtime_error("Cannot create cover directory: " + cover_dir_);
    }
}

DownloadManager::~DownloadManager() {
}

std::string DownloadManager::tag(const std::string& step) const {
    return Logger::contextTag("Download", user_id_, step);
}

int DownloadManager::addUrls(const std::vector<std::string>& urls) {
    int added = queue_store_.append(user_id_, urls);
    LOG_INFO(tag("queue"), added << " URL(s) added to queue");
    LOG_INFO(tag("queue"), queue_store_.load(user_id_).size() << " URL(s) in queue");
    return added;
}

bool DownloadManager::hasEnoughDiskSpace() {
    int64_t available_mb = PathUtils::freeSpaceMb(output_dir_);
    if (available_mb < 0) {
        LOG_WARN(tag("queue"), "Could not check disk space for " << output_dir_);
        return true;
    }
    if (available_mb < settings_.min_free_mb) {
        LOG_WARN(tag("queue"), "Low disk space: " << available_mb << " MB available (need "
                 << settings_.min_free_mb << " MB)");
        return false;
    }
    return true;
}

std::vector<SongCacheRecord> DownloadManager::loadCache() {
    try {
        return cache_store_.load(user_id_);
    } catch (const SongCacheError& e) {
        LOG_ERROR(tag("cache"), "Failed to load song cache: " << e.what());
        return std::vector<SongCacheRecord>();
    }
}

void DownloadManager::saveCache(const SongCache& cache) {
    try {
        cache_store_.save(user_id_, cache.records());
    } catch (const SongCacheError& e) {
        LOG_ERROR(tag("cache"), "Failed to save song cache: " << e.what());
    }
}

std::vector<EntryOutcome> DownloadManager::downloadAll(const std::vector<MediaEntry>& entries, size_t workers,
                                                       SongCache& cache) {
    CoverFetcher covers(extractor_, cover_dir_, settings_.ffmpeg_path, settings_.cover_convert_timeout);

    ExecutorConfig config;
    config.user_id = user_id_;
    config.output_dir = output_dir_;
    config.audio_format = settings_.audio_format;
    config.retry_backoff_ms = settings_.retry_backoff_ms;
    DownloadExecutor executor(extractor_, covers, cache, config);

    std::vector<EntryOutcome> outcomes;
    std::mutex outcomes_mutex;
    const size_t total = entries.size();
    std::string progress_tag = tag("download");

    {
        WorkerPool pool(workers, progress_tag);
        for (const auto& entry : entries) {
            pool.submit([&executor, &outcomes, &outcomes_mutex, &entry, &progress_tag, total]() {
                EntryOutcome outcome;
                try {
                    outcome = executor.process(entry);
                } catch (const std::exception& e) {
                    outcome = EntryOutcome();
                    outcome.entry = entry;
                    outcome.attempts = 1;
                    outcome.failure = FailedEntry(UNKNOWN_FIELD, UNKNOWN_FIELD, UNKNOWN_FIELD, e.what(), 1);
                }

                std::lock_guard<std::mutex> lock(outcomes_mutex);
                outcomes.push_back(outcome);
                size_t done = outcomes.size();
                if (!outcome.success) {
                    LOG_ERROR(progress_tag, "Error in entry " << done << "/" << total << ": "
                              << outcome.failure.reason);
                    if (!outcome.stderr_output.empty()) {
                        LOG_ERROR(progress_tag, "stderr: " << ValidationUtils::shorten(outcome.stderr_output));
                    }
                }
                LOG_INFO(progress_tag, "Progress: " << done << "/" << total);
            });
        }
        pool.wait();
    }
    return outcomes;
}

RunResult DownloadManager::run(int workers) {
    RunResult result;
    if (workers < 1) workers = 1;

    std::vector<std::string> urls = queue_store_.load(user_id_);
    if (urls.empty()) {
        LOG_INFO(tag("queue"), "No URLs in queue.");
        return result;
    }

    if (!hasEnoughDiskSpace()) {
        LOG_WARN(tag("queue"), "Insufficient disk space, aborting download");
        queue_store_.replace(user_id_, std::vector<std::string>());
        result.errors = 1;
        result.failed.push_back(FailedEntry(UNKNOWN_FIELD, UNKNOWN_FIELD, UNKNOWN_FIELD,
                                            "Insufficient disk space", 0));
        return result;
    }
    LOG_INFO(tag("queue"), "Starting download of " << urls.size() << " URL(s)");

    MetadataResolver resolver(extractor_, settings_.playlist_limit);
    std::vector<ResolvedUrl> resolved = resolver.resolveAll(urls, static_cast<size_t>(workers), tag("metadata"));

    std::vector<MediaEntry> entries;
    std::vector<FailedEntry> failed_meta;
    for (const auto& item : resolved) {
        if (!item.ok()) {
            failed_meta.push_back(FailedEntry(UNKNOWN_FIELD, UNKNOWN_FIELD, item.url, item.error, 0));
            continue;
        }
        std::vector<MediaEntry> expanded = MetadataResolver::expandEntries(item.data);
        entries.insert(entries.end(), expanded.begin(), expanded.end());
    }

    SongCache cache(loadCache());
    std::vector<std::string> existing_files;
    if (!PathUtils::listFiles(output_dir_, existing_files)) {
        LOG_WARN(tag("dedup"), "Cannot list " << output_dir_);
    }
    DedupFilter dedup(cache, existing_files);
    std::vector<MediaEntry> survivors = dedup.filter(entries);
    result.duplicates = static_cast<int>(entries.size() - survivors.size());

    if (survivors.empty()) {
        queue_store_.replace(user_id_, std::vector<std::string>());
        result.errors = static_cast<int>(failed_meta.size());
        result.failed = failed_meta;
        if (result.errors) {
            LOG_WARN(tag("metadata"), result.errors << " errors already in metadata phase.");
        } else {
            LOG_INFO(tag("metadata"), "Only duplicates or empty results, nothing to do.");
        }
        return result;
    }

    std::vector<EntryOutcome> outcomes = downloadAll(survivors, static_cast<size_t>(workers), cache);

    std::vector<FailedEntry> failed_download;
    for (const auto& outcome : outcomes) {
        if (outcome.success) {
            ++result.downloaded;
        } else {
            failed_download.push_back(outcome.failure);
        }
    }
    if (!failed_download.empty()) {
        LOG_WARN(tag("download"), failed_download.size() << " errors occurred.");
    }

    saveCache(cache);
    queue_store_.replace(user_id_, std::vector<std::string>());

    result.failed = failed_meta;
    result.failed.insert(result.failed.end(), failed_download.begin(), failed_download.end());
    result.errors = static_cast<int>(result.failed.size());
    LOG_INFO(tag("download"), "Run finished: " << result.downloaded << " downloaded, "
             << result.duplicates << " duplicate(s), " << result.errors << " error(s)");
    return result;
}
