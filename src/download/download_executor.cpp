#include "download_executor.h"
#include "failure_classifier.h"
#include "../common/id_utils.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/validation_utils.h"
#include <chrono>
#include <thread>
#include <utility>

DownloadExecutor::DownloadExecutor(MediaExtractor& extractor, CoverFetcher& covers, SongCache& cache,
                                   const ExecutorConfig& config, TagFunction tag_file)
    : extractor_(extractor)
    , covers_(covers)
    , cache_(cache)
    , config_(config)
    , tag_file_(std::move(tag_file)) {
}

DownloadOptions DownloadExecutor::buildOptions(const std::string& output_template, bool alternate_client) const {
    DownloadOptions options;
    options.output_template = output_template;
    options.format = "bestaudio/best";
    options.audio_format = config_.audio_format;
    options.audio_quality = "0";
    options.embed_metadata = true;
    options.embed_thumbnail = true;
    options.alternate_client = alternate_client;
    return options;
}

std::vector<std::string> DownloadExecutor::prefixedFiles(const std::string& prefix, const std::string& log_tag) const {
    std::vector<std::string> matches;
    std::vector<std::string> names;
    if (!PathUtils::listFiles(config_.output_dir, names)) {
        LOG_ERROR(log_tag, "Cannot list " << config_.output_dir);
        return matches;
    }

    std::string marker = prefix + "_";
    for (const auto& name : names) {
        if (name.compare(0, marker.size(), marker) == 0) {
            matches.push_back(name);
        }
    }
    return matches;
}

std::vector<std::string> DownloadExecutor::finalizeFiles(const std::string& prefix, const std::string& log_tag) const {
    std::vector<std::string> finals;
    for (const auto& name : prefixedFiles(prefix, log_tag)) {
        std::string final_name = name.substr(prefix.size() + 1);
        std::string from = PathUtils::joinPath(config_.output_dir, name);
        std::string to = PathUtils::joinPath(config_.output_dir, final_name);
        if (!PathUtils::renameFile(from, to)) {
            LOG_ERROR(log_tag, "Cannot rename " << name << " to " << final_name);
            continue;
        }
        finals.push_back(final_name);
    }
    return finals;
}

void DownloadExecutor::discardFiles(const std::string& prefix, const std::string& log_tag) const {
    for (const auto& name : prefixedFiles(prefix, log_tag)) {
        if (!PathUtils::removeFile(PathUtils::joinPath(config_.output_dir, name))) {
            LOG_WARN(log_tag, "Cannot remove leftover " << name);
        }
    }
}

EntryOutcome DownloadExecutor::process(const MediaEntry& entry) {
    EntryOutcome outcome;
    outcome.entry = entry;
    std::string tag = Logger::contextTag("Download", config_.user_id, "download", entry.id);

    std::string prefix = IdUtils::generateShortId(8);
    std::string stem = ValidationUtils::sanitizeFilename(entry.title + " # " + entry.uploader);
    std::string output_template = PathUtils::joinPath(config_.output_dir, prefix + "_" + stem + ".%(ext)s");

    outcome.attempts = 1;
    ExtractResult result = extractor_.download(entry.url, buildOptions(output_template, false));
    if (!result.success) {
        BlockedSignal signal = FailureClassifier::classify(result.error);
        if (FailureClassifier::needsAlternateClient(signal)) {
            LOG_WARN(tag, "Blocked (" << FailureClassifier::toString(signal)
                     << "), retrying with alternate client");
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.retry_backoff_ms));
            outcome.attempts = 2;
            result = extractor_.download(entry.url, buildOptions(output_template, true));
        }
    }

    if (!result.success) {
        outcome.stderr_output = result.stderr_output;
        outcome.failure = FailedEntry(entry.title, entry.uploader, entry.url,
                                      "yt-dlp exit: " + ValidationUtils::shorten(result.error, 600),
                                      outcome.attempts);
        LOG_ERROR(tag, "Download failed after " << outcome.attempts << " attempt(s): "
                  << ValidationUtils::shorten(result.error, 200));
        discardFiles(prefix, tag);
        return outcome;
    }

    outcome.final_files = finalizeFiles(prefix, tag);
    for (const auto& name : outcome.final_files) {
        std::string path = PathUtils::joinPath(config_.output_dir, name);
        try {
            tag_file_(path, entry);
        } catch (const TaggingError& e) {
            LOG_WARN(Logger::contextTag("Download", config_.user_id, "metadata", entry.id),
                     "Tagging error: " << e.what());
        }
    }

    try {
        outcome.cover = covers_.fetch(entry);
    } catch (const CoverError& e) {
        LOG_WARN(Logger::contextTag("Download", config_.user_id, "metadata", entry.id),
                 "Could not save cover: " << e.what());
    }

    SongCacheRecord record;
    record.id = entry.id;
    record.title = entry.title;
    record.artist = entry.uploader;
    record.url = entry.url;
    record.date = entry.upload_date;
    record.cover = outcome.cover;
    cache_.insert(record);

    outcome.success = true;
    return outcome;
}
