#include "metadata_resolver.h"
#include "../common/logger.h"
#include "../common/playlist_detector.h"
#include "../common/url_parser.h"
#include "../common/validation_utils.h"
#include "../common/worker_pool.h"
#include <cctype>

MetadataResolver::MetadataResolver(MediaExtractor& extractor, int playlist_limit)
    : extractor_(extractor)
    , playlist_limit_(playlist_limit) {
}

ResolvedUrl MetadataResolver::resolve(const std::string& url) {
    ResolvedUrl resolved;
    resolved.url = url;

    ExtractOptions options;
    std::string target = url;
    if (PlaylistDetector::isYouTubePlaylist(url)) {
        options.flat_playlist = true;
        options.playlist_end = playlist_limit_;
    } else {
        target = PlaylistDetector::stripPlaylistContext(url);
    }

    ExtractResult result = extractor_.extractInfo(target, options);
    if (!result.success) {
        resolved.error = result.error.empty() ? "No metadata" : result.error;
        return resolved;
    }
    if (!result.data.is_object() || result.data.empty()) {
        resolved.error = "No metadata";
        return resolved;
    }
    resolved.data = result.data;
    return resolved;
}

std::vector<ResolvedUrl> MetadataResolver::resolveAll(const std::vector<std::string>& urls, size_t workers,
                                                      const std::string& log_tag) {
    std::vector<ResolvedUrl> results(urls.size());
    {
        WorkerPool pool(workers, log_tag);
        for (size_t i = 0; i < urls.size(); ++i) {
            pool.submit([this, &urls, &results, &log_tag, i]() {
                try {
                    results[i] = resolve(urls[i]);
                } catch (const std::exception& e) {
                    results[i].url = urls[i];
                    results[i].data = json();
                    results[i].error = e.what();
                }
                if (results[i].ok()) {
                    LOG_DEBUG(log_tag, "Resolved " << urls[i]);
                } else {
                    LOG_WARN(log_tag, "Metadata failed for " << urls[i] << ": " << results[i].error);
                }
            });
        }
        pool.wait();
    }
    return results;
}

std::string MetadataResolver::formatUploadDate(const std::string& raw) {
    if (raw.size() != 8) {
        return "";
    }
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return "";
        }
    }
    return raw.substr(0, 4) + "-" + raw.substr(4, 2) + "-" + raw.substr(6, 2);
}

MediaEntry MetadataResolver::entryFromMetadata(const json& data) {
    MediaEntry entry;
    entry.id = JsonUtils::getStringOr(data, "id", JsonUtils::getString(data, "display_id"));
    entry.title = JsonUtils::getStringOr(data, "title", "Unknown Title");
    entry.uploader = JsonUtils::getStringOr(data, "uploader", "Unknown Artist");
    entry.url = JsonUtils::getStringOr(data, "webpage_url", JsonUtils::getString(data, "url"));

    if (UrlParser::toLower(entry.title).find("nightcore") != std::string::npos) {
        entry.album = "Nightcore";
    }
    entry.upload_date = formatUploadDate(JsonUtils::getString(data, "upload_date"));
    entry.description = ValidationUtils::trim(JsonUtils::getString(data, "description"));
    return entry;
}

std::vector<MediaEntry> MetadataResolver::expandEntries(const json& data) {
    std::vector<MediaEntry> entries;
    if (data.is_object()) {
        auto it = data.find("entries");
        if (it != data.end() && it->is_array() && !it->empty()) {
            for (const auto& child : *it) {
                if (child.is_null()) continue;
                entries.push_back(entryFromMetadata(child));
            }
            return entries;
        }
    }
    entries.push_back(entryFromMetadata(data));
    return entries;
}
