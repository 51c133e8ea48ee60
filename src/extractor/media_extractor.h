#pragma once

#include "../common/json_utils.h"
#include <string>
#include <vector>

// Options shared by every extractor call
struct ExtractorSettings {
    std::string cookies_file_path;  // Applied to each call while the file exists
    std::string ffmpeg_path;        // Passed as --ffmpeg-location when non-empty
    int socket_timeout = 30;        // Seconds, 0 leaves the yt-dlp default
    bool force_ipv4 = true;
};

struct ExtractOptions {
    bool flat_playlist = false;  // Resolve playlist children as metadata only
    int playlist_end = 150;      // Upper bound on playlist children, used with flat_playlist
};

struct DownloadOptions {
    std::string output_template;         // Path with %(ext)s placeholder
    std::string format = "bestaudio/best";
    std::string audio_format = "opus";
    std::string audio_quality = "0";
    bool embed_metadata = true;
    bool embed_thumbnail = true;
    bool alternate_client = false;       // youtube:player_client=android
};

struct ThumbnailOptions {
    std::string output_template;  // Path with %(ext)s placeholder
};

struct ExtractResult {
    bool success = false;
    json data;                                // Parsed info document (extractInfo only)
    std::vector<std::string> produced_paths;  // Files reported by the tool, may be empty
    std::string error;                        // Short human readable error
    std::string stderr_output;                // Raw diagnostics
};

// Extraction/download contract. Implementations must be safe to call from
// several worker threads at once.
class MediaExtractor {
public:
    virtual ~MediaExtractor() {}

    // Resolve metadata for a URL without downloading media
    virtual ExtractResult extractInfo(const std::string& url, const ExtractOptions& options) = 0;

    // Download and post-process one media item
    virtual ExtractResult download(const std::string& url, const DownloadOptions& options) = 0;

    // Write only the thumbnail of a media item
    virtual ExtractResult fetchThumbnail(const std::string& url, const ThumbnailOptions& options) = 0;
};
