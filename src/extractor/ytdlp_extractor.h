#pragma once

#include "media_extractor.h"
#include <string>
#include <vector>

// MediaExtractor backed by the yt-dlp executable
class YtDlpExtractor : public MediaExtractor {
public:
    YtDlpExtractor(const std::string& ytdlp_path, const ExtractorSettings& settings);

    ExtractResult extractInfo(const std::string& url, const ExtractOptions& options) override;
    ExtractResult download(const std::string& url, const DownloadOptions& options) override;
    ExtractResult fetchThumbnail(const std::string& url, const ThumbnailOptions& options) override;

    // Argument vectors, exposed for logging and tests
    std::vector<std::string> buildInfoArguments(const std::string& url, const ExtractOptions& options) const;
    std::vector<std::string> buildDownloadArguments(const std::string& url, const DownloadOptions& options) const;
    std::vector<std::string> buildThumbnailArguments(const std::string& url, const ThumbnailOptions& options) const;

    // "ERROR:" lines of yt-dlp diagnostics, or the whole text when none are tagged
    static std::string extractErrorText(const std::string& stderr_output);

private:
    std::string ytdlp_path_;
    ExtractorSettings settings_;

    void appendCommonArguments(std::vector<std::string>& args) const;
    ExtractResult runTool(const std::vector<std::string>& args, const char* action) const;
    ExtractResult runTool(const std::vector<std::string>& args, const char* action,
                          std::string& stdout_output) const;
};
