#include "ytdlp_extractor.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/process_launcher.h"
#include "../common/validation_utils.h"
#include <sstream>

YtDlpExtractor::YtDlpExtractor(const std::string& ytdlp_path, const ExtractorSettings& settings)
    : ytdlp_path_(ytdlp_path)
    , settings_(settings) {
}

void YtDlpExtractor::appendCommonArguments(std::vector<std::string>& args) const {
    args.push_back("--no-warnings");
    if (settings_.force_ipv4) {
        args.push_back("--force-ipv4");
    }
    if (settings_.socket_timeout > 0) {
        args.push_back("--socket-timeout");
        args.push_back(std::to_string(settings_.socket_timeout));
    }
    // Checked per call, the file may appear or vanish between calls
    if (!settings_.cookies_file_path.empty() && PathUtils::fileExists(settings_.cookies_file_path)) {
        args.push_back("--cookies");
        args.push_back(settings_.cookies_file_path);
    }
}

std::vector<std::string> YtDlpExtractor::buildInfoArguments(const std::string& url, const ExtractOptions& options) const {
    std::vector<std::string> args;
    // Single JSON document on stdout, nothing downloaded
    args.push_back("-J");
    if (options.flat_playlist) {
        args.push_back("--flat-playlist");
        args.push_back("--playlist-end");
        args.push_back(std::to_string(options.playlist_end));
    } else {
        args.push_back("--no-playlist");
    }
    appendCommonArguments(args);
    args.push_back(url);
    return args;
}

std::vector<std::string> YtDlpExtractor::buildDownloadArguments(const std::string& url, const DownloadOptions& options) const {
    std::vector<std::string> args;

    if (!settings_.ffmpeg_path.empty()) {
        args.push_back("--ffmpeg-location");
        args.push_back(settings_.ffmpeg_path);
    }

    args.push_back("-o");
    args.push_back(options.output_template);

    args.push_back("-f");
    args.push_back(options.format);

    // Post-processing: extract audio
    args.push_back("-x");
    args.push_back("--audio-format");
    args.push_back(options.audio_format);
    args.push_back("--audio-quality");
    args.push_back(options.audio_quality);

    if (options.embed_metadata) {
        args.push_back("--embed-metadata");
    }
    if (options.embed_thumbnail) {
        args.push_back("--write-thumbnail");
        args.push_back("--embed-thumbnail");
    }

    if (options.alternate_client) {
        args.push_back("--extractor-args");
        args.push_back("youtube:player_client=android");
    }

    args.push_back("--no-playlist");
    args.push_back("--no-progress");
    // Final path of every produced file, one per line
    args.push_back("--print");
    args.push_back("after_move:filepath");
    appendCommonArguments(args);

    args.push_back(url);
    return args;
}

std::vector<std::string> YtDlpExtractor::buildThumbnailArguments(const std::string& url, const ThumbnailOptions& options) const {
    std::vector<std::string> args;
    args.push_back("--skip-download");
    args.push_back("--write-thumbnail");
    args.push_back("--no-playlist");
    args.push_back("-o");
    args.push_back(options.output_template);
    appendCommonArguments(args);
    args.push_back(url);
    return args;
}

std::string YtDlpExtractor::extractErrorText(const std::string& stderr_output) {
    std::istringstream stream(stderr_output);
    std::string line;
    std::string errors;
    while (std::getline(stream, line)) {
        if (line.compare(0, 6, "ERROR:") == 0) {
            if (!errors.empty()) errors += "\n";
            errors += ValidationUtils::trim(line);
        }
    }
    if (!errors.empty()) {
        return errors;
    }
    return ValidationUtils::trim(stderr_output);
}

ExtractResult YtDlpExtractor::runTool(const std::vector<std::string>& args, const char* action,
                                      std::string& stdout_output) const {
    ExtractResult result;
    LOG_DEBUG("YtDlp", action << ": " << ProcessLauncher::describe(ytdlp_path_, args));

    ProcessResult process = ProcessLauncher::run(ytdlp_path_, args);
    result.stderr_output = process.stderr_output;
    stdout_output = process.stdout_output;

    if (!process.launched) {
        result.error = process.launch_error;
        return result;
    }
    if (process.exit_code != 0) {
        result.error = extractErrorText(process.stderr_output);
        if (result.error.empty()) {
            result.error = "exit code " + std::to_string(process.exit_code);
        }
        return result;
    }
    result.success = true;
    return result;
}

ExtractResult YtDlpExtractor::runTool(const std::vector<std::string>& args, const char* action) const {
    std::string stdout_output;
    ExtractResult result = runTool(args, action, stdout_output);
    if (!result.success) {
        return result;
    }
    std::istringstream stream(stdout_output);
    std::string line;
    while (std::getline(stream, line)) {
        line = ValidationUtils::trim(line);
        if (!line.empty()) {
            result.produced_paths.push_back(line);
        }
    }
    return result;
}

ExtractResult YtDlpExtractor::extractInfo(const std::string& url, const ExtractOptions& options) {
    std::string stdout_output;
    ExtractResult result = runTool(buildInfoArguments(url, options), "extract info", stdout_output);
    if (!result.success) {
        return result;
    }

    std::string parse_error;
    result.data = JsonUtils::parse(stdout_output, parse_error);
    if (!parse_error.empty()) {
        result.success = false;
        result.error = "Invalid metadata JSON: " + parse_error;
    }
    return result;
}

ExtractResult YtDlpExtractor::download(const std::string& url, const DownloadOptions& options) {
    return runTool(buildDownloadArguments(url, options), "download");
}

ExtractResult YtDlpExtractor::fetchThumbnail(const std::string& url, const ThumbnailOptions& options) {
    return runTool(buildThumbnailArguments(url, options), "fetch thumbnail");
}
