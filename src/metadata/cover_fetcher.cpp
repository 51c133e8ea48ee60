#include "cover_fetcher.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/process_launcher.h"
#include "../common/validation_utils.h"

namespace {
const char* const REUSE_EXTENSIONS[] = {"jpg", "jpeg", "png", "webp"};
const char* const FETCHED_EXTENSIONS[] = {"webp", "png", "jpeg", "jpg"};
}

CoverFetcher::CoverFetcher(MediaExtractor& extractor, const std::string& cover_dir,
                           const std::string& ffmpeg_path, int convert_timeout_seconds)
    : extractor_(extractor)
    , cover_dir_(cover_dir)
    , ffmpeg_path_(ffmpeg_path)
    , convert_timeout_seconds_(convert_timeout_seconds) {
}

std::string CoverFetcher::findExisting(const std::string& id, const char* const* extensions, size_t count) const {
    for (size_t i = 0; i < count; ++i) {
        std::string name = id + "." + extensions[i];
        if (PathUtils::fileExists(PathUtils::joinPath(cover_dir_, name))) {
            return name;
        }
    }
    return "";
}

std::string CoverFetcher::fetch(const MediaEntry& entry) {
    std::string tag = Logger::contextTag("Cover", "", "cover", entry.id);
    if (entry.id.empty()) {
        return "";
    }
    if (!ValidationUtils::isSafeMediaId(entry.id)) {
        LOG_WARN(tag, "Invalid media id, not fetching cover");
        return "";
    }

    std::string existing = findExisting(entry.id, REUSE_EXTENSIONS, 4);
    if (!existing.empty()) {
        return existing;
    }

    ThumbnailOptions options;
    options.output_template = PathUtils::joinPath(cover_dir_, entry.id + ".%(ext)s");
    ExtractResult result = extractor_.fetchThumbnail(entry.url, options);
    if (!result.success) {
        throw CoverError("thumbnail fetch failed: " + ValidationUtils::shorten(result.error));
    }

    std::string fetched = findExisting(entry.id, FETCHED_EXTENSIONS, 4);
    if (fetched.empty()) {
        LOG_WARN(tag, "No thumbnail file found after download");
        return "";
    }
    if (PathUtils::extensionLower(fetched) == ".jpg") {
        return fetched;
    }

    LOG_INFO(tag, "Converting cover from " << PathUtils::extensionLower(fetched) << " to .jpg");
    return convertToJpeg(fetched, entry.id);
}

std::string CoverFetcher::convertToJpeg(const std::string& source_name, const std::string& id) {
    std::string tag = Logger::contextTag("Cover", "", "cover", id);
    std::string source_path = PathUtils::joinPath(cover_dir_, source_name);
    std::string target_name = id + ".jpg";
    std::string target_path = PathUtils::joinPath(cover_dir_, target_name);

    std::vector<std::string> args;
    args.push_back("-y");
    args.push_back("-i");
    args.push_back(source_path);
    args.push_back("-v");
    args.push_back("quiet");
    args.push_back("-q:v");
    args.push_back("2");
    args.push_back(target_path);

    ProcessResult process = ProcessLauncher::run(ffmpeg_path_, args, convert_timeout_seconds_);
    if (!process.launched) {
        LOG_ERROR(tag, "FFmpeg conversion failed: " << process.launch_error);
        return source_name;
    }
    if (process.timed_out) {
        LOG_ERROR(tag, "FFmpeg conversion timed out after " << convert_timeout_seconds_ << "s");
        return source_name;
    }
    if (process.exit_code != 0 || !PathUtils::fileExists(target_path)) {
        LOG_ERROR(tag, "FFmpeg conversion failed with exit code " << process.exit_code);
        return source_name;
    }

    if (!PathUtils::removeFile(source_path)) {
        LOG_WARN(tag, "Could not remove " << source_path);
    }
    return target_name;
}
