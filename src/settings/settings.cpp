#include "settings.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/validation_utils.h"
#include <fstream>
#include <algorithm>
#include <cstdlib>
#include <climits>

// Helper function to parse integer with bounds
static int parseInt(const std::string& value, int fallback, int min_val = 0, int max_val = INT_MAX) {
    try {
        int val = std::stoi(value);
        return std::max(min_val, std::min(max_val, val));
    } catch (const std::exception&) {
        LOG_WARN("Settings", "Invalid integer '" << value << "', using " << fallback);
        return fallback;
    }
}

static std::string envOr(const char* name, const std::string& current) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return value;
    }
    return current;
}

Settings::Settings() {
    loadDefaults();
}

Settings::~Settings() {
}

void Settings::loadDefaults() {
    data_root = "data";
    output_root = "";
    covers_root = "";
    queue_root = "";
    log_dir = "";
    cookies_file = "";
    ffmpeg_path = "";
    ytdlp_path = "";

    workers = 4;
    min_free_mb = 100;
    playlist_limit = 150;
    retry_backoff_ms = 800;
    cover_convert_timeout = 15;
    socket_timeout = 30;
    audio_format = "opus";
    log_level = "info";
}

bool Settings::load(const std::string& config_path) {
    LOG_DEBUG("Settings", "Loading settings from: " << config_path);
    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_DEBUG("Settings", "Config file not found, using defaults");
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = ValidationUtils::trim(line.substr(0, eq_pos));
        std::string value = ValidationUtils::trim(line.substr(eq_pos + 1));
        setValue(key, value);
    }
    LOG_DEBUG("Settings", "Settings loaded successfully");
    return true;
}

void Settings::setValue(const std::string& key, const std::string& value) {
    if (key == "data_root") {
        data_root = value;
    } else if (key == "output_root") {
        output_root = value;
    } else if (key == "covers_root") {
        covers_root = value;
    } else if (key == "queue_root") {
        queue_root = value;
    } else if (key == "log_dir") {
        log_dir = value;
    } else if (key == "cookies_file") {
        cookies_file = value;
    } else if (key == "ffmpeg_path") {
        ffmpeg_path = value;
    } else if (key == "ytdlp_path") {
        ytdlp_path = value;
    } else if (key == "workers") {
        workers = parseInt(value, 4, 1, 32);
    } else if (key == "min_free_mb") {
        min_free_mb = parseInt(value, 100, 0);
    } else if (key == "playlist_limit") {
        playlist_limit = parseInt(value, 150, 1, 5000);
    } else if (key == "retry_backoff_ms") {
        retry_backoff_ms = parseInt(value, 800, 0, 60000);
    } else if (key == "cover_convert_timeout") {
        cover_convert_timeout = parseInt(value, 15, 1, 600);
    } else if (key == "socket_timeout") {
        socket_timeout = parseInt(value, 30, 1, 600);
    } else if (key == "audio_format") {
        audio_format = value;
    } else if (key == "log_level") {
        log_level = value;
    } else {
        LOG_WARN("Settings", "Unknown setting '" << key << "' ignored");
    }
}

void Settings::applyEnvironment() {
    data_root = envOr("DATA_ROOT", data_root);
    output_root = envOr("OUTPUT_ROOT", output_root);
    covers_root = envOr("COVERS_ROOT", covers_root);
    queue_root = envOr("QUEUE_ROOT", queue_root);
    log_dir = envOr("LOG_DIR", log_dir);
    cookies_file = envOr("COOKIES_FILE", cookies_file);
    ffmpeg_path = envOr("FFMPEG_PATH", ffmpeg_path);
    ytdlp_path = envOr("YTDLP_PATH", ytdlp_path);
}

void Settings::finalize() {
    if (output_root.empty()) output_root = PathUtils::joinPath(data_root, "downloads");
    if (covers_root.empty()) covers_root = PathUtils::joinPath(data_root, "covers");
    if (queue_root.empty()) queue_root = PathUtils::joinPath(data_root, "queue");
    if (log_dir.empty()) log_dir = PathUtils::joinPath(data_root, "logs");
    if (cookies_file.empty()) cookies_file = PathUtils::joinPath(data_root, "cookies.txt");

    ffmpeg_path = resolveExecutable(ffmpeg_path, "ffmpeg");
    ytdlp_path = resolveExecutable(ytdlp_path, "yt-dlp");
}

std::string Settings::resolveExecutable(const std::string& hint, const std::string& name) {
    if (!hint.empty()) {
        if (PathUtils::isExecutable(hint)) {
            return hint;
        }
        if (PathUtils::isDirectory(hint)) {
            std::string in_dir = PathUtils::joinPath(hint, name);
            if (PathUtils::isExecutable(in_dir)) {
                return in_dir;
            }
        }
        LOG_WARN("Settings", name << " hint '" << hint << "' is not executable, searching PATH");
    }

    std::string from_path = PathUtils::findInPath(name);
    if (!from_path.empty()) {
        return from_path;
    }
    // Final fallback, rely on PATH at exec time
    return name;
}

bool Settings::save(const std::string& config_path) const {
    std::ofstream file(config_path);
    if (!file.is_open()) {
        LOG_ERROR("Settings", "Cannot open " << config_path << " for writing");
        return false;
    }

    file << "# TuneVault Configuration\n";
    file << "# This file is automatically generated\n\n";

    file << "data_root=" << data_root << "\n";
    file << "output_root=" << output_root << "\n";
    file << "covers_root=" << covers_root << "\n";
    file << "queue_root=" << queue_root << "\n";
    file << "log_dir=" << log_dir << "\n";
    file << "cookies_file=" << cookies_file << "\n";
    file << "ffmpeg_path=" << ffmpeg_path << "\n";
    file << "ytdlp_path=" << ytdlp_path << "\n";
    file << "workers=" << workers << "\n";
    file << "min_free_mb=" << min_free_mb << "\n";
    file << "playlist_limit=" << playlist_limit << "\n";
    file << "retry_backoff_ms=" << retry_backoff_ms << "\n";
    file << "cover_convert_timeout=" << cover_convert_timeout << "\n";
    file << "socket_timeout=" << socket_timeout << "\n";
    file << "audio_format=" << audio_format << "\n";
    file << "log_level=" << log_level << "\n";
    return static_cast<bool>(file);
}

ExtractorSettings Settings::createExtractorSettings() const {
    ExtractorSettings settings;
    settings.cookies_file_path = cookies_file;
    settings.ffmpeg_path = ffmpeg_path;
    settings.socket_timeout = socket_timeout;
    settings.force_ipv4 = true;
    return settings;
}
