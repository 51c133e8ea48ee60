#pragma once

#include <string>
#include "../extractor/media_extractor.h"

class Settings {
public:
    Settings();
    ~Settings();

    // Load settings from a key=value config file. A missing file keeps the
    // defaults and returns false.
    bool load(const std::string& config_path);

    // Apply DATA_ROOT, OUTPUT_ROOT, COVERS_ROOT, QUEUE_ROOT, LOG_DIR,
    // COOKIES_FILE, FFMPEG_PATH and YTDLP_PATH from the environment
    void applyEnvironment();

    // Save settings to a config file
    bool save(const std::string& config_path) const;

    // Fill derived paths (output_root etc.) that were left empty from data_root
    // and resolve the ffmpeg/yt-dlp executables
    void finalize();

    // Storage layout
    std::string data_root;
    std::string output_root;
    std::string covers_root;
    std::string queue_root;
    std::string log_dir;
    std::string cookies_file;

    // External tools. Hints may be a file or a directory holding the tool.
    std::string ffmpeg_path;
    std::string ytdlp_path;

    // Pipeline
    int workers;
    int min_free_mb;
    int playlist_limit;
    int retry_backoff_ms;
    int cover_convert_timeout;   // seconds
    int socket_timeout;          // seconds, passed to yt-dlp
    std::string audio_format;
    std::string log_level;

    // Options shared by every extractor call
    ExtractorSettings createExtractorSettings() const;

    static std::string resolveExecutable(const std::string& hint, const std::string& name);

private:
    void loadDefaults();
    void setValue(const std::string& key, const std::string& value);
};
