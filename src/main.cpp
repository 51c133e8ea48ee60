#include "common/logger.h"
#include "common/path_utils.h"
#include "common/validation_utils.h"
#include "cache/song_cache.h"
#include "download/download_manager.h"
#include "extractor/ytdlp_extractor.h"
#include "queue/queue_store.h"
#include "settings/settings.h"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [-c config] [-u user] [-w workers] [--no-run] <url|file.txt>...\n"
              << "  -c, --config FILE   settings file (default: tunevault.conf)\n"
              << "  -u, --user ID       user id, also the folder name (default: local)\n"
              << "  -w, --workers N     parallel threads (default: from settings)\n"
              << "      --no-run        only add URLs to the queue\n";
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Lines of a URL list file, blank lines skipped
bool readUrlFile(const std::string& path, std::vector<std::string>& urls) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::string line;
    while (std::getline(file, line)) {
        line = ValidationUtils::trim(line);
        if (!line.empty()) {
            urls.push_back(line);
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "tunevault.conf";
    std::string user_id = "local";
    int workers = 0;
    bool run_after_queue = true;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-u" || arg == "--user") && i + 1 < argc) {
            user_id = argv[++i];
        } else if ((arg == "-w" || arg == "--workers") && i + 1 < argc) {
            try {
                workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid worker count: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--no-run") {
            run_after_queue = false;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            inputs.push_back(arg);
        }
    }

    Settings settings;
    settings.load(config_path);
    settings.applyEnvironment();
    settings.finalize();

    Logger::setLevel(Logger::levelFromString(settings.log_level));
    if (PathUtils::createDirectories(settings.log_dir)) {
        std::string log_path = PathUtils::joinPath(settings.log_dir, "tunevault.log");
        if (!Logger::setLogFile(log_path)) {
            LOG_WARN("Main", "Cannot open log file " << log_path);
        }
    } else {
        LOG_WARN("Main", "Cannot create log directory " << settings.log_dir);
    }
    if (workers <= 0) {
        workers = settings.workers;
    }

    std::vector<std::string> urls;
    for (const auto& input : inputs) {
        if (endsWith(input, ".txt")) {
            if (!readUrlFile(input, urls)) {
                LOG_ERROR("Main", "Cannot read " << input);
            }
        } else {
            urls.push_back(input);
        }
    }
    if (urls.empty()) {
        LOG_ERROR("Main", "No valid URLs provided.");
        printUsage(argv[0]);
        return 1;
    }

    LOG_DEBUG("Main", "yt-dlp: " << settings.ytdlp_path << ", ffmpeg: " << settings.ffmpeg_path);
    YtDlpExtractor extractor(settings.ytdlp_path, settings.createExtractorSettings());
    JsonQueueStore queue_store(settings.queue_root);
    JsonSongCacheStore cache_store(settings.output_root);

    try {
        DownloadManager manager(user_id, settings, queue_store, cache_store, extractor);
        manager.addUrls(urls);
        if (!run_after_queue) {
            return 0;
        }
        RunResult result = manager.run(workers);
        json output = result;
        std::cout << output.dump(2) << std::endl;
    } catch (const QueueStoreError& e) {
        LOG_ERROR("Main", "Queue storage failed: " << e.what());
        return 2;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Main", "Invalid user ID: " << e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Main", e.what());
        return 1;
    }
    return 0;
}
