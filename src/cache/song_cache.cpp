#include "song_cache.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/validation_utils.h"
#include <fstream>
#include <sstream>

const char* const JsonSongCacheStore::FILE_NAME = "song-list.json";

JsonSongCacheStore::JsonSongCacheStore(const std::string& output_root)
    : output_root_(output_root) {
}

std::string JsonSongCacheStore::cachePath(const std::string& user_id) const {
    std::string user_dir = PathUtils::joinPath(output_root_, ValidationUtils::sanitizeUserId(user_id));
    return PathUtils::joinPath(user_dir, FILE_NAME);
}

std::vector<SongCacheRecord> JsonSongCacheStore::load(const std::string& user_id) {
    std::string path = cachePath(user_id);
    std::vector<SongCacheRecord> records;

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_DEBUG("SongCache", "No cache at " << path << ", starting empty");
        return records;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string error;
    json doc = JsonUtils::parse(buffer.str(), error);
    if (!error.empty()) {
        throw SongCacheError("Corrupt song cache " + path + ": " + error);
    }
    if (!doc.is_array()) {
        throw SongCacheError("Song cache " + path + " is not a JSON array");
    }

    for (const auto& element : doc) {
        if (!element.is_object()) {
            LOG_WARN("SongCache", "Skipping malformed record in " << path);
            continue;
        }
        records.push_back(element.get<SongCacheRecord>());
    }
    LOG_DEBUG("SongCache", "Loaded " << records.size() << " record(s) from " << path);
    return records;
}

void JsonSongCacheStore::save(const std::string& user_id, const std::vector<SongCacheRecord>& records) {
    std::string path = cachePath(user_id);
    std::string dir = path.substr(0, path.find_last_of('/'));
    if (!PathUtils::createDirectories(dir)) {
        throw SongCacheError("Cannot create directory " + dir);
    }

    json doc = records;
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw SongCacheError("Cannot write song cache " + tmp_path);
        }
        file << doc.dump(4);
        file.close();
        if (file.fail()) {
            throw SongCacheError("Failed writing song cache " + tmp_path);
        }
    }
    if (!PathUtils::renameFile(tmp_path, path)) {
        PathUtils::removeFile(tmp_path);
        throw SongCacheError("Cannot replace song cache " + path);
    }
    LOG_DEBUG("SongCache", "Saved " << records.size() << " record(s) to " << path);
}

SongCache::SongCache(const std::vector<SongCacheRecord>& records) {
    for (const auto& record : records) {
        records_[record.key()] = record;
    }
}

void SongCache::insert(const SongCacheRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.key()] = record;
}

bool SongCache::containsKey(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.find(key) != records_.end();
}

bool SongCache::containsEntry(const MediaEntry& entry) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!entry.id.empty() && records_.find(entry.id) != records_.end()) {
        return true;
    }
    return records_.find(entry.titleArtistKey()) != records_.end();
}

size_t SongCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::vector<SongCacheRecord> SongCache::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SongCacheRecord> result;
    result.reserve(records_.size());
    for (const auto& pair : records_) {
        result.push_back(pair.second);
    }
    return result;
}
