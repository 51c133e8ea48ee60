#include "queue_store.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/playlist_detector.h"
#include "../common/validation_utils.h"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

std::vector<std::string> filterNewQueueUrls(const std::vector<std::string>& existing,
                                            const std::vector<std::string>& candidates) {
    std::set<std::string> seen(existing.begin(), existing.end());
    std::vector<std::string> accepted;
    for (const auto& candidate : candidates) {
        std::string url = ValidationUtils::trim(candidate);
        if (url.empty() || url.size() > PlaylistDetector::MAX_URL_LENGTH) {
            continue;
        }
        if (!seen.insert(url).second) {
            continue;
        }
        accepted.push_back(url);
    }
    return accepted;
}

JsonQueueStore::JsonQueueStore(const std::string& root_dir)
    : root_dir_(root_dir) {
}

std::string JsonQueueStore::queuePath(const std::string& user_id) const {
    return PathUtils::joinPath(root_dir_, ValidationUtils::sanitizeUserId(user_id) + ".json");
}

std::vector<QueueItem> JsonQueueStore::readItems(const std::string& user_id) const {
    std::string path = queuePath(user_id);
    std::vector<QueueItem> items;

    std::ifstream file(path);
    if (!file.is_open()) {
        if (PathUtils::fileExists(path)) {
            throw QueueStoreError("Cannot open queue file " + path);
        }
        return items;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string error;
    json doc = JsonUtils::parse(buffer.str(), error);
    if (!error.empty()) {
        throw QueueStoreError("Corrupt queue file " + path + ": " + error);
    }
    if (!doc.is_object() || !doc.contains("items") || !doc["items"].is_array()) {
        throw QueueStoreError("Queue file " + path + " has no items array");
    }
    try {
        items = doc["items"].get<std::vector<QueueItem>>();
    } catch (const json::exception& e) {
        throw QueueStoreError("Invalid queue item in " + path + ": " + e.what());
    }

    std::stable_sort(items.begin(), items.end(), [](const QueueItem& a, const QueueItem& b) {
        return a.position < b.position;
    });
    return items;
}

void JsonQueueStore::writeItems(const std::string& user_id, const std::vector<QueueItem>& items) const {
    if (!PathUtils::createDirectories(root_dir_)) {
        throw QueueStoreError("Cannot create queue directory " + root_dir_);
    }
    std::string path = queuePath(user_id);
    std::string tmp_path = path + ".tmp";

    json doc;
    doc["items"] = items;
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw QueueStoreError("Cannot write queue file " + tmp_path);
        }
        file << doc.dump(2);
        file.close();
        if (file.fail()) {
            throw QueueStoreError("Failed writing queue file " + tmp_path);
        }
    }
    if (!PathUtils::renameFile(tmp_path, path)) {
        PathUtils::removeFile(tmp_path);
        throw QueueStoreError("Cannot replace queue file " + path);
    }
}

std::vector<std::string> JsonQueueStore::load(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> urls;
    for (const auto& item : readItems(user_id)) {
        urls.push_back(item.url);
    }
    return urls;
}

void JsonQueueStore::replace(const std::string& user_id, const std::vector<std::string>& urls) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueItem> items;
    items.reserve(urls.size());
    for (size_t i = 0; i < urls.size(); ++i) {
        items.push_back(QueueItem(urls[i], static_cast<int>(i)));
    }
    writeItems(user_id, items);
    LOG_DEBUG("QueueStore", "Replaced queue for " << user_id << " with " << items.size() << " item(s)");
}

int JsonQueueStore::append(const std::string& user_id, const std::vector<std::string>& urls) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<QueueItem> items = readItems(user_id);

    std::vector<std::string> existing;
    int next_position = 0;
    for (const auto& item : items) {
        existing.push_back(item.url);
        next_position = std::max(next_position, item.position + 1);
    }

    std::vector<std::string> accepted = filterNewQueueUrls(existing, urls);
    if (accepted.empty()) {
        return 0;
    }
    for (const auto& url : accepted) {
        items.push_back(QueueItem(url, next_position++));
    }
    writeItems(user_id, items);
    LOG_INFO("QueueStore", "Queued " << accepted.size() << " URL(s) for " << user_id);
    return static_cast<int>(accepted.size());
}
