#pragma once

#include "../common/types.h"
#include "../common/json_utils.h"
#include <stdexcept>
#include <string>
#include <vector>
#include <mutex>

// Storage failure of the pending-URL queue. Always propagated to the caller.
class QueueStoreError : public std::runtime_error {
public:
    explicit QueueStoreError(const std::string& message) : std::runtime_error(message) {}
};

inline void to_json(json& j, const QueueItem& q) {
    j = json{
        {"url", q.url},
        {"position", q.position}
    };
}

inline void from_json(const json& j, QueueItem& q) {
    j.at("url").get_to(q.url);
    if (j.contains("position")) j.at("position").get_to(q.position);
}

// Ordered per-user list of pending URLs
class QueueStore {
public:
    virtual ~QueueStore() {}

    // URLs ordered by position
    virtual std::vector<std::string> load(const std::string& user_id) = 0;

    // Rewrite the queue with positions 0..n-1. An empty list clears it.
    virtual void replace(const std::string& user_id, const std::vector<std::string>& urls) = 0;

    // Append new URLs after the current maximum position. Candidates are
    // trimmed; empty, over-long and already queued URLs are skipped.
    // Returns the number of URLs added.
    virtual int append(const std::string& user_id, const std::vector<std::string>& urls) = 0;
};

// One JSON document per user: <root>/<user>.json
class JsonQueueStore : public QueueStore {
public:
    explicit JsonQueueStore(const std::string& root_dir);

    std::vector<std::string> load(const std::string& user_id) override;
    void replace(const std::string& user_id, const std::vector<std::string>& urls) override;
    int append(const std::string& user_id, const std::vector<std::string>& urls) override;

    std::string queuePath(const std::string& user_id) const;

private:
    std::string root_dir_;
    std::mutex mutex_;  // Serializes read-modify-write within this process

    std::vector<QueueItem> readItems(const std::string& user_id) const;
    void writeItems(const std::string& user_id, const std::vector<QueueItem>& items) const;
};

// Insertion filter shared by QueueStore implementations.
// Returns the candidates that should be appended, in order.
std::vector<std::string> filterNewQueueUrls(const std::vector<std::string>& existing,
                                            const std::vector<std::string>& candidates);
