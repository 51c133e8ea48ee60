#include "framework/SimpleTest.hpp"
#include "framework/TempDir.hpp"
#include "framework/FakeExtractor.hpp"
#include "common/logger.h"
#include "common/path_utils.h"
#include "download/download_manager.h"
#include <string>
#include <vector>

using tunevault::test::FakeExtractor;
using tunevault::test::TempDir;

namespace {

const char* const VIDEO_URL = "https://www.youtube.com/watch?v=abc123";

json videoInfo(const std::string& id, const std::string& title) {
    return json{
        {"id", id},
        {"title", title},
        {"uploader", "Artist"},
        {"webpage_url", "https://www.youtube.com/watch?v=" + id},
        {"upload_date", "20240131"}
    };
}

// Everything a run needs, rooted in one scratch directory
struct Fixture {
    TempDir dir;
    Settings settings;
    FakeExtractor extractor;
    JsonQueueStore queue;
    JsonSongCacheStore cache;

    Fixture()
        : queue(dir.path() + "/queue")
        , cache(dir.path() + "/downloads") {
        Logger::setLevel(Logger::Level::Error);
        settings.data_root = dir.path();
        settings.ffmpeg_path = "/nonexistent/bin/ffmpeg";
        settings.retry_backoff_ms = 10;
        settings.finalize();
    }

    DownloadManager manager() {
        return DownloadManager("42", settings, queue, cache, extractor);
    }
};

} // namespace

TEST_CASE(test_scenario_a_single_video) {
    Fixture fx;
    fx.extractor.setInfo(VIDEO_URL, videoInfo("abc123", "Song"));
    DownloadManager manager = fx.manager();
    manager.addUrls({VIDEO_URL});

    RunResult result = manager.run(4);
    ASSERT_EQ(result.downloaded, 1);
    ASSERT_EQ(result.duplicates, 0);
    ASSERT_EQ(result.errors, 0);
    ASSERT_TRUE(result.failed.empty());

    // Temporary prefix is gone, cover and cache record are in place
    ASSERT_TRUE(PathUtils::fileExists(manager.outputDir() + "/Song # Artist.opus"));
    ASSERT_TRUE(PathUtils::fileExists(manager.coverDir() + "/abc123.jpg"));
    std::vector<SongCacheRecord> records = fx.cache.load("42");
    ASSERT_EQ(records.size(), 1u);
    ASSERT_EQ(records[0].id, std::string("abc123"));
    ASSERT_EQ(records[0].date, std::string("2024-01-31"));
    ASSERT_EQ(records[0].cover, std::string("abc123.jpg"));
    ASSERT_TRUE(fx.queue.load("42").empty());
}

TEST_CASE(test_scenario_b_second_run_is_duplicate) {
    Fixture fx;
    fx.extractor.setInfo(VIDEO_URL, videoInfo("abc123", "Song"));
    DownloadManager manager = fx.manager();

    manager.addUrls({VIDEO_URL});
    manager.run(4);
    manager.addUrls({VIDEO_URL});
    RunResult second = manager.run(4);

    ASSERT_EQ(second.downloaded, 0);
    ASSERT_EQ(second.duplicates, 1);
    ASSERT_EQ(second.errors, 0);
    ASSERT_EQ(fx.extractor.downloadCalls().size(), 1u);
    ASSERT_TRUE(fx.queue.load("42").empty());
}

TEST_CASE(test_scenario_c_forbidden_then_success) {
    Fixture fx;
    fx.extractor.setInfo(VIDEO_URL, videoInfo("abc123", "Song"));
    fx.extractor.queueDownloadFailure("https://www.youtube.com/watch?v=abc123",
                                      "ERROR: unable to download video data: HTTP Error 403: Forbidden");
    DownloadManager manager = fx.manager();
    manager.addUrls({VIDEO_URL});

    RunResult result = manager.run(4);
    ASSERT_EQ(result.downloaded, 1);
    ASSERT_EQ(result.errors, 0);
    ASSERT_TRUE(result.failed.empty());

    std::vector<FakeExtractor::DownloadCall> calls = fx.extractor.downloadCalls();
    ASSERT_EQ(calls.size(), 2u);
    ASSERT_FALSE(calls[0].alternate_client);
    ASSERT_TRUE(calls[1].alternate_client);
    ASSERT_EQ(calls[0].output_template, calls[1].output_template);
}

TEST_CASE(test_scenario_d_unrelated_failure_is_terminal) {
    Fixture fx;
    fx.extractor.setInfo(VIDEO_URL, videoInfo("abc123", "Song"));
    fx.extractor.queueDownloadFailure("https://www.youtube.com/watch?v=abc123",
                                      "ERROR: [youtube] abc123: Video unavailable");
    DownloadManager manager = fx.manager();
    manager.addUrls({VIDEO_URL});

    RunResult result = manager.run(4);
    ASSERT_EQ(result.downloaded, 0);
    ASSERT_EQ(result.errors, 1);
    ASSERT_EQ(result.failed.size(), 1u);
    ASSERT_EQ(result.failed[0].attempts, 1);
    ASSERT_EQ(result.failed[0].title, std::string("Song"));
    ASSERT_EQ(result.failed[0].reason, std::string("yt-dlp exit: ERROR: [youtube] abc123: Video unavailable"));
    ASSERT_EQ(fx.extractor.downloadCalls().size(), 1u);
    ASSERT_TRUE(fx.cache.load("42").empty());
}

TEST_CASE(test_failed_download_can_be_retried_next_run) {
    Fixture fx;
    fx.extractor.side_exts.push_back("webp");
    fx.extractor.setInfo(VIDEO_URL, videoInfo("abc123", "Song"));
    fx.extractor.queueDownloadFailure("https://www.youtube.com/watch?v=abc123",
                                      "ERROR: [youtube] abc123: Video unavailable");
    DownloadManager manager = fx.manager();

    manager.addUrls({VIDEO_URL});
    RunResult first = manager.run(4);
    ASSERT_EQ(first.errors, 1);
    std::vector<std::string> names;
    ASSERT_TRUE(PathUtils::listFiles(manager.outputDir(), names));
    for (const auto& name : names) {
        ASSERT_TRUE(name.find("Song # Artist") == std::string::npos);
    }

    manager.addUrls({VIDEO_URL});
    RunResult second = manager.run(4);
    ASSERT_EQ(second.downloaded, 1);
    ASSERT_EQ(second.duplicates, 0);
    ASSERT_EQ(second.errors, 0);
    ASSERT_TRUE(PathUtils::fileExists(manager.outputDir() + "/Song # Artist.opus"));
}

TEST_CASE(test_blocked_twice_records_two_attempts) {
    Fixture fx;
    fx.extractor.setInfo(VIDEO_URL, videoInfo("abc123", "Song"));
    std::string target = "https://www.youtube.com/watch?v=abc123";
    fx.extractor.queueDownloadFailure(target, "ERROR: HTTP Error 429: Too Many Requests");
    fx.extractor.queueDownloadFailure(target, "ERROR: HTTP Error 429: Too Many Requests");
    DownloadManager manager = fx.manager();
    manager.addUrls({VIDEO_URL});

    RunResult result = manager.run(4);
    ASSERT_EQ(result.errors, 1);
    ASSERT_EQ(result.failed[0].attempts, 2);
    ASSERT_EQ(fx.extractor.downloadCalls().size(), 2u);
}

TEST_CASE(test_scenario_e_insufficient_disk_space) {
    Fixture fx;
    fx.settings.min_free_mb = 2000000000;
    fx.extractor.setInfo(VIDEO_URL, videoInfo("abc123", "Song"));
    DownloadManager manager = fx.manager();
    manager.addUrls({VIDEO_URL});

    RunResult result = manager.run(4);
    ASSERT_EQ(result.downloaded, 0);
    ASSERT_EQ(result.errors, 1);
    ASSERT_EQ(result.failed.size(), 1u);
    ASSERT_EQ(result.failed[0].reason, std::string("Insufficient disk space"));
    ASSERT_EQ(result.failed[0].attempts, 0);
    ASSERT_EQ(result.failed[0].url, std::string(UNKNOWN_FIELD));
    ASSERT_EQ(fx.extractor.totalCalls(), 0u);
    ASSERT_TRUE(fx.queue.load("42").empty());
}

TEST_CASE(test_empty_queue_returns_zeros) {
    Fixture fx;
    DownloadManager manager = fx.manager();
    RunResult result = manager.run(4);
    ASSERT_EQ(result.downloaded, 0);
    ASSERT_EQ(result.duplicates, 0);
    ASSERT_EQ(result.errors, 0);
    ASSERT_EQ(fx.extractor.totalCalls(), 0u);
}

TEST_CASE(test_playlist_and_metadata_failures) {
    Fixture fx;
    std::string playlist = "https://www.youtube.com/playlist?list=PL1";
    std::string broken = "https://example.com/broken";
    fx.extractor.setInfo(playlist, json{
        {"id", "PL1"},
        {"title", "Mix"},
        {"entries", json::array({
            json{{"id", "a1"}, {"title", "One"}, {"uploader", "Artist"}, {"url", "https://www.youtube.com/watch?v=a1"}},
            nullptr,
            json{{"id", "b2"}, {"title", "Two"}, {"uploader", "Artist"}, {"url", "https://www.youtube.com/watch?v=b2"}}
        })}
    });
    fx.extractor.setInfoError(broken, "ERROR: Unsupported URL");
    fx.extractor.queueDownloadFailure("https://www.youtube.com/watch?v=b2", "ERROR: Private video");

    DownloadManager manager = fx.manager();
    manager.addUrls({broken, playlist});
    RunResult result = manager.run(2);

    ASSERT_EQ(result.downloaded, 1);
    ASSERT_EQ(result.errors, 2);
    ASSERT_EQ(result.failed.size(), 2u);
    // Metadata failures come first
    ASSERT_EQ(result.failed[0].url, broken);
    ASSERT_EQ(result.failed[0].attempts, 0);
    ASSERT_EQ(result.failed[0].reason, std::string("ERROR: Unsupported URL"));
    ASSERT_EQ(result.failed[1].title, std::string("Two"));
    ASSERT_TRUE(fx.queue.load("42").empty());
}

TEST_CASE(test_only_metadata_failures_clear_queue) {
    Fixture fx;
    fx.extractor.setInfoError("https://example.com/broken", "ERROR: Unsupported URL");
    DownloadManager manager = fx.manager();
    manager.addUrls({"https://example.com/broken"});

    RunResult result = manager.run(4);
    ASSERT_EQ(result.downloaded, 0);
    ASSERT_EQ(result.errors, 1);
    ASSERT_EQ(result.failed[0].title, std::string(UNKNOWN_FIELD));
    ASSERT_TRUE(fx.extractor.downloadCalls().empty());
    ASSERT_TRUE(fx.queue.load("42").empty());
}

TEST_CASE(test_invalid_user_is_rejected) {
    Fixture fx;
    ASSERT_THROWS(DownloadManager("../x", fx.settings, fx.queue, fx.cache, fx.extractor), std::invalid_argument);
}

TEST_CASE(test_result_serializes_to_json) {
    RunResult result;
    result.downloaded = 1;
    result.errors = 1;
    result.failed.push_back(FailedEntry("T", "A", "U", "R", 2));
    json doc = result;
    ASSERT_EQ(doc["downloaded"].get<int>(), 1);
    ASSERT_EQ(doc["failed"][0]["artist"].get<std::string>(), std::string("A"));
    ASSERT_EQ(doc["failed"][0]["attempts"].get<int>(), 2);
}

int main() {
    return tunevault::test::TestRunner::instance().run_all();
}
