#include "framework/SimpleTest.hpp"
#include "framework/TempDir.hpp"
#include "framework/FakeExtractor.hpp"
#include "common/logger.h"
#include "common/path_utils.h"
#include "download/download_executor.h"
#include <algorithm>
#include <string>
#include <vector>

using tunevault::test::FakeExtractor;
using tunevault::test::TempDir;

namespace {

MediaEntry songEntry() {
    MediaEntry entry;
    entry.id = "abc123";
    entry.title = "Song";
    entry.uploader = "Artist";
    entry.url = "https://www.youtube.com/watch?v=abc123";
    return entry;
}

struct ExecutorFixture {
    TempDir dir;
    FakeExtractor extractor;
    SongCache cache;
    CoverFetcher covers;
    ExecutorConfig config;
    std::vector<std::string> tagged;

    ExecutorFixture()
        : covers(extractor, dir.path(), "/nonexistent/bin/ffmpeg", 15) {
        Logger::setLevel(Logger::Level::Error);
        config.user_id = "42";
        config.output_dir = dir.path();
        config.retry_backoff_ms = 1;
    }

    DownloadExecutor executor() {
        return DownloadExecutor(extractor, covers, cache, config,
                                [this](const std::string& path, const MediaEntry&) {
                                    tagged.push_back(path);
                                    return true;
                                });
    }

    std::vector<std::string> files() const {
        std::vector<std::string> names;
        PathUtils::listFiles(dir.path(), names);
        std::sort(names.begin(), names.end());
        return names;
    }
};

} // namespace

TEST_CASE(test_every_prefixed_file_is_renamed_and_tagged) {
    ExecutorFixture fx;
    fx.extractor.side_exts.push_back("webp");
    tunevault::test::writeFile(fx.dir.file("zzzzzzzz_Other # Band.opus"), "other");

    DownloadExecutor executor = fx.executor();
    EntryOutcome outcome = executor.process(songEntry());
    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.attempts, 1);

    std::vector<std::string> finals = outcome.final_files;
    std::sort(finals.begin(), finals.end());
    ASSERT_EQ(finals.size(), 2u);
    ASSERT_EQ(finals[0], std::string("Song # Artist.opus"));
    ASSERT_EQ(finals[1], std::string("Song # Artist.webp"));

    std::vector<std::string> tagged = fx.tagged;
    std::sort(tagged.begin(), tagged.end());
    ASSERT_EQ(tagged.size(), 2u);
    ASSERT_EQ(tagged[0], fx.dir.file("Song # Artist.opus"));
    ASSERT_EQ(tagged[1], fx.dir.file("Song # Artist.webp"));

    // Another download's temporary file stays untouched
    ASSERT_EQ(tunevault::test::readFile(fx.dir.file("zzzzzzzz_Other # Band.opus")), std::string("other"));
    ASSERT_TRUE(fx.cache.containsEntry(songEntry()));
}

TEST_CASE(test_failed_download_removes_its_leftovers) {
    ExecutorFixture fx;
    fx.extractor.side_exts.push_back("webp");
    fx.extractor.queueDownloadFailure(songEntry().url, "ERROR: [youtube] abc123: Video unavailable");
    tunevault::test::writeFile(fx.dir.file("zzzzzzzz_Other # Band.opus"), "other");

    DownloadExecutor executor = fx.executor();
    EntryOutcome outcome = executor.process(songEntry());
    ASSERT_FALSE(outcome.success);
    ASSERT_TRUE(fx.tagged.empty());

    std::vector<std::string> names = fx.files();
    ASSERT_EQ(names.size(), 1u);
    ASSERT_EQ(names[0], std::string("zzzzzzzz_Other # Band.opus"));
    ASSERT_EQ(fx.cache.size(), 0u);
}

TEST_CASE(test_blocked_retry_failure_removes_both_attempts_files) {
    ExecutorFixture fx;
    fx.extractor.side_exts.push_back("webp");
    fx.extractor.queueDownloadFailure(songEntry().url, "ERROR: HTTP Error 403: Forbidden");
    fx.extractor.queueDownloadFailure(songEntry().url, "ERROR: HTTP Error 403: Forbidden");

    DownloadExecutor executor = fx.executor();
    EntryOutcome outcome = executor.process(songEntry());
    ASSERT_FALSE(outcome.success);
    ASSERT_EQ(outcome.attempts, 2);
    ASSERT_TRUE(fx.files().empty());
}

int main() {
    return tunevault::test::TestRunner::instance().run_all();
}
