#include "framework/SimpleTest.hpp"
#include "framework/TempDir.hpp"
#include "settings/settings.h"
#include <cstdlib>
#include <string>

#include <sys/stat.h>

using tunevault::test::TempDir;

TEST_CASE(test_defaults) {
    Settings settings;
    ASSERT_EQ(settings.workers, 4);
    ASSERT_EQ(settings.min_free_mb, 100);
    ASSERT_EQ(settings.playlist_limit, 150);
    ASSERT_EQ(settings.retry_backoff_ms, 800);
    ASSERT_EQ(settings.cover_convert_timeout, 15);
    ASSERT_EQ(settings.audio_format, std::string("opus"));
}

TEST_CASE(test_load_parses_and_clamps) {
    TempDir dir;
    tunevault::test::writeFile(dir.file("tunevault.conf"),
        "# comment\n"
        "data_root = /srv/tunevault\n"
        "workers=99\n"
        "min_free_mb=abc\n"
        "log_level=debug\n");

    Settings settings;
    ASSERT_TRUE(settings.load(dir.file("tunevault.conf")));
    ASSERT_EQ(settings.data_root, std::string("/srv/tunevault"));
    ASSERT_EQ(settings.workers, 32);
    ASSERT_EQ(settings.min_free_mb, 100);
    ASSERT_EQ(settings.log_level, std::string("debug"));
}

TEST_CASE(test_missing_file_keeps_defaults) {
    Settings settings;
    ASSERT_FALSE(settings.load("/nonexistent/tunevault.conf"));
    ASSERT_EQ(settings.data_root, std::string("data"));
}

TEST_CASE(test_derived_paths_follow_data_root) {
    Settings settings;
    settings.data_root = "/srv/tv";
    settings.output_root = "/mnt/music";
    settings.finalize();
    ASSERT_EQ(settings.output_root, std::string("/mnt/music"));
    ASSERT_EQ(settings.covers_root, std::string("/srv/tv/covers"));
    ASSERT_EQ(settings.queue_root, std::string("/srv/tv/queue"));
    ASSERT_EQ(settings.log_dir, std::string("/srv/tv/logs"));
    ASSERT_EQ(settings.cookies_file, std::string("/srv/tv/cookies.txt"));
}

TEST_CASE(test_environment_overrides_file) {
    setenv("QUEUE_ROOT", "/env/queue", 1);
    Settings settings;
    settings.queue_root = "/file/queue";
    settings.applyEnvironment();
    unsetenv("QUEUE_ROOT");
    ASSERT_EQ(settings.queue_root, std::string("/env/queue"));
}

TEST_CASE(test_executable_hint_may_be_directory) {
    TempDir dir;
    std::string tool = dir.file("ffmpeg");
    tunevault::test::writeFile(tool, "#!/bin/sh\n");
    chmod(tool.c_str(), 0755);

    ASSERT_EQ(Settings::resolveExecutable(dir.path(), "ffmpeg"), tool);
    ASSERT_EQ(Settings::resolveExecutable(tool, "ffmpeg"), tool);
}

TEST_CASE(test_missing_executable_falls_back_to_name) {
    ASSERT_EQ(Settings::resolveExecutable("/nonexistent", "tunevault-no-such-tool"),
              std::string("tunevault-no-such-tool"));
}

TEST_CASE(test_extractor_settings_carry_cookie_path) {
    Settings settings;
    settings.cookies_file = "/srv/tv/cookies.txt";
    settings.socket_timeout = 12;
    ExtractorSettings extractor = settings.createExtractorSettings();
    ASSERT_EQ(extractor.cookies_file_path, std::string("/srv/tv/cookies.txt"));
    ASSERT_EQ(extractor.socket_timeout, 12);
}

int main() {
    return tunevault::test::TestRunner::instance().run_all();
}
