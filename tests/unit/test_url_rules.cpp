#include "framework/SimpleTest.hpp"
#include "common/playlist_detector.h"
#include "common/url_parser.h"
#include <string>

TEST_CASE(test_playlist_path_is_playlist) {
    ASSERT_TRUE(PlaylistDetector::isYouTubePlaylist("https://www.youtube.com/playlist?list=PL123"));
    ASSERT_TRUE(PlaylistDetector::isYouTubePlaylist("https://music.youtube.com/playlist?list=OLAK5uy"));
}

TEST_CASE(test_watch_with_list_only_is_playlist) {
    ASSERT_TRUE(PlaylistDetector::isYouTubePlaylist("https://www.youtube.com/watch?list=PL123"));
}

TEST_CASE(test_watch_with_video_and_list_is_single) {
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist("https://www.youtube.com/watch?v=abc&list=PL123"));
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist("https://www.youtube.com/watch?v=abc"));
}

TEST_CASE(test_short_links_are_single) {
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist("https://youtu.be/abc?list=PL123"));
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist("https://www.youtube.com/shorts/abc?list=PL123"));
}

TEST_CASE(test_other_hosts_are_single) {
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist("https://soundcloud.com/playlist?list=PL123"));
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist("not a url"));
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist(""));
}

TEST_CASE(test_overlong_url_is_never_playlist) {
    std::string url = "https://www.youtube.com/playlist?list=PL" + std::string(2100, 'x');
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist(url));
}

TEST_CASE(test_empty_list_value_does_not_count) {
    ASSERT_FALSE(PlaylistDetector::isYouTubePlaylist("https://www.youtube.com/watch?list="));
}

TEST_CASE(test_strip_playlist_context_keeps_other_params_in_order) {
    std::string stripped = PlaylistDetector::stripPlaylistContext(
        "https://www.youtube.com/watch?v=abc&list=PL1&t=42&index=3&start_radio=1");
    ASSERT_EQ(stripped, std::string("https://www.youtube.com/watch?v=abc&t=42"));
}

TEST_CASE(test_strip_without_playlist_params_is_identity) {
    std::string url = "https://youtu.be/abc?t=10";
    ASSERT_EQ(PlaylistDetector::stripPlaylistContext(url), url);
}

TEST_CASE(test_strip_truncates_overlong_urls) {
    std::string url = "https://www.youtube.com/watch?v=" + std::string(2500, 'a');
    ASSERT_EQ(PlaylistDetector::stripPlaylistContext(url).size(), static_cast<size_t>(2000));
}

TEST_CASE(test_parse_splits_components) {
    UrlParser::ParsedUrl parsed = UrlParser::parse("https://WWW.YouTube.com/watch?v=abc&t=1#frag");
    ASSERT_EQ(parsed.scheme, std::string("https"));
    ASSERT_EQ(parsed.getHostLower(), std::string("www.youtube.com"));
    ASSERT_EQ(parsed.path, std::string("/watch"));
    ASSERT_EQ(parsed.fragment, std::string("frag"));
    ASSERT_EQ(parsed.query_params.size(), 2u);
    ASSERT_TRUE(parsed.hasQueryParam("v"));
    ASSERT_FALSE(parsed.hasQueryParam("list"));
}

TEST_CASE(test_lowercase_leaves_utf8_bytes_alone) {
    std::string input = "NIGHTCORE \xE2\x80\x93 \xC3\x84rger";
    ASSERT_EQ(UrlParser::toLower(input), std::string("nightcore \xE2\x80\x93 \xC3\x84rger"));
}

int main() {
    return tunevault::test::TestRunner::instance().run_all();
}
