#include "playlist_detector.h"
#include <vector>

const size_t PlaylistDetector::MAX_URL_LENGTH;

bool PlaylistDetector::isYouTubePlaylist(const std::string& url) {
    if (url.empty() || url.length() > MAX_URL_LENGTH) {
        return false;
    }

    UrlParser::ParsedUrl parsed = UrlParser::parse(url);
    std::string host = parsed.getHostLower();
    if (!isYouTubeHost(host)) {
        return false;
    }

    const std::string& path = parsed.path;
    if (startsWith(path, "/playlist")) {
        return true;
    }

    // youtu.be/<id> is always a single video, even with ?list=
    std::string trimmed_path = path;
    while (!trimmed_path.empty() && trimmed_path.front() == '/') trimmed_path.erase(0, 1);
    while (!trimmed_path.empty() && trimmed_path.back() == '/') trimmed_path.pop_back();
    if (host.size() >= 8 && host.compare(host.size() - 8, 8, "youtu.be") == 0 && !trimmed_path.empty()) {
        return false;
    }

    if (startsWith(path, "/shorts/")) {
        return false;
    }

    if (startsWith(path, "/watch") && parsed.hasQueryParam("list") && !parsed.hasQueryParam("v")) {
        return true;
    }

    return false;
}

std::string PlaylistDetector::stripPlaylistContext(const std::string& url) {
    if (url.empty()) {
        return "";
    }
    if (url.length() > MAX_URL_LENGTH) {
        return url.substr(0, MAX_URL_LENGTH);
    }
    static const std::vector<std::string> playlist_keys = {"list", "index", "start_radio"};
    return UrlParser::removeQueryParams(url, playlist_keys);
}

bool PlaylistDetector::isYouTubeHost(const std::string& host_lower) {
    return host_lower.find("youtube.com") != std::string::npos ||
           host_lower.find("youtu.be") != std::string::npos;
}

bool PlaylistDetector::startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}
