#ifndef PLAYLIST_DETECTOR_H
#define PLAYLIST_DETECTOR_H

#include <string>
#include "url_parser.h"

class PlaylistDetector {
public:
    // URLs longer than this are never treated as playlists and get truncated
    // before resolution
    static const size_t MAX_URL_LENGTH = 2000;

    // True for YouTube URLs that name a playlist rather than a single video:
    //   /playlist...                 -> playlist
    //   youtu.be/<id>                -> single
    //   /shorts/<id>                 -> single
    //   /watch?list=... without v=   -> playlist
    // Everything else is a single item.
    static bool isYouTubePlaylist(const std::string& url);

    // Remove playlist context (list, index, start_radio) from a single-item URL
    static std::string stripPlaylistContext(const std::string& url);

private:
    static bool isYouTubeHost(const std::string& host_lower);
    static bool startsWith(const std::string& value, const std::string& prefix);
};

#endif // PLAYLIST_DETECTOR_H
