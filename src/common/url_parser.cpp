#include "url_parser.h"
#include <algorithm>
#include <sstream>
#include <cctype>

std::string UrlParser::ParsedUrl::getHostLower() const {
    return UrlParser::toLower(host);
}

bool UrlParser::ParsedUrl::hasQueryParam(const std::string& key) const {
    for (const auto& param : query_params) {
        if (param.first == key && !param.second.empty()) return true;
    }
    return false;
}

UrlParser::ParsedUrl UrlParser::parse(const std::string& url) {
    ParsedUrl result;
    result.full_url = url;

    std::string rest = url;

    // Fragment is never sent to the server, split it off first
    size_t hash_pos = rest.find('#');
    if (hash_pos != std::string::npos) {
        result.fragment = rest.substr(hash_pos + 1);
        rest = rest.substr(0, hash_pos);
    }

    size_t scheme_end = rest.find("://");
    size_t host_start = 0;
    if (scheme_end != std::string::npos) {
        result.scheme = rest.substr(0, scheme_end);
        host_start = scheme_end + 3;
    }

    size_t path_start = rest.find('/', host_start);
    size_t query_start = rest.find('?', host_start);

    // "host?query" without a path
    if (query_start != std::string::npos && (path_start == std::string::npos || query_start < path_start)) {
        path_start = std::string::npos;
    }

    if (path_start != std::string::npos) {
        result.host = rest.substr(host_start, path_start - host_start);
        if (query_start != std::string::npos) {
            result.path = rest.substr(path_start, query_start - path_start);
            result.query = rest.substr(query_start + 1);
        } else {
            result.path = rest.substr(path_start);
        }
    } else if (query_start != std::string::npos) {
        result.host = rest.substr(host_start, query_start - host_start);
        result.query = rest.substr(query_start + 1);
    } else {
        result.host = rest.substr(host_start);
    }

    if (!result.query.empty()) {
        parseQueryString(result.query, result.query_params);
    }

    return result;
}

std::string UrlParser::build(const ParsedUrl& parsed) {
    std::ostringstream oss;
    if (!parsed.scheme.empty()) {
        oss << parsed.scheme << "://";
    }
    oss << parsed.host << parsed.path;

    if (!parsed.query_params.empty()) {
        oss << "?";
        bool first = true;
        for (const auto& param : parsed.query_params) {
            if (!first) oss << "&";
            oss << param.first << "=" << param.second;
            first = false;
        }
    }
    if (!parsed.fragment.empty()) {
        oss << "#" << parsed.fragment;
    }
    return oss.str();
}

std::string UrlParser::removeQueryParams(const std::string& url, const std::vector<std::string>& keys) {
    ParsedUrl parsed = parse(url);
    if (parsed.query_params.empty()) {
        return url;
    }

    size_t before = parsed.query_params.size();
    parsed.query_params.erase(
        std::remove_if(parsed.query_params.begin(), parsed.query_params.end(),
            [&keys](const std::pair<std::string, std::string>& param) {
                return std::find(keys.begin(), keys.end(), param.first) != keys.end();
            }),
        parsed.query_params.end());

    if (parsed.query_params.size() == before) {
        return url;
    }
    return build(parsed);
}

void UrlParser::parseQueryString(const std::string& query, std::vector<std::pair<std::string, std::string>>& params) {
    std::istringstream stream(query);
    std::string pair;

    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        size_t equals_pos = pair.find('=');
        if (equals_pos != std::string::npos) {
            params.emplace_back(pair.substr(0, equals_pos), pair.substr(equals_pos + 1));
        } else {
            params.emplace_back(pair, "");
        }
    }
}

std::string UrlParser::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}
