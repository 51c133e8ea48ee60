#ifndef URL_PARSER_H
#define URL_PARSER_H

#include <string>
#include <vector>
#include <utility>

class UrlParser {
public:
    struct ParsedUrl {
        std::string full_url;
        std::string scheme;
        std::string host;
        std::string path;
        std::string query;
        std::string fragment;
        // Kept in original order so a URL can be rebuilt without reshuffling
        std::vector<std::pair<std::string, std::string>> query_params;

        std::string getHostLower() const;
        // Blank values ("list=") do not count as present
        bool hasQueryParam(const std::string& key) const;
    };

    // Parse full URL into components
    static ParsedUrl parse(const std::string& url);

    // Reassemble scheme://host/path?query#fragment from query_params
    static std::string build(const ParsedUrl& parsed);

    // Drop every occurrence of the given query keys, keeping the rest in order
    static std::string removeQueryParams(const std::string& url, const std::vector<std::string>& keys);

    static std::string toLower(const std::string& str);

private:
    static void parseQueryString(const std::string& query, std::vector<std::pair<std::string, std::string>>& params);
};

#endif // URL_PARSER_H
