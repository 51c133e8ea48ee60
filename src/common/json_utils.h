#pragma once

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace JsonUtils {
    // String value of a field. Missing, null or non-string values yield
    // an empty string.
    std::string getString(const json& object, const std::string& field_name);

    // Like getString, but returns fallback when the value is missing, null
    // or an empty string
    std::string getStringOr(const json& object, const std::string& field_name, const std::string& fallback);

    // Empty strings are stored as null, everything else as a string
    json nullableString(const std::string& value);

    // Parse yt-dlp output. Returns a null json on parse failure and stores
    // the parser message in error.
    json parse(const std::string& text, std::string& error);
}
