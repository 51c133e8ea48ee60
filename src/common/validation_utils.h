#pragma once

#include <string>

class ValidationUtils {
public:
    // Replace characters that are illegal in file names with their full-width
    // look-alikes, cap the length at 200 characters, trim trailing dots and
    // whitespace. Empty input yields "unnamed".
    static std::string sanitizeFilename(const std::string& name);

    // Validate a user id before it becomes part of a directory path.
    // Accepts 1-64 characters of [A-Za-z0-9_-] after trimming.
    // Throws std::invalid_argument otherwise.
    static std::string sanitizeUserId(const std::string& user_id);

    // Media ids become cover file names, reject anything that could escape
    // the cover directory
    static bool isSafeMediaId(const std::string& id);

    // Trim leading/trailing whitespace
    static std::string trim(const std::string& value);

    // Trim, then cut to max_len characters and append " …" when longer
    static std::string shorten(const std::string& text, size_t max_len = 600);

private:
    static const size_t MAX_FILENAME_LENGTH = 200;
    static const size_t MAX_USER_ID_LENGTH = 64;
};
