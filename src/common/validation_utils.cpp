#include "validation_utils.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

const size_t ValidationUtils::MAX_FILENAME_LENGTH;
const size_t ValidationUtils::MAX_USER_ID_LENGTH;

namespace {

// Full-width replacements, UTF-8 encoded
const char* fullWidthFor(char c) {
    switch (c) {
        case '/':  return "\xEF\xBC\x8F";  // U+FF0F
        case '\\': return "\xEF\xBC\xBC";  // U+FF3C
        case ':':  return "\xEF\xBC\x9A";  // U+FF1A
        case '*':  return "\xEF\xBC\x8A";  // U+FF0A
        case '?':  return "\xEF\xBC\x9F";  // U+FF1F
        case '"':  return "\xEF\xBC\x82";  // U+FF02
        case '<':  return "\xEF\xBC\x9C";  // U+FF1C
        case '>':  return "\xEF\xBC\x9E";  // U+FF1E
        case '|':  return "\xEF\xBD\x9C";  // U+FF5C
        default:   return nullptr;
    }
}

// Byte offset just past the first max_chars UTF-8 code points
size_t utf8Prefix(const std::string& str, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if ((c & 0xC0) != 0x80) {
            if (chars == max_chars) {
                return i;
            }
            ++chars;
        }
    }
    return str.size();
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string ValidationUtils::sanitizeFilename(const std::string& name) {
    if (name.empty()) {
        return "unnamed";
    }

    std::string truncated = name.substr(0, utf8Prefix(name, MAX_FILENAME_LENGTH));

    std::string safe_name;
    safe_name.reserve(truncated.size() + 16);
    for (char c : truncated) {
        const char* replacement = fullWidthFor(c);
        if (replacement) {
            safe_name += replacement;
        } else {
            safe_name += c;
        }
    }

    safe_name = trim(safe_name);
    while (!safe_name.empty() && safe_name.back() == '.') {
        safe_name.pop_back();
    }
    return safe_name;
}

std::string ValidationUtils::sanitizeUserId(const std::string& user_id) {
    std::string trimmed = trim(user_id);
    if (trimmed.empty()) {
        throw std::invalid_argument("Invalid user ID: empty");
    }
    if (trimmed.length() > MAX_USER_ID_LENGTH) {
        throw std::invalid_argument("Invalid user ID: too long");
    }
    bool valid = std::all_of(trimmed.begin(), trimmed.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
    if (!valid) {
        throw std::invalid_argument("Invalid user ID: contains invalid characters");
    }
    return trimmed;
}

bool ValidationUtils::isSafeMediaId(const std::string& id) {
    if (id.empty()) {
        return false;
    }
    return id.find('/') == std::string::npos &&
           id.find('\\') == std::string::npos &&
           id.find("..") == std::string::npos;
}

std::string ValidationUtils::trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && isSpace(value[start])) {
        ++start;
    }
    size_t end = value.size();
    while (end > start && isSpace(value[end - 1])) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string ValidationUtils::shorten(const std::string& text, size_t max_len) {
    std::string trimmed = trim(text);
    size_t cut = utf8Prefix(trimmed, max_len);
    if (cut == trimmed.size()) {
        return trimmed;
    }
    return trimmed.substr(0, cut) + " \xE2\x80\xA6";
}
