#include "json_utils.h"

namespace JsonUtils {

std::string getString(const json& object, const std::string& field_name) {
    if (!object.is_object()) return "";
    auto it = object.find(field_name);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string getStringOr(const json& object, const std::string& field_name, const std::string& fallback) {
    std::string value = getString(object, field_name);
    return value.empty() ? fallback : value;
}

json nullableString(const std::string& value) {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

json parse(const std::string& text, std::string& error) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        error = e.what();
        return json();
    }
}

} // namespace JsonUtils
