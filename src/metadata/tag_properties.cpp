#include "tag_properties.h"

#include <taglib/tstring.h>
#include <taglib/tstringlist.h>

namespace {

TagLib::StringList utf8(const std::string& value) {
    return TagLib::StringList(TagLib::String(value, TagLib::String::UTF8));
}

} // namespace

namespace TagProperties {

TagLib::PropertyMap build(const TagLib::PropertyMap& current, const MediaEntry& entry) {
    TagLib::PropertyMap properties = current;
    properties.replace("TITLE", utf8(entry.title));
    properties.replace("ARTIST", utf8(entry.uploader));
    if (!entry.album.empty()) {
        properties.replace("ALBUM", utf8(entry.album));
    }
    if (!entry.upload_date.empty()) {
        properties.replace("DATE", utf8(entry.upload_date));
    }
    properties.replace("DESCRIPTION", utf8(entry.url));
    if (!entry.description.empty()) {
        properties.replace("COMMENT", utf8(entry.description));
    }
    return properties;
}

bool moveRejectedComment(TagLib::PropertyMap& properties, const TagLib::PropertyMap& rejected,
                         const MediaEntry& entry) {
    if (entry.description.empty() || !rejected.contains("COMMENT")) {
        return false;
    }
    properties.erase("COMMENT");
    properties.replace("SYNOPSIS", utf8(entry.description));
    return true;
}

} // namespace TagProperties
