#include "tag_writer.h"
#include "tag_properties.h"
#include "../common/logger.h"
#include "../common/path_utils.h"

#include <taglib/flacfile.h>
#include <taglib/mp4file.h>
#include <taglib/mp4tag.h>
#include <taglib/mpegfile.h>
#include <taglib/opusfile.h>
#include <taglib/tstring.h>
#include <taglib/tstringlist.h>

namespace {

TagLib::String utf8(const std::string& value) {
    return TagLib::String(value, TagLib::String::UTF8);
}

// Apply the map to any TagLib file type exposing properties()/setProperties()
template <typename FileType>
void writePropertyMap(const std::string& path, const MediaEntry& entry, const char* kind) {
    FileType file(path.c_str());
    if (!file.isValid()) {
        throw TaggingError(std::string("cannot read ") + kind + " file " + path);
    }

    TagLib::PropertyMap properties = TagProperties::build(file.properties(), entry);
    TagLib::PropertyMap rejected = file.setProperties(properties);
    if (TagProperties::moveRejectedComment(properties, rejected, entry)) {
        file.setProperties(properties);
    }

    if (!file.save()) {
        throw TaggingError(std::string("cannot save ") + kind + " tags to " + path);
    }
}

} // namespace

void Mp4TagContainer::write(const std::string& path, const MediaEntry& entry) {
    TagLib::MP4::File file(path.c_str());
    if (!file.isValid() || !file.tag()) {
        throw TaggingError("cannot read mp4 file " + path);
    }

    TagLib::MP4::Tag* tag = file.tag();
    tag->setItem("\251nam", TagLib::StringList(utf8(entry.title)));
    tag->setItem("\251ART", TagLib::StringList(utf8(entry.uploader)));
    if (!entry.album.empty()) {
        tag->setItem("\251alb", TagLib::StringList(utf8(entry.album)));
    }
    if (!entry.upload_date.empty()) {
        tag->setItem("\251day", TagLib::StringList(utf8(entry.upload_date)));
    }
    tag->setItem("desc", TagLib::StringList(utf8(entry.url)));
    if (!entry.description.empty()) {
        tag->setItem("ldes", TagLib::StringList(utf8(entry.description)));
    }

    if (!file.save()) {
        throw TaggingError("cannot save mp4 tags to " + path);
    }
}

void Mp3TagContainer::write(const std::string& path, const MediaEntry& entry) {
    writePropertyMap<TagLib::MPEG::File>(path, entry, name());
}

void OpusTagContainer::write(const std::string& path, const MediaEntry& entry) {
    writePropertyMap<TagLib::Ogg::Opus::File>(path, entry, name());
}

void FlacTagContainer::write(const std::string& path, const MediaEntry& entry) {
    writePropertyMap<TagLib::FLAC::File>(path, entry, name());
}

std::unique_ptr<TagContainer> TagWriter::forPath(const std::string& path) {
    std::string ext = PathUtils::extensionLower(path);
    if (ext == ".mp3") return std::make_unique<Mp3TagContainer>();
    if (ext == ".m4a") return std::make_unique<Mp4TagContainer>();
    if (ext == ".opus") return std::make_unique<OpusTagContainer>();
    if (ext == ".flac") return std::make_unique<FlacTagContainer>();
    return nullptr;
}

bool TagWriter::writeTags(const std::string& path, const MediaEntry& entry) {
    std::unique_ptr<TagContainer> container = forPath(path);
    if (!container) {
        LOG_WARN("TagWriter", "Unsupported container, not tagging " << path);
        return false;
    }
    container->write(path, entry);
    LOG_DEBUG("TagWriter", "Wrote " << container->name() << " tags to " << path);
    return true;
}
