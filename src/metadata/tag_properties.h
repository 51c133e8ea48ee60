#pragma once

#include "../common/types.h"

#include <taglib/tpropertymap.h>

// Generic property-map tagging shared by the ID3v2, Opus and FLAC containers
namespace TagProperties {

    // TITLE ARTIST ALBUM DATE, DESCRIPTION = source URL, COMMENT = description.
    // Album and date are left as found when the entry has none.
    TagLib::PropertyMap build(const TagLib::PropertyMap& current, const MediaEntry& entry);

    // When the container refused COMMENT, move the description to SYNOPSIS.
    // Returns true when the map changed and must be applied again.
    bool moveRejectedComment(TagLib::PropertyMap& properties, const TagLib::PropertyMap& rejected,
                             const MediaEntry& entry);

} // namespace TagProperties
