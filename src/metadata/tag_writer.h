#pragma once

#include "../common/types.h"
#include <memory>
#include <stdexcept>
#include <string>

// A file could not be opened or saved by the tag library
class TaggingError : public std::runtime_error {
public:
    explicit TaggingError(const std::string& message) : std::runtime_error(message) {}
};

// Writes MediaEntry fields into one kind of audio container
class TagContainer {
public:
    virtual ~TagContainer() {}

    // Throws TaggingError when the file cannot be read or written
    virtual void write(const std::string& path, const MediaEntry& entry) = 0;

    virtual const char* name() const = 0;
};

// MP4 atoms: ©nam ©ART ©alb ©day, desc = source URL, ldes = description
class Mp4TagContainer : public TagContainer {
public:
    void write(const std::string& path, const MediaEntry& entry) override;
    const char* name() const override { return "mp4"; }
};

// ID3v2, Ogg Opus and FLAC share the generic property map:
// TITLE ARTIST ALBUM DATE, DESCRIPTION = source URL, COMMENT = description
// (SYNOPSIS when the container refuses COMMENT)
class Mp3TagContainer : public TagContainer {
public:
    void write(const std::string& path, const MediaEntry& entry) override;
    const char* name() const override { return "id3v2"; }
};

class OpusTagContainer : public TagContainer {
public:
    void write(const std::string& path, const MediaEntry& entry) override;
    const char* name() const override { return "opus"; }
};

class FlacTagContainer : public TagContainer {
public:
    void write(const std::string& path, const MediaEntry& entry) override;
    const char* name() const override { return "flac"; }
};

class TagWriter {
public:
    // Container for a file extension (".mp3", ".m4a", ".opus", ".flac",
    // case-insensitive). Null for anything else.
    static std::unique_ptr<TagContainer> forPath(const std::string& path);

    // Tag one file. Returns false when the extension is not supported.
    // Throws TaggingError when the file is unreadable.
    static bool writeTags(const std::string& path, const MediaEntry& entry);
};
