#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <variant>

class ResourceManager;

// One file part of a multipart request body.
struct UploadedPart {
    std::string filename;
    std::string content;
    std::string content_type;
};

struct UploadedSource {
    std::optional<UploadedPart> part;
    uint64_t max_bytes = 0;
};

struct RemoteSource {
    std::string url;
    uint64_t max_bytes = 0;
    ResourceManager* resources = nullptr;
    std::string downloaded; // scratch file, set by fetch()
};

struct InlineSource {
    std::string payload; // base64, optionally a data: URI
    uint64_t max_bytes = 0;
    ResourceManager* resources = nullptr;
    std::string decoded; // scratch file, set by fetch()
};

struct LocalPathSource {
    std::string path;
    uint64_t max_bytes = 0;
};

using AudioSource = std::variant<UploadedSource, RemoteSource, InlineSource, LocalPathSource>;

struct FetchedAudio {
    std::unique_ptr<std::istream> stream; // positioned at the start
    std::string name;
};

// Materializes the source as a readable stream plus a display name. Every
// variant enforces its byte ceiling before the caller sees the stream.
std::expected<FetchedAudio, Error> fetch(AudioSource& source);

// Releases whatever fetch() materialized. Safe to call more than once and
// after a failed fetch().
void cleanup(AudioSource& source);

// Seeks to the end to measure the stream, then restores the read position.
std::expected<uint64_t, Error> check_size(std::istream& in, uint64_t max_bytes);
