#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>
#include "Backoff.hpp"
#include "FileLocation.hpp"

enum class Compression {
    Auto,  // sniff the gzip magic bytes at the start of the resource
    Gzip,
    None,
};

Compression compressionFromString(const std::string& name);
const char* toString(Compression compression);

struct StreamConfig {
    std::string url;
    std::optional<FileLocation> startingLocation;
    int64_t initialDelayMs = 1000;
    int64_t maxRetryTimeMs = 3600000;
    int64_t maxDelayMs = 30000;
    Compression compression = Compression::Auto;
    // Bytes requested per ranged GET
    uint64_t chunkSize = 1024 * 1024;
    double requestTimeoutSec = 60.0;

    // Throws std::invalid_argument describing the first invalid field.
    void validate() const;

    BackoffPolicy backoffPolicy() const;

    // Overrides the fields present in a config object (the url is left alone unless given).
    void applyJson(const Json::Value& json);
};
