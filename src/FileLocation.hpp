#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

// Restart point inside a JSONL resource: bytes and lines fully consumed so far.
struct FileLocation {
    uint64_t byteOffset = 0;
    uint64_t line = 0;

    bool operator==(const FileLocation& other) const {
        return byteOffset == other.byteOffset && line == other.line;
    }
    bool operator!=(const FileLocation& other) const { return !(*this == other); }
};

std::string toString(const FileLocation& location);

Json::Value toJson(const FileLocation& location);

// Throws std::invalid_argument if either field is missing or not a non-negative integer.
FileLocation fileLocationFromJson(const Json::Value& json);

// State file helpers used to carry a location between process runs.
void saveLocation(const std::string& path, const FileLocation& location);
std::optional<FileLocation> loadLocation(const std::string& path);
