#pragma once
#include <memory>
#include <string_view>
#include <json/json.h>

// Parses one JSONL line into a Json::Value. Comments and trailing content are rejected.
class RecordDecoder {
public:
    RecordDecoder();

    // Throws DecodeError when the line is not exactly one JSON value.
    Json::Value decode(std::string_view line) const;

private:
    std::unique_ptr<Json::CharReader> reader_;
};
