#include "FileLocation.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

std::string toString(const FileLocation& location) {
    return "byte " + std::to_string(location.byteOffset) + ", line " + std::to_string(location.line);
}

Json::Value toJson(const FileLocation& location) {
    Json::Value json(Json::objectValue);
    json["byteOffset"] = (Json::UInt64)location.byteOffset;
    json["line"] = (Json::UInt64)location.line;
    return json;
}

FileLocation fileLocationFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::invalid_argument("location must be a JSON object");
    }
    for (const char* key : {"byteOffset", "line"}) {
        const Json::Value& field = json[key];
        if (!field.isIntegral() || (field.isInt64() && field.asInt64() < 0)) {
            throw std::invalid_argument(std::string("location field '") + key + "' must be a non-negative integer");
        }
    }
    FileLocation location;
    location.byteOffset = json["byteOffset"].asUInt64();
    location.line = json["line"].asUInt64();
    return location;
}

void saveLocation(const std::string& path, const FileLocation& location) {
    // Replaced atomically through a rename
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream ofs(tmpPath, std::ios::trunc);
        if (!ofs) {
            throw std::runtime_error("Cannot open state file for writing: " + tmpPath);
        }
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        ofs << Json::writeString(writer, toJson(location)) << std::endl;
        if (!ofs) {
            throw std::runtime_error("Failed to write state file: " + tmpPath);
        }
    }
    std::filesystem::rename(tmpPath, path);
}

std::optional<FileLocation> loadLocation(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return std::nullopt;
    }
    Json::CharReaderBuilder builder;
    Json::Value json;
    std::string errs;
    if (!Json::parseFromStream(builder, ifs, &json, &errs)) {
        throw std::runtime_error("Failed to parse state file " + path + ": " + errs);
    }
    return fileLocationFromJson(json);
}
