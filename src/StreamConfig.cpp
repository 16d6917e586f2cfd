#include "StreamConfig.hpp"
#include <stdexcept>
#include "HttpTransport.hpp"

Compression compressionFromString(const std::string& name) {
    if (name == "auto") return Compression::Auto;
    if (name == "gzip") return Compression::Gzip;
    if (name == "none") return Compression::None;
    throw std::invalid_argument("Unknown compression mode: " + name);
}

const char* toString(Compression compression) {
    switch (compression) {
        case Compression::Auto: return "auto";
        case Compression::Gzip: return "gzip";
        case Compression::None: return "none";
    }
    return "unknown";
}

void StreamConfig::validate() const {
    if (url.empty()) {
        throw std::invalid_argument("url is required");
    }
    ParsedUrl parsed = parseUrl(url);
    if (parsed.scheme != "http" && parsed.scheme != "https" && parsed.scheme != "file") {
        throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
    }
    if (chunkSize == 0) {
        throw std::invalid_argument("chunkSize must be positive");
    }
    if (requestTimeoutSec < 0) {
        throw std::invalid_argument("requestTimeoutSec must not be negative");
    }
    backoffPolicy();  // throws on inconsistent delays
}

BackoffPolicy StreamConfig::backoffPolicy() const {
    return BackoffPolicy(Millis(initialDelayMs), Millis(maxDelayMs), Millis(maxRetryTimeMs));
}

void StreamConfig::applyJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::invalid_argument("stream config must be a JSON object");
    }
    if (json.isMember("url")) url = json["url"].asString();
    if (json.isMember("startingLocation")) startingLocation = fileLocationFromJson(json["startingLocation"]);
    if (json.isMember("initialDelayMs")) initialDelayMs = json["initialDelayMs"].asInt64();
    if (json.isMember("maxRetryTimeMs")) maxRetryTimeMs = json["maxRetryTimeMs"].asInt64();
    if (json.isMember("maxDelayMs")) maxDelayMs = json["maxDelayMs"].asInt64();
    if (json.isMember("compression")) compression = compressionFromString(json["compression"].asString());
    if (json.isMember("chunkSize")) chunkSize = json["chunkSize"].asUInt64();
    if (json.isMember("requestTimeoutSec")) requestTimeoutSec = json["requestTimeoutSec"].asDouble();
}
