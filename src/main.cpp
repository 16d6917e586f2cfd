#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include "FileLocation.hpp"
#include "JsonlStream.hpp"

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <url> [--state <file>] [--config <file>] [--verbose]" << std::endl;
    std::cerr << "  Streams JSONL records as {\"value\":...,\"location\":{...}} lines to stdout." << std::endl;
    std::cerr << "  With --state, a failed run stores its resume location and the next run continues from it."
              << std::endl;
}

// Reads the optional "stream" section of a JSON config file into config.
static bool loadConfig(const std::string& path, bool required, StreamConfig& config) {
    std::ifstream configFile(path);
    if (!configFile) {
        if (required) {
            std::cerr << "Cannot open config file: " << path << std::endl;
            return false;
        }
        return true;
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        std::cerr << "Failed to parse " << path << ": " << errs << std::endl;
        return false;
    }
    if (root.isMember("stream")) {
        try {
            config.applyJson(root["stream"]);
        } catch (const std::exception& e) {
            std::cerr << "Invalid stream section in " << path << ": " << e.what() << std::endl;
            return false;
        }
    }
    return true;
}

int main(int argc, char* argv[]) {
    std::string url;
    std::string statePath;
    std::string configPath = "config.json";
    bool configRequired = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--state" && i + 1 < argc) {
            statePath = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
            configRequired = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (url.empty() && !arg.empty() && arg[0] != '-') {
            url = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    trantor::Logger::setLogLevel(verbose ? trantor::Logger::kDebug : trantor::Logger::kWarn);

    StreamConfig config;
    if (!loadConfig(configPath, configRequired, config)) {
        return 2;
    }
    if (!url.empty()) {
        config.url = url;
    }
    if (config.url.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    if (!statePath.empty()) {
        try {
            config.startingLocation = loadLocation(statePath);
        } catch (const std::exception& e) {
            std::cerr << "Ignoring unreadable state file: " << e.what() << std::endl;
        }
        if (config.startingLocation) {
            std::cerr << "Resuming at " << toString(*config.startingLocation) << std::endl;
        }
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    uint64_t records = 0;
    try {
        JsonlStream stream = streamJsonl(config);
        for (const auto& record : stream) {
            Json::Value out;
            out["value"] = record.value;
            out["location"] = toJson(record.location);
            std::cout << Json::writeString(writer, out) << '\n';
            ++records;
        }
        std::cout.flush();
    } catch (const StreamError& e) {
        std::cout.flush();
        std::cerr << "Stream failed after " << records << " records: " << e.what() << std::endl;
        std::cerr << "Resume location: " << Json::writeString(writer, toJson(e.location())) << std::endl;
        if (!statePath.empty()) {
            try {
                saveLocation(statePath, e.location());
            } catch (const std::exception& saveError) {
                std::cerr << "Failed to store resume location: " << saveError.what() << std::endl;
            }
        }
        return 1;
    }

    if (!statePath.empty()) {
        std::error_code ec;
        std::filesystem::remove(statePath, ec);
    }
    std::cerr << "Streamed " << records << " records" << std::endl;
    return 0;
}
