#include "MappedFileTransport.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <boost/interprocess/exceptions.hpp>

std::string fileUrlPath(const std::string& url) {
    ParsedUrl parsed = parseUrl(url);
    if (parsed.scheme != "file") {
        throw std::invalid_argument("Not a file URL: " + url);
    }
    std::string target = parsed.target;
    auto query = target.find('?');
    if (query != std::string::npos) target.erase(query);

    std::string path;
    path.reserve(target.size());
    for (size_t i = 0; i < target.size(); ++i) {
        if (target[i] == '%' && i + 2 < target.size() &&
            std::isxdigit(static_cast<unsigned char>(target[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(target[i + 2]))) {
            path.push_back(static_cast<char>(std::stoi(target.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            path.push_back(target[i]);
        }
    }
    return path;
}

std::shared_ptr<MappedFile> MappedFileTransport::open(const std::string& url, HttpResult& result) {
    std::string path;
    try {
        path = fileUrlPath(url);
    } catch (const std::invalid_argument& e) {
        result.status = TransportStatus::BadAddress;
        result.message = e.what();
        return nullptr;
    }
    if (openFile_ && openPath_ == path) {
        return openFile_;
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.statusCode = 404;
        result.message = "No such file: " + path;
        return nullptr;
    }
    try {
        openFile_ = std::make_shared<MappedFile>(path);
        openPath_ = path;
    } catch (const boost::interprocess::interprocess_exception& e) {
        result.statusCode = 403;
        result.message = std::string("Cannot map ") + path + ": " + e.what();
        return nullptr;
    } catch (const std::filesystem::filesystem_error& e) {
        result.statusCode = 403;
        result.message = e.what();
        return nullptr;
    }
    return openFile_;
}

HttpResult MappedFileTransport::head(const std::string& url) {
    HttpResult result;
    auto file = open(url, result);
    if (!file) {
        return result;
    }
    result.statusCode = 200;
    result.headers["content-length"] = std::to_string(file->size());
    result.headers["accept-ranges"] = "bytes";
    return result;
}

HttpResult MappedFileTransport::get(const std::string& url, const std::optional<ByteRange>& range) {
    HttpResult result;
    auto file = open(url, result);
    if (!file) {
        return result;
    }
    uint64_t size = file->size();
    result.headers["accept-ranges"] = "bytes";
    if (!range) {
        result.statusCode = 200;
        result.body = std::string(file->view(0, size));
        return result;
    }
    if (range->first >= size) {
        result.statusCode = 416;
        result.headers["content-range"] = "bytes */" + std::to_string(size);
        return result;
    }
    uint64_t last = std::min<uint64_t>(range->last.value_or(size - 1), size - 1);
    result.statusCode = 206;
    result.headers["content-range"] =
        "bytes " + std::to_string(range->first) + "-" + std::to_string(last) + "/" + std::to_string(size);
    result.body = std::string(file->view(range->first, last - range->first + 1));
    return result;
}
