#include "HttpTransport.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

const char* toString(TransportStatus status) {
    switch (status) {
        case TransportStatus::Ok: return "ok";
        case TransportStatus::NetworkFailure: return "network failure";
        case TransportStatus::Timeout: return "timeout";
        case TransportStatus::BadResponse: return "bad response";
        case TransportStatus::ResolveFailure: return "host resolution failure";
        case TransportStatus::BadAddress: return "bad address";
        case TransportStatus::TlsFailure: return "TLS failure";
    }
    return "unknown";
}

std::string HttpResult::header(const std::string& lowerCaseName) const {
    auto it = headers.find(lowerCaseName);
    return it != headers.end() ? it->second : std::string();
}

std::string ByteRange::toHeaderValue() const {
    std::string value = "bytes=" + std::to_string(first) + "-";
    if (last) {
        value += std::to_string(*last);
    }
    return value;
}

std::string ParsedUrl::origin() const {
    std::string result = scheme + "://" + host;
    if (port != 0) {
        result += ":" + std::to_string(port);
    }
    return result;
}

ParsedUrl parseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }
    ParsedUrl parsed;
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (char c : parsed.scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            throw std::invalid_argument("URL has an invalid scheme: " + url);
        }
    }

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, authorityEnd == std::string::npos
                                                           ? std::string::npos
                                                           : authorityEnd - authorityStart);
    if (authorityEnd == std::string::npos) {
        parsed.target = "/";
    } else {
        parsed.target = url.substr(authorityEnd);
        auto fragment = parsed.target.find('#');
        if (fragment != std::string::npos) parsed.target.erase(fragment);
        if (parsed.target.empty() || parsed.target[0] != '/') parsed.target.insert(0, "/");
    }

    // file:///path has an empty authority; everything else needs a host
    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        authority.erase(colon);
        if (portText.empty() || portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("URL has an invalid port: " + url);
        }
        unsigned long port = std::stoul(portText);
        if (port == 0 || port > 65535) {
            throw std::invalid_argument("URL port out of range: " + url);
        }
        parsed.port = static_cast<uint16_t>(port);
    }
    parsed.host = authority;
    if (parsed.host.empty() && parsed.scheme != "file") {
        throw std::invalid_argument("URL has no host: " + url);
    }
    return parsed;
}

std::optional<uint64_t> contentRangeTotal(const std::string& contentRange) {
    auto slash = contentRange.rfind('/');
    if (slash == std::string::npos || slash + 1 >= contentRange.size()) {
        return std::nullopt;
    }
    std::string total = contentRange.substr(slash + 1);
    if (!std::all_of(total.begin(), total.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;  // "*" means unknown
    }
    try {
        return std::stoull(total);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<uint64_t> contentRangeFirst(const std::string& contentRange) {
    const std::string unit = "bytes ";
    if (contentRange.compare(0, unit.size(), unit) != 0) {
        return std::nullopt;
    }
    auto dash = contentRange.find('-', unit.size());
    if (dash == std::string::npos || dash == unit.size()) {
        return std::nullopt;
    }
    std::string first = contentRange.substr(unit.size(), dash - unit.size());
    if (!std::all_of(first.begin(), first.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoull(first);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string resolveUrl(const std::string& base, const std::string& reference) {
    auto schemeEnd = reference.find("://");
    if (schemeEnd != std::string::npos && reference.find_first_of("/?#") > schemeEnd) {
        return reference;
    }
    ParsedUrl parsed = parseUrl(base);
    if (reference.compare(0, 2, "//") == 0) {
        return parsed.scheme + ":" + reference;
    }
    if (!reference.empty() && reference[0] == '/') {
        return parsed.origin() + reference;
    }
    std::string path = parsed.target.substr(0, parsed.target.find('?'));
    if (reference.empty()) {
        return parsed.origin() + parsed.target;
    }
    if (reference[0] == '?') {
        return parsed.origin() + path + reference;
    }
    return parsed.origin() + path.substr(0, path.rfind('/') + 1) + reference;
}
