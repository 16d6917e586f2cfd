#include "DrogonTransport.hpp"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <trantor/utils/Logger.h>
#include <stdexcept>

namespace {

TransportStatus mapReqResult(drogon::ReqResult result) {
    switch (result) {
        case drogon::ReqResult::Ok: return TransportStatus::Ok;
        case drogon::ReqResult::BadServerAddress: return TransportStatus::ResolveFailure;
        case drogon::ReqResult::Timeout: return TransportStatus::Timeout;
        case drogon::ReqResult::BadResponse: return TransportStatus::BadResponse;
        case drogon::ReqResult::HandshakeError:
        case drogon::ReqResult::InvalidCertificate: return TransportStatus::TlsFailure;
        default: return TransportStatus::NetworkFailure;
    }
}

}  // namespace

DrogonTransport::DrogonTransport(double requestTimeoutSec)
    : requestTimeoutSec_(requestTimeoutSec), loopThread_("jsonl-fetch") {
    loopThread_.run();
}

DrogonTransport::~DrogonTransport() {
    clients_.clear();
}

HttpResult DrogonTransport::head(const std::string& url) {
    return send(url, drogon::Head, std::nullopt);
}

HttpResult DrogonTransport::get(const std::string& url, const std::optional<ByteRange>& range) {
    return send(url, drogon::Get, range);
}

drogon::HttpClientPtr DrogonTransport::clientFor(const ParsedUrl& url) {
    std::string origin = url.origin();
    auto it = clients_.find(origin);
    if (it != clients_.end()) {
        return it->second;
    }
    auto client = drogon::HttpClient::newHttpClient(origin, loopThread_.getLoop());
    clients_[origin] = client;
    return client;
}

HttpResult DrogonTransport::send(const std::string& url, drogon::HttpMethod method,
                                 const std::optional<ByteRange>& range) {
    HttpResult result;
    ParsedUrl parsed;
    try {
        parsed = parseUrl(url);
    } catch (const std::invalid_argument& e) {
        result.status = TransportStatus::BadAddress;
        result.message = e.what();
        return result;
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        result.status = TransportStatus::BadAddress;
        result.message = "Unsupported scheme for HTTP transport: " + parsed.scheme;
        return result;
    }

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(method);
    // Target is sent verbatim; it already carries its own percent-encoding and query
    req->setPathEncode(false);
    req->setPath(parsed.target);
    if (range) {
        req->addHeader("Range", range->toHeaderValue());
    }

    LOG_TRACE << (method == drogon::Head ? "HEAD " : "GET ") << url
              << (range ? " Range: " + range->toHeaderValue() : std::string());

    auto [reqResult, resp] = clientFor(parsed)->sendRequest(req, requestTimeoutSec_);
    result.status = mapReqResult(reqResult);
    if (result.status != TransportStatus::Ok || !resp) {
        if (result.status == TransportStatus::Ok) {
            result.status = TransportStatus::BadResponse;
        }
        result.message = std::string(toString(result.status)) + " while requesting " + url;
        // Drop the client so the next request opens a fresh connection
        clients_.erase(parsed.origin());
        return result;
    }

    result.statusCode = static_cast<int>(resp->statusCode());
    for (const auto& [name, value] : resp->headers()) {
        result.headers[name] = value;
    }
    result.body = std::string(resp->body());
    return result;
}
