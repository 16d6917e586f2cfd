#pragma once
#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <map>
#include <string>
#include "HttpTransport.hpp"

// HTTP(S) transport on drogon's client. Requests are sent synchronously from the
// caller's thread and executed on a private event loop thread.
class DrogonTransport : public HttpTransport {
public:
    explicit DrogonTransport(double requestTimeoutSec = 60.0);
    ~DrogonTransport() override;

    DrogonTransport(const DrogonTransport&) = delete;
    DrogonTransport& operator=(const DrogonTransport&) = delete;

    HttpResult head(const std::string& url) override;
    HttpResult get(const std::string& url, const std::optional<ByteRange>& range) override;

private:
    HttpResult send(const std::string& url, drogon::HttpMethod method, const std::optional<ByteRange>& range);
    drogon::HttpClientPtr clientFor(const ParsedUrl& url);

    double requestTimeoutSec_;
    trantor::EventLoopThread loopThread_;
    // Declared after the loop thread so clients are torn down while it still runs
    std::map<std::string, drogon::HttpClientPtr> clients_;
};
