#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include "Backoff.hpp"
#include "HttpTransport.hpp"

struct RangeSupport {
    bool rangesSupported = false;
    std::optional<uint64_t> contentLength;
};

// Pulls a resource window by window with ranged GETs. Transient failures are retried
// with backoff; every retry asks for the bytes after the last delivered one.
//
// Servers that ignore Range answer 200 with the whole resource. The bytes before the
// current offset are then dropped, which keeps the delivered stream gap and duplicate
// free at the cost of a full transfer.
class RangeFetcher {
public:
    RangeFetcher(HttpTransport& transport, std::string url, uint64_t chunkSize, BackoffPolicy policy,
                 RetryClock& clock);

    // HEAD based capability check. Throws TransportError.
    RangeSupport checkRanges();

    // First bytes of the resource, fewer if it is shorter. Throws TransportError.
    std::string readPrefix(uint64_t length);

    // Only valid before the first call to next().
    void startAt(uint64_t offset);

    // Next chunk of the resource, nullopt once it is exhausted.
    // Throws TransportError for fatal responses and RetryExhaustedError when the
    // retry budget is spent.
    std::optional<std::string> next();

    // Absolute offset of the next byte to deliver.
    uint64_t offset() const { return offset_; }
    bool done() const { return done_; }
    uint32_t totalRetries() const { return totalRetries_; }

    // Called with the delay right before each backoff sleep.
    void setBackoffObserver(std::function<void(Millis)> observer) { observer_ = std::move(observer); }

private:
    enum class RangeMode { Unknown, Supported, Unsupported };

    HttpResult execute(const std::function<HttpResult()>& request, const std::string& what);

    HttpTransport& transport_;
    std::string url_;
    uint64_t chunkSize_;
    BackoffPolicy policy_;
    RetryClock& clock_;
    BackoffState backoff_;
    std::function<void(Millis)> observer_;

    RangeMode rangeMode_ = RangeMode::Unknown;
    uint64_t offset_ = 0;
    std::optional<uint64_t> resourceSize_;
    bool started_ = false;
    bool done_ = false;
    uint32_t totalRetries_ = 0;
};

// true for failures worth retrying: connection level errors, 408, 429 and 5xx
bool isTransientFailure(const HttpResult& result);
