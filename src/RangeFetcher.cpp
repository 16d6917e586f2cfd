#include "RangeFetcher.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <trantor/utils/Logger.h>
#include "StreamErrors.hpp"

namespace {

bool isSuccess(int statusCode) {
    return statusCode >= 200 && statusCode < 300;
}

bool isRedirect(int statusCode) {
    return statusCode == 301 || statusCode == 302 || statusCode == 303 || statusCode == 307 || statusCode == 308;
}

constexpr int kMaxRedirects = 5;

// Delta-seconds Retry-After, clamped to cap before any unit conversion.
std::optional<Millis> retryAfter(const HttpResult& result, Millis cap) {
    std::string value = result.header("retry-after");
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        // HTTP-date form is not honoured
        return std::nullopt;
    }
    long long seconds = 0;
    try {
        seconds = std::stoll(value);
    } catch (const std::out_of_range&) {
        return cap;
    }
    if (seconds > std::chrono::duration_cast<std::chrono::seconds>(cap).count()) {
        return cap;
    }
    return std::chrono::duration_cast<Millis>(std::chrono::seconds(seconds));
}

std::string describe(const HttpResult& result) {
    if (result.status != TransportStatus::Ok) {
        return result.message.empty() ? std::string(toString(result.status)) : result.message;
    }
    std::string text = "HTTP " + std::to_string(result.statusCode);
    if (!result.message.empty()) text += " (" + result.message + ")";
    return text;
}

}  // namespace

bool isTransientFailure(const HttpResult& result) {
    switch (result.status) {
        case TransportStatus::Ok:
            return result.statusCode == 408 || result.statusCode == 429 || result.statusCode >= 500;
        case TransportStatus::BadAddress:
        case TransportStatus::TlsFailure:
            return false;
        default:
            return true;
    }
}

RangeFetcher::RangeFetcher(HttpTransport& transport, std::string url, uint64_t chunkSize, BackoffPolicy policy,
                           RetryClock& clock)
    : transport_(transport), url_(std::move(url)), chunkSize_(chunkSize), policy_(policy), clock_(clock) {}

HttpResult RangeFetcher::execute(const std::function<HttpResult()>& request, const std::string& what) {
    int redirects = 0;
    for (;;) {
        HttpResult result = request();
        if (result.status == TransportStatus::Ok && isRedirect(result.statusCode) &&
            !result.header("location").empty()) {
            if (++redirects > kMaxRedirects) {
                throw TransportError(what + " of " + url_ + " failed: too many redirects", false, result.statusCode);
            }
            std::string target;
            try {
                target = resolveUrl(url_, result.header("location"));
                std::string scheme = parseUrl(target).scheme;
                if (scheme != "http" && scheme != "https") {
                    throw std::invalid_argument("redirect to unsupported URL " + target);
                }
            } catch (const std::invalid_argument& e) {
                throw TransportError(what + " of " + url_ + " failed: " + e.what(), false, result.statusCode);
            }
            LOG_INFO << url_ << " redirected (HTTP " << result.statusCode << ") to " << target;
            url_ = std::move(target);
            continue;
        }
        bool failed = result.status != TransportStatus::Ok ||
                      (!isSuccess(result.statusCode) && result.statusCode != 416);
        if (!failed) {
            if (backoff_.active) {
                LOG_INFO << what << " of " << url_ << " succeeded after " << backoff_.attempt << " retries";
            }
            backoff_.reset();
            return result;
        }
        if (!isTransientFailure(result)) {
            throw TransportError(what + " of " + url_ + " failed: " + describe(result), false, result.statusCode);
        }

        backoff_.begin(clock_.now());
        Millis delay = policy_.nextDelay(backoff_.attempt, retryAfter(result, policy_.maxDelay()));
        if (policy_.wouldExceed(backoff_.startedAt, clock_.now(), delay)) {
            LOG_ERROR << what << " of " << url_ << " gave up after " << backoff_.attempt << " retries: "
                      << describe(result);
            throw RetryExhaustedError(what + " of " + url_ + " kept failing, last error: " + describe(result),
                                      result.statusCode, backoff_.attempt);
        }
        LOG_WARN << what << " of " << url_ << " at offset " << offset_ << " failed (" << describe(result)
                 << "), retrying in " << delay.count() << " ms";
        if (observer_) {
            observer_(delay);
        }
        clock_.sleepFor(delay);
        ++backoff_.attempt;
        ++totalRetries_;
    }
}

RangeSupport RangeFetcher::checkRanges() {
    HttpResult result = execute([this]() { return transport_.head(url_); }, "HEAD");
    RangeSupport support;
    std::string acceptRanges = result.header("accept-ranges");
    std::transform(acceptRanges.begin(), acceptRanges.end(), acceptRanges.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    support.rangesSupported = acceptRanges == "bytes";
    std::string contentLength = result.header("content-length");
    if (!contentLength.empty()) {
        try {
            support.contentLength = std::stoull(contentLength);
        } catch (const std::exception& e) {
            LOG_DEBUG << "Ignoring unparsable Content-Length '" << contentLength << "': " << e.what();
        }
    }
    LOG_DEBUG << "Range check of " << url_ << ": ranges " << (support.rangesSupported ? "supported" : "not supported");
    return support;
}

std::string RangeFetcher::readPrefix(uint64_t length) {
    if (length == 0) {
        return {};
    }
    ByteRange range{0, length - 1};
    HttpResult result = execute([this, &range]() { return transport_.get(url_, range); }, "Prefix GET");
    if (result.statusCode == 416) {
        return {};
    }
    if (result.body.size() > length) {
        result.body.resize(length);
    }
    return std::move(result.body);
}

void RangeFetcher::startAt(uint64_t offset) {
    if (started_) {
        throw std::logic_error("RangeFetcher::startAt called after fetching started");
    }
    offset_ = offset;
}

std::optional<std::string> RangeFetcher::next() {
    if (done_) {
        return std::nullopt;
    }
    started_ = true;

    HttpResult result = execute(
        [this]() {
            std::optional<ByteRange> range;
            if (rangeMode_ != RangeMode::Unsupported) {
                range = ByteRange{offset_, offset_ + chunkSize_ - 1};
            }
            return transport_.get(url_, range);
        },
        "GET");

    if (result.statusCode == 416) {
        auto total = contentRangeTotal(result.header("content-range"));
        if (total ? offset_ >= *total : offset_ > 0) {
            LOG_DEBUG << "Range at " << offset_ << " is past the end of " << url_;
            done_ = true;
            return std::nullopt;
        }
        throw TransportError("Range not satisfiable at offset " + std::to_string(offset_) + " of " + url_, false, 416);
    }

    if (result.statusCode == 206) {
        rangeMode_ = RangeMode::Supported;
        std::string contentRange = result.header("content-range");
        size_t received = result.body.size();
        auto first = contentRangeFirst(contentRange);
        if (first && *first != offset_) {
            // Only a window that starts early and still reaches offset_ can be realigned
            if (*first > offset_ || *first + result.body.size() <= offset_) {
                throw TransportError("Server answered the range at " + std::to_string(offset_) + " of " + url_ +
                                         " with '" + contentRange + "'",
                                     false, 206);
            }
            LOG_WARN << url_ << " answered the range at " << offset_ << " with '" << contentRange
                     << "'; dropping the overlap";
            result.body.erase(0, offset_ - *first);
        }
        auto total = contentRangeTotal(contentRange);
        if (total) {
            if (resourceSize_ && *resourceSize_ != *total) {
                throw TransportError("Size of " + url_ + " changed from " + std::to_string(*resourceSize_) + " to " +
                                         std::to_string(*total) + " while streaming",
                                     false, 206);
            }
            resourceSize_ = total;
        }
        offset_ += result.body.size();
        if (result.body.empty() || (resourceSize_ ? offset_ >= *resourceSize_ : received < chunkSize_)) {
            done_ = true;
        }
        return std::move(result.body);
    }

    // Any other 2xx carries the whole resource
    if (rangeMode_ != RangeMode::Unsupported) {
        LOG_WARN << url_ << " ignored the Range header; receiving the whole resource";
    }
    rangeMode_ = RangeMode::Unsupported;
    done_ = true;
    if (result.body.size() < offset_) {
        throw TransportError("Resource " + url_ + " is shorter (" + std::to_string(result.body.size()) +
                                 " bytes) than the resume offset " + std::to_string(offset_),
                             false, result.statusCode);
    }
    result.body.erase(0, offset_);
    offset_ += result.body.size();
    if (result.body.empty()) {
        return std::nullopt;
    }
    return std::move(result.body);
}
