#include "Backoff.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

RetryClock::TimePoint SteadyRetryClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyRetryClock::sleepFor(Millis delay) {
    std::this_thread::sleep_for(delay);
}

BackoffPolicy::BackoffPolicy(Millis initialDelay, Millis maxDelay, Millis maxRetryTime)
    : initialDelay_(initialDelay), maxDelay_(maxDelay), maxRetryTime_(maxRetryTime) {
    if (initialDelay_.count() <= 0) {
        throw std::invalid_argument("initialDelayMs must be positive");
    }
    if (maxDelay_ < initialDelay_) {
        throw std::invalid_argument("maxDelayMs must not be smaller than initialDelayMs");
    }
    if (maxRetryTime_.count() < 0) {
        throw std::invalid_argument("maxRetryTimeMs must not be negative");
    }
}

Millis BackoffPolicy::nextDelay(uint32_t attempt) const {
    // Doubling stops as soon as the cap is reached, so large attempts cannot overflow
    int64_t delay = initialDelay_.count();
    for (uint32_t i = 0; i < attempt && delay < maxDelay_.count(); ++i) {
        delay *= 2;
    }
    return Millis(std::min<int64_t>(delay, maxDelay_.count()));
}

Millis BackoffPolicy::nextDelay(uint32_t attempt, std::optional<Millis> retryAfter) const {
    Millis delay = nextDelay(attempt);
    if (retryAfter && *retryAfter > delay) {
        delay = std::min(*retryAfter, maxDelay_);
    }
    return delay;
}

bool BackoffPolicy::isExhausted(RetryClock::TimePoint startedAt, RetryClock::TimePoint now) const {
    return now - startedAt >= maxRetryTime_;
}

bool BackoffPolicy::wouldExceed(RetryClock::TimePoint startedAt, RetryClock::TimePoint now, Millis delay) const {
    return (now - startedAt) + delay > maxRetryTime_;
}
