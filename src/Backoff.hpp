#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

using Millis = std::chrono::milliseconds;

// Time source for retry episodes. Tests substitute a fake that records sleeps.
class RetryClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~RetryClock() = default;
    virtual TimePoint now() = 0;
    virtual void sleepFor(Millis delay) = 0;
};

class SteadyRetryClock : public RetryClock {
public:
    TimePoint now() override;
    void sleepFor(Millis delay) override;
};

// Exponential backoff: initialDelay * 2^attempt, capped at maxDelay.
// The whole retry episode is bounded by maxRetryTime.
class BackoffPolicy {
public:
    BackoffPolicy(Millis initialDelay, Millis maxDelay, Millis maxRetryTime);

    Millis nextDelay(uint32_t attempt) const;

    // Server supplied Retry-After raises the delay, never above maxDelay.
    Millis nextDelay(uint32_t attempt, std::optional<Millis> retryAfter) const;

    bool isExhausted(RetryClock::TimePoint startedAt, RetryClock::TimePoint now) const;

    // True if sleeping for delay would run the episode past maxRetryTime.
    bool wouldExceed(RetryClock::TimePoint startedAt, RetryClock::TimePoint now, Millis delay) const;

    Millis initialDelay() const { return initialDelay_; }
    Millis maxDelay() const { return maxDelay_; }
    Millis maxRetryTime() const { return maxRetryTime_; }

private:
    Millis initialDelay_;
    Millis maxDelay_;
    Millis maxRetryTime_;
};

// Retry bookkeeping for one episode of consecutive failures.
struct BackoffState {
    uint32_t attempt = 0;
    RetryClock::TimePoint startedAt{};
    bool active = false;

    void begin(RetryClock::TimePoint now) {
        if (!active) {
            attempt = 0;
            startedAt = now;
            active = true;
        }
    }
    void reset() {
        attempt = 0;
        active = false;
    }
};
