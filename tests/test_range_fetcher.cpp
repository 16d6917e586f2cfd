#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/RangeFetcher.hpp"
#include "../src/StreamErrors.hpp"
#include "TestSupport.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static const std::string kUrl = "http://example.test/data.jsonl";
static const std::string kContent = "0123456789abcdefghij";

static BackoffPolicy defaultPolicy() {
    return BackoffPolicy(Millis(1000), Millis(30000), Millis(3600000));
}

static std::string drainAll(RangeFetcher& fetcher) {
    std::string all;
    while (auto chunk = fetcher.next()) {
        all += *chunk;
    }
    return all;
}

int main() {
    try {
        // 1) Windows of chunkSize bytes, no request past the known size
        {
            FakeTransport transport(kContent);
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            auto first = fetcher.next();
            ASSERT_TRUE(first && *first == "01234");
            ASSERT_TRUE(fetcher.offset() == 5);
            ASSERT_TRUE(drainAll(fetcher) == "56789abcdefghij");
            ASSERT_TRUE(fetcher.done());
            ASSERT_TRUE(transport.requestedRanges.size() == 4);
            ASSERT_TRUE(transport.requestedRanges[3]->first == 15);
            ASSERT_TRUE(*transport.requestedRanges[3]->last == 19);
            ASSERT_TRUE(!fetcher.next());
            ASSERT_TRUE(transport.requestedRanges.size() == 4);
            ASSERT_TRUE(clock.delays.empty());
        }

        // 2) A 503 is retried once after the initial delay, from the last delivered byte
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index == 1) return httpError(503);
                return std::nullopt;
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            std::vector<Millis> observed;
            fetcher.setBackoffObserver([&observed](Millis delay) { observed.push_back(delay); });
            ASSERT_TRUE(drainAll(fetcher) == kContent);
            ASSERT_TRUE(clock.delays.size() == 1);
            ASSERT_TRUE(clock.delays[0] == Millis(1000));
            ASSERT_TRUE(observed.size() == 1 && observed[0] == Millis(1000));
            ASSERT_TRUE(transport.requestedRanges[1]->first == 5);
            ASSERT_TRUE(transport.requestedRanges[2]->first == 5);
            ASSERT_TRUE(fetcher.totalRetries() == 1);
        }

        // 3) Consecutive failures back off exponentially; a success resets the episode
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index == 0 || index == 1 || index == 3) return transportFailure(TransportStatus::Timeout);
                return std::nullopt;
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(drainAll(fetcher) == kContent);
            ASSERT_TRUE(clock.delays.size() == 3);
            ASSERT_TRUE(clock.delays[0] == Millis(1000));
            ASSERT_TRUE(clock.delays[1] == Millis(2000));
            ASSERT_TRUE(clock.delays[2] == Millis(1000));
        }

        // 4) Non-transient status is fatal without any retry
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                return httpError(404);
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            bool threw = false;
            try {
                fetcher.next();
            } catch (const RetryExhaustedError&) {
                ASSERT_TRUE(false);
            } catch (const TransportError& e) {
                threw = true;
                ASSERT_TRUE(!e.transient());
                ASSERT_TRUE(e.httpStatus() == 404);
            }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(clock.delays.empty());
            ASSERT_TRUE(transport.requestedRanges.size() == 1);
        }

        // 5) Unusable address and TLS failures are fatal, resolution failures are retried
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                return transportFailure(TransportStatus::BadAddress);
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            bool threw = false;
            try { fetcher.next(); } catch (const TransportError& e) { threw = !e.transient(); }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(clock.delays.empty());

            ASSERT_TRUE(!isTransientFailure(transportFailure(TransportStatus::TlsFailure)));
            ASSERT_TRUE(isTransientFailure(transportFailure(TransportStatus::ResolveFailure)));
            ASSERT_TRUE(isTransientFailure(transportFailure(TransportStatus::NetworkFailure)));
            ASSERT_TRUE(isTransientFailure(httpError(408)));
            ASSERT_TRUE(isTransientFailure(httpError(429)));
            ASSERT_TRUE(isTransientFailure(httpError(500)));
            ASSERT_TRUE(isTransientFailure(httpError(504)));
            ASSERT_TRUE(!isTransientFailure(httpError(400)));
            ASSERT_TRUE(!isTransientFailure(httpError(403)));
        }

        // 6) The retry budget bounds the total sleep
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                return httpError(503);
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, BackoffPolicy(Millis(1000), Millis(4000), Millis(10000)), clock);
            bool exhausted = false;
            try {
                fetcher.next();
            } catch (const RetryExhaustedError& e) {
                exhausted = true;
                ASSERT_TRUE(e.attempts() == 3);
                ASSERT_TRUE(e.httpStatus() == 503);
            }
            ASSERT_TRUE(exhausted);
            ASSERT_TRUE(clock.delays.size() == 3);
            ASSERT_TRUE(clock.totalSlept() == Millis(7000));
            ASSERT_TRUE(transport.requestedRanges.size() == 4);
        }

        // 7) Retry-After raises the delay
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index != 0) return std::nullopt;
                HttpResult busy = httpError(429);
                busy.headers["retry-after"] = "3";
                return busy;
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(drainAll(fetcher) == kContent);
            ASSERT_TRUE(clock.delays.size() == 1 && clock.delays[0] == Millis(3000));

            // Absurdly large values are clamped to maxDelay
            for (std::string huge : {"9000000000000000000", "99999999999999999999999", "31"}) {
                FakeTransport slow(kContent);
                slow.interceptor = [huge](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                    if (index != 0) return std::nullopt;
                    HttpResult busy = httpError(503);
                    busy.headers["retry-after"] = huge;
                    return busy;
                };
                FakeClock slowClock;
                RangeFetcher slowFetcher(slow, kUrl, 5, defaultPolicy(), slowClock);
                ASSERT_TRUE(drainAll(slowFetcher) == kContent);
                ASSERT_TRUE(slowClock.delays.size() == 1 && slowClock.delays[0] == Millis(30000));
            }
        }

        // 8) Server without range support: whole body once, resume offset dropped
        {
            FakeTransport transport(kContent, false);
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            fetcher.startAt(7);
            ASSERT_TRUE(drainAll(fetcher) == kContent.substr(7));
            ASSERT_TRUE(transport.requestedRanges.size() == 1);
            ASSERT_TRUE(fetcher.offset() == kContent.size());
        }

        // 9) Range dropped by the server after a retry: no duplicated bytes
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index != 1) return std::nullopt;
                HttpResult whole;
                whole.statusCode = 200;
                whole.body = kContent;
                return whole;
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(drainAll(fetcher) == kContent);
            ASSERT_TRUE(transport.requestedRanges.size() == 2);
        }

        // 10) 416 past the end is a clean end, before the end it is fatal
        {
            FakeTransport transport(kContent);
            FakeClock clock;
            RangeFetcher atEnd(transport, kUrl, 5, defaultPolicy(), clock);
            atEnd.startAt(kContent.size());
            ASSERT_TRUE(!atEnd.next());
            ASSERT_TRUE(atEnd.done());

            transport.interceptor = [](size_t, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                HttpResult unsatisfiable = httpError(416);
                unsatisfiable.headers["content-range"] = "bytes */20";
                return unsatisfiable;
            };
            RangeFetcher early(transport, kUrl, 5, defaultPolicy(), clock);
            early.startAt(3);
            bool threw = false;
            try { early.next(); } catch (const TransportError& e) { threw = e.httpStatus() == 416; }
            ASSERT_TRUE(threw);
        }

        // 11) Empty resource
        {
            FakeTransport transport("");
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(!fetcher.next());
            ASSERT_TRUE(fetcher.done());
        }

        // 12) Size change mid-stream is fatal
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t index, const std::optional<ByteRange>& range) -> std::optional<HttpResult> {
                if (index != 1) return std::nullopt;
                HttpResult grown;
                grown.statusCode = 206;
                grown.headers["content-range"] = "bytes " + std::to_string(range->first) + "-" +
                                                 std::to_string(*range->last) + "/30";
                grown.body = "56789";
                return grown;
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(fetcher.next());
            bool threw = false;
            try { fetcher.next(); } catch (const TransportError& e) { threw = !e.transient(); }
            ASSERT_TRUE(threw);
        }

        // 13) Unknown total size: a short window marks the end
        {
            FakeTransport transport(kContent);
            transport.interceptor = [](size_t, const std::optional<ByteRange>& range) -> std::optional<HttpResult> {
                HttpResult partial;
                partial.statusCode = 206;
                partial.headers["content-range"] = "bytes " + std::to_string(range->first) + "-*/*";
                size_t last = std::min<size_t>(*range->last, kContent.size() - 1);
                partial.body = kContent.substr(range->first, last - range->first + 1);
                return partial;
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 6, defaultPolicy(), clock);
            ASSERT_TRUE(drainAll(fetcher) == kContent);
            ASSERT_TRUE(transport.requestedRanges.size() == 4);
        }

        // 14) Range support check and prefix reads
        {
            FakeTransport transport(kContent);
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            RangeSupport support = fetcher.checkRanges();
            ASSERT_TRUE(support.rangesSupported);
            ASSERT_TRUE(support.contentLength && *support.contentLength == kContent.size());
            ASSERT_TRUE(transport.headRequests == 1);
            ASSERT_TRUE(fetcher.readPrefix(2) == "01");
            ASSERT_TRUE(fetcher.offset() == 0);
            ASSERT_TRUE(drainAll(fetcher) == kContent);

            bool threw = false;
            try { fetcher.startAt(3); } catch (const std::logic_error&) { threw = true; }
            ASSERT_TRUE(threw);

            FakeTransport plain(kContent, false);
            RangeFetcher noRanges(plain, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(!noRanges.checkRanges().rangesSupported);
            ASSERT_TRUE(noRanges.readPrefix(2) == "01");

            FakeTransport empty("");
            RangeFetcher emptyFetcher(empty, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(emptyFetcher.readPrefix(2).empty());
        }

        // 15) A 206 window that does not start at the requested offset
        {
            auto windowAt = [](uint64_t first, uint64_t last) {
                HttpResult shifted;
                shifted.statusCode = 206;
                shifted.headers["content-range"] =
                    "bytes " + std::to_string(first) + "-" + std::to_string(last) + "/" + std::to_string(kContent.size());
                shifted.body = kContent.substr(first, last - first + 1);
                return shifted;
            };

            // Earlier window reaching past the offset: overlap dropped, nothing duplicated
            FakeTransport early(kContent);
            early.interceptor = [&windowAt](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index == 1) return windowAt(3, 9);
                return std::nullopt;
            };
            FakeClock clock;
            RangeFetcher realigned(early, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(realigned.next() == std::optional<std::string>("01234"));
            ASSERT_TRUE(realigned.next() == std::optional<std::string>("56789"));
            ASSERT_TRUE(realigned.offset() == 10);
            ASSERT_TRUE(drainAll(realigned) == "abcdefghij");

            // Window entirely before the offset: would duplicate bytes
            FakeTransport stale(kContent);
            stale.interceptor = [&windowAt](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index == 2) return windowAt(0, 4);
                return std::nullopt;
            };
            RangeFetcher duplicating(stale, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(duplicating.next());
            ASSERT_TRUE(duplicating.next());
            bool threw = false;
            try { duplicating.next(); } catch (const TransportError& e) { threw = !e.transient() && e.httpStatus() == 206; }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(duplicating.offset() == 10);

            // Window after the offset: would skip bytes
            FakeTransport ahead(kContent);
            ahead.interceptor = [&windowAt](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index == 1) return windowAt(7, 11);
                return std::nullopt;
            };
            RangeFetcher skipping(ahead, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(skipping.next());
            threw = false;
            try { skipping.next(); } catch (const TransportError& e) { threw = !e.transient(); }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(skipping.offset() == 5);
        }

        // 16) Redirects are followed and later windows go to the new location
        {
            auto redirectTo = [](int status, const std::string& location) {
                HttpResult moved;
                moved.statusCode = status;
                moved.headers["location"] = location;
                return moved;
            };

            FakeTransport transport(kContent);
            transport.interceptor = [&redirectTo](size_t index, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                if (index == 1) return redirectTo(302, "/moved/data.jsonl");
                return std::nullopt;
            };
            FakeClock clock;
            RangeFetcher fetcher(transport, kUrl, 5, defaultPolicy(), clock);
            ASSERT_TRUE(drainAll(fetcher) == kContent);
            ASSERT_TRUE(clock.delays.empty());
            ASSERT_TRUE(transport.requestedUrls.front() == kUrl);
            ASSERT_TRUE(transport.requestedUrls.back() == "http://example.test/moved/data.jsonl");
            // The redirected request repeats the same window
            ASSERT_TRUE(transport.requestedRanges[2] && transport.requestedRanges[2]->first == 5);

            // Endless redirects are fatal
            FakeTransport loop(kContent);
            loop.interceptor = [&redirectTo](size_t, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                return redirectTo(301, "http://example.test/again.jsonl");
            };
            RangeFetcher looping(loop, kUrl, 5, defaultPolicy(), clock);
            bool threw = false;
            try { looping.next(); } catch (const TransportError& e) { threw = !e.transient() && e.httpStatus() == 301; }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(loop.requestedUrls.size() == 6);

            // 3xx without a Location stays fatal
            FakeTransport bare(kContent);
            bare.interceptor = [](size_t, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                HttpResult moved;
                moved.statusCode = 302;
                return moved;
            };
            RangeFetcher stuck(bare, kUrl, 5, defaultPolicy(), clock);
            threw = false;
            try { stuck.next(); } catch (const TransportError& e) { threw = !e.transient() && e.httpStatus() == 302; }
            ASSERT_TRUE(threw);

            // Redirects leaving HTTP are refused
            FakeTransport local(kContent);
            local.interceptor = [&redirectTo](size_t, const std::optional<ByteRange>&) -> std::optional<HttpResult> {
                return redirectTo(307, "file:///etc/passwd");
            };
            RangeFetcher escaping(local, kUrl, 5, defaultPolicy(), clock);
            threw = false;
            try { escaping.next(); } catch (const TransportError& e) { threw = !e.transient(); }
            ASSERT_TRUE(threw);
            ASSERT_TRUE(local.requestedUrls.size() == 1);
        }

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All range fetcher tests passed" << std::endl;
    return 0;
}
