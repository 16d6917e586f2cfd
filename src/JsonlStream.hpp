#pragma once
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <json/json.h>
#include "Backoff.hpp"
#include "FileLocation.hpp"
#include "GzipInflater.hpp"
#include "HttpTransport.hpp"
#include "LineFramer.hpp"
#include "RangeFetcher.hpp"
#include "RecordDecoder.hpp"
#include "StreamConfig.hpp"
#include "StreamErrors.hpp"

struct JsonlRecord {
    Json::Value value;
    // Resume from here to skip this record and everything before it
    FileLocation location;
};

enum class StreamState {
    Idle,
    Fetching,
    Backoff,
    Framing,
    Done,
    Failed,
};

const char* toString(StreamState state);

// Lazy, pull driven sequence of JSONL records from one resource.
//
// Each next() frames at most as many chunks as needed for one record. Fatal
// conditions surface as StreamError carrying the last safe FileLocation, after
// which the stream is Failed and yields nothing more. A stream cannot be
// restarted in place: resume by constructing a new one with
// StreamConfig::startingLocation set to the last location seen.
//
// With gzip, byteOffset counts decompressed bytes and resuming always re-reads
// the resource from its start, skipping lines up to startingLocation.line.
class JsonlStream {
public:
    // Picks the transport from the URL scheme. Throws StreamError(Configuration).
    explicit JsonlStream(StreamConfig config);
    JsonlStream(StreamConfig config, std::shared_ptr<HttpTransport> transport, std::shared_ptr<RetryClock> clock);
    ~JsonlStream();

    // Pinned in memory: iterators and the fetcher's backoff observer point back at it
    JsonlStream(const JsonlStream&) = delete;
    JsonlStream& operator=(const JsonlStream&) = delete;

    std::optional<JsonlRecord> next();

    // Releases the connection and decoder state; the stream ends without error.
    void close();

    StreamState state() const { return state_; }
    // Last safe restart point
    FileLocation location() const;
    bool gzip() const { return inflater_ != nullptr; }
    const StreamConfig& config() const { return config_; }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = JsonlRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const JsonlRecord*;
        using reference = const JsonlRecord&;

        iterator() = default;
        explicit iterator(JsonlStream* stream) : stream_(stream) { ++*this; }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return stream_ != other.stream_; }

    private:
        JsonlStream* stream_ = nullptr;
        std::optional<JsonlRecord> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    void start();
    void pump();
    void feed(std::string bytes);
    void decideCompression(bool isGzip);
    [[noreturn]] void fail(StreamErrorKind kind, const FileLocation& location, const std::string& message,
                           std::exception_ptr cause);
    void release();

    StreamConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<RetryClock> clock_;
    std::unique_ptr<RangeFetcher> fetcher_;
    std::unique_ptr<GzipInflater> inflater_;
    std::unique_ptr<LineFramer> framer_;
    RecordDecoder decoder_;

    StreamState state_ = StreamState::Idle;
    FileLocation startLocation_;
    bool compressionDecided_ = false;
    std::string sniffBuffer_;
    bool upstreamEnded_ = false;
    FileLocation finalLocation_;
};

// Transport for the URL scheme: drogon for http/https, memory mapping for file.
std::shared_ptr<HttpTransport> makeTransport(const StreamConfig& config);

JsonlStream streamJsonl(const StreamConfig& config);
