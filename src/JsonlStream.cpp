#include "JsonlStream.hpp"
#include <stdexcept>
#include <utility>
#include <trantor/utils/Logger.h>
#include "DrogonTransport.hpp"
#include "MappedFileTransport.hpp"

const char* toString(StreamState state) {
    switch (state) {
        case StreamState::Idle: return "idle";
        case StreamState::Fetching: return "fetching";
        case StreamState::Backoff: return "backoff";
        case StreamState::Framing: return "framing";
        case StreamState::Done: return "done";
        case StreamState::Failed: return "failed";
    }
    return "unknown";
}

namespace {

StreamConfig validated(StreamConfig config) {
    try {
        config.validate();
    } catch (const std::exception& e) {
        throw StreamError(StreamErrorKind::Configuration, config.startingLocation.value_or(FileLocation()), e.what(),
                          std::current_exception());
    }
    return config;
}

}  // namespace

std::shared_ptr<HttpTransport> makeTransport(const StreamConfig& config) {
    ParsedUrl parsed = parseUrl(config.url);
    if (parsed.scheme == "file") {
        return std::make_shared<MappedFileTransport>();
    }
    if (parsed.scheme == "http" || parsed.scheme == "https") {
        return std::make_shared<DrogonTransport>(config.requestTimeoutSec);
    }
    throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
}

JsonlStream streamJsonl(const StreamConfig& config) {
    return JsonlStream(config);
}

JsonlStream::JsonlStream(StreamConfig config) : JsonlStream(std::move(config), nullptr, nullptr) {}

JsonlStream::JsonlStream(StreamConfig config, std::shared_ptr<HttpTransport> transport,
                         std::shared_ptr<RetryClock> clock)
    : config_(validated(std::move(config))), transport_(std::move(transport)), clock_(std::move(clock)) {
    startLocation_ = config_.startingLocation.value_or(FileLocation());
    finalLocation_ = startLocation_;
    if (!transport_) {
        try {
            transport_ = makeTransport(config_);
        } catch (const std::exception& e) {
            throw StreamError(StreamErrorKind::Configuration, startLocation_, e.what(), std::current_exception());
        }
    }
    if (!clock_) {
        clock_ = std::make_shared<SteadyRetryClock>();
    }
}

JsonlStream::~JsonlStream() = default;

FileLocation JsonlStream::location() const {
    if (!framer_) {
        return finalLocation_;
    }
    const FileLocation& current = framer_->tracker().location();
    // Still re-reading lines that precede the resume point
    if (current.line < startLocation_.line) {
        return startLocation_;
    }
    return current;
}

void JsonlStream::close() {
    if (state_ == StreamState::Done || state_ == StreamState::Failed) {
        return;
    }
    LOG_DEBUG << "Stream of " << config_.url << " closed at " << toString(location());
    release();
    state_ = StreamState::Done;
}

void JsonlStream::release() {
    finalLocation_ = location();
    fetcher_.reset();
    inflater_.reset();
    framer_.reset();
    transport_.reset();
}

void JsonlStream::fail(StreamErrorKind kind, const FileLocation& location, const std::string& message,
                       std::exception_ptr cause) {
    LOG_ERROR << "Stream of " << config_.url << " failed at " << toString(location) << ": " << message;
    if (framer_) {
        framer_->abandon();
    }
    release();
    finalLocation_ = location;
    state_ = StreamState::Failed;
    throw StreamError(kind, location, message, std::move(cause));
}

void JsonlStream::decideCompression(bool isGzip) {
    compressionDecided_ = true;
    if (isGzip) {
        inflater_ = std::make_unique<GzipInflater>();
    }
    LOG_DEBUG << config_.url << " is " << (isGzip ? "gzip compressed" : "not compressed");
}

void JsonlStream::start() {
    fetcher_ = std::make_unique<RangeFetcher>(*transport_, config_.url, config_.chunkSize, config_.backoffPolicy(),
                                              *clock_);
    fetcher_->setBackoffObserver([this](Millis) { state_ = StreamState::Backoff; });

    if (config_.compression != Compression::Auto) {
        decideCompression(config_.compression == Compression::Gzip);
    }

    FileLocation framerStart;
    bool resuming = startLocation_.byteOffset > 0 || startLocation_.line > 0;
    if (resuming) {
        state_ = StreamState::Fetching;
        RangeSupport support = fetcher_->checkRanges();
        if (support.rangesSupported && !compressionDecided_) {
            decideCompression(hasGzipMagic(fetcher_->readPrefix(2)));
        }
        if (support.rangesSupported && !gzip() && startLocation_.byteOffset > 0) {
            LOG_INFO << "Resuming " << config_.url << " at " << toString(startLocation_);
            fetcher_->startAt(startLocation_.byteOffset);
            framerStart = startLocation_;
        } else {
            LOG_WARN << "Resuming " << config_.url << " from its first byte and skipping " << startLocation_.line
                     << " lines (" << (gzip() ? "gzip resource" : "no range support") << ")";
        }
    }
    framer_ = std::make_unique<LineFramer>(framerStart);
}

void JsonlStream::feed(std::string bytes) {
    if (!compressionDecided_) {
        sniffBuffer_ += bytes;
        if (sniffBuffer_.size() < 2 && !upstreamEnded_) {
            return;
        }
        decideCompression(hasGzipMagic(sniffBuffer_));
        bytes = std::move(sniffBuffer_);
        sniffBuffer_.clear();
    }
    if (inflater_) {
        framer_->feed(inflater_->inflate(bytes));
    } else {
        framer_->feed(bytes);
    }
}

void JsonlStream::pump() {
    state_ = StreamState::Fetching;
    std::optional<std::string> chunk = fetcher_->next();
    if (chunk) {
        feed(std::move(*chunk));
        return;
    }
    upstreamEnded_ = true;
    if (!compressionDecided_) {
        feed(std::string());
    }
}

std::optional<JsonlRecord> JsonlStream::next() {
    if (state_ == StreamState::Done || state_ == StreamState::Failed) {
        return std::nullopt;
    }
    try {
        if (state_ == StreamState::Idle) {
            start();
        }
        for (;;) {
            state_ = StreamState::Framing;
            FileLocation before = location();
            std::optional<FramedLine> line = framer_->next();
            if (!line && upstreamEnded_) {
                // Bytes of a truncated gzip member never form a safe line
                if (inflater_) {
                    inflater_->finish();
                }
                line = framer_->finish();
            }
            if (!line) {
                if (upstreamEnded_) {
                    LOG_DEBUG << "Stream of " << config_.url << " completed at " << toString(location());
                    release();
                    state_ = StreamState::Done;
                    return std::nullopt;
                }
                pump();
                continue;
            }
            if (line->location.line <= startLocation_.line || isBlankLine(line->text)) {
                continue;
            }
            try {
                return JsonlRecord{decoder_.decode(line->text), line->location};
            } catch (const DecodeError& e) {
                fail(StreamErrorKind::Decode, before, std::string(e.what()) + " on line " +
                                                          std::to_string(line->location.line),
                     std::current_exception());
            }
        }
    } catch (const StreamError&) {
        throw;
    } catch (const RetryExhaustedError& e) {
        fail(StreamErrorKind::RetryExhausted, location(), e.what(), std::current_exception());
    } catch (const TransportError& e) {
        fail(StreamErrorKind::Transport, location(), e.what(), std::current_exception());
    } catch (const DecompressionError& e) {
        fail(StreamErrorKind::Decompression, location(), e.what(), std::current_exception());
    } catch (const std::exception& e) {
        fail(StreamErrorKind::Internal, location(), e.what(), std::current_exception());
    }
}

JsonlStream::iterator& JsonlStream::iterator::operator++() {
    current_ = stream_->next();
    if (!current_) {
        stream_ = nullptr;
    }
    return *this;
}
