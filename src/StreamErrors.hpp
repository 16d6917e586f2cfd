#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include "FileLocation.hpp"

// Failure reported by an HTTP transport or by the fetcher interpreting a response.
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, bool transient, int httpStatus = 0)
        : std::runtime_error(message), transient_(transient), httpStatus_(httpStatus) {}

    bool transient() const { return transient_; }
    // 0 when no HTTP response was received
    int httpStatus() const { return httpStatus_; }

private:
    bool transient_;
    int httpStatus_;
};

// Transient failures kept recurring until the retry budget ran out.
class RetryExhaustedError : public TransportError {
public:
    RetryExhaustedError(const std::string& message, int httpStatus, uint32_t attempts)
        : TransportError(message, true, httpStatus), attempts_(attempts) {}

    uint32_t attempts() const { return attempts_; }

private:
    uint32_t attempts_;
};

class DecompressionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class StreamErrorKind {
    Transport,
    RetryExhausted,
    Decompression,
    Decode,
    Configuration,
    Internal,  // any other exception escaping the pipeline
};

const char* toString(StreamErrorKind kind);

// Terminal error of a JSONL stream. location() is the last safe point to resume from.
class StreamError : public std::runtime_error {
public:
    StreamError(StreamErrorKind kind, const FileLocation& location, const std::string& message,
                std::exception_ptr cause = nullptr);

    StreamErrorKind kind() const { return kind_; }
    const FileLocation& location() const { return location_; }
    std::exception_ptr cause() const { return cause_; }

private:
    StreamErrorKind kind_;
    FileLocation location_;
    std::exception_ptr cause_;
};
