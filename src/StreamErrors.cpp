#include "StreamErrors.hpp"
#include <utility>

const char* toString(StreamErrorKind kind) {
    switch (kind) {
        case StreamErrorKind::Transport: return "transport";
        case StreamErrorKind::RetryExhausted: return "retry_exhausted";
        case StreamErrorKind::Decompression: return "decompression";
        case StreamErrorKind::Decode: return "decode";
        case StreamErrorKind::Configuration: return "configuration";
        case StreamErrorKind::Internal: return "internal";
    }
    return "unknown";
}

StreamError::StreamError(StreamErrorKind kind, const FileLocation& location, const std::string& message,
                         std::exception_ptr cause)
    : std::runtime_error(std::string(toString(kind)) + " error at " + toString(location) + ": " + message),
      kind_(kind),
      location_(location),
      cause_(std::move(cause)) {}
