#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

enum class TransportStatus {
    Ok,              // an HTTP response was received, whatever its status code
    NetworkFailure,
    Timeout,
    BadResponse,
    ResolveFailure,  // host name did not resolve; may be temporary
    BadAddress,      // URL is unusable
    TlsFailure,
};

const char* toString(TransportStatus status);

struct HttpResult {
    TransportStatus status = TransportStatus::Ok;
    int statusCode = 0;
    // Keys are lower case
    std::map<std::string, std::string> headers;
    std::string body;
    std::string message;

    std::string header(const std::string& lowerCaseName) const;
};

// Inclusive byte range; an unset last means "to the end of the resource".
struct ByteRange {
    uint64_t first = 0;
    std::optional<uint64_t> last;

    std::string toHeaderValue() const;
};

// Narrow request interface the fetcher is written against.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult head(const std::string& url) = 0;
    virtual HttpResult get(const std::string& url, const std::optional<ByteRange>& range) = 0;
};

struct ParsedUrl {
    std::string scheme;     // lower case
    std::string host;
    uint16_t port = 0;      // 0 when absent
    std::string target;     // path plus query, always starts with '/'

    // scheme://host[:port]
    std::string origin() const;
};

// Throws std::invalid_argument on a malformed URL.
ParsedUrl parseUrl(const std::string& url);

// Target of a Location header: absolute, scheme relative ("//host/x"), rooted ("/x")
// or relative to the directory of base. Dot segments are left as they are.
// Throws std::invalid_argument when base is malformed.
std::string resolveUrl(const std::string& base, const std::string& reference);

// Parses "bytes a-b/total"; returns the total size when known.
std::optional<uint64_t> contentRangeTotal(const std::string& contentRange);

// First byte position a of "bytes a-b/total"; nullopt for "bytes */total" or garbage.
std::optional<uint64_t> contentRangeFirst(const std::string& contentRange);
