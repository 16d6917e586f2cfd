#pragma once
#include <memory>
#include <string>
#include "HttpTransport.hpp"
#include "MappedFile.hpp"

// Serves file:// URLs with HTTP semantics (200, 206, 404, 416) from a memory mapping.
// The mapping of the last requested file is kept open between requests.
class MappedFileTransport : public HttpTransport {
public:
    HttpResult head(const std::string& url) override;
    HttpResult get(const std::string& url, const std::optional<ByteRange>& range) override;

private:
    // Returns nullptr and fills result (404, 403 or BadAddress) when the file cannot be mapped.
    std::shared_ptr<MappedFile> open(const std::string& url, HttpResult& result);

    std::string openPath_;
    std::shared_ptr<MappedFile> openFile_;
};

// Percent-decoded local path of a file:// URL.
std::string fileUrlPath(const std::string& url);
