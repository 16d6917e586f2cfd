#include "GzipInflater.hpp"
#include "StreamErrors.hpp"

GzipInflater::GzipInflater() {
    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    stream_.opaque = Z_NULL;
    stream_.avail_in = 0;
    stream_.next_in = Z_NULL;
    // 16 + MAX_WBITS: expect a gzip header and trailer instead of a zlib wrapper
    if (inflateInit2(&stream_, 16 + MAX_WBITS) != Z_OK) {
        throw DecompressionError("Failed to initialize zlib inflate");
    }
}

GzipInflater::~GzipInflater() {
    inflateEnd(&stream_);
}

std::string GzipInflater::inflate(std::string_view input) {
    std::string output;
    stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream_.avail_in = static_cast<uInt>(input.size());
    totalIn_ += input.size();

    // Keep going while input remains or zlib may still hold output for a full buffer
    do {
        if (stream_.avail_in > 0) {
            inMember_ = true;
        }
        stream_.next_out = reinterpret_cast<Bytef*>(outBuffer_.data());
        stream_.avail_out = static_cast<uInt>(outBuffer_.size());

        int ret = ::inflate(&stream_, Z_NO_FLUSH);
        output.append(outBuffer_.data(), outBuffer_.size() - stream_.avail_out);

        if (ret == Z_STREAM_END) {
            inMember_ = false;
            if (inflateReset(&stream_) != Z_OK) {
                throw DecompressionError("Failed to reset zlib stream after gzip member");
            }
        } else if (ret == Z_BUF_ERROR) {
            break;  // no progress possible without more input
        } else if (ret != Z_OK) {
            std::string message = stream_.msg ? stream_.msg : "zlib error " + std::to_string(ret);
            throw DecompressionError("Corrupt gzip data: " + message);
        }
    } while (stream_.avail_in > 0 || stream_.avail_out == 0);
    return output;
}

void GzipInflater::finish() const {
    if (inMember_) {
        throw DecompressionError("Truncated gzip stream");
    }
}

bool hasGzipMagic(std::string_view prefix) {
    return prefix.size() >= 2 && static_cast<unsigned char>(prefix[0]) == 0x1f &&
           static_cast<unsigned char>(prefix[1]) == 0x8b;
}
