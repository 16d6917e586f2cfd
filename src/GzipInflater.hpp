#pragma once
#include <array>
#include <string>
#include <string_view>
#include <zlib.h>

// Streaming gzip decoder on zlib. Concatenated gzip members are decoded back to back.
class GzipInflater {
public:
    GzipInflater();
    ~GzipInflater();

    GzipInflater(const GzipInflater&) = delete;
    GzipInflater& operator=(const GzipInflater&) = delete;

    // Decompresses one chunk of input; throws DecompressionError on corrupt data.
    std::string inflate(std::string_view input);

    // Throws DecompressionError when input ended inside a gzip member.
    void finish() const;

    size_t compressedBytesIn() const { return totalIn_; }

private:
    z_stream stream_{};
    // true between the first byte of a member and its trailer
    bool inMember_ = false;
    size_t totalIn_ = 0;
    std::array<char, 64 * 1024> outBuffer_;
};

bool hasGzipMagic(std::string_view prefix);
