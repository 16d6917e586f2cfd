#pragma once
#include <cstdint>
#include "FileLocation.hpp"

// Cumulative (byteOffset, line) counter. Only the LineFramer advances it.
class LocationTracker {
public:
    explicit LocationTracker(const FileLocation& start = FileLocation()) : location_(start) {}

    const FileLocation& location() const { return location_; }

private:
    friend class LineFramer;

    void advance(uint64_t consumedBytes) {
        location_.byteOffset += consumedBytes;
        ++location_.line;
    }

    FileLocation location_;
};
