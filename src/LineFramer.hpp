#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "LocationTracker.hpp"

struct FramedLine {
    std::string text;       // without the terminator
    FileLocation location;  // position right after the line
};

// Slices a byte stream into '\n' terminated lines. A '\r' before the '\n' is stripped.
// Bytes of an unterminated line are carried over to the next feed().
class LineFramer {
public:
    explicit LineFramer(const FileLocation& start = FileLocation());

    void feed(std::string_view chunk);

    // Next complete line from the carry buffer, or nullopt if more input is needed.
    std::optional<FramedLine> next();

    // Upstream ended cleanly: the unterminated remainder, if any, becomes the last line.
    std::optional<FramedLine> finish();

    // Upstream failed: the unterminated remainder is not a safe line and is dropped.
    void abandon();

    bool hasPartialLine() const { return carry_.size() > consumed_; }
    const LocationTracker& tracker() const { return tracker_; }

private:
    FramedLine take(size_t length, size_t terminatorLength);

    std::string carry_;
    size_t consumed_ = 0;  // bytes of carry_ already handed out
    size_t scanned_ = 0;   // no '\n' in carry_[consumed_, scanned_)
    LocationTracker tracker_;
};

// Empty or whitespace-only lines are counted but produce no record.
bool isBlankLine(std::string_view line);
