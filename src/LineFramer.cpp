#include "LineFramer.hpp"
#include <algorithm>

LineFramer::LineFramer(const FileLocation& start) : tracker_(start) {}

void LineFramer::feed(std::string_view chunk) {
    // Compact once the handed out prefix dominates the buffer
    if (consumed_ > 0 && consumed_ >= carry_.size() / 2) {
        carry_.erase(0, consumed_);
        scanned_ -= consumed_;
        consumed_ = 0;
    }
    carry_.append(chunk.data(), chunk.size());
}

std::optional<FramedLine> LineFramer::next() {
    size_t newline = carry_.find('\n', scanned_);
    if (newline == std::string::npos) {
        scanned_ = carry_.size();
        return std::nullopt;
    }
    size_t length = newline - consumed_;
    size_t terminator = 1;
    if (length > 0 && carry_[newline - 1] == '\r') {
        --length;
        ++terminator;
    }
    return take(length, terminator);
}

std::optional<FramedLine> LineFramer::finish() {
    if (!hasPartialLine()) {
        return std::nullopt;
    }
    size_t length = carry_.size() - consumed_;
    size_t terminator = 0;
    // A lone trailing '\r' is part of an unfinished CRLF
    if (carry_.back() == '\r') {
        --length;
        ++terminator;
    }
    return take(length, terminator);
}

void LineFramer::abandon() {
    carry_.clear();
    consumed_ = 0;
    scanned_ = 0;
}

FramedLine LineFramer::take(size_t length, size_t terminatorLength) {
    FramedLine line;
    line.text.assign(carry_, consumed_, length);
    consumed_ += length + terminatorLength;
    scanned_ = consumed_;
    tracker_.advance(length + terminatorLength);
    line.location = tracker_.location();
    return line;
}

bool isBlankLine(std::string_view line) {
    return std::all_of(line.begin(), line.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}
