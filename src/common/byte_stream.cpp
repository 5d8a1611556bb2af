#include "common/byte_stream.hpp"
#include <algorithm>
#include <cstring>

SourceReader::SourceReader(ByteSource& source, size_t bufferSize)
    : source_(source)
    , buffer_(bufferSize == 0 ? 1 : bufferSize)
    , begin_(0)
    , end_(0)
    , eof_(false)
    , position_(0) {
}

bool SourceReader::fill() {
    if (begin_ < end_) {
        return true;
    }
    if (eof_) {
        return false;
    }
    begin_ = 0;
    end_ = source_.read(buffer_.data(), buffer_.size());
    if (end_ == 0) {
        eof_ = true;
        return false;
    }
    return true;
}

size_t SourceReader::read(char* buffer, size_t length) {
    size_t total = 0;
    while (total < length && fill()) {
        size_t n = std::min(length - total, end_ - begin_);
        std::memcpy(buffer + total, buffer_.data() + begin_, n);
        begin_ += n;
        total += n;
    }
    position_ += total;
    return total;
}

bool SourceReader::atEnd() {
    return !fill();
}

uint64_t SourceReader::discard(uint64_t count) {
    uint64_t skipped = 0;
    while (skipped < count && fill()) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(count - skipped, end_ - begin_));
        begin_ += n;
        skipped += n;
    }
    position_ += skipped;
    return skipped;
}
