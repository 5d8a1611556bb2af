#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Exported snapshot byte stream. read() returns 0 only at end of stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(char* buffer, size_t length) = 0;
    // Releases the producer; throws SourceUnavailable if it failed.
    virtual void close() = 0;
};

// Destination of a reconstructed stream. Nothing is final until commit().
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(const char* data, size_t length) = 0;
    virtual void commit() = 0;
    virtual void abort() = 0;
};

class StreamSourceFactory {
public:
    virtual ~StreamSourceFactory() = default;
    // Same (source, since) must produce the same bytes on every call.
    virtual std::unique_ptr<ByteSource> openExport(const std::string& sourceIdentifier,
                                                   const std::string& sinceIdentifier) = 0;
};

class StreamSinkFactory {
public:
    virtual ~StreamSinkFactory() = default;
    virtual std::unique_ptr<ByteSink> openImport(const std::string& target) = 0;
};

// Buffered reader with a one byte look-ahead so the caller can tell a
// source that ended exactly on a shard boundary from one that did not.
class SourceReader {
public:
    explicit SourceReader(ByteSource& source, size_t bufferSize = 1024 * 1024);

    // Fills up to length bytes; short only at end of stream.
    size_t read(char* buffer, size_t length);
    bool atEnd();
    // Returns the number of bytes actually skipped.
    uint64_t discard(uint64_t count);
    uint64_t position() const { return position_; }

private:
    bool fill();

    ByteSource& source_;
    std::vector<char> buffer_;
    size_t begin_;
    size_t end_;
    bool eof_;
    uint64_t position_;
};
