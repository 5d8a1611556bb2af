#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <zlib.h>

// Raised by the codec layer on malformed input or library failures.
class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class GzipCompressor {
public:
    explicit GzipCompressor(int level);
    ~GzipCompressor();

    GzipCompressor(const GzipCompressor&) = delete;
    GzipCompressor& operator=(const GzipCompressor&) = delete;

    // Appends compressed bytes to out.
    void compress(const char* data, size_t length, std::string& out);
    void finish(std::string& out);

private:
    void run(const char* data, size_t length, int flush, std::string& out);

    z_stream stream_;
    bool finished_;
};

class GzipDecompressor {
public:
    GzipDecompressor();
    ~GzipDecompressor();

    GzipDecompressor(const GzipDecompressor&) = delete;
    GzipDecompressor& operator=(const GzipDecompressor&) = delete;

    // Appends inflated bytes to out. Input past the end of the gzip member
    // is rejected.
    void decompress(const char* data, size_t length, std::string& out);
    // Throws unless the gzip trailer has been seen.
    void finish();
    bool finished() const { return finished_; }

private:
    z_stream stream_;
    bool finished_;
};
