#include "codec/gzip_stream.hpp"
#include <cstring>

namespace {

// 15 bits of window plus 16 selects the gzip wrapper.
const int kGzipWindowBits = 15 + 16;
const size_t kChunkSize = 64 * 1024;

} // namespace

GzipCompressor::GzipCompressor(int level)
    : finished_(false) {
    std::memset(&stream_, 0, sizeof(stream_));
    if (deflateInit2(&stream_, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw CodecError("deflateInit2 failed");
    }
}

GzipCompressor::~GzipCompressor() {
    deflateEnd(&stream_);
}

void GzipCompressor::run(const char* data, size_t length, int flush, std::string& out) {
    stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream_.avail_in = static_cast<uInt>(length);

    char chunk[kChunkSize];
    int ret;
    do {
        stream_.next_out = reinterpret_cast<Bytef*>(chunk);
        stream_.avail_out = sizeof(chunk);
        ret = deflate(&stream_, flush);
        if (ret == Z_STREAM_ERROR) {
            throw CodecError("deflate failed");
        }
        out.append(chunk, sizeof(chunk) - stream_.avail_out);
    } while (stream_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
}

void GzipCompressor::compress(const char* data, size_t length, std::string& out) {
    if (finished_) {
        throw CodecError("Compressor already finished");
    }
    if (length == 0) {
        return;
    }
    run(data, length, Z_NO_FLUSH, out);
}

void GzipCompressor::finish(std::string& out) {
    if (finished_) {
        return;
    }
    run(nullptr, 0, Z_FINISH, out);
    finished_ = true;
}

GzipDecompressor::GzipDecompressor()
    : finished_(false) {
    std::memset(&stream_, 0, sizeof(stream_));
    if (inflateInit2(&stream_, kGzipWindowBits) != Z_OK) {
        throw CodecError("inflateInit2 failed");
    }
}

GzipDecompressor::~GzipDecompressor() {
    inflateEnd(&stream_);
}

void GzipDecompressor::decompress(const char* data, size_t length, std::string& out) {
    if (length == 0) {
        return;
    }
    if (finished_) {
        throw CodecError("Trailing data after gzip stream");
    }

    stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream_.avail_in = static_cast<uInt>(length);

    char chunk[kChunkSize];
    while (stream_.avail_in > 0 || stream_.avail_out == 0) {
        stream_.next_out = reinterpret_cast<Bytef*>(chunk);
        stream_.avail_out = sizeof(chunk);
        int ret = inflate(&stream_, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            throw CodecError(std::string("inflate failed: ") + (stream_.msg ? stream_.msg : "corrupt data"));
        }
        out.append(chunk, sizeof(chunk) - stream_.avail_out);
        if (ret == Z_STREAM_END) {
            finished_ = true;
            if (stream_.avail_in > 0) {
                throw CodecError("Trailing data after gzip stream");
            }
            break;
        }
        if (ret == Z_BUF_ERROR && stream_.avail_in == 0) {
            break;
        }
    }
}

void GzipDecompressor::finish() {
    if (!finished_) {
        throw CodecError("Truncated gzip stream");
    }
}
