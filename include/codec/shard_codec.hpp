#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "codec/envelope_cipher.hpp"
#include "codec/gzip_stream.hpp"

class CancellationToken;
class SourceReader;

struct EncodedShard {
    uint64_t plaintextSize = 0;
    uint64_t ciphertextSize = 0;
};

// Source bytes -> gzip -> envelope, written to a local file.
class ShardEncoder {
public:
    ShardEncoder(std::shared_ptr<RecipientKey> recipient, int compressionLevel);

    // Consumes at most maxBytes from reader. Throws CodecError on codec or
    // file failures.
    EncodedShard encode(SourceReader& reader, uint64_t maxBytes, const std::string& outputPath,
                        const CancellationToken* cancel = nullptr) const;

private:
    std::shared_ptr<RecipientKey> recipient_;
    int compressionLevel_;
};

// Inverse of ShardEncoder. Plaintext is handed to the callback as it is
// produced, so callers must stage it until decode() returns.
class ShardDecoder {
public:
    using OutputCallback = std::function<void(const char*, size_t)>;

    explicit ShardDecoder(std::shared_ptr<IdentityKey> identity);

    // Returns the plaintext length. Throws CodecError when the envelope,
    // tag or gzip stream is invalid.
    uint64_t decode(const std::string& inputPath, const OutputCallback& output,
                    const CancellationToken* cancel = nullptr) const;

    uint64_t decodeToFile(const std::string& inputPath, const std::string& outputPath,
                          const CancellationToken* cancel = nullptr) const;

private:
    std::shared_ptr<IdentityKey> identity_;
};
