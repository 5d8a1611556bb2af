#include "codec/shard_codec.hpp"
#include "common/byte_stream.hpp"
#include "common/cancellation.hpp"
#include <algorithm>
#include <fstream>
#include <vector>

namespace {

const size_t kBlockSize = 1024 * 1024;

void writeAll(std::ofstream& out, const std::string& data, const std::string& path) {
    if (data.empty()) {
        return;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw CodecError("Failed to write " + path);
    }
}

} // namespace

ShardEncoder::ShardEncoder(std::shared_ptr<RecipientKey> recipient, int compressionLevel)
    : recipient_(std::move(recipient))
    , compressionLevel_(compressionLevel) {
    if (!recipient_) {
        throw CodecError("No recipient key configured");
    }
}

EncodedShard ShardEncoder::encode(SourceReader& reader, uint64_t maxBytes, const std::string& outputPath,
                                  const CancellationToken* cancel) const {
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw CodecError("Cannot open " + outputPath + " for writing");
    }

    GzipCompressor compressor(compressionLevel_);
    EnvelopeEncryptor encryptor(*recipient_);

    EncodedShard result;
    writeAll(out, encryptor.header(), outputPath);
    result.ciphertextSize += encryptor.header().size();

    std::vector<char> block(kBlockSize);
    std::string compressed;
    std::string encrypted;
    while (result.plaintextSize < maxBytes) {
        if (cancel) {
            cancel->throwIfCancelled("shard encoding");
        }
        size_t want = static_cast<size_t>(std::min<uint64_t>(block.size(), maxBytes - result.plaintextSize));
        size_t got = reader.read(block.data(), want);
        if (got == 0) {
            break;
        }
        result.plaintextSize += got;

        compressed.clear();
        encrypted.clear();
        compressor.compress(block.data(), got, compressed);
        encryptor.update(compressed, encrypted);
        writeAll(out, encrypted, outputPath);
        result.ciphertextSize += encrypted.size();

        if (got < want) {
            break;
        }
    }

    compressed.clear();
    encrypted.clear();
    compressor.finish(compressed);
    encryptor.update(compressed, encrypted);
    encryptor.finish(encrypted);
    writeAll(out, encrypted, outputPath);
    result.ciphertextSize += encrypted.size();

    out.close();
    if (!out) {
        throw CodecError("Failed to close " + outputPath);
    }
    return result;
}

ShardDecoder::ShardDecoder(std::shared_ptr<IdentityKey> identity)
    : identity_(std::move(identity)) {
    if (!identity_) {
        throw CodecError("No identity key configured");
    }
}

uint64_t ShardDecoder::decode(const std::string& inputPath, const OutputCallback& output,
                              const CancellationToken* cancel) const {
    std::ifstream in(inputPath, std::ios::binary);
    if (!in) {
        throw CodecError("Cannot open " + inputPath);
    }
    in.seekg(0, std::ios::end);
    uint64_t fileSize = static_cast<uint64_t>(in.tellg());
    in.seekg(0);

    std::string prefix(envelope::kMagicSize + 2, '\0');
    if (!in.read(&prefix[0], prefix.size())) {
        throw CodecError("Shard is too short for an envelope header");
    }
    size_t headerSize = EnvelopeDecryptor::headerSize(prefix);
    if (fileSize < headerSize + envelope::kTagSize) {
        throw CodecError("Shard is truncated");
    }

    std::string header = prefix;
    header.resize(headerSize);
    if (!in.read(&header[prefix.size()], headerSize - prefix.size())) {
        throw CodecError("Shard envelope header is truncated");
    }

    std::string tag(envelope::kTagSize, '\0');
    in.seekg(static_cast<std::streamoff>(fileSize - envelope::kTagSize));
    if (!in.read(&tag[0], tag.size())) {
        throw CodecError("Cannot read shard authentication tag");
    }
    in.seekg(static_cast<std::streamoff>(headerSize));

    EnvelopeDecryptor decryptor(*identity_, header);
    GzipDecompressor decompressor;

    uint64_t remaining = fileSize - headerSize - envelope::kTagSize;
    uint64_t plaintextSize = 0;
    std::vector<char> block(kBlockSize);
    std::string decrypted;
    std::string inflated;
    while (remaining > 0) {
        if (cancel) {
            cancel->throwIfCancelled("shard decoding");
        }
        size_t want = static_cast<size_t>(std::min<uint64_t>(block.size(), remaining));
        if (!in.read(block.data(), want)) {
            throw CodecError("Failed to read " + inputPath);
        }
        remaining -= want;

        decrypted.clear();
        inflated.clear();
        decryptor.update(block.data(), want, decrypted);
        decompressor.decompress(decrypted.data(), decrypted.size(), inflated);
        if (!inflated.empty()) {
            output(inflated.data(), inflated.size());
            plaintextSize += inflated.size();
        }
    }

    decryptor.finish(tag);
    decompressor.finish();
    return plaintextSize;
}

uint64_t ShardDecoder::decodeToFile(const std::string& inputPath, const std::string& outputPath,
                                    const CancellationToken* cancel) const {
    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw CodecError("Cannot open " + outputPath + " for writing");
    }

    uint64_t size = decode(inputPath, [&](const char* data, size_t length) {
        out.write(data, static_cast<std::streamsize>(length));
        if (!out) {
            throw CodecError("Failed to write " + outputPath);
        }
    }, cancel);

    out.close();
    if (!out) {
        throw CodecError("Failed to close " + outputPath);
    }
    return size;
}
