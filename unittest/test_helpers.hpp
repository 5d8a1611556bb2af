#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "common/byte_stream.hpp"
#include "common/errors.hpp"
#include "storage/local_remote_store.hpp"

namespace testing_support {

// Directory removed with everything under it when the test ends.
class ScopedTempDir {
public:
    ScopedTempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "snapshard-test-XXXXXX").string();
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

struct KeyPairFiles {
    std::string publicKey;
    std::string privateKey;
};

// Writes a fresh RSA-2048 key pair as PEM files into directory.
inline KeyPairFiles writeKeyPair(const std::string& directory) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    EVP_PKEY* key = nullptr;
    if (!ctx || EVP_PKEY_keygen_init(ctx) <= 0 || EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 2048) <= 0 ||
        EVP_PKEY_keygen(ctx, &key) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        throw std::runtime_error("RSA key generation failed");
    }
    EVP_PKEY_CTX_free(ctx);

    KeyPairFiles files{directory + "/recipient.pem", directory + "/identity.pem"};
    FILE* pub = std::fopen(files.publicKey.c_str(), "w");
    FILE* priv = std::fopen(files.privateKey.c_str(), "w");
    bool ok = pub && priv && PEM_write_PUBKEY(pub, key) == 1 &&
              PEM_write_PrivateKey(priv, key, nullptr, nullptr, 0, nullptr, nullptr) == 1;
    if (pub) {
        std::fclose(pub);
    }
    if (priv) {
        std::fclose(priv);
    }
    EVP_PKEY_free(key);
    if (!ok) {
        throw std::runtime_error("Cannot write PEM key pair");
    }
    return files;
}

// Incompressible but reproducible bytes.
inline std::string patternBytes(size_t length, uint32_t seed = 1) {
    std::string data(length, '\0');
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < length; ++i) {
        state = state * 1664525u + 1013904223u;
        data[i] = static_cast<char>(state >> 24);
    }
    return data;
}

// Serves a fixed string in small reads. close() can be told to fail the
// way a producer exiting non-zero would.
class MemorySource : public ByteSource {
public:
    MemorySource(std::string data, bool failOnClose = false)
        : data_(std::move(data)), offset_(0), failOnClose_(failOnClose) {}

    size_t read(char* buffer, size_t length) override {
        size_t count = std::min<size_t>({length, data_.size() - offset_, 4096});
        data_.copy(buffer, count, offset_);
        offset_ += count;
        return count;
    }

    void close() override {
        if (failOnClose_) {
            throw SourceUnavailable("export exited with status 1");
        }
    }

private:
    std::string data_;
    size_t offset_;
    bool failOnClose_;
};

class MemorySourceFactory : public StreamSourceFactory {
public:
    void set(const std::string& identifier, const std::string& data) { streams_[identifier] = data; }
    void failOnClose(bool fail) { failOnClose_ = fail; }
    int opened() const { return opened_; }

    std::unique_ptr<ByteSource> openExport(const std::string& sourceIdentifier,
                                           const std::string& sinceIdentifier) override {
        auto it = streams_.find(sinceIdentifier.empty() ? sourceIdentifier
                                                        : sinceIdentifier + ".." + sourceIdentifier);
        if (it == streams_.end()) {
            throw SourceUnavailable("No such stream: " + sourceIdentifier);
        }
        ++opened_;
        return std::make_unique<MemorySource>(it->second, failOnClose_);
    }

private:
    std::map<std::string, std::string> streams_;
    bool failOnClose_ = false;
    int opened_ = 0;
};

class MemorySink : public ByteSink {
public:
    void write(const char* data, size_t length) override { data_.append(data, length); }
    void commit() override { committed_ = true; }
    void abort() override { aborted_ = true; }

    const std::string& data() const { return data_; }
    bool committed() const { return committed_; }
    bool aborted() const { return aborted_; }

private:
    std::string data_;
    bool committed_ = false;
    bool aborted_ = false;
};

class MemorySinkFactory : public StreamSinkFactory {
public:
    std::unique_ptr<ByteSink> openImport(const std::string& target) override {
        lastTarget = target;
        return std::make_unique<ForwardingSink>(sink);
    }

    MemorySink sink;
    std::string lastTarget;

private:
    class ForwardingSink : public ByteSink {
    public:
        explicit ForwardingSink(MemorySink& target) : target_(target) {}
        void write(const char* data, size_t length) override { target_.write(data, length); }
        void commit() override { target_.commit(); }
        void abort() override { target_.abort(); }

    private:
        MemorySink& target_;
    };
};

// Local store whose shard uploads start failing after a number of
// successful ones, leaving the sidecar of the failed shard behind.
class FlakyStore : public LocalRemoteStore {
public:
    explicit FlakyStore(const std::string& root) : LocalRemoteStore(root) {}

    void failShardUploadsAfter(int count) { remainingUploads_ = count; }
    void heal() { remainingUploads_ = -1; }

    void putFile(const std::string& path, const std::string& localFile,
                 const CancellationToken* cancel = nullptr) override {
        if (remainingUploads_ == 0) {
            throw StorageError("connection reset");
        }
        if (remainingUploads_ > 0) {
            --remainingUploads_;
        }
        LocalRemoteStore::putFile(path, localFile, cancel);
    }

private:
    int remainingUploads_ = -1;
};

} // namespace testing_support
