#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <openssl/evp.h>

// Shard envelope layout:
//   "SNSHARD1" | u16 BE wrapped key length | RSA-OAEP wrapped AES key |
//   12 byte IV | AES-256-GCM ciphertext | 16 byte tag
namespace envelope {
const char kMagic[] = "SNSHARD1";
const size_t kMagicSize = 8;
const size_t kKeySize = 32;
const size_t kIvSize = 12;
const size_t kTagSize = 16;
}

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

// Public half, used to wrap per-shard keys on backup.
class RecipientKey {
public:
    static std::shared_ptr<RecipientKey> loadPem(const std::string& path);
    explicit RecipientKey(PKeyPtr key) : key_(std::move(key)) {}
    EVP_PKEY* get() const { return key_.get(); }

private:
    PKeyPtr key_;
};

// Private half, used to unwrap on restore.
class IdentityKey {
public:
    static std::shared_ptr<IdentityKey> loadPem(const std::string& path);
    explicit IdentityKey(PKeyPtr key) : key_(std::move(key)) {}
    EVP_PKEY* get() const { return key_.get(); }

private:
    PKeyPtr key_;
};

class EnvelopeEncryptor {
public:
    explicit EnvelopeEncryptor(const RecipientKey& recipient);
    ~EnvelopeEncryptor();

    EnvelopeEncryptor(const EnvelopeEncryptor&) = delete;
    EnvelopeEncryptor& operator=(const EnvelopeEncryptor&) = delete;

    // Magic, wrapped key and IV; written once before any ciphertext.
    const std::string& header() const { return header_; }
    void update(const std::string& plaintext, std::string& out);
    // Appends the final block and the tag.
    void finish(std::string& out);

private:
    EVP_CIPHER_CTX* ctx_;
    std::string header_;
};

class EnvelopeDecryptor {
public:
    // Parses and unwraps the header; throws CodecError on mismatch.
    EnvelopeDecryptor(const IdentityKey& identity, const std::string& header);
    ~EnvelopeDecryptor();

    EnvelopeDecryptor(const EnvelopeDecryptor&) = delete;
    EnvelopeDecryptor& operator=(const EnvelopeDecryptor&) = delete;

    // Size of the header prefix as declared by its first ten bytes.
    static size_t headerSize(const std::string& prefix);

    void update(const char* data, size_t length, std::string& out);
    // Verifies the tag; throws CodecError on authentication failure.
    void finish(const std::string& tag);

private:
    EVP_CIPHER_CTX* ctx_;
};
