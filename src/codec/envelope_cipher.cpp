#include "codec/envelope_cipher.hpp"
#include "codec/gzip_stream.hpp"
#include <cstdio>
#include <cstring>
#include <vector>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

namespace {

std::string opensslError(const std::string& what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return what + ": " + buffer;
}

struct PKeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

PKeyPtr readPem(const std::string& path, bool isPrivate) {
    FILE* file = std::fopen(path.c_str(), "r");
    if (!file) {
        throw CodecError("Cannot open key file: " + path);
    }
    EVP_PKEY* key = isPrivate ? PEM_read_PrivateKey(file, nullptr, nullptr, nullptr)
                              : PEM_read_PUBKEY(file, nullptr, nullptr, nullptr);
    std::fclose(file);
    if (!key) {
        throw CodecError(opensslError("Cannot parse key file " + path));
    }
    return PKeyPtr(key);
}

std::string wrapKey(EVP_PKEY* recipient, const unsigned char* key, size_t keyLength) {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new(recipient, nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0) {
        throw CodecError(opensslError("Failed to set up key wrapping"));
    }

    size_t outLength = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outLength, key, keyLength) <= 0) {
        throw CodecError(opensslError("Failed to size wrapped key"));
    }
    std::vector<unsigned char> out(outLength);
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &outLength, key, keyLength) <= 0) {
        throw CodecError(opensslError("Failed to wrap key"));
    }
    return std::string(reinterpret_cast<char*>(out.data()), outLength);
}

std::vector<unsigned char> unwrapKey(EVP_PKEY* identity, const std::string& wrapped) {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new(identity, nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0) {
        throw CodecError(opensslError("Failed to set up key unwrapping"));
    }

    const unsigned char* in = reinterpret_cast<const unsigned char*>(wrapped.data());
    size_t outLength = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &outLength, in, wrapped.size()) <= 0) {
        throw CodecError(opensslError("Failed to size unwrapped key"));
    }
    std::vector<unsigned char> out(outLength);
    if (EVP_PKEY_decrypt(ctx.get(), out.data(), &outLength, in, wrapped.size()) <= 0) {
        throw CodecError(opensslError("Failed to unwrap shard key"));
    }
    out.resize(outLength);
    if (out.size() != envelope::kKeySize) {
        throw CodecError("Unwrapped shard key has wrong length");
    }
    return out;
}

} // namespace

std::shared_ptr<RecipientKey> RecipientKey::loadPem(const std::string& path) {
    return std::make_shared<RecipientKey>(readPem(path, false));
}

std::shared_ptr<IdentityKey> IdentityKey::loadPem(const std::string& path) {
    return std::make_shared<IdentityKey>(readPem(path, true));
}

EnvelopeEncryptor::EnvelopeEncryptor(const RecipientKey& recipient)
    : ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) {
        throw CodecError("AES-GCM context allocation failed");
    }

    unsigned char key[envelope::kKeySize];
    unsigned char iv[envelope::kIvSize];
    if (RAND_bytes(key, sizeof(key)) != 1 || RAND_bytes(iv, sizeof(iv)) != 1) {
        EVP_CIPHER_CTX_free(ctx_);
        throw CodecError(opensslError("RAND_bytes failed"));
    }

    try {
        std::string wrapped = wrapKey(recipient.get(), key, sizeof(key));
        if (wrapped.size() > 0xffff) {
            throw CodecError("Wrapped key too large");
        }
        header_.assign(envelope::kMagic, envelope::kMagicSize);
        header_.push_back(static_cast<char>((wrapped.size() >> 8) & 0xff));
        header_.push_back(static_cast<char>(wrapped.size() & 0xff));
        header_ += wrapped;
        header_.append(reinterpret_cast<char*>(iv), sizeof(iv));

        if (EVP_EncryptInit_ex(ctx_, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_IVLEN, sizeof(iv), nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx_, nullptr, nullptr, key, iv) != 1) {
            throw CodecError(opensslError("AES-GCM init failed"));
        }
    } catch (...) {
        OPENSSL_cleanse(key, sizeof(key));
        EVP_CIPHER_CTX_free(ctx_);
        throw;
    }
    OPENSSL_cleanse(key, sizeof(key));
}

EnvelopeEncryptor::~EnvelopeEncryptor() {
    EVP_CIPHER_CTX_free(ctx_);
}

void EnvelopeEncryptor::update(const std::string& plaintext, std::string& out) {
    if (plaintext.empty()) {
        return;
    }
    size_t offset = out.size();
    out.resize(offset + plaintext.size());
    int outLength = 0;
    if (EVP_EncryptUpdate(ctx_, reinterpret_cast<unsigned char*>(&out[offset]), &outLength,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw CodecError(opensslError("AES-GCM encrypt failed"));
    }
    out.resize(offset + outLength);
}

void EnvelopeEncryptor::finish(std::string& out) {
    unsigned char tail[16];
    int outLength = 0;
    if (EVP_EncryptFinal_ex(ctx_, tail, &outLength) != 1) {
        throw CodecError(opensslError("AES-GCM final failed"));
    }
    out.append(reinterpret_cast<char*>(tail), outLength);

    unsigned char tag[envelope::kTagSize];
    if (EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_GET_TAG, sizeof(tag), tag) != 1) {
        throw CodecError(opensslError("AES-GCM get tag failed"));
    }
    out.append(reinterpret_cast<char*>(tag), sizeof(tag));
}

size_t EnvelopeDecryptor::headerSize(const std::string& prefix) {
    if (prefix.size() < envelope::kMagicSize + 2 ||
        prefix.compare(0, envelope::kMagicSize, envelope::kMagic, envelope::kMagicSize) != 0) {
        throw CodecError("Missing shard envelope magic");
    }
    size_t wrappedLength = (static_cast<unsigned char>(prefix[envelope::kMagicSize]) << 8) |
                           static_cast<unsigned char>(prefix[envelope::kMagicSize + 1]);
    return envelope::kMagicSize + 2 + wrappedLength + envelope::kIvSize;
}

EnvelopeDecryptor::EnvelopeDecryptor(const IdentityKey& identity, const std::string& header)
    : ctx_(nullptr) {
    size_t expected = headerSize(header);
    if (header.size() != expected) {
        throw CodecError("Truncated shard envelope header");
    }

    size_t wrappedLength = expected - envelope::kMagicSize - 2 - envelope::kIvSize;
    std::string wrapped = header.substr(envelope::kMagicSize + 2, wrappedLength);
    const unsigned char* iv =
        reinterpret_cast<const unsigned char*>(header.data()) + envelope::kMagicSize + 2 + wrappedLength;

    std::vector<unsigned char> key = unwrapKey(identity.get(), wrapped);

    ctx_ = EVP_CIPHER_CTX_new();
    if (!ctx_) {
        OPENSSL_cleanse(key.data(), key.size());
        throw CodecError("AES-GCM context allocation failed");
    }
    bool ok = EVP_DecryptInit_ex(ctx_, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_IVLEN, envelope::kIvSize, nullptr) == 1 &&
              EVP_DecryptInit_ex(ctx_, nullptr, nullptr, key.data(), iv) == 1;
    OPENSSL_cleanse(key.data(), key.size());
    if (!ok) {
        EVP_CIPHER_CTX_free(ctx_);
        ctx_ = nullptr;
        throw CodecError(opensslError("AES-GCM init failed"));
    }
}

EnvelopeDecryptor::~EnvelopeDecryptor() {
    EVP_CIPHER_CTX_free(ctx_);
}

void EnvelopeDecryptor::update(const char* data, size_t length, std::string& out) {
    if (length == 0) {
        return;
    }
    size_t offset = out.size();
    out.resize(offset + length);
    int outLength = 0;
    if (EVP_DecryptUpdate(ctx_, reinterpret_cast<unsigned char*>(&out[offset]), &outLength,
                          reinterpret_cast<const unsigned char*>(data), static_cast<int>(length)) != 1) {
        throw CodecError(opensslError("AES-GCM decrypt failed"));
    }
    out.resize(offset + outLength);
}

void EnvelopeDecryptor::finish(const std::string& tag) {
    if (tag.size() != envelope::kTagSize) {
        throw CodecError("Shard authentication tag has wrong length");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx_, EVP_CTRL_GCM_SET_TAG, envelope::kTagSize,
                            const_cast<char*>(tag.data())) != 1) {
        throw CodecError(opensslError("AES-GCM set tag failed"));
    }
    unsigned char tail[16];
    int outLength = 0;
    if (EVP_DecryptFinal_ex(ctx_, tail, &outLength) != 1) {
        throw CodecError("Shard authentication failed");
    }
}
