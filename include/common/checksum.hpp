#pragma once

#include <string>
#include <cstddef>
#include <openssl/evp.h>

// Incremental SHA-256 over EVP.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t length);
    // Returns the lowercase hex digest. The context cannot be reused afterwards.
    std::string finalHex();
    std::string finalRaw();

private:
    EVP_MD_CTX* ctx_;
    bool finished_;
};

std::string sha256Hex(const std::string& data);
std::string calculateFileChecksum(const std::string& path);

std::string toHex(const unsigned char* data, size_t length);
std::string hmacSha256(const std::string& key, const std::string& data);
