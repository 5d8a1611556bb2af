#include "common/checksum.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>
#include <openssl/hmac.h>

Sha256::Sha256()
    : ctx_(EVP_MD_CTX_new())
    , finished_(false) {
    if (!ctx_) {
        throw std::runtime_error("Failed to create EVP context");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize SHA-256");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void* data, size_t length) {
    if (finished_) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    if (EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("Failed to update SHA-256");
    }
}

std::string Sha256::finalRaw() {
    if (finished_) {
        throw std::logic_error("SHA-256 context already finalized");
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256");
    }
    finished_ = true;
    return std::string(reinterpret_cast<char*>(hash), hashLen);
}

std::string Sha256::finalHex() {
    std::string raw = finalRaw();
    return toHex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

std::string sha256Hex(const std::string& data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.finalHex();
}

std::string calculateFileChecksum(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for checksum: " + path);
    }

    Sha256 sha;
    std::vector<char> buffer(1024 * 1024);
    while (file) {
        file.read(buffer.data(), buffer.size());
        std::streamsize count = file.gcount();
        if (count > 0) {
            sha.update(buffer.data(), static_cast<size_t>(count));
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file for checksum: " + path);
    }
    return sha.finalHex();
}

std::string toHex(const unsigned char* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              out, &outLen)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<char*>(out), outLen);
}
