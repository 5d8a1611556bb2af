#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "common/byte_stream.hpp"

class CancellationToken;

struct VerificationResult {
    bool success = false;
    std::string firstDigest;
    std::string secondDigest;
    uint64_t firstLength = 0;
    uint64_t secondLength = 0;
    std::string errorMessage;
};

// Exports the same snapshot twice and compares the streams. Resume relies
// on the export being byte-identical across invocations.
class StreamVerifier {
public:
    using ProgressCallback = std::function<void(int pass, uint64_t bytes)>;

    explicit StreamVerifier(std::shared_ptr<StreamSourceFactory> sources);

    VerificationResult verify(const std::string& sourceIdentifier, const std::string& sinceIdentifier,
                              const CancellationToken* cancel = nullptr);
    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }

private:
    void digest(int pass, const std::string& sourceIdentifier, const std::string& sinceIdentifier,
                std::string& digest, uint64_t& length, const CancellationToken* cancel);

    std::shared_ptr<StreamSourceFactory> sources_;
    ProgressCallback progressCallback_;
};
