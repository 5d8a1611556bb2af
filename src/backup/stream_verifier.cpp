#include "backup/stream_verifier.hpp"
#include "common/cancellation.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"
#include <vector>

StreamVerifier::StreamVerifier(std::shared_ptr<StreamSourceFactory> sources)
    : sources_(std::move(sources)) {
}

void StreamVerifier::digest(int pass, const std::string& sourceIdentifier, const std::string& sinceIdentifier,
                            std::string& digest, uint64_t& length, const CancellationToken* cancel) {
    std::unique_ptr<ByteSource> source = sources_->openExport(sourceIdentifier, sinceIdentifier);

    Sha256 sha;
    std::vector<char> buffer(1024 * 1024);
    length = 0;
    size_t n;
    while ((n = source->read(buffer.data(), buffer.size())) > 0) {
        if (cancel) {
            cancel->throwIfCancelled("stream verification");
        }
        sha.update(buffer.data(), n);
        length += n;
        if (progressCallback_ && length % (64 * buffer.size()) < n) {
            progressCallback_(pass, length);
        }
    }
    source->close();
    digest = sha.finalHex();
    Logger::info("Export pass " + std::to_string(pass) + ": " + std::to_string(length) + " bytes, sha256 " + digest);
}

VerificationResult StreamVerifier::verify(const std::string& sourceIdentifier, const std::string& sinceIdentifier,
                                          const CancellationToken* cancel) {
    VerificationResult result;
    digest(1, sourceIdentifier, sinceIdentifier, result.firstDigest, result.firstLength, cancel);
    digest(2, sourceIdentifier, sinceIdentifier, result.secondDigest, result.secondLength, cancel);

    if (result.firstLength != result.secondLength) {
        result.errorMessage = "Stream lengths differ: " + std::to_string(result.firstLength) +
                              " vs " + std::to_string(result.secondLength);
    } else if (result.firstDigest != result.secondDigest) {
        result.errorMessage = "Stream digests differ";
    } else {
        result.success = true;
    }
    return result;
}
