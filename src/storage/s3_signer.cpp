#include "storage/s3_signer.hpp"
#include "common/checksum.hpp"
#include "common/utils.hpp"

S3Signer::S3Signer(const std::string& accessKey, const std::string& secretKey,
                   const std::string& region, const std::string& service)
    : accessKey_(accessKey)
    , secretKey_(secretKey)
    , region_(region)
    , service_(service) {
}

std::string S3Signer::amzDate(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return buffer;
}

std::string S3Signer::dateStamp(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d", &tm);
    return buffer;
}

std::string S3Signer::canonicalQueryString(const std::map<std::string, std::string>& query) {
    // Encoded keys sort the same as raw keys for the parameters S3 uses.
    std::string result;
    for (const auto& entry : query) {
        if (!result.empty()) {
            result += '&';
        }
        result += utils::urlEncode(entry.first) + "=" + utils::urlEncode(entry.second);
    }
    return result;
}

std::string S3Signer::signedHeaders(const S3Request& request) {
    std::string result;
    for (const auto& header : request.headers) {
        if (!result.empty()) {
            result += ';';
        }
        result += header.first;
    }
    return result;
}

std::string S3Signer::canonicalRequest(const S3Request& request) {
    std::string headers;
    for (const auto& header : request.headers) {
        headers += header.first + ":" + utils::trim(header.second) + "\n";
    }

    return request.method + "\n" +
           request.canonicalUri + "\n" +
           canonicalQueryString(request.query) + "\n" +
           headers + "\n" +
           signedHeaders(request) + "\n" +
           request.payloadHash;
}

std::string S3Signer::credentialScope(std::time_t time) const {
    return dateStamp(time) + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string S3Signer::stringToSign(const std::string& canonical, std::time_t time) const {
    return "AWS4-HMAC-SHA256\n" +
           amzDate(time) + "\n" +
           credentialScope(time) + "\n" +
           sha256Hex(canonical);
}

std::string S3Signer::signingKey(const std::string& date) const {
    std::string key = hmacSha256("AWS4" + secretKey_, date);
    key = hmacSha256(key, region_);
    key = hmacSha256(key, service_);
    return hmacSha256(key, "aws4_request");
}

std::string S3Signer::sign(S3Request& request, std::time_t now) const {
    request.headers["x-amz-date"] = amzDate(now);
    request.headers["x-amz-content-sha256"] = request.payloadHash;

    std::string canonical = canonicalRequest(request);
    std::string raw = hmacSha256(signingKey(dateStamp(now)), stringToSign(canonical, now));
    std::string signature = toHex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());

    return "AWS4-HMAC-SHA256 Credential=" + accessKey_ + "/" + credentialScope(now) +
           ", SignedHeaders=" + signedHeaders(request) +
           ", Signature=" + signature;
}
