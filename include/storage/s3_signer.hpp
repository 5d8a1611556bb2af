#pragma once

#include <ctime>
#include <map>
#include <string>

struct S3Request {
    std::string method;
    std::string canonicalUri;                  // already URI-encoded
    std::map<std::string, std::string> query;  // raw keys and values
    std::map<std::string, std::string> headers;  // lowercase names
    std::string payloadHash;
};

// AWS Signature Version 4 for S3-compatible endpoints.
class S3Signer {
public:
    S3Signer(const std::string& accessKey, const std::string& secretKey,
             const std::string& region, const std::string& service = "s3");

    // Adds x-amz-date and x-amz-content-sha256, then returns the
    // Authorization header value.
    std::string sign(S3Request& request, std::time_t now) const;

    static std::string canonicalQueryString(const std::map<std::string, std::string>& query);
    static std::string canonicalRequest(const S3Request& request);
    static std::string signedHeaders(const S3Request& request);
    static std::string amzDate(std::time_t time);
    static std::string dateStamp(std::time_t time);

    std::string credentialScope(std::time_t time) const;
    std::string stringToSign(const std::string& canonical, std::time_t time) const;

    static const char* unsignedPayload() { return "UNSIGNED-PAYLOAD"; }

private:
    std::string signingKey(const std::string& date) const;

    std::string accessKey_;
    std::string secretKey_;
    std::string region_;
    std::string service_;
};
